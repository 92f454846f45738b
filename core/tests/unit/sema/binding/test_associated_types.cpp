// tests/sema/binding/test_associated_types.cpp - Unit tests for AssociatedTypeResolver
//

#include <gtest/gtest.h>

#include "rsema/hir/hir.hpp"
#include "rsema/hir/hir_context.hpp"
#include "rsema/sema/binding/associated_types.hpp"
#include "rsema/sema/types/type.hpp"
#include "rsema/sema/types/type_lowering.hpp"
#include "rsema/sema/types/type_utils.hpp"

using namespace rsema;

TEST(AssociatedTypeResolverTest, BindAndResolve)
{
  TypeContext types;
  AssociatedTypeResolver assoc;

  ASSERT_TRUE(assoc.bind("vec_iter", "Item", types.int32_type()));
  EXPECT_TRUE(assoc.contains("vec_iter", "Item"));
  EXPECT_EQ(assoc.size(), 1U);

  auto r = assoc.resolve("vec_iter", "Item");
  ASSERT_TRUE(r);
  EXPECT_EQ(r.value(), types.int32_type());
}

TEST(AssociatedTypeResolverTest, RebindingSameTypeIsNoOp)
{
  TypeContext types;
  AssociatedTypeResolver assoc;

  ASSERT_TRUE(assoc.bind("vec_iter", "Item", types.get_vec_type(types.uint8_type())));
  EXPECT_TRUE(assoc.bind("vec_iter", "Item", types.get_vec_type(types.uint8_type())));
  EXPECT_EQ(assoc.size(), 1U);
}

TEST(AssociatedTypeResolverTest, ConflictingBindingKeepsFirst)
{
  TypeContext types;
  AssociatedTypeResolver assoc;

  ASSERT_TRUE(assoc.bind("vec_iter", "Item", types.int32_type()));
  auto r = assoc.bind("vec_iter", "Item", types.string_type());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, BindingErrorKind::ConflictingAssociatedType);
  EXPECT_EQ(r.error().owner, "vec_iter");
  EXPECT_EQ(r.error().existing, types.int32_type());
  EXPECT_EQ(r.error().requested, types.string_type());

  EXPECT_EQ(assoc.resolve("vec_iter", "Item").value(), types.int32_type());
}

TEST(AssociatedTypeResolverTest, UnboundNameFails)
{
  AssociatedTypeResolver assoc;
  auto r = assoc.resolve("vec_iter", "Output");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, BindingErrorKind::AssociatedTypeUnbound);
  EXPECT_EQ(r.error().owner, "vec_iter");
  EXPECT_EQ(r.error().name, "Output");
}

TEST(AssociatedTypeResolverTest, SameNameInDifferentImpls)
{
  TypeContext types;
  AssociatedTypeResolver assoc;

  ASSERT_TRUE(assoc.bind("a", "Item", types.bool_type()));
  ASSERT_TRUE(assoc.bind("b", "Item", types.char_type()));
  EXPECT_EQ(assoc.resolve("a", "Item").value(), types.bool_type());
  EXPECT_EQ(assoc.resolve("b", "Item").value(), types.char_type());
}

TEST(AssociatedTypeResolverTest, ProjectionGoesThroughRegisteredImpl)
{
  TypeContext types;
  AssociatedTypeResolver assoc;
  assoc.register_impl("vec_iter", "Iterator", "VecIter");
  ASSERT_TRUE(assoc.bind("vec_iter", "Item", types.uint32_type()));

  auto found = assoc.resolve_projection("Iterator", "VecIter", "Item");
  ASSERT_TRUE(found);
  EXPECT_EQ(found.value(), types.uint32_type());

  auto missing = assoc.resolve_projection("Iterator", "Other", "Item");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().owner, "<Other as Iterator>");
}

TEST(AssociatedTypeResolverTest, ClearForgetsEverything)
{
  TypeContext types;
  AssociatedTypeResolver assoc;
  assoc.register_impl("vec_iter", "Iterator", "VecIter");
  ASSERT_TRUE(assoc.bind("vec_iter", "Item", types.int32_type()));

  assoc.clear();
  EXPECT_TRUE(assoc.empty());
  EXPECT_FALSE(assoc.resolve_projection("Iterator", "VecIter", "Item"));
}

// ============================================================================
// Lowering of `Self::Name`
// ============================================================================

TEST(TypeLoweringTest, AssociatedTypeLowersThroughResolver)
{
  HirContext hir;
  TypeContext types;
  AssociatedTypeResolver assoc;
  ASSERT_TRUE(assoc.bind("vec_iter", "Item", types.int64_type()));

  TypeLowering lowering(types, &assoc);
  const auto * node = hir.create<VecTypeNode>(
    hir.create<AssocTypeNode>(hir.intern("vec_iter"), hir.intern("Item")));

  auto r = lowering.lower(node);
  ASSERT_TRUE(r);
  EXPECT_EQ(to_string(r.value()), "Vec<i64>");
}

TEST(TypeLoweringTest, AssociatedTypeWithoutResolverIsUnbound)
{
  HirContext hir;
  TypeContext types;
  TypeLowering lowering(types);

  auto r = lowering.lower(hir.create<AssocTypeNode>(hir.intern("vec_iter"), hir.intern("Item")));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, BindingErrorKind::AssociatedTypeUnbound);
}

TEST(TypeLoweringTest, ReferenceKeepsLifetimeAndMutability)
{
  HirContext hir;
  TypeContext types;
  TypeLowering lowering(types);

  const auto * node = hir.create<RefTypeNode>(
    hir.intern("a"), true, hir.create<NamedTypeNode>(hir.intern("i32")));
  auto r = lowering.lower(node);
  ASSERT_TRUE(r);
  EXPECT_EQ(to_string(r.value()), "&'a mut i32");
}
