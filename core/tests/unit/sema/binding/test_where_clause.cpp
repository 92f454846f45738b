// tests/sema/binding/test_where_clause.cpp - Unit tests for WhereClauseLowering
//

#include <gtest/gtest.h>

#include <variant>
#include <vector>

#include "rsema/hir/hir.hpp"
#include "rsema/hir/hir_context.hpp"
#include "rsema/sema/binding/where_clause.hpp"
#include "rsema/sema/constraints/constraint_set.hpp"
#include "rsema/sema/lifetimes/lifetime_context.hpp"
#include "rsema/sema/types/type.hpp"
#include "rsema/sema/types/type_lowering.hpp"

using namespace rsema;

namespace
{

struct WhereClauseFixture : ::testing::Test
{
  HirContext hir;
  TypeContext types;
  TypeLowering lowering{types};
  ConstraintSet constraints;
  LifetimeContext lifetimes;

  WhereBound * trait(std::string_view name, std::vector<AssocEquality> eqs = {})
  {
    return hir.create<WhereBound>(BoundKind::Trait, hir.intern(name), hir.copy_to_arena(eqs));
  }

  WhereBound * outlives(std::string_view lifetime)
  {
    return hir.create<WhereBound>(BoundKind::Lifetime, hir.intern(lifetime));
  }

  WhereClause * clause(std::string_view param, std::vector<WhereBound *> bounds)
  {
    return hir.create<WhereClause>(hir.intern(param), false, hir.copy_to_arena(bounds));
  }

  WhereClause * lifetime_clause(std::string_view param, std::vector<WhereBound *> bounds)
  {
    return hir.create<WhereClause>(hir.intern(param), true, hir.copy_to_arena(bounds));
  }

  bool has(std::string_view spelled) const
  {
    for (const auto & c : constraints.constraints()) {
      if (to_string(c) == spelled) return true;
    }
    return false;
  }
};

}  // namespace

TEST(ProjectionNameTest, Spelling)
{
  EXPECT_EQ(projection_name("I", "Iterator", "Item"), "<I as Iterator>::Item");
}

TEST_F(WhereClauseFixture, TraitAndSizedBounds)
{
  WhereClauseLowering where(constraints, lifetimes, lowering);
  ASSERT_TRUE(where.lower(*clause("T", {trait("Clone"), trait("Sized")})));

  EXPECT_EQ(constraints.size(), 2U);
  EXPECT_TRUE(has("T: Clone"));
  EXPECT_TRUE(has("T: Sized"));
  EXPECT_TRUE(constraints.has_trait_bound("T", "Clone"));
}

TEST_F(WhereClauseFixture, AssociatedEqualityBecomesProjectionEquality)
{
  AssocEquality item{hir.intern("Item"), hir.create<NamedTypeNode>(hir.intern("u32"))};

  WhereClauseLowering where(constraints, lifetimes, lowering);
  ASSERT_TRUE(where.lower(*clause("T", {trait("Iterator", {item})})));

  EXPECT_TRUE(has("T: Iterator"));
  EXPECT_TRUE(has("<T as Iterator>::Item == u32"));
}

TEST_F(WhereClauseFixture, TypeOutlivesRegisteredLifetime)
{
  lifetimes.register_named_lifetime("a");

  WhereClauseLowering where(constraints, lifetimes, lowering);
  ASSERT_TRUE(where.lower(*clause("T", {outlives("a")})));
  EXPECT_TRUE(has("T: 'a"));
}

TEST_F(WhereClauseFixture, TypeOutlivesUnregisteredLifetime)
{
  WhereClauseLowering where(constraints, lifetimes, lowering);
  auto r = where.lower(*clause("T", {outlives("a")}));
  ASSERT_FALSE(r);
  ASSERT_TRUE(std::holds_alternative<LifetimeError>(r.error()));
  EXPECT_EQ(std::get<LifetimeError>(r.error()).kind, LifetimeErrorKind::UnregisteredLifetime);
  EXPECT_EQ(std::get<LifetimeError>(r.error()).name, "a");
}

TEST_F(WhereClauseFixture, LifetimeParamBecomesOutlivesEdge)
{
  lifetimes.register_named_lifetime("a");
  lifetimes.register_named_lifetime("b");

  WhereClauseLowering where(constraints, lifetimes, lowering);
  ASSERT_TRUE(where.lower(*lifetime_clause("a", {outlives("b")})));

  ASSERT_EQ(lifetimes.constraints().size(), 1U);
  const OutlivesConstraint & edge = lifetimes.constraints().front();
  EXPECT_EQ(edge.longer.display(), "'a");
  EXPECT_EQ(edge.shorter.display(), "'b");
  EXPECT_EQ(edge.reason, k_where_clause_reason);
  EXPECT_TRUE(constraints.empty());
}

TEST_F(WhereClauseFixture, LifetimeParamMustBeDeclared)
{
  lifetimes.register_named_lifetime("a");

  WhereClauseLowering where(constraints, lifetimes, lowering);
  auto r = where.lower(*lifetime_clause("a", {outlives("c")}));
  ASSERT_FALSE(r);
  ASSERT_TRUE(std::holds_alternative<LifetimeError>(r.error()));
  EXPECT_EQ(std::get<LifetimeError>(r.error()).name, "c");
}

TEST_F(WhereClauseFixture, BoundLimitCountsAcrossClauses)
{
  WhereClauseLowering where(constraints, lifetimes, lowering, 2);
  ASSERT_TRUE(where.lower(*clause("T", {trait("Clone")})));
  ASSERT_TRUE(where.lower(*clause("U", {trait("Clone"), trait("Debug")})));

  auto r = where.lower(*clause("T", {trait("Debug"), trait("Eq")}));
  ASSERT_FALSE(r);
  ASSERT_TRUE(std::holds_alternative<BindingError>(r.error()));
  const auto & err = std::get<BindingError>(r.error());
  EXPECT_EQ(err.kind, BindingErrorKind::TooManyBounds);
  EXPECT_EQ(err.owner, "T");
  EXPECT_EQ(err.count, 3U);
  EXPECT_EQ(err.limit, 2U);
}

TEST_F(WhereClauseFixture, LowerAllStopsAtFirstFailure)
{
  std::vector<WhereClause *> clauses{
    clause("T", {trait("Clone")}), clause("U", {outlives("missing")}),
    clause("V", {trait("Copy")})};

  WhereClauseLowering where(constraints, lifetimes, lowering);
  auto r = where.lower_all(hir.copy_to_arena(clauses));
  ASSERT_FALSE(r);
  EXPECT_TRUE(has("T: Clone"));
  EXPECT_FALSE(has("V: Copy"));
}

TEST_F(WhereClauseFixture, LoweredBoundsPropagateThroughEqualities)
{
  WhereClauseLowering where(constraints, lifetimes, lowering);
  ASSERT_TRUE(where.lower(*clause("T", {trait("Clone")})));
  constraints.add_constraint(Constraint::type_equality("T", "U"));

  auto derived = constraints.propagate_constraints();
  ASSERT_TRUE(derived);
  EXPECT_EQ(derived.value(), 1U);
  EXPECT_TRUE(constraints.has_trait_bound("U", "Clone"));
}
