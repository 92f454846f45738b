// tests/sema/constraints/test_constraint_set.cpp - Unit tests for the constraint store
//
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "rsema/sema/constraints/constraint.hpp"
#include "rsema/sema/constraints/constraint_set.hpp"

using namespace rsema;

// ============================================================================
// Storage and indexing
// ============================================================================

TEST(ConstraintSetTest, AddIsIdempotent)
{
  ConstraintSet set;
  EXPECT_TRUE(set.add_constraint(Constraint::trait_bound("T", "Clone")));
  EXPECT_FALSE(set.add_constraint(Constraint::trait_bound("T", "Clone")));
  EXPECT_EQ(set.size(), 1U);

  // Same names, different kind
  EXPECT_TRUE(set.add_constraint(Constraint::type_equality("T", "Clone")));
  EXPECT_EQ(set.size(), 2U);
}

TEST(ConstraintSetTest, ResolveIndexesEqualitiesUnderBothSides)
{
  ConstraintSet set;
  set.add_constraint(Constraint::type_equality("T", "U"));
  set.add_constraint(Constraint::trait_bound("T", "Debug"));
  set.add_constraint(Constraint::lifetime_bound("U", "a"));
  set.resolve();

  EXPECT_EQ(set.get_constraints("T").size(), 2U);
  EXPECT_EQ(set.get_constraints("U").size(), 2U);
  EXPECT_EQ(set.get_constraints("'a").size(), 1U);
  EXPECT_TRUE(set.get_constraints("V").empty());
}

TEST(ConstraintSetTest, ConstraintsAddedAfterResolveAreIndexed)
{
  ConstraintSet set;
  set.resolve();
  set.add_constraint(Constraint::sized_bound("T"));
  ASSERT_EQ(set.get_constraints("T").size(), 1U);
  EXPECT_EQ(set.get_constraints("T")[0]->kind, ConstraintKind::SizedBound);
}

TEST(ConstraintSetTest, IsMoveOnly)
{
  static_assert(!std::is_copy_constructible_v<ConstraintSet>);
  static_assert(!std::is_copy_assignable_v<ConstraintSet>);
  static_assert(std::is_move_constructible_v<ConstraintSet>);
}

TEST(ConstraintSetTest, IndexSurvivesMoveFromDestroyedSource)
{
  auto source = std::make_unique<ConstraintSet>();
  source->add_constraint(Constraint::type_equality("T", "U"));
  source->add_constraint(Constraint::trait_bound("T", "Clone"));
  source->resolve();

  ConstraintSet moved(std::move(*source));
  source.reset();

  const auto found = moved.get_constraints("T");
  ASSERT_EQ(found.size(), 2U);
  EXPECT_EQ(found.front()->subject, "T");
  EXPECT_TRUE(moved.has_trait_bound("T", "Clone"));
}

TEST(ConstraintSetTest, SurfaceSpelling)
{
  EXPECT_EQ(to_string(Constraint::type_equality("T", "U")), "T == U");
  EXPECT_EQ(to_string(Constraint::trait_bound("T", "Clone")), "T: Clone");
  EXPECT_EQ(to_string(Constraint::lifetime_bound("T", "a")), "T: 'a");
  EXPECT_EQ(to_string(Constraint::lifetime_bound("T", "'b")), "T: 'b");
  EXPECT_EQ(to_string(Constraint::sized_bound("T")), "T: Sized");
}

TEST(ConstraintSetTest, MergeUnionsWithoutDuplicates)
{
  ConstraintSet ambient;
  ambient.add_constraint(Constraint::trait_bound("T", "Clone"));
  ambient.add_constraint(Constraint::trait_bound("T", "Debug"));

  ConstraintSet where;
  where.add_constraint(Constraint::trait_bound("T", "Clone"));
  where.add_constraint(Constraint::trait_bound("U", "Copy"));

  ambient.merge(where);
  EXPECT_EQ(ambient.size(), 3U);
  EXPECT_TRUE(ambient.has_trait_bound("U", "Copy"));
  EXPECT_EQ(ambient.trait_bounds_of("T"), (std::vector<std::string>{"Clone", "Debug"}));
}

// ============================================================================
// Propagation
// ============================================================================

TEST(ConstraintPropagationTest, TraitBoundFollowsEquality)
{
  ConstraintSet set;
  set.add_constraint(Constraint::type_equality("T", "U"));
  set.add_constraint(Constraint::trait_bound("T", "Clone"));

  auto derived = set.propagate_constraints();
  ASSERT_TRUE(derived);
  EXPECT_EQ(derived.value(), 1U);
  EXPECT_TRUE(set.has_trait_bound("U", "Clone"));
}

TEST(ConstraintPropagationTest, ReachesFixpointAlongChains)
{
  ConstraintSet set;
  set.add_constraint(Constraint::trait_bound("A", "Ord"));
  set.add_constraint(Constraint::type_equality("A", "B"));
  set.add_constraint(Constraint::type_equality("B", "C"));
  set.add_constraint(Constraint::type_equality("C", "D"));

  auto derived = set.propagate_constraints();
  ASSERT_TRUE(derived);
  EXPECT_EQ(derived.value(), 3U);
  EXPECT_TRUE(set.has_trait_bound("D", "Ord"));

  // Saturated: a second run adds nothing
  auto again = set.propagate_constraints();
  ASSERT_TRUE(again);
  EXPECT_EQ(again.value(), 0U);
}

TEST(ConstraintPropagationTest, TerminatesOnEqualityCycle)
{
  ConstraintSet set;
  set.add_constraint(Constraint::type_equality("A", "B"));
  set.add_constraint(Constraint::type_equality("B", "C"));
  set.add_constraint(Constraint::type_equality("C", "A"));
  set.add_constraint(Constraint::trait_bound("B", "Hash"));

  auto derived = set.propagate_constraints();
  ASSERT_TRUE(derived);
  EXPECT_TRUE(set.has_trait_bound("A", "Hash"));
  EXPECT_TRUE(set.has_trait_bound("C", "Hash"));
}

TEST(ConstraintPropagationTest, StepLimitIsReported)
{
  ConstraintSet set(2);
  set.add_constraint(Constraint::trait_bound("A", "Ord"));
  set.add_constraint(Constraint::type_equality("A", "B"));
  set.add_constraint(Constraint::type_equality("B", "C"));

  auto derived = set.propagate_constraints();
  ASSERT_FALSE(derived);
  EXPECT_EQ(derived.error().kind, ConstraintErrorKind::PropagationLimitExceeded);
  EXPECT_EQ(derived.error().limit, 2U);
}

// ============================================================================
// Satisfiability
// ============================================================================

TEST(ConstraintSatisfiabilityTest, EqualityCycleIsAnEquivalenceClass)
{
  ConstraintSet set;
  set.add_constraint(Constraint::type_equality("A", "B"));
  set.add_constraint(Constraint::type_equality("B", "C"));
  set.add_constraint(Constraint::type_equality("C", "A"));

  auto analysis = set.check_satisfiable();
  ASSERT_TRUE(analysis);
  EXPECT_EQ(analysis.value().cycle_count, 1U);
  ASSERT_EQ(analysis.value().classes.size(), 1U);
  EXPECT_EQ(analysis.value().classes[0].size(), 3U);
  EXPECT_TRUE(analysis.value().same_class("A", "C"));
}

TEST(ConstraintSatisfiabilityTest, SeparateClassesStaySeparate)
{
  ConstraintSet set;
  set.add_constraint(Constraint::type_equality("A", "B"));
  set.add_constraint(Constraint::type_equality("X", "Y"));

  auto analysis = set.check_satisfiable();
  ASSERT_TRUE(analysis);
  EXPECT_EQ(analysis.value().cycle_count, 0U);
  EXPECT_EQ(analysis.value().classes.size(), 2U);
  EXPECT_FALSE(analysis.value().same_class("A", "X"));
  EXPECT_EQ(analysis.value().class_of("Z"), nullptr);
}

TEST(ConstraintSatisfiabilityTest, ReflexiveEqualityIsNotACycle)
{
  ConstraintSet set;
  set.add_constraint(Constraint::type_equality("T", "T"));

  auto analysis = set.check_satisfiable();
  ASSERT_TRUE(analysis);
  EXPECT_EQ(analysis.value().cycle_count, 0U);
}

TEST(ConstraintSatisfiabilityTest, DistinctPrimitivesConflict)
{
  ConstraintSet set;
  set.add_constraint(Constraint::type_equality("i32", "T"));
  set.add_constraint(Constraint::type_equality("T", "bool"));

  auto analysis = set.check_satisfiable();
  ASSERT_FALSE(analysis);
  const ConstraintError & e = analysis.error();
  EXPECT_EQ(e.kind, ConstraintErrorKind::ConflictingEquality);
  EXPECT_EQ(e.lhs, "i32");
  EXPECT_EQ(e.rhs, "bool");
  EXPECT_EQ(e.path, (std::vector<std::string>{"i32", "T", "bool"}));
}

TEST(ConstraintSatisfiabilityTest, SamePrimitiveUnderTwoSpellingsIsFine)
{
  ConstraintSet set;
  set.add_constraint(Constraint::type_equality("i32", "T"));
  set.add_constraint(Constraint::type_equality("T", "i32"));

  EXPECT_TRUE(set.check_satisfiable());
}
