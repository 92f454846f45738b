// tests/sema/lifetimes/test_lifetime_elision.cpp - Unit tests for elision and signature lifetimes
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rsema/hir/hir.hpp"
#include "rsema/sema/lifetimes/lifetime_context.hpp"
#include "rsema/sema/lifetimes/lifetime_elision.hpp"
#include "rsema/sema/lifetimes/lifetime_solver.hpp"
#include "rsema/sema/lifetimes/signature_lifetimes.hpp"
#include "rsema/test_support/hir_helpers.hpp"

using namespace rsema;

namespace
{

// Read a single-function program and return its function
const FnItem * only_fn(const test_support::TestProgram & p)
{
  if (!p.ok() || p.program->items.size() != 1) return nullptr;
  return dyn_cast<FnItem>(p.program->items[0]);
}

}  // namespace

// ============================================================================
// Elision rules
// ============================================================================

TEST(LifetimeElisionTest, RuleOneSharesTheOnlyInput)
{
  LifetimeContext ctx;
  const ElisionResult r = LifetimeElision::elide_function_lifetimes({false, true}, true, ctx);

  EXPECT_EQ(r.rule, ElisionRule::SingleInput);
  EXPECT_FALSE(r.inputs[0].has_value());
  ASSERT_TRUE(r.inputs[1].has_value());
  ASSERT_TRUE(r.output.has_value());
  EXPECT_EQ(*r.inputs[1], *r.output);
  EXPECT_EQ(r.output_source(), 1U);
  EXPECT_TRUE(LifetimeElision::check_elision(r, "f"));
}

TEST(LifetimeElisionTest, RuleTwoUsesTheFirstInput)
{
  LifetimeContext ctx;
  const ElisionResult r = LifetimeElision::elide_function_lifetimes({true, true}, true, ctx);

  EXPECT_EQ(r.rule, ElisionRule::FirstInput);
  ASSERT_TRUE(r.inputs[0] && r.inputs[1] && r.output);
  EXPECT_EQ(*r.output, *r.inputs[0]);
  EXPECT_NE(*r.inputs[1], *r.inputs[0]);
  EXPECT_EQ(r.ref_param_count(), 2U);
}

TEST(LifetimeElisionTest, RuleThreeGivesIndependentInputs)
{
  LifetimeContext ctx;
  const ElisionResult r = LifetimeElision::elide_function_lifetimes({true, false, true}, false, ctx);

  EXPECT_EQ(r.rule, ElisionRule::Independent);
  EXPECT_FALSE(r.ambiguous);
  EXPECT_FALSE(r.output.has_value());
  ASSERT_TRUE(r.inputs[0] && r.inputs[2]);
  EXPECT_NE(*r.inputs[0], *r.inputs[2]);
  EXPECT_EQ(ctx.registered().size(), 2U);
}

TEST(LifetimeElisionTest, ReferenceReturnWithoutSourceIsAmbiguous)
{
  LifetimeContext ctx;
  const ElisionResult r = LifetimeElision::elide_function_lifetimes({false, true, true}, true, ctx);

  EXPECT_EQ(r.rule, ElisionRule::Independent);
  EXPECT_TRUE(r.ambiguous);

  auto check = LifetimeElision::check_elision(r, "pick");
  ASSERT_FALSE(check);
  EXPECT_EQ(check.error().kind, LifetimeErrorKind::AmbiguousElision);
  EXPECT_EQ(check.error().name, "pick");
  EXPECT_EQ(check.error().ref_params, 2U);
}

TEST(LifetimeElisionTest, NoParametersWithReferenceReturnIsAmbiguous)
{
  LifetimeContext ctx;
  const ElisionResult r = LifetimeElision::elide_function_lifetimes({}, true, ctx);
  EXPECT_TRUE(r.ambiguous);
  EXPECT_EQ(r.ref_param_count(), 0U);
}

// ============================================================================
// Signature lifetimes
// ============================================================================

TEST(SignatureLifetimesTest, ElidedSignatureFollowsRuleOne)
{
  auto p = test_support::read(R"({"items": [
    {"kind": "fn", "name": "first",
     "params": [{"name": "xs", "type": {"kind": "ref", "inner": {"kind": "vec", "element": "i32"}}}],
     "return": {"kind": "ref", "inner": "i32"}}
  ]})");
  const FnItem * fn = only_fn(p);
  ASSERT_NE(fn, nullptr) << p.error;

  LifetimeContext ctx;
  auto sig = extract_signature_lifetimes(*fn, ctx);
  ASSERT_TRUE(sig);
  ASSERT_TRUE(sig.value().elision.has_value());
  EXPECT_EQ(sig.value().elision->rule, ElisionRule::SingleInput);
  ASSERT_TRUE(sig.value().params[0] && sig.value().output);
  EXPECT_EQ(*sig.value().params[0], *sig.value().output);
}

TEST(SignatureLifetimesTest, ElidedReturnBorrowsNamedLifetime)
{
  auto p = test_support::read(R"({"items": [
    {"kind": "fn", "name": "get", "lifetime_params": ["a"],
     "params": [{"name": "s", "type": {"kind": "ref", "lifetime": "a", "inner": "str"}}],
     "return": {"kind": "ref", "inner": "str"}}
  ]})");
  const FnItem * fn = only_fn(p);
  ASSERT_NE(fn, nullptr) << p.error;

  LifetimeContext ctx;
  auto sig = extract_signature_lifetimes(*fn, ctx);
  ASSERT_TRUE(sig);
  ASSERT_TRUE(sig.value().output.has_value());
  EXPECT_EQ(sig.value().output->display(), "'a");
  EXPECT_TRUE(sig.value().unused_lifetime_params.empty());

  // 'a only; the explicit parameter gets no inferred lifetime of its own
  EXPECT_EQ(ctx.registered().size(), 1U);
}

TEST(SignatureLifetimesTest, ExplicitFirstParameterStillSelectsRuleTwo)
{
  auto p = test_support::read(R"({"items": [
    {"kind": "fn", "name": "pick", "lifetime_params": ["a"],
     "params": [{"name": "x", "type": {"kind": "ref", "lifetime": "a", "inner": "i32"}},
                {"name": "y", "type": {"kind": "ref", "inner": "i32"}}],
     "return": {"kind": "ref", "inner": "i32"}}
  ]})");
  const FnItem * fn = only_fn(p);
  ASSERT_NE(fn, nullptr) << p.error;

  LifetimeContext ctx;
  auto sig = extract_signature_lifetimes(*fn, ctx);
  ASSERT_TRUE(sig);
  ASSERT_TRUE(sig.value().elision.has_value());
  EXPECT_EQ(sig.value().elision->rule, ElisionRule::FirstInput);
  ASSERT_TRUE(sig.value().output && sig.value().params[1]);
  EXPECT_EQ(sig.value().output->display(), "'a");
  EXPECT_TRUE(sig.value().params[1]->is_inferred());

  ASSERT_EQ(ctx.registered().size(), 2U);
  EXPECT_EQ(ctx.registered()[1], *sig.value().params[1]);
}

TEST(SignatureLifetimesTest, UndeclaredLifetimeFails)
{
  auto p = test_support::read(R"({"items": [
    {"kind": "fn", "name": "f", "lifetime_params": ["a"],
     "params": [{"name": "x", "type": {"kind": "ref", "lifetime": "c", "inner": "i32"}}]}
  ]})");
  const FnItem * fn = only_fn(p);
  ASSERT_NE(fn, nullptr) << p.error;

  LifetimeContext ctx;
  auto sig = extract_signature_lifetimes(*fn, ctx);
  ASSERT_FALSE(sig);
  EXPECT_EQ(sig.error().kind, LifetimeErrorKind::UnregisteredLifetime);
  EXPECT_EQ(sig.error().name, "c");
}

TEST(SignatureLifetimesTest, NestedReferenceAddsWellFormednessEdge)
{
  auto p = test_support::read(R"({"items": [
    {"kind": "fn", "name": "deref_twice", "lifetime_params": ["a", "b"],
     "params": [{"name": "x", "type": {"kind": "ref", "lifetime": "a",
                                        "inner": {"kind": "ref", "lifetime": "b", "inner": "i32"}}}]}
  ]})");
  const FnItem * fn = only_fn(p);
  ASSERT_NE(fn, nullptr) << p.error;

  LifetimeContext ctx;
  auto sig = extract_signature_lifetimes(*fn, ctx);
  ASSERT_TRUE(sig);
  ASSERT_EQ(ctx.constraints().size(), 1U);
  EXPECT_EQ(ctx.constraints()[0].longer.display(), "'b");
  EXPECT_EQ(ctx.constraints()[0].shorter.display(), "'a");
  EXPECT_EQ(ctx.constraints()[0].reason, k_wellformed_reason);

  LifetimeSolver solver(ctx);
  EXPECT_TRUE(solver.is_satisfiable());
}

TEST(SignatureLifetimesTest, ReportsUnusedLifetimeParameters)
{
  auto p = test_support::read(R"({"items": [
    {"kind": "fn", "name": "f", "lifetime_params": ["a", "b"],
     "params": [{"name": "x", "type": {"kind": "ref", "lifetime": "a", "inner": "i32"}}]}
  ]})");
  const FnItem * fn = only_fn(p);
  ASSERT_NE(fn, nullptr) << p.error;

  LifetimeContext ctx;
  auto sig = extract_signature_lifetimes(*fn, ctx);
  ASSERT_TRUE(sig);
  EXPECT_FALSE(sig.value().elision.has_value());
  EXPECT_EQ(sig.value().unused_lifetime_params, (std::vector<std::string>{"'b"}));
}
