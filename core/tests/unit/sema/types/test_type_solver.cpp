// tests/sema/types/test_type_solver.cpp - Unit tests for TypeConstraintSolver
//
// Expressions are built directly in a HirContext; the solver sees the same
// nodes the JSON reader would produce.
//

#include <gtest/gtest.h>

#include <vector>

#include "rsema/hir/hir.hpp"
#include "rsema/hir/hir_context.hpp"
#include "rsema/sema/types/substitution.hpp"
#include "rsema/sema/types/type.hpp"
#include "rsema/sema/types/type_solver.hpp"
#include "rsema/sema/types/type_utils.hpp"

using namespace rsema;

namespace
{

struct SolverFixture : ::testing::Test
{
  HirContext hir;
  TypeContext types;
  TypeConstraintSolver solver{types};

  Expr * var(std::string_view name) { return hir.create<VarRefExpr>(hir.intern(name)); }
  Expr * num(int64_t v) { return hir.create<IntLiteralExpr>(v); }
  Expr * str(std::string_view s) { return hir.create<StringLiteralExpr>(hir.intern(s)); }
  Expr * boolean(bool b) { return hir.create<BoolLiteralExpr>(b); }

  Expr * bin(Expr * l, BinaryOp op, Expr * r) { return hir.create<BinaryExpr>(l, op, r); }
  Expr * un(UnaryOp op, Expr * e) { return hir.create<UnaryExpr>(op, e); }

  Expr * call(std::string_view callee, std::vector<Expr *> args)
  {
    return hir.create<CallExpr>(hir.intern(callee), hir.copy_to_arena(args));
  }
};

}  // namespace

// ============================================================================
// Literals and variables
// ============================================================================

TEST_F(SolverFixture, LiteralDefaults)
{
  EXPECT_EQ(solver.solve_expr(*num(1)).value(), types.int32_type());
  EXPECT_EQ(solver.solve_expr(*boolean(true)).value(), types.bool_type());
  EXPECT_EQ(solver.solve_expr(*str("x")).value(), types.string_type());
  EXPECT_EQ(solver.solve_expr(*hir.create<FloatLiteralExpr>(1.5)).value(), types.float64_type());
}

TEST_F(SolverFixture, UnboundVariable)
{
  auto r = solver.solve_expr(*var("missing"));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, TypeErrorKind::UnboundVariable);
  EXPECT_EQ(r.error().name, "missing");
}

// ============================================================================
// Operators
// ============================================================================

TEST_F(SolverFixture, ArithmeticOnRegisteredVariable)
{
  solver.register_variable("x", types.int32_type());
  auto r = solver.solve_expr(*bin(var("x"), BinaryOp::Add, num(5)));
  ASSERT_TRUE(r);
  EXPECT_EQ(r.value(), types.int32_type());
}

TEST_F(SolverFixture, ArithmeticOperandMismatch)
{
  solver.register_variable("x", types.int64_type());
  auto r = solver.solve_expr(*bin(var("x"), BinaryOp::Mul, num(2)));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, TypeErrorKind::TypeMismatch);
  EXPECT_EQ(r.error().expected, types.int64_type());
  EXPECT_EQ(r.error().found, types.int32_type());
}

TEST_F(SolverFixture, ArithmeticRequiresNumbers)
{
  auto r = solver.solve_expr(*bin(boolean(true), BinaryOp::Add, boolean(false)));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, TypeErrorKind::InvalidOperand);
  EXPECT_EQ(r.error().name, "+");
}

TEST_F(SolverFixture, ComparisonYieldsBool)
{
  solver.register_variable("s", types.string_type());
  auto r = solver.solve_expr(*bin(var("s"), BinaryOp::Eq, str("t")));
  ASSERT_TRUE(r);
  EXPECT_EQ(r.value(), types.bool_type());
}

TEST_F(SolverFixture, LogicalRequiresBool)
{
  auto r = solver.solve_expr(*bin(boolean(true), BinaryOp::And, num(1)));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, TypeErrorKind::InvalidOperand);
}

TEST_F(SolverFixture, BitwiseAndShiftOnIntegers)
{
  solver.register_variable("mask", types.uint64_type());
  solver.register_variable("bits", types.uint64_type());

  for (BinaryOp op : {BinaryOp::BitAnd, BinaryOp::BitOr, BinaryOp::BitXor, BinaryOp::Shl,
                      BinaryOp::Shr}) {
    auto r = solver.solve_expr(*bin(var("mask"), op, var("bits")));
    ASSERT_TRUE(r) << to_string(op);
    EXPECT_EQ(r.value(), types.uint64_type());
  }
  EXPECT_EQ(solver.solve_expr(*bin(num(1), BinaryOp::Shl, num(4))).value(), types.int32_type());
}

TEST_F(SolverFixture, BitwiseRejectsFloats)
{
  solver.register_variable("f", types.float64_type());
  auto r = solver.solve_expr(*bin(var("f"), BinaryOp::BitOr, var("f")));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, TypeErrorKind::InvalidOperand);
  EXPECT_EQ(r.error().name, "|");
  EXPECT_EQ(r.error().found, types.float64_type());
}

TEST_F(SolverFixture, BitwiseAcceptsBoolButShiftDoesNot)
{
  auto both = solver.solve_expr(*bin(boolean(true), BinaryOp::BitXor, boolean(false)));
  ASSERT_TRUE(both);
  EXPECT_EQ(both.value(), types.bool_type());

  auto shifted = solver.solve_expr(*bin(boolean(true), BinaryOp::Shr, boolean(false)));
  ASSERT_FALSE(shifted);
  EXPECT_EQ(shifted.error().kind, TypeErrorKind::InvalidOperand);
  EXPECT_EQ(shifted.error().name, ">>");
}

TEST_F(SolverFixture, NegationRequiresNumber)
{
  auto negated = solver.solve_expr(*un(UnaryOp::Neg, hir.create<FloatLiteralExpr>(2.5)));
  ASSERT_TRUE(negated);
  EXPECT_EQ(negated.value(), types.float64_type());

  auto bad = solver.solve_expr(*un(UnaryOp::Neg, str("x")));
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().kind, TypeErrorKind::InvalidOperand);
  EXPECT_EQ(bad.error().name, "-");
  EXPECT_EQ(bad.error().found, types.string_type());
}

TEST_F(SolverFixture, NotOnBoolAndIntegers)
{
  EXPECT_EQ(solver.solve_expr(*un(UnaryOp::Not, boolean(true))).value(), types.bool_type());

  solver.register_variable("n", types.uint8_type());
  EXPECT_EQ(solver.solve_expr(*un(UnaryOp::Not, var("n"))).value(), types.uint8_type());

  auto bad = solver.solve_expr(*un(UnaryOp::Not, hir.create<FloatLiteralExpr>(1.0)));
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().kind, TypeErrorKind::InvalidOperand);
  EXPECT_EQ(bad.error().name, "!");
}

TEST_F(SolverFixture, BorrowAndDereference)
{
  solver.register_variable("x", types.int32_type());
  auto borrowed = solver.solve_expr(*un(UnaryOp::Ref, var("x")));
  ASSERT_TRUE(borrowed);
  EXPECT_EQ(to_string(borrowed.value()), "&i32");

  solver.register_variable("r", types.get_reference_type(types.bool_type(), true, "'a"));
  auto read = solver.solve_expr(*un(UnaryOp::Deref, var("r")));
  ASSERT_TRUE(read);
  EXPECT_EQ(read.value(), types.bool_type());

  auto bad = solver.solve_expr(*un(UnaryOp::Deref, var("x")));
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().kind, TypeErrorKind::InvalidOperand);
}

// ============================================================================
// Calls
// ============================================================================

TEST_F(SolverFixture, CallReturnsDeclaredType)
{
  solver.register_function("add", {types.int32_type(), types.int32_type()}, types.int32_type());
  auto r = solver.solve_expr(*call("add", {num(5), num(3)}));
  ASSERT_TRUE(r);
  EXPECT_EQ(r.value(), types.int32_type());
}

TEST_F(SolverFixture, CallArgumentMismatchCarriesPosition)
{
  solver.register_function("add", {types.int32_type(), types.int32_type()}, types.int32_type());
  auto r = solver.solve_expr(*call("add", {num(5), str("x")}));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, TypeErrorKind::TypeMismatch);
  ASSERT_TRUE(r.error().position.has_value());
  EXPECT_EQ(*r.error().position, 1U);
  EXPECT_EQ(r.error().expected, types.int32_type());
  EXPECT_EQ(r.error().found, types.string_type());
}

TEST_F(SolverFixture, CallArityAndUnknownFunction)
{
  solver.register_function("add", {types.int32_type(), types.int32_type()}, types.int32_type());

  auto arity = solver.solve_expr(*call("add", {num(5)}));
  ASSERT_FALSE(arity);
  EXPECT_EQ(arity.error().kind, TypeErrorKind::ArityMismatch);
  EXPECT_EQ(arity.error().expected_arity, 2U);
  EXPECT_EQ(arity.error().found_arity, 1U);

  auto unknown = solver.solve_expr(*call("sub", {num(5), num(3)}));
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error().kind, TypeErrorKind::UnknownFunction);
}

TEST_F(SolverFixture, GenericSignatureIsInstantiatedPerCall)
{
  FunctionSignature identity;
  identity.name = "identity";
  identity.params = {types.get_named_type("T")};
  identity.return_type = types.get_named_type("T");
  identity.generic_params = {"T"};
  solver.register_function(identity);

  auto a = solver.solve_expr(*call("identity", {num(1)}));
  ASSERT_TRUE(a);
  EXPECT_EQ(a.value(), types.int32_type());

  auto b = solver.solve_expr(*call("identity", {boolean(false)}));
  ASSERT_TRUE(b);
  EXPECT_EQ(b.value(), types.bool_type());
}

// ============================================================================
// Let bindings and solutions
// ============================================================================

TEST_F(SolverFixture, LetBindsAnnotationOrInitializerType)
{
  auto inferred = solver.solve_let("n", *num(4), nullptr);
  ASSERT_TRUE(inferred);
  auto annotated = solver.solve_let("flag", *boolean(true), types.bool_type());
  ASSERT_TRUE(annotated);

  const TypeSolution solution = solver.get_solution();
  EXPECT_EQ(solution.lookup("n"), types.int32_type());
  EXPECT_EQ(solution.lookup("flag"), types.bool_type());
  EXPECT_EQ(solution.lookup("other"), nullptr);
  EXPECT_EQ(solution.size(), 2U);
}

TEST_F(SolverFixture, LetAnnotationMismatch)
{
  auto r = solver.solve_let("n", *num(4), types.string_type());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, TypeErrorKind::TypeMismatch);
  EXPECT_FALSE(solver.get_solution().contains("n"));
}

TEST_F(SolverFixture, FailedSolveLeavesSubstitutionUntouched)
{
  const Type * v = types.fresh_variable();
  solver.register_variable("v", v);
  solver.register_function("take", {types.bool_type(), types.bool_type()}, types.unit_type());

  // First argument binds ?v to bool, second argument fails
  auto r = solver.solve_expr(*call("take", {var("v"), num(1)}));
  ASSERT_FALSE(r);
  EXPECT_EQ(solver.apply(v), v);
  EXPECT_EQ(solver.substitution().size(), 0U);
}

TEST_F(SolverFixture, ExpectTypeUnifiesVariables)
{
  const Type * v = types.fresh_variable();
  ASSERT_TRUE(solver.expect_type(types.get_vec_type(types.int32_type()), types.get_vec_type(v)));
  EXPECT_EQ(solver.apply(v), types.int32_type());
}

// ============================================================================
// Substitution
// ============================================================================

TEST(SubstitutionTest, OccursCheckRejectsInfiniteType)
{
  TypeContext types;
  Substitution subst(types);
  const Type * v = types.fresh_variable();

  auto r = subst.unify(v, types.get_vec_type(v));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, TypeErrorKind::CyclicTypeConstraint);
}

TEST(SubstitutionTest, ReferenceMutabilityMustMatch)
{
  TypeContext types;
  Substitution subst(types);
  const Type * shared = types.get_reference_type(types.int32_type(), false);
  const Type * unique = types.get_reference_type(types.int32_type(), true);

  EXPECT_TRUE(subst.unify(shared, shared));
  EXPECT_FALSE(subst.unify(shared, unique));
}

TEST(SubstitutionTest, LifetimesDoNotAffectUnification)
{
  TypeContext types;
  Substitution subst(types);
  EXPECT_TRUE(subst.unify(
    types.get_reference_type(types.string_type(), false, "'a"),
    types.get_reference_type(types.string_type(), false)));
}
