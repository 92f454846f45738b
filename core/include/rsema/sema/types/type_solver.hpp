// rsema/sema/types/type_solver.hpp - Expression type constraint solver
//
// Solves the types of HIR expressions against registered variable and
// function signatures by unification.
//
#pragma once

#include <gsl/span>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rsema/basic/result.hpp"
#include "rsema/hir/hir.hpp"
#include "rsema/sema/types/substitution.hpp"
#include "rsema/sema/types/type.hpp"
#include "rsema/sema/types/type_error.hpp"

namespace rsema
{

// ============================================================================
// Function Signature
// ============================================================================

/**
 * Callable signature as seen by call sites.
 *
 * Named types listed in `generic_params`, and any type variables, are
 * replaced by fresh variables at every call, so one generic signature can be
 * used at several types.
 */
struct FunctionSignature
{
  std::string name;
  std::vector<const Type *> params;
  const Type * return_type = nullptr;
  std::vector<std::string> generic_params;
};

// ============================================================================
// Type Solution
// ============================================================================

/**
 * Immutable name -> type snapshot produced by a successful solve.
 *
 * Iteration is ordered by name.
 */
class TypeSolution
{
public:
  TypeSolution() = default;
  explicit TypeSolution(std::map<std::string, const Type *, std::less<>> bindings)
  : bindings_(std::move(bindings))
  {
  }

  /// Type bound to `name`, or nullptr if the name is not part of the solution
  [[nodiscard]] const Type * lookup(std::string_view name) const
  {
    auto it = bindings_.find(name);
    return it == bindings_.end() ? nullptr : it->second;
  }

  [[nodiscard]] bool contains(std::string_view name) const
  {
    return bindings_.find(name) != bindings_.end();
  }

  [[nodiscard]] size_t size() const noexcept { return bindings_.size(); }
  [[nodiscard]] bool empty() const noexcept { return bindings_.empty(); }

  [[nodiscard]] auto begin() const { return bindings_.begin(); }
  [[nodiscard]] auto end() const { return bindings_.end(); }

private:
  std::map<std::string, const Type *, std::less<>> bindings_;
};

// ============================================================================
// Type Constraint Solver
// ============================================================================

/**
 * Bottom-up expression typing with unification.
 *
 * Typing rules:
 * - integer literal: i32; float literal: f64; bool: bool; string: String
 * - arithmetic (+ - * / %): operands unify, must be numeric, result is the operand type
 * - comparison (== != < <= > >=): operands unify, result is bool
 * - logical (&& ||): operands must be bool, result is bool
 * - bitwise and shifts: operands unify, must be integers, result is the operand type
 * - calls: arity check, then each argument unifies with its parameter
 *
 * Variables are bound to their declared types. There is no let-generalization;
 * type variables only appear through generic signatures, dereferences of
 * unknown pointees, and unannotated lets.
 *
 * A failing solve leaves the solver exactly as it was before the call.
 *
 * ## Usage
 * ```cpp
 * TypeConstraintSolver solver(types);
 * solver.register_variable("x", types.int32_type());
 * auto r = solver.solve_expr(*expr);  // Result<const Type *, TypeError>
 * ```
 */
class TypeConstraintSolver
{
public:
  explicit TypeConstraintSolver(TypeContext & types);

  // ===========================================================================
  // Registration
  // ===========================================================================

  /// Register or rebind a variable. Later registrations shadow earlier ones.
  void register_variable(std::string_view name, const Type * type);

  void register_function(FunctionSignature signature);

  void register_function(
    std::string_view name, std::vector<const Type *> params, const Type * return_type);

  [[nodiscard]] const FunctionSignature * lookup_function(std::string_view name) const;
  [[nodiscard]] const Type * lookup_variable(std::string_view name) const;

  // ===========================================================================
  // Solving
  // ===========================================================================

  /// Infer the type of one expression.
  Result<const Type *, TypeError> solve_expr(const Expr & expr);

  /// Solve expressions in order, stopping at the first error.
  Result<std::vector<const Type *>, TypeError> solve_exprs(gsl::span<const Expr * const> exprs);

  /**
   * Type a `let` binding and register the bound name.
   *
   * @param annotation Declared type, or nullptr to take the initializer's type
   * @return the type the name is bound to
   */
  Result<const Type *, TypeError> solve_let(
    std::string_view name, const Expr & init, const Type * annotation);

  /// Require `found` to unify with `expected` (e.g. a body against its return type).
  Result<void, TypeError> expect_type(const Type * expected, const Type * found);

  // ===========================================================================
  // Results
  // ===========================================================================

  /// Current variable bindings with the substitution applied.
  [[nodiscard]] TypeSolution get_solution() const;

  /// Apply the current substitution to a type.
  [[nodiscard]] const Type * apply(const Type * type) const { return subst_.apply(type); }

  [[nodiscard]] const Substitution & substitution() const noexcept { return subst_; }

  /// Forget all registrations and bindings.
  void reset();

private:
  Result<const Type *, TypeError> infer(const Expr & expr);
  Result<const Type *, TypeError> infer_binary(const BinaryExpr & expr);
  Result<const Type *, TypeError> infer_unary(const UnaryExpr & expr);
  Result<const Type *, TypeError> infer_call(const CallExpr & expr);

  /// Replace generic parameters and variables of a signature with fresh variables.
  FunctionSignature instantiate(const FunctionSignature & sig);
  const Type * instantiate_type(
    const Type * type, const FunctionSignature & sig,
    std::unordered_map<const Type *, const Type *> & fresh);

  TypeContext & types_;
  Substitution subst_;
  std::map<std::string, const Type *, std::less<>> variables_;
  std::map<std::string, FunctionSignature, std::less<>> functions_;
};

}  // namespace rsema
