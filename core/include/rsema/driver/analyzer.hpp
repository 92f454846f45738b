// rsema/driver/analyzer.hpp - Analysis driver
//
// Single entry point for the per-item analysis pipeline.
// Used by the CLI and by tests that build HIR in code.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rsema/basic/diagnostic.hpp"
#include "rsema/hir/hir.hpp"
#include "rsema/project/project_config.hpp"
#include "rsema/sema/lifetimes/lifetime_elision.hpp"
#include "rsema/sema/types/type.hpp"
#include "rsema/sema/types/type_solver.hpp"

namespace rsema
{

// ============================================================================
// Analysis Options
// ============================================================================

struct AnalysisOptions
{
  size_t max_propagation_steps = 100000;
  size_t max_closure_iterations = 100000;
  size_t max_bounds_per_param = 16;
  bool reject_ambiguous_elision = true;
  bool warn_unused_lifetimes = true;

  [[nodiscard]] static AnalysisOptions from_config(const AnalysisConfig & config);
};

// ============================================================================
// Analysis Result
// ============================================================================

/**
 * What the pipeline learned about one function or impl method.
 *
 * Fields are filled as far as analysis got; `success` is false if any
 * stage reported an error.
 */
struct ItemReport
{
  /// Qualified name: `name` or `impl_id::name`
  std::string name;
  bool success = false;

  /// Parameters and `let` bindings with the final substitution applied
  TypeSolution solution;
  /// Type of each expression statement, in body order
  std::vector<const Type *> statement_types;
  /// Type of the tail expression, if any
  const Type * tail_type = nullptr;

  /// Generic constraints after propagation, surface form
  std::vector<std::string> constraints;
  size_t derived_constraints = 0;
  size_t equality_cycles = 0;

  /// Outlives edges of the signature and body, as `'a: 'b`
  std::vector<std::string> outlives;
  std::optional<ElisionRule> elision_rule;
};

struct AnalysisResult
{
  /// No errors in any item
  bool success = false;
  std::vector<ItemReport> items;

  /// Report for a qualified item name, or nullptr
  [[nodiscard]] const ItemReport * find(std::string_view name) const;
  [[nodiscard]] size_t failed_count() const;
};

// ============================================================================
// Analyzer
// ============================================================================

/**
 * Runs the analysis pipeline over a program.
 *
 * 1. Bind the associated types of every impl
 * 2. Lower every function signature into a shared signature table
 * 3. For each function and impl method, independently:
 *    a. where clauses and upstream equalities -> ConstraintSet, propagate,
 *       check satisfiability
 *    b. signature lifetimes, elision, upstream outlives facts, lifetime
 *       satisfiability
 *    c. parameters, `let` statements, body expressions, tail vs. return type
 *
 * The first error aborts the current item only; diagnostics of all items
 * accumulate in `diags`.
 */
class Analyzer
{
public:
  [[nodiscard]] static AnalysisResult analyze(
    const Program & program, TypeContext & types, const AnalysisOptions & options,
    DiagnosticBag & diags);
};

}  // namespace rsema
