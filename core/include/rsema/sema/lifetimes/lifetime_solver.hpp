// rsema/sema/lifetimes/lifetime_solver.hpp - Outlives closure and cycle detection
//
#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rsema/basic/name_interner.hpp"
#include "rsema/basic/result.hpp"
#include "rsema/sema/lifetimes/lifetime_context.hpp"
#include "rsema/sema/lifetimes/lifetime_error.hpp"

namespace rsema
{

inline constexpr size_t k_default_max_closure_iterations = 100000;

/// A lifetime that outlives itself through a chain of other lifetimes.
struct LifetimeViolation
{
  std::string lifetime;              ///< display name, e.g. "'a"
  std::vector<std::string> path;     ///< 'a -> ... -> 'a
  std::vector<std::string> reasons;  ///< one per edge of `path`
};

/**
 * Solver over a snapshot of one LifetimeContext.
 *
 * The outlives closure contains the direct edges plus `'static: x` for every
 * registered lifetime. Edges out of 'static never form cycles, and a
 * reflexive edge `'a: 'a` is trivially satisfied; any other chain leading a
 * lifetime back to itself is a violation.
 *
 * Lifetime names in queries may be given with or without the apostrophe.
 */
class LifetimeSolver
{
public:
  explicit LifetimeSolver(
    const LifetimeContext & ctx, size_t max_closure_iterations = k_default_max_closure_iterations);

  /// First violation as CyclicLifetime, in registration order.
  Result<void, LifetimeError> is_satisfiable();

  /// Every violation, in registration order.
  Result<std::vector<LifetimeViolation>, LifetimeError> violations();

  /// Display names of every lifetime `name` transitively outlives.
  Result<std::set<std::string>, LifetimeError> get_outlives(std::string_view name);

  /// Display names of every other lifetime that transitively outlives `name`.
  Result<std::set<std::string>, LifetimeError> get_outlived_by(std::string_view name);

private:
  /// Compute both closures once. Idempotent.
  Result<void, LifetimeError> solve();

  /// Reachability fixpoint over `adjacency`, bounded by the iteration cap.
  Result<std::vector<std::vector<bool>>, LifetimeError> close(
    const std::vector<std::vector<NameId>> & adjacency) const;

  /// Shortest cycle from `start` back to itself over the cycle graph.
  LifetimeViolation cycle_through(NameId start) const;

  /// Graph node of a lifetime, keyed on its identity
  NameId node(const Lifetime & lt);

  [[nodiscard]] std::string display_key(std::string_view name) const;

  size_t max_iterations_;
  NameInterner names_;                ///< Lifetime::key() -> node
  std::vector<std::string> displays_;  ///< node -> display name
  NameId static_id_ = 0;

  std::vector<std::vector<NameId>> edges_;   ///< direct edges, self-edges dropped
  std::map<std::pair<NameId, NameId>, std::string> reasons_;

  bool solved_ = false;
  std::vector<std::vector<bool>> closure_;   ///< with 'static: every lifetime
  std::vector<std::vector<bool>> cyclic_;    ///< without edges out of 'static
};

}  // namespace rsema
