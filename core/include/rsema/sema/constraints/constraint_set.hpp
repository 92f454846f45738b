// rsema/sema/constraints/constraint_set.hpp - Constraint store and propagator
//
// One ConstraintSet holds the generic constraints of a single item (a free
// function or an impl method). It is built during constraint generation,
// propagated to a fixpoint, and checked for conflicting equalities.
//
#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "rsema/basic/result.hpp"
#include "rsema/sema/constraints/constraint.hpp"
#include "rsema/sema/constraints/constraint_error.hpp"

namespace rsema
{

inline constexpr size_t k_default_max_propagation_steps = 100000;

// ============================================================================
// Equality Analysis
// ============================================================================

/**
 * Result of a successful satisfiability check.
 *
 * `classes` holds every equivalence class with at least two members. Each
 * class lists its members in first-seen order; classes are ordered by their
 * first member's first appearance.
 */
struct EqualityAnalysis
{
  std::vector<std::vector<std::string>> classes;
  size_t cycle_count = 0;

  /// Class containing `name`, or nullptr if it is not equated with anything
  [[nodiscard]] const std::vector<std::string> * class_of(std::string_view name) const;

  [[nodiscard]] bool same_class(std::string_view a, std::string_view b) const;
};

// ============================================================================
// Constraint Set
// ============================================================================

/**
 * Deduplicated, insertion-ordered constraint store with a per-key index.
 *
 * Stored constraints never move, so pointers returned by get_constraints()
 * stay valid until clear(). The index points into the set's own storage, so
 * sets can be moved but not copied; use merge() to combine them.
 *
 * ## Usage
 * ```cpp
 * ConstraintSet set;
 * set.add_constraint(Constraint::type_equality("T", "U"));
 * set.add_constraint(Constraint::trait_bound("T", "Clone"));
 * auto derived = set.propagate_constraints();  // U: Clone
 * auto analysis = set.check_satisfiable();
 * ```
 */
class ConstraintSet
{
public:
  explicit ConstraintSet(size_t max_propagation_steps = k_default_max_propagation_steps)
  : max_propagation_steps_(max_propagation_steps)
  {
  }

  ConstraintSet(const ConstraintSet &) = delete;
  ConstraintSet & operator=(const ConstraintSet &) = delete;
  ConstraintSet(ConstraintSet &&) = default;
  ConstraintSet & operator=(ConstraintSet &&) = default;

  /// Insert unless a structurally equal constraint is already present.
  /// @return true if the constraint was inserted
  bool add_constraint(Constraint c);

  /// Rebuild the key index. Later insertions keep it current.
  void resolve();

  [[nodiscard]] bool is_resolved() const noexcept { return resolved_; }

  /// Indexed constraints mentioning `key`. Empty before resolve().
  [[nodiscard]] std::vector<const Constraint *> get_constraints(std::string_view key) const;

  /// Analyze TypeEquality edges for cycles and conflicting concrete types.
  [[nodiscard]] Result<EqualityAnalysis, ConstraintError> check_satisfiable() const;

  /**
   * Derive trait bounds across equalities until nothing new is added.
   *
   * For TypeEquality(a, b) and TraitBound(a, T), TraitBound(b, T) is added.
   * Resolves the index first if needed.
   *
   * @return number of derived constraints
   */
  Result<size_t, ConstraintError> propagate_constraints();

  /// Union another set into this one.
  void merge(const ConstraintSet & other);

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] const std::deque<Constraint> & constraints() const noexcept { return items_; }
  [[nodiscard]] size_t size() const noexcept { return items_.size(); }
  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

  /// Trait names bound on `type`, sorted
  [[nodiscard]] std::vector<std::string> trait_bounds_of(std::string_view type) const;
  [[nodiscard]] bool has_trait_bound(std::string_view type, std::string_view trait) const;

  [[nodiscard]] size_t max_propagation_steps() const noexcept { return max_propagation_steps_; }
  void set_max_propagation_steps(size_t steps) noexcept { max_propagation_steps_ = steps; }

  void clear();

private:
  void index(const Constraint & c);

  std::deque<Constraint> items_;
  std::unordered_set<Constraint, ConstraintHash> seen_;
  std::map<std::string, std::vector<const Constraint *>, std::less<>> index_;
  bool resolved_ = false;
  size_t max_propagation_steps_;
};

}  // namespace rsema
