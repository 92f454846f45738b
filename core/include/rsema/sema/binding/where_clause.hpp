// rsema/sema/binding/where_clause.hpp - Where clause lowering
//
// Turns `where` clauses into generic constraints and outlives edges:
//
//   where T: Clone + Sized + 'a      TraitBound(T, Clone), SizedBound(T), LifetimeBound(T, 'a)
//   where I: Iterator<Item = u8>     TraitBound(I, Iterator), TypeEquality(<I as Iterator>::Item, u8)
//   where 'a: 'b                     outlives edge 'a: 'b (reason "where clause")
//
#pragma once

#include <gsl/span>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <variant>

#include "rsema/basic/result.hpp"
#include "rsema/hir/hir.hpp"
#include "rsema/sema/binding/binding_error.hpp"
#include "rsema/sema/constraints/constraint_set.hpp"
#include "rsema/sema/lifetimes/lifetime_context.hpp"
#include "rsema/sema/lifetimes/lifetime_error.hpp"
#include "rsema/sema/types/type_lowering.hpp"

namespace rsema
{

inline constexpr size_t k_default_max_bounds_per_param = 16;
inline constexpr const char * k_where_clause_reason = "where clause";

/// Where clauses fail either on their bounds or on the lifetimes they name.
using WhereClauseError = std::variant<BindingError, LifetimeError>;

/// Spelling of an associated type projection: `<T as Trait>::Name`.
[[nodiscard]] std::string projection_name(
  std::string_view self_type, std::string_view trait, std::string_view name);

class WhereClauseLowering
{
public:
  WhereClauseLowering(
    ConstraintSet & constraints, LifetimeContext & lifetimes, const TypeLowering & lowering,
    size_t max_bounds_per_param = k_default_max_bounds_per_param);

  /// Lower one clause. Bounds are counted per parameter across calls.
  Result<void, WhereClauseError> lower(const WhereClause & clause);

  Result<void, WhereClauseError> lower_all(gsl::span<WhereClause * const> clauses);

private:
  Result<void, WhereClauseError> lower_trait_bound(
    std::string_view param, const WhereBound & bound);

  ConstraintSet & constraints_;
  LifetimeContext & lifetimes_;
  const TypeLowering & lowering_;
  size_t max_bounds_;
  std::map<std::string, size_t, std::less<>> bound_counts_;
};

}  // namespace rsema
