// rsema/sema/binding/where_clause.cpp - Where clause lowering
//
#include "rsema/sema/binding/where_clause.hpp"

#include <fmt/core.h>

#include <cassert>
#include <utility>

#include "rsema/sema/types/type_utils.hpp"

namespace rsema
{

namespace
{

using VoidResult = Result<void, WhereClauseError>;

}  // namespace

std::string projection_name(
  std::string_view self_type, std::string_view trait, std::string_view name)
{
  return fmt::format("<{} as {}>::{}", self_type, trait, name);
}

WhereClauseLowering::WhereClauseLowering(
  ConstraintSet & constraints, LifetimeContext & lifetimes, const TypeLowering & lowering,
  size_t max_bounds_per_param)
: constraints_(constraints),
  lifetimes_(lifetimes),
  lowering_(lowering),
  max_bounds_(max_bounds_per_param)
{
}

Result<void, WhereClauseError> WhereClauseLowering::lower(const WhereClause & clause)
{
  auto it = bound_counts_.find(clause.param);
  if (it == bound_counts_.end()) {
    it = bound_counts_.emplace(std::string(clause.param), 0).first;
  }
  it->second += clause.bounds.size();
  if (it->second > max_bounds_) {
    return VoidResult::fail(
      BindingError::too_many_bounds(std::string(clause.param), it->second, max_bounds_));
  }

  if (clause.is_lifetime_param) {
    for (const WhereBound * bound : clause.bounds) {
      assert(bound->bound_kind == BoundKind::Lifetime && "trait bound on a lifetime parameter");
      auto r = lifetimes_.add_outlives_constraint(clause.param, bound->name, k_where_clause_reason);
      if (!r) return VoidResult::fail(std::move(r).error());
    }
    return VoidResult::ok();
  }

  const std::string param(clause.param);
  for (const WhereBound * bound : clause.bounds) {
    if (bound->bound_kind == BoundKind::Lifetime) {
      if (!lifetimes_.lookup_named(bound->name)) {
        return VoidResult::fail(LifetimeError::unregistered(bare_lifetime_name(bound->name)));
      }
      constraints_.add_constraint(Constraint::lifetime_bound(param, bound->name));
      continue;
    }
    if (auto r = lower_trait_bound(param, *bound); !r) return r;
  }
  return VoidResult::ok();
}

Result<void, WhereClauseError> WhereClauseLowering::lower_trait_bound(
  std::string_view param, const WhereBound & bound)
{
  if (bound.name == "Sized") {
    constraints_.add_constraint(Constraint::sized_bound(std::string(param)));
    return VoidResult::ok();
  }

  constraints_.add_constraint(Constraint::trait_bound(std::string(param), std::string(bound.name)));

  for (const AssocEquality & eq : bound.assoc_equalities) {
    auto rhs = lowering_.lower(eq.type);
    if (!rhs) return VoidResult::fail(std::move(rhs).error());
    constraints_.add_constraint(Constraint::type_equality(
      projection_name(param, bound.name, eq.name), to_string(rhs.value())));
  }
  return VoidResult::ok();
}

Result<void, WhereClauseError> WhereClauseLowering::lower_all(gsl::span<WhereClause * const> clauses)
{
  for (const WhereClause * clause : clauses) {
    if (auto r = lower(*clause); !r) return r;
  }
  return VoidResult::ok();
}

}  // namespace rsema
