// rsema/sema/lifetimes/lifetime_context.cpp - Lifetime registry and outlives edges
//
#include "rsema/sema/lifetimes/lifetime_context.hpp"

namespace rsema
{

// ============================================================================
// LifetimeContext
// ============================================================================

Lifetime LifetimeContext::fresh_lifetime()
{
  Lifetime lt = Lifetime::inferred(next_id_++);
  registered_.push_back(lt);
  return lt;
}

Lifetime LifetimeContext::register_named_lifetime(std::string_view name)
{
  if (is_static_lifetime_name(name)) {
    return Lifetime::static_lifetime();
  }

  const std::string_view bare = bare_lifetime_name(name);
  if (auto it = named_.find(bare); it != named_.end()) {
    return it->second;
  }

  Lifetime lt = Lifetime::named(bare);
  named_.emplace(std::string(bare), lt);
  registered_.push_back(lt);
  return lt;
}

std::optional<Lifetime> LifetimeContext::lookup_named(std::string_view name) const
{
  if (is_static_lifetime_name(name)) {
    return Lifetime::static_lifetime();
  }
  auto it = named_.find(bare_lifetime_name(name));
  if (it == named_.end()) return std::nullopt;
  return it->second;
}

bool LifetimeContext::is_registered(const Lifetime & lt) const
{
  switch (lt.kind) {
    case LifetimeKind::Static:
      return true;
    case LifetimeKind::Named:
      return named_.find(lt.name) != named_.end();
    case LifetimeKind::Inferred:
      for (const auto & r : registered_) {
        if (r == lt) return true;
      }
      return false;
  }
  return false;
}

Result<void, LifetimeError> LifetimeContext::add_outlives_constraint(
  const Lifetime & longer, const Lifetime & shorter, std::string reason)
{
  for (const Lifetime * side : {&longer, &shorter}) {
    if (!is_registered(*side)) {
      const std::string bare =
        side->is_named() ? side->name : std::string(bare_lifetime_name(side->display()));
      return Result<void, LifetimeError>::fail(LifetimeError::unregistered(bare));
    }
  }

  auto key = std::make_pair(longer.key(), shorter.key());
  if (!edge_keys_.insert(std::move(key)).second) {
    return Result<void, LifetimeError>::ok();
  }
  constraints_.push_back(OutlivesConstraint{longer, shorter, std::move(reason)});
  return Result<void, LifetimeError>::ok();
}

Result<void, LifetimeError> LifetimeContext::add_outlives_constraint(
  std::string_view longer, std::string_view shorter, std::string reason)
{
  return add_outlives_constraint(Lifetime::named(longer), Lifetime::named(shorter), std::move(reason));
}

void LifetimeContext::clear()
{
  named_.clear();
  registered_.clear();
  edge_keys_.clear();
  constraints_.clear();
}

}  // namespace rsema
