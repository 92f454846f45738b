// rsema/sema/binding/associated_types.cpp - Explicit associated type bindings
//
#include "rsema/sema/binding/associated_types.hpp"

#include <fmt/core.h>

namespace rsema
{

Result<void, BindingError> AssociatedTypeResolver::bind(
  std::string_view impl_id, std::string_view name, const Type * type)
{
  Key key{std::string(impl_id), std::string(name)};
  auto [it, inserted] = bindings_.emplace(std::move(key), type);
  if (!inserted && it->second != type) {
    return Result<void, BindingError>::fail(
      BindingError::conflicting(std::string(impl_id), std::string(name), it->second, type));
  }
  return Result<void, BindingError>::ok();
}

Result<const Type *, BindingError> AssociatedTypeResolver::resolve(
  std::string_view impl_id, std::string_view name) const
{
  auto it = bindings_.find(Key{std::string(impl_id), std::string(name)});
  if (it == bindings_.end()) {
    return Result<const Type *, BindingError>::fail(
      BindingError::unbound(std::string(impl_id), std::string(name)));
  }
  return Result<const Type *, BindingError>::ok(it->second);
}

void AssociatedTypeResolver::register_impl(
  std::string_view impl_id, std::string_view trait, std::string_view self_type)
{
  impls_.insert_or_assign(Key{std::string(trait), std::string(self_type)}, std::string(impl_id));
}

Result<const Type *, BindingError> AssociatedTypeResolver::resolve_projection(
  std::string_view trait, std::string_view self_type, std::string_view name) const
{
  auto it = impls_.find(Key{std::string(trait), std::string(self_type)});
  if (it == impls_.end()) {
    return Result<const Type *, BindingError>::fail(
      BindingError::unbound(fmt::format("<{} as {}>", self_type, trait), std::string(name)));
  }
  return resolve(it->second, name);
}

bool AssociatedTypeResolver::contains(std::string_view impl_id, std::string_view name) const
{
  return bindings_.count(Key{std::string(impl_id), std::string(name)}) != 0;
}

void AssociatedTypeResolver::clear()
{
  bindings_.clear();
  impls_.clear();
}

}  // namespace rsema
