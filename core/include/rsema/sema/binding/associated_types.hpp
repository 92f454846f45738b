// rsema/sema/binding/associated_types.hpp - Explicit associated type bindings
//
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>

#include "rsema/basic/result.hpp"
#include "rsema/sema/binding/binding_error.hpp"
#include "rsema/sema/types/type.hpp"

namespace rsema
{

/**
 * Maps (impl id, associated type name) to the concrete type the impl binds.
 *
 * Only explicit `type Item = T;` bindings are known; nothing is inferred.
 *
 * ## Usage
 * ```cpp
 * AssociatedTypeResolver assoc;
 * assoc.register_impl("vec_iter", "Iterator", "VecIter");
 * assoc.bind("vec_iter", "Item", types.int32_type());
 * auto item = assoc.resolve_projection("Iterator", "VecIter", "Item");  // i32
 * ```
 */
class AssociatedTypeResolver
{
public:
  /// Bind an associated type. Rebinding to the same type is a no-op.
  Result<void, BindingError> bind(std::string_view impl_id, std::string_view name, const Type * type);

  /// Direct lookup. Unbound names fail with AssociatedTypeUnbound.
  [[nodiscard]] Result<const Type *, BindingError> resolve(
    std::string_view impl_id, std::string_view name) const;

  /// Record that `impl_id` implements `trait` for `self_type` (surface spelling).
  void register_impl(std::string_view impl_id, std::string_view trait, std::string_view self_type);

  /// Resolve `<self_type as trait>::name` through the registered impl.
  [[nodiscard]] Result<const Type *, BindingError> resolve_projection(
    std::string_view trait, std::string_view self_type, std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view impl_id, std::string_view name) const;
  [[nodiscard]] size_t size() const noexcept { return bindings_.size(); }
  [[nodiscard]] bool empty() const noexcept { return bindings_.empty(); }

  void clear();

private:
  using Key = std::pair<std::string, std::string>;

  std::map<Key, const Type *> bindings_;
  std::map<Key, std::string> impls_;  ///< (trait, self type) -> impl id
};

}  // namespace rsema
