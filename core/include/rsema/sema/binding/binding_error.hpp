// rsema/sema/binding/binding_error.hpp - Where-clause and associated type failures
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace rsema
{

struct Type;

enum class BindingErrorKind : uint8_t {
  AssociatedTypeUnbound,      ///< projection with no explicit binding
  ConflictingAssociatedType,  ///< second binding of one associated type to another type
  TooManyBounds,              ///< generic parameter exceeds the bound limit
};

[[nodiscard]] constexpr std::string_view to_string(BindingErrorKind kind) noexcept
{
  switch (kind) {
    case BindingErrorKind::AssociatedTypeUnbound:
      return "AssociatedTypeUnbound";
    case BindingErrorKind::ConflictingAssociatedType:
      return "ConflictingAssociatedType";
    case BindingErrorKind::TooManyBounds:
      return "TooManyBounds";
  }
  return "";
}

struct BindingError
{
  BindingErrorKind kind = BindingErrorKind::AssociatedTypeUnbound;

  /// Impl id (or `<Self as Trait>`) for associated types, parameter for TooManyBounds
  std::string owner;
  /// Associated type name
  std::string name;

  /// ConflictingAssociatedType
  const Type * existing = nullptr;
  const Type * requested = nullptr;

  /// TooManyBounds
  size_t count = 0;
  size_t limit = 0;

  static BindingError unbound(std::string owner, std::string name)
  {
    BindingError e;
    e.kind = BindingErrorKind::AssociatedTypeUnbound;
    e.owner = std::move(owner);
    e.name = std::move(name);
    return e;
  }

  static BindingError conflicting(
    std::string owner, std::string name, const Type * existing, const Type * requested)
  {
    BindingError e;
    e.kind = BindingErrorKind::ConflictingAssociatedType;
    e.owner = std::move(owner);
    e.name = std::move(name);
    e.existing = existing;
    e.requested = requested;
    return e;
  }

  static BindingError too_many_bounds(std::string param, size_t count, size_t limit)
  {
    BindingError e;
    e.kind = BindingErrorKind::TooManyBounds;
    e.owner = std::move(param);
    e.count = count;
    e.limit = limit;
    return e;
  }
};

}  // namespace rsema
