// rsema/sema/types/type_utils.hpp - Shared type helpers
//
#pragma once

#include <string>
#include <string_view>

#include "rsema/sema/types/type.hpp"

namespace rsema
{

/**
 * Convert a Type to its surface spelling.
 *
 * Examples: "i32", "Vec<String>", "&'a mut T", "*const u8", "dyn Display",
 * "?3" for an unresolved variable and "{error}" for the error type.
 */
[[nodiscard]] std::string to_string(const Type * type);

/// Primitive spelling of a kind ("i32", "bool", ...). Empty for non-primitives.
[[nodiscard]] std::string_view primitive_name(TypeKind kind) noexcept;

/// Ensure a lifetime name carries its leading apostrophe ("a" -> "'a").
[[nodiscard]] std::string normalize_lifetime_name(std::string_view name);

}  // namespace rsema
