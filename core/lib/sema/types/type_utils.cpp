// rsema/sema/types/type_utils.cpp - Shared type helpers implementation
//
#include "rsema/sema/types/type_utils.hpp"

#include <fmt/core.h>

namespace rsema
{

std::string_view primitive_name(TypeKind kind) noexcept
{
  switch (kind) {
    case TypeKind::Int8:
      return "i8";
    case TypeKind::Int16:
      return "i16";
    case TypeKind::Int32:
      return "i32";
    case TypeKind::Int64:
      return "i64";
    case TypeKind::UInt8:
      return "u8";
    case TypeKind::UInt16:
      return "u16";
    case TypeKind::UInt32:
      return "u32";
    case TypeKind::UInt64:
      return "u64";
    case TypeKind::Float32:
      return "f32";
    case TypeKind::Float64:
      return "f64";
    case TypeKind::Bool:
      return "bool";
    case TypeKind::Char:
      return "char";
    case TypeKind::String:
      return "String";
    case TypeKind::Unit:
      return "()";
    default:
      return "";
  }
}

std::string to_string(const Type * type)
{
  if (!type) return "<null>";

  if (type->is_primitive()) {
    return std::string(primitive_name(type->kind));
  }

  switch (type->kind) {
    case TypeKind::Vec:
      return fmt::format("Vec<{}>", to_string(type->element_type));
    case TypeKind::Reference: {
      std::string prefix = "&";
      if (!type->lifetime.empty()) {
        prefix += fmt::format("{} ", type->lifetime);
      }
      if (type->is_mutable) {
        prefix += "mut ";
      }
      return prefix + to_string(type->element_type);
    }
    case TypeKind::Pointer:
      return fmt::format(
        "*{} {}", type->is_mutable ? "mut" : "const", to_string(type->element_type));
    case TypeKind::Named:
      return std::string(type->name);
    case TypeKind::TraitObject:
      return fmt::format("dyn {}", type->name);
    case TypeKind::Variable:
      return fmt::format("?{}", type->var_id);
    case TypeKind::Error:
      return "{error}";
    default:
      return "{unknown}";
  }
}

std::string normalize_lifetime_name(std::string_view name)
{
  if (!name.empty() && name.front() == '\'') {
    return std::string(name);
  }
  return fmt::format("'{}", name);
}

}  // namespace rsema
