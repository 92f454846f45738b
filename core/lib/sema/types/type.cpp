// rsema/sema/types/type.cpp - Type context implementation
//
#include "rsema/sema/types/type.hpp"

#include <cstring>

namespace rsema
{

namespace
{

struct PrimitiveSpelling
{
  std::string_view name;
  TypeKind kind;
};

constexpr PrimitiveSpelling k_primitive_spellings[] = {
  {"i8", TypeKind::Int8},
  {"i16", TypeKind::Int16},
  {"i32", TypeKind::Int32},
  {"i64", TypeKind::Int64},
  {"isize", TypeKind::Int64},
  {"u8", TypeKind::UInt8},
  {"u16", TypeKind::UInt16},
  {"u32", TypeKind::UInt32},
  {"u64", TypeKind::UInt64},
  {"usize", TypeKind::UInt64},
  {"f32", TypeKind::Float32},
  {"f64", TypeKind::Float64},
  {"bool", TypeKind::Bool},
  {"char", TypeKind::Char},
  {"String", TypeKind::String},
  {"str", TypeKind::String},
  {"()", TypeKind::Unit},
};

[[nodiscard]] bool same_structure(const Type & a, const Type & b) noexcept
{
  return a.kind == b.kind && a.element_type == b.element_type && a.name == b.name &&
         a.lifetime == b.lifetime && a.is_mutable == b.is_mutable;
}

}  // namespace

std::optional<TypeKind> lookup_primitive_kind(std::string_view name) noexcept
{
  for (const auto & p : k_primitive_spellings) {
    if (p.name == name) return p.kind;
  }
  return std::nullopt;
}

// ============================================================================
// TypeContext Implementation
// ============================================================================

TypeContext::TypeContext() = default;

const Type * TypeContext::primitive(TypeKind kind) const noexcept
{
  switch (kind) {
    case TypeKind::Int8:
      return &int8_;
    case TypeKind::Int16:
      return &int16_;
    case TypeKind::Int32:
      return &int32_;
    case TypeKind::Int64:
      return &int64_;
    case TypeKind::UInt8:
      return &uint8_;
    case TypeKind::UInt16:
      return &uint16_;
    case TypeKind::UInt32:
      return &uint32_;
    case TypeKind::UInt64:
      return &uint64_;
    case TypeKind::Float32:
      return &float32_;
    case TypeKind::Float64:
      return &float64_;
    case TypeKind::Bool:
      return &bool_;
    case TypeKind::Char:
      return &char_;
    case TypeKind::String:
      return &string_;
    case TypeKind::Unit:
      return &unit_;
    default:
      return &error_;
  }
}

std::string_view TypeContext::intern(std::string_view s)
{
  if (s.empty()) return {};
  if (auto it = names_.find(s); it != names_.end()) {
    return *it;
  }
  char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
  std::memcpy(ptr, s.data(), s.size());
  const std::string_view stored(ptr, s.size());
  names_.insert(stored);
  return stored;
}

const Type * TypeContext::intern_type(const Type & candidate)
{
  for (const auto & t : composite_types_) {
    if (same_structure(t, candidate)) {
      return &t;
    }
  }
  composite_types_.push_back(candidate);
  return &composite_types_.back();
}

const Type * TypeContext::get_vec_type(const Type * element_type)
{
  Type t{TypeKind::Vec};
  t.element_type = element_type;
  return intern_type(t);
}

const Type * TypeContext::get_reference_type(
  const Type * pointee, bool is_mutable, std::string_view lifetime)
{
  Type t{TypeKind::Reference};
  t.element_type = pointee;
  t.is_mutable = is_mutable;
  t.lifetime = intern(lifetime);
  return intern_type(t);
}

const Type * TypeContext::get_pointer_type(const Type * pointee, bool is_mutable)
{
  Type t{TypeKind::Pointer};
  t.element_type = pointee;
  t.is_mutable = is_mutable;
  return intern_type(t);
}

const Type * TypeContext::get_named_type(std::string_view name)
{
  Type t{TypeKind::Named};
  t.name = intern(name);
  return intern_type(t);
}

const Type * TypeContext::get_trait_object_type(std::string_view trait_name)
{
  Type t{TypeKind::TraitObject};
  t.name = intern(trait_name);
  return intern_type(t);
}

const Type * TypeContext::fresh_variable()
{
  Type t{TypeKind::Variable};
  t.var_id = static_cast<uint32_t>(variables_.size());
  variables_.push_back(t);
  return &variables_.back();
}

const Type * TypeContext::variable(uint32_t id) const noexcept
{
  if (id >= variables_.size()) return nullptr;
  return &variables_[id];
}

const Type * TypeContext::lookup_builtin(std::string_view name) const noexcept
{
  if (auto kind = lookup_primitive_kind(name)) {
    return primitive(*kind);
  }
  return nullptr;
}

}  // namespace rsema
