// rsema/sema/types/type.hpp - Semantic type representation
//
// Resolved types shared by the type solver, the constraint store and the
// lifetime passes. Types are interned: two types are structurally equal
// exactly when their pointers are equal.
//
#pragma once

#include <cstdint>
#include <deque>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace rsema
{

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  // Primitive types
  Int8,
  Int16,
  Int32,
  Int64,
  UInt8,
  UInt16,
  UInt32,
  UInt64,
  Float32,
  Float64,
  Bool,
  Char,
  String,
  Unit,

  // Composite types
  Vec,        ///< Vec<T>
  Reference,  ///< &'a T / &'a mut T
  Pointer,    ///< *const T / *mut T

  // Nominal types
  Named,        ///< user type or generic parameter
  TraitObject,  ///< dyn Trait

  // Inference
  Variable,  ///< ?N - unification variable

  // Error
  Error,
};

// ============================================================================
// Type
// ============================================================================

/**
 * Semantic type.
 *
 * Unlike HIR TypeNode (syntax), Type is the resolved form. Instances are
 * created and owned by TypeContext and never mutated.
 */
struct Type
{
  TypeKind kind;

  /// Vec element, reference / pointer pointee
  const Type * element_type = nullptr;

  /// Named / TraitObject name
  std::string_view name;

  /// Reference lifetime in display form ("'a", "'static"), empty when elided
  std::string_view lifetime;

  /// Reference / Pointer mutability
  bool is_mutable = false;

  /// Variable id
  uint32_t var_id = 0;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_signed_integer() const noexcept
  {
    return kind == TypeKind::Int8 || kind == TypeKind::Int16 || kind == TypeKind::Int32 ||
           kind == TypeKind::Int64;
  }

  [[nodiscard]] bool is_unsigned_integer() const noexcept
  {
    return kind == TypeKind::UInt8 || kind == TypeKind::UInt16 || kind == TypeKind::UInt32 ||
           kind == TypeKind::UInt64;
  }

  [[nodiscard]] bool is_integer() const noexcept
  {
    return is_signed_integer() || is_unsigned_integer();
  }

  [[nodiscard]] bool is_float() const noexcept
  {
    return kind == TypeKind::Float32 || kind == TypeKind::Float64;
  }

  [[nodiscard]] bool is_numeric() const noexcept { return is_integer() || is_float(); }

  [[nodiscard]] bool is_primitive() const noexcept { return kind <= TypeKind::Unit; }

  [[nodiscard]] bool is_reference() const noexcept { return kind == TypeKind::Reference; }
  [[nodiscard]] bool is_pointer() const noexcept { return kind == TypeKind::Pointer; }
  [[nodiscard]] bool is_variable() const noexcept { return kind == TypeKind::Variable; }
  [[nodiscard]] bool is_error() const noexcept { return kind == TypeKind::Error; }

  /// True if a type variable occurs anywhere inside this type
  [[nodiscard]] bool has_variables() const noexcept
  {
    if (kind == TypeKind::Variable) return true;
    return element_type != nullptr && element_type->has_variables();
  }
};

// ============================================================================
// Primitive names
// ============================================================================

/// Map a primitive spelling ("i32", "bool", "String", ...) to its kind.
[[nodiscard]] std::optional<TypeKind> lookup_primitive_kind(std::string_view name) noexcept;

/// True if `name` spells a primitive type.
[[nodiscard]] inline bool is_primitive_type_name(std::string_view name) noexcept
{
  return lookup_primitive_kind(name).has_value();
}

// ============================================================================
// Type Context
// ============================================================================

/**
 * Interns semantic types.
 *
 * Primitive types are singletons; composite and nominal types are created on
 * demand and deduplicated, so pointer comparison is structural comparison.
 * Type variables are numbered from 0 in creation order.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Built-in Types (Singletons)
  // ===========================================================================

  [[nodiscard]] const Type * int8_type() const noexcept { return &int8_; }
  [[nodiscard]] const Type * int16_type() const noexcept { return &int16_; }
  [[nodiscard]] const Type * int32_type() const noexcept { return &int32_; }
  [[nodiscard]] const Type * int64_type() const noexcept { return &int64_; }
  [[nodiscard]] const Type * uint8_type() const noexcept { return &uint8_; }
  [[nodiscard]] const Type * uint16_type() const noexcept { return &uint16_; }
  [[nodiscard]] const Type * uint32_type() const noexcept { return &uint32_; }
  [[nodiscard]] const Type * uint64_type() const noexcept { return &uint64_; }
  [[nodiscard]] const Type * float32_type() const noexcept { return &float32_; }
  [[nodiscard]] const Type * float64_type() const noexcept { return &float64_; }
  [[nodiscard]] const Type * bool_type() const noexcept { return &bool_; }
  [[nodiscard]] const Type * char_type() const noexcept { return &char_; }
  [[nodiscard]] const Type * string_type() const noexcept { return &string_; }
  [[nodiscard]] const Type * unit_type() const noexcept { return &unit_; }
  [[nodiscard]] const Type * error_type() const noexcept { return &error_; }

  /// Singleton for a primitive kind. `kind` must satisfy Type::is_primitive().
  [[nodiscard]] const Type * primitive(TypeKind kind) const noexcept;

  // ===========================================================================
  // Composite Type Creation (Interned)
  // ===========================================================================

  const Type * get_vec_type(const Type * element_type);

  /// `lifetime` is a display name ("'a") or empty for an elided lifetime
  const Type * get_reference_type(
    const Type * pointee, bool is_mutable, std::string_view lifetime = {});

  const Type * get_pointer_type(const Type * pointee, bool is_mutable);

  const Type * get_named_type(std::string_view name);

  const Type * get_trait_object_type(std::string_view trait_name);

  // ===========================================================================
  // Type Variables
  // ===========================================================================

  /// Create a new unification variable.
  const Type * fresh_variable();

  /// Variable by id, or nullptr if no such variable was created.
  [[nodiscard]] const Type * variable(uint32_t id) const noexcept;

  [[nodiscard]] uint32_t variable_count() const noexcept
  {
    return static_cast<uint32_t>(variables_.size());
  }

  // ===========================================================================
  // Type Lookup by Name
  // ===========================================================================

  /// Look up a primitive type by spelling ("i32", "f64", "bool", "()")
  /// Returns nullptr if the name is not a primitive.
  [[nodiscard]] const Type * lookup_builtin(std::string_view name) const noexcept;

private:
  std::string_view intern(std::string_view s);
  const Type * intern_type(const Type & candidate);

  Type int8_{TypeKind::Int8}, int16_{TypeKind::Int16}, int32_{TypeKind::Int32},
    int64_{TypeKind::Int64};
  Type uint8_{TypeKind::UInt8}, uint16_{TypeKind::UInt16}, uint32_{TypeKind::UInt32},
    uint64_{TypeKind::UInt64};
  Type float32_{TypeKind::Float32}, float64_{TypeKind::Float64};
  Type bool_{TypeKind::Bool}, char_{TypeKind::Char}, string_{TypeKind::String},
    unit_{TypeKind::Unit};
  Type error_{TypeKind::Error};

  // Arena for composite types and names
  std::pmr::monotonic_buffer_resource arena_{4096};
  // Pointers to interned types are handed out widely, so the containers
  // must keep element addresses stable.
  std::pmr::deque<Type> composite_types_{&arena_};
  std::pmr::deque<Type> variables_{&arena_};
  std::pmr::unordered_set<std::string_view> names_{&arena_};
};

}  // namespace rsema
