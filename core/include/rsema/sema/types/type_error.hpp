// rsema/sema/types/type_error.hpp - Structured type-solving errors
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rsema
{

struct Type;

enum class TypeErrorKind : uint8_t {
  UnboundVariable,       ///< variable referenced but never registered
  UnknownFunction,       ///< call of an unregistered function
  ArityMismatch,         ///< wrong number of call arguments
  TypeMismatch,          ///< two types failed to unify
  InvalidOperand,        ///< operator applied to an operand of the wrong category
  CyclicTypeConstraint,  ///< occurs check failure (?T := Vec<?T>)
};

[[nodiscard]] constexpr std::string_view to_string(TypeErrorKind kind) noexcept
{
  switch (kind) {
    case TypeErrorKind::UnboundVariable:
      return "UnboundVariable";
    case TypeErrorKind::UnknownFunction:
      return "UnknownFunction";
    case TypeErrorKind::ArityMismatch:
      return "ArityMismatch";
    case TypeErrorKind::TypeMismatch:
      return "TypeMismatch";
    case TypeErrorKind::InvalidOperand:
      return "InvalidOperand";
    case TypeErrorKind::CyclicTypeConstraint:
      return "CyclicTypeConstraint";
  }
  return "";
}

/**
 * A type-solving failure.
 *
 * Only the fields relevant to `kind` are populated. Type pointers refer to
 * the TypeContext the solver was built with.
 */
struct TypeError
{
  TypeErrorKind kind = TypeErrorKind::TypeMismatch;

  /// Variable, function or operator spelling the error is about
  std::string name;

  /// TypeMismatch / InvalidOperand / CyclicTypeConstraint
  const Type * expected = nullptr;
  const Type * found = nullptr;

  /// TypeMismatch on a call argument: zero-based argument index
  std::optional<size_t> position;

  /// ArityMismatch
  size_t expected_arity = 0;
  size_t found_arity = 0;

  static TypeError unbound_variable(std::string var)
  {
    TypeError e;
    e.kind = TypeErrorKind::UnboundVariable;
    e.name = std::move(var);
    return e;
  }

  static TypeError unknown_function(std::string fn)
  {
    TypeError e;
    e.kind = TypeErrorKind::UnknownFunction;
    e.name = std::move(fn);
    return e;
  }

  static TypeError arity_mismatch(std::string fn, size_t expected, size_t found)
  {
    TypeError e;
    e.kind = TypeErrorKind::ArityMismatch;
    e.name = std::move(fn);
    e.expected_arity = expected;
    e.found_arity = found;
    return e;
  }

  static TypeError mismatch(const Type * expected, const Type * found)
  {
    TypeError e;
    e.kind = TypeErrorKind::TypeMismatch;
    e.expected = expected;
    e.found = found;
    return e;
  }

  static TypeError invalid_operand(std::string op, const Type * found)
  {
    TypeError e;
    e.kind = TypeErrorKind::InvalidOperand;
    e.name = std::move(op);
    e.found = found;
    return e;
  }

  /// `var` would have to contain itself through `within`
  static TypeError cyclic(const Type * var, const Type * within)
  {
    TypeError e;
    e.kind = TypeErrorKind::CyclicTypeConstraint;
    e.expected = var;
    e.found = within;
    return e;
  }
};

}  // namespace rsema
