// rsema/hir/hir_enums.hpp - HIR enumeration definitions
//
// Node kinds and operators of the lowered HIR consumed by the
// semantic core.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace rsema
{

// ============================================================================
// NodeKind - Identifies all HIR node types
// ============================================================================

/**
 * Node kind enumeration for classof-based RTTI.
 * Kinds are grouped by category so that category checks are range checks.
 */
enum class NodeKind : uint8_t {
  // === Expressions ===
  IntLiteral,
  FloatLiteral,
  BoolLiteral,
  StringLiteral,
  VarRef,
  Binary,
  Unary,
  Call,

  // === Types ===
  NamedType,
  VecType,
  RefType,
  PtrType,
  DynType,
  AssocType,

  // === Statements ===
  Let,
  ExprStatement,

  // === Items ===
  Fn,
  Impl,

  // === Supporting nodes ===
  Param,
  Bound,
  Where,
  AssocBindingDecl,
  ProgramRoot,
};

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Logical
  And,  ///< &&
  Or,   ///< ||
  // Bitwise
  BitAnd,  ///< &
  BitOr,   ///< |
  BitXor,  ///< ^
  Shl,     ///< <<
  Shr,     ///< >>
};

enum class UnaryOp : uint8_t {
  Neg,     ///< -
  Not,     ///< !
  Ref,     ///< &
  RefMut,  ///< &mut
  Deref,   ///< *
};

/// Operator families that share one typing rule.
enum class BinaryOpClass : uint8_t { Arithmetic, Comparison, Logical, Bitwise };

[[nodiscard]] constexpr BinaryOpClass classify(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
    case BinaryOp::Sub:
    case BinaryOp::Mul:
    case BinaryOp::Div:
    case BinaryOp::Mod:
      return BinaryOpClass::Arithmetic;
    case BinaryOp::Eq:
    case BinaryOp::Ne:
    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
      return BinaryOpClass::Comparison;
    case BinaryOp::And:
    case BinaryOp::Or:
      return BinaryOpClass::Logical;
    case BinaryOp::BitAnd:
    case BinaryOp::BitOr:
    case BinaryOp::BitXor:
    case BinaryOp::Shl:
    case BinaryOp::Shr:
      return BinaryOpClass::Bitwise;
  }
  return BinaryOpClass::Arithmetic;
}

// ============================================================================
// to_string() / parsing helpers
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitOr:
      return "|";
    case BinaryOp::BitXor:
      return "^";
    case BinaryOp::Shl:
      return "<<";
    case BinaryOp::Shr:
      return ">>";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Ref:
      return "&";
    case UnaryOp::RefMut:
      return "&mut";
    case UnaryOp::Deref:
      return "*";
  }
  return "";
}

/// Parse an operator spelling. Returns std::nullopt for unknown spellings.
[[nodiscard]] constexpr std::optional<BinaryOp> parse_binary_op(std::string_view s) noexcept
{
  constexpr BinaryOp k_all[] = {
    BinaryOp::Add,    BinaryOp::Sub,   BinaryOp::Mul,    BinaryOp::Div, BinaryOp::Mod,
    BinaryOp::Eq,     BinaryOp::Ne,    BinaryOp::Lt,     BinaryOp::Le,  BinaryOp::Gt,
    BinaryOp::Ge,     BinaryOp::And,   BinaryOp::Or,     BinaryOp::BitAnd, BinaryOp::BitOr,
    BinaryOp::BitXor, BinaryOp::Shl,   BinaryOp::Shr};
  for (const BinaryOp op : k_all) {
    if (to_string(op) == s) return op;
  }
  return std::nullopt;
}

[[nodiscard]] constexpr std::optional<UnaryOp> parse_unary_op(std::string_view s) noexcept
{
  constexpr UnaryOp k_all[] = {
    UnaryOp::Neg, UnaryOp::Not, UnaryOp::Ref, UnaryOp::RefMut, UnaryOp::Deref};
  for (const UnaryOp op : k_all) {
    if (to_string(op) == s) return op;
  }
  return std::nullopt;
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::IntLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::Call;

inline constexpr NodeKind k_first_type_kind = NodeKind::NamedType;
inline constexpr NodeKind k_last_type_kind = NodeKind::AssocType;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::Let;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::ExprStatement;

inline constexpr NodeKind k_first_item_kind = NodeKind::Fn;
inline constexpr NodeKind k_last_item_kind = NodeKind::Impl;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_type_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] constexpr bool is_item_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_item_kind && kind <= detail::k_last_item_kind;
}

}  // namespace rsema
