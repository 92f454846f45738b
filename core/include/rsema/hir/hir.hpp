// rsema/hir/hir.hpp - HIR node class definitions
//
// The lowered, name-resolved program representation consumed by the
// semantic core. Nodes are arena-allocated by HirContext and follow the
// classof() pattern for RTTI.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string>
#include <string_view>

#include "rsema/basic/casting.hpp"
#include "rsema/hir/hir_enums.hpp"

namespace rsema
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all HIR nodes.
 *
 * Nodes are non-copyable, trivially destructible and owned by HirContext.
 */
class HirNode
{
public:
  const NodeKind kind;

  HirNode(const HirNode &) = delete;
  HirNode & operator=(const HirNode &) = delete;
  HirNode(HirNode &&) = delete;
  HirNode & operator=(HirNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

protected:
  explicit HirNode(NodeKind k) : kind(k) {}
  ~HirNode() = default;
};

/**
 * CRTP base class that implements classof() for a single kind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind_value = K;

  static bool classof(const HirNode * node) { return node->get_kind() == K; }

protected:
  NodeBase() : Base(K) {}
};

class Expr : public HirNode
{
public:
  static bool classof(const HirNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k) : HirNode(k) {}
};

class TypeNode : public HirNode
{
public:
  static bool classof(const HirNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k) : HirNode(k) {}
};

class Stmt : public HirNode
{
public:
  static bool classof(const HirNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k) : HirNode(k) {}
};

class Item : public HirNode
{
public:
  std::string_view name;

  static bool classof(const HirNode * node) { return is_item_kind(node->kind); }

protected:
  explicit Item(NodeKind k) : HirNode(k) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v) : value(v) {}
};

class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  double value;

  explicit FloatLiteralExpr(double v) : value(v) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v) : value(v) {}
};

class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v) : value(v) {}
};

/// Reference to a local variable or parameter.
class VarRefExpr : public NodeBase<VarRefExpr, Expr, NodeKind::VarRef>
{
public:
  std::string_view name;

  explicit VarRefExpr(std::string_view n) : name(n) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r) : lhs(l), op(o), rhs(r) {}
};

/// Unary expression, including borrows (`&x`, `&mut x`) and dereference.
class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e) : op(o), operand(e) {}
};

/// Call of a free function or an impl method (`ImplId::method`).
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::Call>
{
public:
  std::string_view callee;
  gsl::span<Expr *> args;

  CallExpr(std::string_view c, gsl::span<Expr *> a) : callee(c), args(a) {}
};

// ============================================================================
// Type Nodes
// ============================================================================

/// Primitive, generic parameter or user type referenced by name.
class NamedTypeNode : public NodeBase<NamedTypeNode, TypeNode, NodeKind::NamedType>
{
public:
  std::string_view name;

  explicit NamedTypeNode(std::string_view n) : name(n) {}
};

/// Vec<T>
class VecTypeNode : public NodeBase<VecTypeNode, TypeNode, NodeKind::VecType>
{
public:
  TypeNode * element;

  explicit VecTypeNode(TypeNode * e) : element(e) {}
};

/// &'a T / &'a mut T. An empty lifetime means the annotation was elided.
class RefTypeNode : public NodeBase<RefTypeNode, TypeNode, NodeKind::RefType>
{
public:
  std::string_view lifetime;
  bool is_mutable;
  TypeNode * inner;

  RefTypeNode(std::string_view lt, bool mut, TypeNode * in)
  : lifetime(lt), is_mutable(mut), inner(in)
  {
  }

  [[nodiscard]] bool has_explicit_lifetime() const noexcept { return !lifetime.empty(); }
};

/// *const T / *mut T
class PtrTypeNode : public NodeBase<PtrTypeNode, TypeNode, NodeKind::PtrType>
{
public:
  bool is_mutable;
  TypeNode * inner;

  PtrTypeNode(bool mut, TypeNode * in) : is_mutable(mut), inner(in) {}
};

/// dyn Trait
class DynTypeNode : public NodeBase<DynTypeNode, TypeNode, NodeKind::DynType>
{
public:
  std::string_view trait_name;

  explicit DynTypeNode(std::string_view t) : trait_name(t) {}
};

/// Associated type projection bound by a specific impl, e.g. `Self::Item`.
class AssocTypeNode : public NodeBase<AssocTypeNode, TypeNode, NodeKind::AssocType>
{
public:
  std::string_view impl_id;
  std::string_view name;

  AssocTypeNode(std::string_view impl, std::string_view n) : impl_id(impl), name(n) {}
};

// ============================================================================
// Statements
// ============================================================================

class LetStmt : public NodeBase<LetStmt, Stmt, NodeKind::Let>
{
public:
  std::string_view name;
  TypeNode * annotation;  ///< nullptr when the binding is unannotated
  Expr * init;

  LetStmt(std::string_view n, TypeNode * ann, Expr * i) : name(n), annotation(ann), init(i) {}
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStatement>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e) : expr(e) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

class ParamDecl : public NodeBase<ParamDecl, HirNode, NodeKind::Param>
{
public:
  std::string_view name;
  TypeNode * type;

  ParamDecl(std::string_view n, TypeNode * t) : name(n), type(t) {}
};

/// `Item = U` inside a trait bound such as `Iterator<Item = U>`.
struct AssocEquality
{
  std::string_view name;
  TypeNode * type = nullptr;
};

enum class BoundKind : uint8_t {
  Trait,     ///< T: Clone
  Lifetime,  ///< T: 'a  or  'a: 'b
};

class WhereBound : public NodeBase<WhereBound, HirNode, NodeKind::Bound>
{
public:
  BoundKind bound_kind;
  std::string_view name;  ///< Trait name, or lifetime name for lifetime bounds
  gsl::span<AssocEquality> assoc_equalities;

  WhereBound(BoundKind k, std::string_view n, gsl::span<AssocEquality> eqs = {})
  : bound_kind(k), name(n), assoc_equalities(eqs)
  {
  }
};

/// `where T: A + B` or `where 'a: 'b`
class WhereClause : public NodeBase<WhereClause, HirNode, NodeKind::Where>
{
public:
  std::string_view param;
  bool is_lifetime_param;
  gsl::span<WhereBound *> bounds;

  WhereClause(std::string_view p, bool lifetime_param, gsl::span<WhereBound *> b)
  : param(p), is_lifetime_param(lifetime_param), bounds(b)
  {
  }
};

/// `type Name = Type;` inside an impl block.
class AssocBinding : public NodeBase<AssocBinding, HirNode, NodeKind::AssocBindingDecl>
{
public:
  std::string_view name;
  TypeNode * type;

  AssocBinding(std::string_view n, TypeNode * t) : name(n), type(t) {}
};

/// Type equality handed down by an earlier lowering pass.
struct EqualityFact
{
  std::string_view lhs;
  std::string_view rhs;
};

/// Outlives fact handed down by an earlier lowering pass: `longer: shorter`.
struct OutlivesFact
{
  std::string_view longer;
  std::string_view shorter;
  std::string_view reason;
};

// ============================================================================
// Items
// ============================================================================

class FnItem : public NodeBase<FnItem, Item, NodeKind::Fn>
{
public:
  gsl::span<std::string_view> lifetime_params;
  gsl::span<std::string_view> generic_params;
  gsl::span<WhereClause *> where_clauses;
  gsl::span<ParamDecl *> params;
  TypeNode * return_type = nullptr;  ///< nullptr for `()`
  gsl::span<Stmt *> body;
  Expr * tail = nullptr;  ///< Trailing expression producing the return value
  gsl::span<EqualityFact> equalities;
  gsl::span<OutlivesFact> outlives;

  /// Owning impl for methods, empty for free functions
  std::string_view impl_id;

  explicit FnItem(std::string_view n) { name = n; }

  /// Name under which call sites refer to this function
  [[nodiscard]] std::string qualified_name() const
  {
    if (impl_id.empty()) return std::string(name);
    std::string out(impl_id);
    out += "::";
    out += name;
    return out;
  }
};

class ImplItem : public NodeBase<ImplItem, Item, NodeKind::Impl>
{
public:
  std::string_view trait_name;  ///< Empty for inherent impls
  TypeNode * self_type = nullptr;
  gsl::span<AssocBinding *> assoc_bindings;
  gsl::span<FnItem *> methods;

  /// `name` holds the impl id used by associated type projections.
  explicit ImplItem(std::string_view id) { name = id; }
};

class Program : public NodeBase<Program, HirNode, NodeKind::ProgramRoot>
{
public:
  gsl::span<Item *> items;

  explicit Program(gsl::span<Item *> i) : items(i) {}
};

}  // namespace rsema
