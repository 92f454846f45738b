// rsema/sema/types/type_solver.cpp - Expression type constraint solver
//
#include "rsema/sema/types/type_solver.hpp"

#include <algorithm>
#include <string>

#include "rsema/basic/casting.hpp"

namespace rsema
{

namespace
{

using TypeResult = Result<const Type *, TypeError>;

[[nodiscard]] bool is_generic_param(const FunctionSignature & sig, std::string_view name)
{
  return std::find(sig.generic_params.begin(), sig.generic_params.end(), name) !=
         sig.generic_params.end();
}

}  // namespace

TypeConstraintSolver::TypeConstraintSolver(TypeContext & types) : types_(types), subst_(types) {}

// ============================================================================
// Registration
// ============================================================================

void TypeConstraintSolver::register_variable(std::string_view name, const Type * type)
{
  variables_.insert_or_assign(std::string(name), type);
}

void TypeConstraintSolver::register_function(FunctionSignature signature)
{
  std::string key = signature.name;
  functions_.insert_or_assign(std::move(key), std::move(signature));
}

void TypeConstraintSolver::register_function(
  std::string_view name, std::vector<const Type *> params, const Type * return_type)
{
  FunctionSignature sig;
  sig.name = std::string(name);
  sig.params = std::move(params);
  sig.return_type = return_type;
  register_function(std::move(sig));
}

const FunctionSignature * TypeConstraintSolver::lookup_function(std::string_view name) const
{
  auto it = functions_.find(name);
  return it == functions_.end() ? nullptr : &it->second;
}

const Type * TypeConstraintSolver::lookup_variable(std::string_view name) const
{
  auto it = variables_.find(name);
  return it == variables_.end() ? nullptr : it->second;
}

// ============================================================================
// Entry Points
// ============================================================================

TypeResult TypeConstraintSolver::solve_expr(const Expr & expr)
{
  auto saved = subst_.snapshot();
  auto r = infer(expr);
  if (!r) {
    subst_.restore(std::move(saved));
    return r;
  }
  return TypeResult::ok(subst_.apply(r.value()));
}

Result<std::vector<const Type *>, TypeError> TypeConstraintSolver::solve_exprs(
  gsl::span<const Expr * const> exprs)
{
  using R = Result<std::vector<const Type *>, TypeError>;

  std::vector<const Type *> out;
  out.reserve(exprs.size());
  for (const Expr * e : exprs) {
    auto r = solve_expr(*e);
    if (!r) return R::fail(std::move(r).error());
    out.push_back(r.value());
  }
  // Later expressions may have refined variables in earlier results
  for (auto & t : out) {
    t = subst_.apply(t);
  }
  return R::ok(std::move(out));
}

TypeResult TypeConstraintSolver::solve_let(
  std::string_view name, const Expr & init, const Type * annotation)
{
  auto saved = subst_.snapshot();
  auto r = infer(init);
  if (!r) {
    subst_.restore(std::move(saved));
    return r;
  }

  const Type * bound = r.value();
  if (annotation) {
    if (auto u = subst_.unify(annotation, bound); !u) {
      subst_.restore(std::move(saved));
      return TypeResult::fail(std::move(u).error());
    }
    bound = annotation;
  }

  bound = subst_.apply(bound);
  register_variable(name, bound);
  return TypeResult::ok(bound);
}

Result<void, TypeError> TypeConstraintSolver::expect_type(const Type * expected, const Type * found)
{
  auto saved = subst_.snapshot();
  auto r = subst_.unify(expected, found);
  if (!r) {
    subst_.restore(std::move(saved));
  }
  return r;
}

TypeSolution TypeConstraintSolver::get_solution() const
{
  std::map<std::string, const Type *, std::less<>> snapshot;
  for (const auto & [name, type] : variables_) {
    snapshot.emplace(name, subst_.apply(type));
  }
  return TypeSolution(std::move(snapshot));
}

void TypeConstraintSolver::reset()
{
  variables_.clear();
  functions_.clear();
  subst_.clear();
}

// ============================================================================
// Inference
// ============================================================================

TypeResult TypeConstraintSolver::infer(const Expr & expr)
{
  switch (expr.get_kind()) {
    case NodeKind::IntLiteral:
      return TypeResult::ok(types_.int32_type());
    case NodeKind::FloatLiteral:
      return TypeResult::ok(types_.float64_type());
    case NodeKind::BoolLiteral:
      return TypeResult::ok(types_.bool_type());
    case NodeKind::StringLiteral:
      return TypeResult::ok(types_.string_type());

    case NodeKind::VarRef: {
      const auto & ref = *cast<VarRefExpr>(&expr);
      const Type * t = lookup_variable(ref.name);
      if (!t) return TypeResult::fail(TypeError::unbound_variable(std::string(ref.name)));
      return TypeResult::ok(t);
    }

    case NodeKind::Binary:
      return infer_binary(*cast<BinaryExpr>(&expr));
    case NodeKind::Unary:
      return infer_unary(*cast<UnaryExpr>(&expr));
    case NodeKind::Call:
      return infer_call(*cast<CallExpr>(&expr));

    default:
      break;
  }
  return TypeResult::ok(types_.error_type());
}

TypeResult TypeConstraintSolver::infer_binary(const BinaryExpr & expr)
{
  auto lhs = infer(*expr.lhs);
  if (!lhs) return lhs;
  auto rhs = infer(*expr.rhs);
  if (!rhs) return rhs;

  const std::string op(to_string(expr.op));
  const BinaryOpClass op_class = classify(expr.op);

  if (op_class == BinaryOpClass::Logical) {
    for (const Type * operand : {lhs.value(), rhs.value()}) {
      if (!subst_.unify(types_.bool_type(), operand)) {
        return TypeResult::fail(TypeError::invalid_operand(op, subst_.apply(operand)));
      }
    }
    return TypeResult::ok(types_.bool_type());
  }

  if (auto u = subst_.unify(lhs.value(), rhs.value()); !u) {
    return TypeResult::fail(std::move(u).error());
  }

  const Type * operand = subst_.resolve(lhs.value());
  const bool unresolved = operand->is_variable() || operand->is_error();

  switch (op_class) {
    case BinaryOpClass::Comparison:
      return TypeResult::ok(types_.bool_type());

    case BinaryOpClass::Arithmetic:
      if (!unresolved && !operand->is_numeric()) {
        return TypeResult::fail(TypeError::invalid_operand(op, subst_.apply(operand)));
      }
      return TypeResult::ok(operand);

    case BinaryOpClass::Bitwise: {
      const bool is_shift = expr.op == BinaryOp::Shl || expr.op == BinaryOp::Shr;
      const bool bool_ok = !is_shift && operand->kind == TypeKind::Bool;
      if (!unresolved && !operand->is_integer() && !bool_ok) {
        return TypeResult::fail(TypeError::invalid_operand(op, subst_.apply(operand)));
      }
      return TypeResult::ok(operand);
    }

    case BinaryOpClass::Logical:
      break;
  }
  return TypeResult::ok(types_.error_type());
}

TypeResult TypeConstraintSolver::infer_unary(const UnaryExpr & expr)
{
  auto inner = infer(*expr.operand);
  if (!inner) return inner;

  const std::string op(to_string(expr.op));
  const Type * operand = subst_.resolve(inner.value());
  const bool unresolved = operand->is_variable() || operand->is_error();

  switch (expr.op) {
    case UnaryOp::Neg:
      if (!unresolved && !operand->is_numeric()) {
        return TypeResult::fail(TypeError::invalid_operand(op, subst_.apply(operand)));
      }
      return TypeResult::ok(operand);

    case UnaryOp::Not:
      if (!unresolved && !operand->is_integer() && operand->kind != TypeKind::Bool) {
        return TypeResult::fail(TypeError::invalid_operand(op, subst_.apply(operand)));
      }
      return TypeResult::ok(operand);

    case UnaryOp::Ref:
    case UnaryOp::RefMut:
      return TypeResult::ok(types_.get_reference_type(operand, expr.op == UnaryOp::RefMut));

    case UnaryOp::Deref:
      if (operand->is_reference() || operand->is_pointer()) {
        return TypeResult::ok(operand->element_type);
      }
      if (operand->is_variable()) {
        const Type * pointee = types_.fresh_variable();
        if (auto b = subst_.bind(operand, types_.get_reference_type(pointee, false)); !b) {
          return TypeResult::fail(std::move(b).error());
        }
        return TypeResult::ok(pointee);
      }
      return TypeResult::fail(TypeError::invalid_operand(op, subst_.apply(operand)));
  }
  return TypeResult::ok(types_.error_type());
}

TypeResult TypeConstraintSolver::infer_call(const CallExpr & expr)
{
  const FunctionSignature * declared = lookup_function(expr.callee);
  if (!declared) {
    return TypeResult::fail(TypeError::unknown_function(std::string(expr.callee)));
  }

  if (declared->params.size() != expr.args.size()) {
    return TypeResult::fail(
      TypeError::arity_mismatch(declared->name, declared->params.size(), expr.args.size()));
  }

  const FunctionSignature sig = instantiate(*declared);

  for (size_t i = 0; i < expr.args.size(); ++i) {
    auto arg = infer(*expr.args[i]);
    if (!arg) return arg;

    if (auto u = subst_.unify(sig.params[i], arg.value()); !u) {
      TypeError err = std::move(u).error();
      if (err.kind == TypeErrorKind::TypeMismatch) {
        err.position = i;
      }
      return TypeResult::fail(std::move(err));
    }
  }

  return TypeResult::ok(sig.return_type ? sig.return_type : types_.unit_type());
}

// ============================================================================
// Signature Instantiation
// ============================================================================

FunctionSignature TypeConstraintSolver::instantiate(const FunctionSignature & sig)
{
  if (sig.generic_params.empty()) {
    const bool has_vars =
      std::any_of(sig.params.begin(), sig.params.end(), [](const Type * t) {
        return t->has_variables();
      }) ||
      (sig.return_type && sig.return_type->has_variables());
    if (!has_vars) return sig;
  }

  std::unordered_map<const Type *, const Type *> fresh;
  FunctionSignature out;
  out.name = sig.name;
  out.params.reserve(sig.params.size());
  for (const Type * p : sig.params) {
    out.params.push_back(instantiate_type(p, sig, fresh));
  }
  out.return_type = sig.return_type ? instantiate_type(sig.return_type, sig, fresh) : nullptr;
  return out;
}

const Type * TypeConstraintSolver::instantiate_type(
  const Type * type, const FunctionSignature & sig,
  std::unordered_map<const Type *, const Type *> & fresh)
{
  const bool replace = type->is_variable() ||
                       (type->kind == TypeKind::Named && is_generic_param(sig, type->name));
  if (replace) {
    auto it = fresh.find(type);
    if (it != fresh.end()) return it->second;
    const Type * v = types_.fresh_variable();
    fresh.emplace(type, v);
    return v;
  }

  switch (type->kind) {
    case TypeKind::Vec:
      return types_.get_vec_type(instantiate_type(type->element_type, sig, fresh));
    case TypeKind::Reference:
      return types_.get_reference_type(
        instantiate_type(type->element_type, sig, fresh), type->is_mutable, type->lifetime);
    case TypeKind::Pointer:
      return types_.get_pointer_type(
        instantiate_type(type->element_type, sig, fresh), type->is_mutable);
    default:
      return type;
  }
}

}  // namespace rsema
