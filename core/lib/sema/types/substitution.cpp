// rsema/sema/types/substitution.cpp - Unification implementation
//
#include "rsema/sema/types/substitution.hpp"

#include <utility>

namespace rsema
{

const Type * Substitution::resolve(const Type * type) const
{
  while (type && type->is_variable()) {
    auto it = bindings_.find(type->var_id);
    if (it == bindings_.end()) break;
    type = it->second;
  }
  return type;
}

const Type * Substitution::apply(const Type * type) const
{
  type = resolve(type);
  if (!type) return nullptr;

  switch (type->kind) {
    case TypeKind::Vec:
      return types_.get_vec_type(apply(type->element_type));
    case TypeKind::Reference:
      return types_.get_reference_type(
        apply(type->element_type), type->is_mutable, type->lifetime);
    case TypeKind::Pointer:
      return types_.get_pointer_type(apply(type->element_type), type->is_mutable);
    default:
      return type;
  }
}

bool Substitution::occurs(uint32_t var_id, const Type * type) const
{
  type = resolve(type);
  while (type) {
    if (type->is_variable()) {
      return type->var_id == var_id;
    }
    type = resolve(type->element_type);
  }
  return false;
}

const Type * Substitution::lookup(uint32_t var_id) const noexcept
{
  auto it = bindings_.find(var_id);
  return it == bindings_.end() ? nullptr : it->second;
}

Result<void, TypeError> Substitution::bind(const Type * var, const Type * type)
{
  const Type * target = resolve(type);
  if (target->is_variable() && target->var_id == var->var_id) {
    return Result<void, TypeError>::ok();
  }
  if (occurs(var->var_id, target)) {
    return Result<void, TypeError>::fail(TypeError::cyclic(var, apply(target)));
  }
  bindings_[var->var_id] = target;
  return Result<void, TypeError>::ok();
}

Result<void, TypeError> Substitution::unify(const Type * expected, const Type * found)
{
  auto r = unify_resolved(resolve(expected), resolve(found));
  if (r.is_err() && r.error().kind == TypeErrorKind::TypeMismatch) {
    // Report the outermost types rather than the innermost disagreeing pair
    return Result<void, TypeError>::fail(TypeError::mismatch(apply(expected), apply(found)));
  }
  return r;
}

Result<void, TypeError> Substitution::unify_resolved(const Type * a, const Type * b)
{
  using R = Result<void, TypeError>;

  if (a == b) return R::ok();

  // Error types unify with anything so one failure does not cascade
  if (a->is_error() || b->is_error()) return R::ok();

  if (a->is_variable()) return bind(a, b);
  if (b->is_variable()) return bind(b, a);

  if (a->kind != b->kind) return R::fail(TypeError::mismatch(a, b));

  switch (a->kind) {
    case TypeKind::Vec:
      return unify_resolved(resolve(a->element_type), resolve(b->element_type));
    case TypeKind::Reference:
    case TypeKind::Pointer:
      if (a->is_mutable != b->is_mutable) return R::fail(TypeError::mismatch(a, b));
      return unify_resolved(resolve(a->element_type), resolve(b->element_type));
    default:
      // Primitives, named types and trait objects are interned, so distinct
      // pointers of the same kind are distinct types
      return R::fail(TypeError::mismatch(a, b));
  }
}

}  // namespace rsema
