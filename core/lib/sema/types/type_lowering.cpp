// rsema/sema/types/type_lowering.cpp - HIR type nodes to interned types
//
#include "rsema/sema/types/type_lowering.hpp"

#include <string>

#include "rsema/basic/casting.hpp"
#include "rsema/sema/types/type_utils.hpp"

namespace rsema
{

Result<const Type *, BindingError> TypeLowering::lower(const TypeNode * node) const
{
  using R = Result<const Type *, BindingError>;

  if (!node) return R::ok(types_.unit_type());

  switch (node->get_kind()) {
    case NodeKind::NamedType: {
      const auto * named = cast<NamedTypeNode>(node);
      if (const Type * builtin = types_.lookup_builtin(named->name)) return R::ok(builtin);
      return R::ok(types_.get_named_type(named->name));
    }

    case NodeKind::VecType: {
      auto element = lower(cast<VecTypeNode>(node)->element);
      if (!element) return element;
      return R::ok(types_.get_vec_type(element.value()));
    }

    case NodeKind::RefType: {
      const auto * ref = cast<RefTypeNode>(node);
      auto inner = lower(ref->inner);
      if (!inner) return inner;
      const std::string lifetime =
        ref->has_explicit_lifetime() ? normalize_lifetime_name(ref->lifetime) : std::string();
      return R::ok(types_.get_reference_type(inner.value(), ref->is_mutable, lifetime));
    }

    case NodeKind::PtrType: {
      const auto * ptr = cast<PtrTypeNode>(node);
      auto inner = lower(ptr->inner);
      if (!inner) return inner;
      return R::ok(types_.get_pointer_type(inner.value(), ptr->is_mutable));
    }

    case NodeKind::DynType:
      return R::ok(types_.get_trait_object_type(cast<DynTypeNode>(node)->trait_name));

    case NodeKind::AssocType: {
      const auto * assoc = cast<AssocTypeNode>(node);
      if (!assoc_) {
        return R::fail(BindingError::unbound(std::string(assoc->impl_id), std::string(assoc->name)));
      }
      return assoc_->resolve(assoc->impl_id, assoc->name);
    }

    default:
      break;
  }
  return R::ok(types_.error_type());
}

}  // namespace rsema
