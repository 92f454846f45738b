// rsema/sema/types/type_lowering.hpp - HIR type nodes to interned types
//
#pragma once

#include "rsema/basic/result.hpp"
#include "rsema/hir/hir.hpp"
#include "rsema/sema/binding/associated_types.hpp"
#include "rsema/sema/binding/binding_error.hpp"
#include "rsema/sema/types/type.hpp"

namespace rsema
{

/**
 * Lowers HIR type nodes to interned Types.
 *
 * Named types spelling a primitive ("i32", "usize", "String", ...) become
 * that primitive; other names become Named types. Explicit reference
 * lifetimes are kept in display form; elided ones stay empty. Associated
 * type nodes are resolved through the AssociatedTypeResolver, if any.
 */
class TypeLowering
{
public:
  explicit TypeLowering(TypeContext & types, const AssociatedTypeResolver * assoc = nullptr)
  : types_(types), assoc_(assoc)
  {
  }

  /// Lower a type node; nullptr lowers to the unit type.
  [[nodiscard]] Result<const Type *, BindingError> lower(const TypeNode * node) const;

private:
  TypeContext & types_;
  const AssociatedTypeResolver * assoc_;
};

}  // namespace rsema
