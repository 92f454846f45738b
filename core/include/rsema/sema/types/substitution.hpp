// rsema/sema/types/substitution.hpp - Type variable bindings and unification
//
// Robinson-style unification over interned types. A binding `?n := T` is
// only recorded after an occurs check, so the substitution never contains a
// self-referential type.
//
#pragma once

#include <cstdint>
#include <unordered_map>
#include <utility>

#include "rsema/basic/result.hpp"
#include "rsema/sema/types/type.hpp"
#include "rsema/sema/types/type_error.hpp"

namespace rsema
{

class Substitution
{
public:
  using Bindings = std::unordered_map<uint32_t, const Type *>;

  explicit Substitution(TypeContext & types) : types_(types) {}

  /// Follow variable bindings until a non-variable or an unbound variable.
  [[nodiscard]] const Type * resolve(const Type * type) const;

  /// Replace every bound variable inside `type`, rebuilding composites.
  [[nodiscard]] const Type * apply(const Type * type) const;

  /// True if variable `var_id` occurs in `type` (after resolution).
  [[nodiscard]] bool occurs(uint32_t var_id, const Type * type) const;

  /// Bind a variable. Fails with CyclicTypeConstraint if the occurs check fails.
  Result<void, TypeError> bind(const Type * var, const Type * type);

  /**
   * Unify two types, extending the substitution.
   *
   * Reference lifetimes are not compared; they are the lifetime solver's
   * concern. On mismatch the error reports both sides with the current
   * substitution applied.
   */
  Result<void, TypeError> unify(const Type * expected, const Type * found);

  [[nodiscard]] const Type * lookup(uint32_t var_id) const noexcept;
  [[nodiscard]] size_t size() const noexcept { return bindings_.size(); }
  [[nodiscard]] bool empty() const noexcept { return bindings_.empty(); }
  void clear() noexcept { bindings_.clear(); }

  /// Copy of the current bindings, for rolling back a failed solve.
  [[nodiscard]] Bindings snapshot() const { return bindings_; }
  void restore(Bindings saved) { bindings_ = std::move(saved); }

private:
  Result<void, TypeError> unify_resolved(const Type * a, const Type * b);

  TypeContext & types_;
  Bindings bindings_;
};

}  // namespace rsema
