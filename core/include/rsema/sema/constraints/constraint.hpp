// rsema/sema/constraints/constraint.hpp - Generic constraint values
//
// Constraints are keyed by the spelling of the types and lifetimes they
// mention ("T", "Vec<U>", "<T as Iterator>::Item", "'a"), which is how
// where clauses and earlier lowering passes refer to them.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rsema
{

enum class ConstraintKind : uint8_t {
  TypeEquality,   ///< A == B
  TraitBound,     ///< T: Trait
  LifetimeBound,  ///< T: 'a
  SizedBound,     ///< T: Sized
};

[[nodiscard]] constexpr std::string_view to_string(ConstraintKind kind) noexcept
{
  switch (kind) {
    case ConstraintKind::TypeEquality:
      return "TypeEquality";
    case ConstraintKind::TraitBound:
      return "TraitBound";
    case ConstraintKind::LifetimeBound:
      return "LifetimeBound";
    case ConstraintKind::SizedBound:
      return "SizedBound";
  }
  return "";
}

/**
 * One generic constraint. Immutable once stored.
 *
 * `subject` is the left-hand type of an equality or the bounded type.
 * `object` is the right-hand type, the trait name, or the lifetime; it is
 * empty for SizedBound.
 */
struct Constraint
{
  ConstraintKind kind = ConstraintKind::TypeEquality;
  std::string subject;
  std::string object;

  static Constraint type_equality(std::string lhs, std::string rhs);
  static Constraint trait_bound(std::string type, std::string trait);
  /// The lifetime is normalized to carry a leading apostrophe.
  static Constraint lifetime_bound(std::string type, std::string_view lifetime);
  static Constraint sized_bound(std::string type);

  /// Every key this constraint is indexed under.
  [[nodiscard]] std::vector<std::string_view> keys() const;

  [[nodiscard]] bool operator==(const Constraint & other) const noexcept
  {
    return kind == other.kind && subject == other.subject && object == other.object;
  }
  [[nodiscard]] bool operator!=(const Constraint & other) const noexcept
  {
    return !(*this == other);
  }
};

struct ConstraintHash
{
  size_t operator()(const Constraint & c) const noexcept;
};

/// Surface form: "T == U", "T: Clone", "T: 'a", "T: Sized".
[[nodiscard]] std::string to_string(const Constraint & c);

}  // namespace rsema
