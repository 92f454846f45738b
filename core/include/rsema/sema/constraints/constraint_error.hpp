// rsema/sema/constraints/constraint_error.hpp - Constraint store failures
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rsema
{

enum class ConstraintErrorKind : uint8_t {
  ConflictingEquality,
  PropagationLimitExceeded,
};

[[nodiscard]] constexpr std::string_view to_string(ConstraintErrorKind kind) noexcept
{
  switch (kind) {
    case ConstraintErrorKind::ConflictingEquality:
      return "ConflictingEquality";
    case ConstraintErrorKind::PropagationLimitExceeded:
      return "PropagationLimitExceeded";
  }
  return "";
}

struct ConstraintError
{
  ConstraintErrorKind kind = ConstraintErrorKind::ConflictingEquality;

  /// Two distinct concrete types forced equal (ConflictingEquality)
  std::string lhs;
  std::string rhs;
  /// Chain of names linking lhs to rhs through equalities, both ends included
  std::vector<std::string> path;

  /// Step budget that was exhausted (PropagationLimitExceeded)
  size_t limit = 0;

  static ConstraintError conflicting_equality(
    std::string lhs, std::string rhs, std::vector<std::string> path)
  {
    ConstraintError e;
    e.kind = ConstraintErrorKind::ConflictingEquality;
    e.lhs = std::move(lhs);
    e.rhs = std::move(rhs);
    e.path = std::move(path);
    return e;
  }

  static ConstraintError propagation_limit(size_t limit)
  {
    ConstraintError e;
    e.kind = ConstraintErrorKind::PropagationLimitExceeded;
    e.limit = limit;
    return e;
  }
};

}  // namespace rsema
