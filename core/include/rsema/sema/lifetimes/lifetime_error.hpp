// rsema/sema/lifetimes/lifetime_error.hpp - Lifetime analysis failures
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

enum class LifetimeErrorKind : uint8_t {
  UnregisteredLifetime,  ///< lifetime used without being declared or created
  CyclicLifetime,        ///< lifetime outlives itself through other lifetimes
  AmbiguousElision,      ///< reference return with no elision rule to pick its lifetime
  ClosureLimitExceeded,  ///< transitive closure did not settle within the iteration cap
};

[[nodiscard]] constexpr std::string_view to_string(LifetimeErrorKind kind) noexcept
{
  switch (kind) {
    case LifetimeErrorKind::UnregisteredLifetime:
      return "UnregisteredLifetime";
    case LifetimeErrorKind::CyclicLifetime:
      return "CyclicLifetime";
    case LifetimeErrorKind::AmbiguousElision:
      return "AmbiguousElision";
    case LifetimeErrorKind::ClosureLimitExceeded:
      return "ClosureLimitExceeded";
  }
  return "";
}

struct LifetimeError
{
  LifetimeErrorKind kind = LifetimeErrorKind::UnregisteredLifetime;

  /// Bare lifetime name for UnregisteredLifetime ("c"), display name for
  /// CyclicLifetime ("'a"), function name for AmbiguousElision
  std::string name;

  /// CyclicLifetime: display names from `name` back to itself
  std::vector<std::string> path;
  /// CyclicLifetime: reason of each edge along `path`
  std::vector<std::string> reasons;

  /// AmbiguousElision: number of reference parameters
  size_t ref_params = 0;
  /// ClosureLimitExceeded: iteration cap
  size_t limit = 0;

  static LifetimeError unregistered(std::string_view name)
  {
    LifetimeError e;
    e.kind = LifetimeErrorKind::UnregisteredLifetime;
    e.name = std::string(name);
    return e;
  }

  static LifetimeError cyclic(
    std::string lifetime, std::vector<std::string> path, std::vector<std::string> reasons)
  {
    LifetimeError e;
    e.kind = LifetimeErrorKind::CyclicLifetime;
    e.name = std::move(lifetime);
    e.path = std::move(path);
    e.reasons = std::move(reasons);
    return e;
  }

  static LifetimeError ambiguous_elision(std::string function, size_t ref_params)
  {
    LifetimeError e;
    e.kind = LifetimeErrorKind::AmbiguousElision;
    e.name = std::move(function);
    e.ref_params = ref_params;
    return e;
  }

  static LifetimeError closure_limit(size_t limit)
  {
    LifetimeError e;
    e.kind = LifetimeErrorKind::ClosureLimitExceeded;
    e.limit = limit;
    return e;
  }
};

}  // namespace rsema
