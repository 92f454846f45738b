// rsema/sema/lifetimes/lifetime_context.hpp - Lifetime registry and outlives edges
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rsema/basic/result.hpp"
#include "rsema/sema/lifetimes/lifetime.hpp"
#include "rsema/sema/lifetimes/lifetime_error.hpp"

namespace rsema
{

/// `longer: shorter`, i.e. `longer` must outlive `shorter`.
struct OutlivesConstraint
{
  Lifetime longer;
  Lifetime shorter;
  std::string reason;
};

/**
 * Lifetimes and outlives edges of one function or impl method.
 *
 * Lifetimes must be registered before they appear in an edge. 'static is
 * always registered. Edges have set semantics on the (longer, shorter) pair;
 * the first reason given for a pair is kept.
 */
class LifetimeContext
{
public:
  LifetimeContext() = default;

  LifetimeContext(const LifetimeContext &) = delete;
  LifetimeContext & operator=(const LifetimeContext &) = delete;

  /// New registered Inferred lifetime
  Lifetime fresh_lifetime();

  /// Register a named lifetime. Repeated calls return the same lifetime.
  Lifetime register_named_lifetime(std::string_view name);

  /// Registered lifetime for a name, if any ("static" always resolves)
  [[nodiscard]] std::optional<Lifetime> lookup_named(std::string_view name) const;

  [[nodiscard]] bool is_registered(const Lifetime & lt) const;

  /// Record `longer: shorter`.
  Result<void, LifetimeError> add_outlives_constraint(
    const Lifetime & longer, const Lifetime & shorter, std::string reason);

  /// Same as above, with both sides given by name.
  Result<void, LifetimeError> add_outlives_constraint(
    std::string_view longer, std::string_view shorter, std::string reason);

  [[nodiscard]] const std::vector<OutlivesConstraint> & constraints() const noexcept
  {
    return constraints_;
  }

  /// Registered lifetimes in registration order, 'static excluded
  [[nodiscard]] const std::vector<Lifetime> & registered() const noexcept { return registered_; }

  /**
   * Drop every registration and edge.
   *
   * The fresh-id counter keeps counting so Inferred lifetimes from an earlier
   * scope never alias later ones.
   */
  void clear();

private:
  uint32_t next_id_ = 0;
  std::map<std::string, Lifetime, std::less<>> named_;
  std::vector<Lifetime> registered_;
  std::set<std::pair<std::string, std::string>> edge_keys_;
  std::vector<OutlivesConstraint> constraints_;
};

/**
 * RAII guard clearing a LifetimeContext on scope exit.
 *
 * ```cpp
 * {
 *   LifetimeScope scope(ctx);
 *   // analyze one function
 * }  // ctx.clear()
 * ```
 */
class LifetimeScope
{
public:
  explicit LifetimeScope(LifetimeContext & ctx) : ctx_(ctx) {}
  ~LifetimeScope() { ctx_.clear(); }

  LifetimeScope(const LifetimeScope &) = delete;
  LifetimeScope & operator=(const LifetimeScope &) = delete;

  [[nodiscard]] LifetimeContext & context() noexcept { return ctx_; }

private:
  LifetimeContext & ctx_;
};

}  // namespace rsema
