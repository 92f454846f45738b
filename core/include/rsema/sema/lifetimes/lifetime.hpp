// rsema/sema/lifetimes/lifetime.hpp - Lifetime identities
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace rsema
{

enum class LifetimeKind : uint8_t {
  Named,     ///< 'a, declared by the user
  Inferred,  ///< 'l<id>, created by elision or inference
  Static,    ///< 'static
};

/// Strip a leading apostrophe: "'a" -> "a".
[[nodiscard]] constexpr std::string_view bare_lifetime_name(std::string_view name) noexcept
{
  if (!name.empty() && name.front() == '\'') name.remove_prefix(1);
  return name;
}

[[nodiscard]] constexpr bool is_static_lifetime_name(std::string_view name) noexcept
{
  return bare_lifetime_name(name) == "static";
}

/**
 * A lifetime. Identity is structural: two Named lifetimes with the same name
 * are the same lifetime.
 *
 * Named lifetimes store the bare name; display() adds the apostrophe.
 */
struct Lifetime
{
  LifetimeKind kind = LifetimeKind::Static;
  std::string name;  ///< Named only, without apostrophe
  uint32_t id = 0;   ///< Inferred only

  /// `a`, `'a`, `static` and `'static` are all accepted.
  static Lifetime named(std::string_view name)
  {
    if (is_static_lifetime_name(name)) return static_lifetime();
    Lifetime lt;
    lt.kind = LifetimeKind::Named;
    lt.name = std::string(bare_lifetime_name(name));
    return lt;
  }

  static Lifetime inferred(uint32_t id)
  {
    Lifetime lt;
    lt.kind = LifetimeKind::Inferred;
    lt.id = id;
    return lt;
  }

  static Lifetime static_lifetime() { return Lifetime{}; }

  [[nodiscard]] bool is_named() const noexcept { return kind == LifetimeKind::Named; }
  [[nodiscard]] bool is_inferred() const noexcept { return kind == LifetimeKind::Inferred; }
  [[nodiscard]] bool is_static() const noexcept { return kind == LifetimeKind::Static; }

  /// 'a, 'l3 or 'static
  [[nodiscard]] std::string display() const;

  /// Identity key, distinct for distinct lifetimes. Named and 'static keys
  /// equal their display form; Inferred keys (`?3`) cannot be spelled.
  [[nodiscard]] std::string key() const;

  [[nodiscard]] bool operator==(const Lifetime & other) const noexcept
  {
    if (kind != other.kind) return false;
    switch (kind) {
      case LifetimeKind::Named:
        return name == other.name;
      case LifetimeKind::Inferred:
        return id == other.id;
      case LifetimeKind::Static:
        return true;
    }
    return false;
  }
  [[nodiscard]] bool operator!=(const Lifetime & other) const noexcept
  {
    return !(*this == other);
  }
};

/// Display form of a lifetime name as written by the user ("a" -> "'a").
[[nodiscard]] std::string lifetime_display_name(std::string_view name);

}  // namespace rsema
