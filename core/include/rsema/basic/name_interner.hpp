// rsema/basic/name_interner.hpp - Dense integer ids for type and lifetime names
//
// Graph walks over equality and outlives edges index their per-node state
// by small integer ids instead of hashing strings on every step.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rsema
{

using NameId = uint32_t;

/// Transparent hash functor for string_view heterogeneous lookup
struct NameHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct NameEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/**
 * Maps names to dense ids in first-seen order.
 *
 * Ids are stable for the lifetime of the interner and range over
 * [0, size()).
 */
class NameInterner
{
public:
  NameInterner() = default;

  // Keys view into names_; a copy would view into the source
  NameInterner(const NameInterner &) = delete;
  NameInterner & operator=(const NameInterner &) = delete;
  NameInterner(NameInterner &&) = default;
  NameInterner & operator=(NameInterner &&) = default;

  /// Return the id for a name, assigning the next free id if it is new.
  NameId intern(std::string_view name)
  {
    if (auto it = ids_.find(name); it != ids_.end()) {
      return it->second;
    }
    const auto id = static_cast<NameId>(names_.size());
    const std::string & stored = names_.emplace_back(name);
    ids_.emplace(std::string_view(stored), id);
    return id;
  }

  /// Look up an existing id. Returns false if the name was never interned.
  [[nodiscard]] bool find(std::string_view name, NameId & out) const
  {
    auto it = ids_.find(name);
    if (it == ids_.end()) {
      return false;
    }
    out = it->second;
    return true;
  }

  [[nodiscard]] const std::string & name(NameId id) const { return names_.at(id); }
  [[nodiscard]] size_t size() const noexcept { return names_.size(); }
  [[nodiscard]] bool empty() const noexcept { return names_.empty(); }

  void clear()
  {
    names_.clear();
    ids_.clear();
  }

private:
  // deque keeps element addresses stable, so the map can key on views
  std::deque<std::string> names_;
  std::unordered_map<std::string_view, NameId, NameHash, NameEqual> ids_;
};

}  // namespace rsema
