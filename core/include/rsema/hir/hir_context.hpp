// rsema/hir/hir_context.hpp - HIR arena allocator and string pool
//
// HirContext owns every HIR node and interned string of one program.
// Memory comes from a std::pmr::monotonic_buffer_resource and is released
// all at once when the context is destroyed.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace rsema
{

class HirNode;

/**
 * Arena that owns HIR nodes and interned strings.
 *
 * Nodes must be trivially destructible: they hold string_views into the
 * pool and gsl::spans into the arena, never owning containers.
 *
 * @code
 *   HirContext ctx;
 *   auto * x = ctx.create<VarRefExpr>(ctx.intern("x"));
 *   auto * five = ctx.create<IntLiteralExpr>(5);
 *   auto * sum = ctx.create<BinaryExpr>(x, BinaryOp::Add, five);
 * @endcode
 */
class HirContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{32} * size_t{1024};

  explicit HirContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~HirContext() = default;

  HirContext(const HirContext &) = delete;
  HirContext & operator=(const HirContext &) = delete;
  HirContext(HirContext &&) = delete;
  HirContext & operator=(HirContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /// Construct a node of type T in the arena. The pointer stays valid for the
  /// lifetime of the context.
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<HirNode, T>, "T must derive from HirNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "HIR nodes must be trivially destructible to live in the arena");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /// Intern a string and return a view that lives as long as the context.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (auto it = string_pool_.find(s); it != string_pool_.end()) {
      return *it;
    }
    if (s.empty()) {
      return *string_pool_.insert(std::string_view()).first;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());
    const std::string_view stored(ptr, s.size());
    string_pool_.insert(stored);
    return stored;
  }

  [[nodiscard]] size_t string_count() const noexcept { return string_pool_.size(); }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /// Copy a vector into arena storage.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    static_assert(std::is_trivially_destructible_v<T>, "arena arrays are never destroyed");
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(arena_.allocate(sizeof(T) * vec.size(), alignof(T)));
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace rsema
