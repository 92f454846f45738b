// rsema/sema/lifetimes/lifetime_elision.hpp - Elision rules for un-annotated signatures
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "rsema/basic/result.hpp"
#include "rsema/sema/lifetimes/lifetime.hpp"
#include "rsema/sema/lifetimes/lifetime_context.hpp"
#include "rsema/sema/lifetimes/lifetime_error.hpp"

namespace rsema
{

enum class ElisionRule : uint8_t {
  SingleInput = 1,  ///< one reference parameter shares its lifetime with the return
  FirstInput = 2,   ///< the first of several reference parameters flows into the return
  Independent = 3,  ///< every reference parameter is independent, the return gets none
};

struct ElisionResult
{
  /// One entry per parameter; set only for reference parameters
  std::vector<std::optional<Lifetime>> inputs;
  /// Lifetime of the returned reference under rules 1 and 2
  std::optional<Lifetime> output;
  ElisionRule rule = ElisionRule::Independent;
  /// Reference return that no rule could give a lifetime
  bool ambiguous = false;

  /// Index of the parameter the return borrows from, if any
  [[nodiscard]] std::optional<size_t> output_source() const;

  [[nodiscard]] size_t ref_param_count() const;
};

class LifetimeElision
{
public:
  /**
   * Assign fresh lifetimes to elided reference positions.
   *
   * @param input_is_ref  one flag per parameter, true for reference parameters
   * @param has_return_ref  whether the return type is a reference
   * @param explicit_inputs  lifetimes already written on reference parameters;
   *   those positions still count for the rules but get no fresh lifetime
   */
  static ElisionResult elide_function_lifetimes(
    const std::vector<bool> & input_is_ref, bool has_return_ref, LifetimeContext & ctx,
    const std::vector<std::optional<Lifetime>> & explicit_inputs = {});

  /// AmbiguousElision when `result.ambiguous` is set.
  static Result<void, LifetimeError> check_elision(
    const ElisionResult & result, std::string_view function);
};

}  // namespace rsema
