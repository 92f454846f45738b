// rsema/sema/lifetimes/lifetime_elision.cpp - Elision rules for un-annotated signatures
//
#include "rsema/sema/lifetimes/lifetime_elision.hpp"

#include <algorithm>
#include <string>

namespace rsema
{

std::optional<size_t> ElisionResult::output_source() const
{
  if (!output) return std::nullopt;
  for (size_t i = 0; i < inputs.size(); ++i) {
    if (inputs[i] && *inputs[i] == *output) return i;
  }
  return std::nullopt;
}

size_t ElisionResult::ref_param_count() const
{
  return static_cast<size_t>(std::count_if(
    inputs.begin(), inputs.end(), [](const auto & lt) { return lt.has_value(); }));
}

ElisionResult LifetimeElision::elide_function_lifetimes(
  const std::vector<bool> & input_is_ref, bool has_return_ref, LifetimeContext & ctx,
  const std::vector<std::optional<Lifetime>> & explicit_inputs)
{
  const auto ref_count =
    static_cast<size_t>(std::count(input_is_ref.begin(), input_is_ref.end(), true));

  ElisionResult result;
  result.inputs.resize(input_is_ref.size());

  auto lifetime_for = [&](size_t i) {
    if (i < explicit_inputs.size() && explicit_inputs[i]) return *explicit_inputs[i];
    return ctx.fresh_lifetime();
  };

  // Rule 1: the only reference parameter lends its lifetime to the return
  if (ref_count == 1 && has_return_ref) {
    const auto only = static_cast<size_t>(
      std::find(input_is_ref.begin(), input_is_ref.end(), true) - input_is_ref.begin());
    const Lifetime shared = lifetime_for(only);
    result.inputs[only] = shared;
    result.output = shared;
    result.rule = ElisionRule::SingleInput;
    return result;
  }

  // Rule 2: the first parameter is a reference and lends its lifetime
  if (ref_count > 1 && has_return_ref && input_is_ref.front()) {
    const Lifetime first = lifetime_for(0);
    result.inputs[0] = first;
    for (size_t i = 1; i < input_is_ref.size(); ++i) {
      if (input_is_ref[i]) result.inputs[i] = lifetime_for(i);
    }
    result.output = first;
    result.rule = ElisionRule::FirstInput;
    return result;
  }

  // Rule 3
  for (size_t i = 0; i < input_is_ref.size(); ++i) {
    if (input_is_ref[i]) result.inputs[i] = lifetime_for(i);
  }
  result.rule = ElisionRule::Independent;
  result.ambiguous = has_return_ref;
  return result;
}

Result<void, LifetimeError> LifetimeElision::check_elision(
  const ElisionResult & result, std::string_view function)
{
  if (result.ambiguous) {
    return Result<void, LifetimeError>::fail(
      LifetimeError::ambiguous_elision(std::string(function), result.ref_param_count()));
  }
  return Result<void, LifetimeError>::ok();
}

}  // namespace rsema
