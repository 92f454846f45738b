// rsema/sema/lifetimes/signature_lifetimes.hpp - Lifetimes of a function signature
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rsema/basic/result.hpp"
#include "rsema/hir/hir.hpp"
#include "rsema/sema/lifetimes/lifetime.hpp"
#include "rsema/sema/lifetimes/lifetime_context.hpp"
#include "rsema/sema/lifetimes/lifetime_elision.hpp"
#include "rsema/sema/lifetimes/lifetime_error.hpp"

namespace rsema
{

inline constexpr const char * k_wellformed_reason = "reference well-formedness";

struct SignatureLifetimes
{
  /// Lifetime of each parameter's outermost reference; empty for non-references
  std::vector<std::optional<Lifetime>> params;
  /// Lifetime of the returned reference, if the return is a reference and
  /// its lifetime could be determined
  std::optional<Lifetime> output;
  /// Present when at least one outermost reference had its lifetime elided
  std::optional<ElisionResult> elision;
  /// Declared lifetime parameters (display form) never mentioned in the
  /// signature or its where clauses
  std::vector<std::string> unused_lifetime_params;
};

/**
 * Resolve every reference lifetime in a function signature.
 *
 * - Declared lifetime parameters are registered in `ctx`.
 * - Explicit lifetimes must be declared (or 'static); otherwise the result
 *   is UnregisteredLifetime.
 * - Elided outermost references go through LifetimeElision. An elided return
 *   that borrows from a parameter with an explicit lifetime takes that
 *   lifetime.
 * - Nested references get fresh lifetimes when elided, and each adds the
 *   well-formedness edge `inner: outer` (`&'a &'b T` requires `'b: 'a`).
 *
 * Ambiguous elision is not an error here; callers decide through
 * LifetimeElision::check_elision().
 */
Result<SignatureLifetimes, LifetimeError> extract_signature_lifetimes(
  const FnItem & fn, LifetimeContext & ctx);

}  // namespace rsema
