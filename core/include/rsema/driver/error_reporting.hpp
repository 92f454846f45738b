// rsema/driver/error_reporting.hpp - Structured errors to diagnostics
//
// The only place where solver errors become user-facing text. Each error
// kind maps to a stable code:
//
//   E00xx  type solving          E02xx  lifetimes
//   E01xx  generic constraints   E03xx  where clauses / associated types
//   W00xx  warnings              E09xx  input
//
#pragma once

#include <string_view>

#include "rsema/basic/diagnostic.hpp"
#include "rsema/sema/binding/binding_error.hpp"
#include "rsema/sema/binding/where_clause.hpp"
#include "rsema/sema/constraints/constraint_error.hpp"
#include "rsema/sema/lifetimes/lifetime_error.hpp"
#include "rsema/sema/types/type_error.hpp"

namespace rsema
{

namespace codes
{
inline constexpr const char * k_unbound_variable = "E0001";
inline constexpr const char * k_arity_mismatch = "E0002";
inline constexpr const char * k_type_mismatch = "E0003";
inline constexpr const char * k_unknown_function = "E0004";
inline constexpr const char * k_invalid_operand = "E0005";
inline constexpr const char * k_cyclic_type = "E0006";

inline constexpr const char * k_conflicting_equality = "E0101";
inline constexpr const char * k_propagation_limit = "E0102";

inline constexpr const char * k_unregistered_lifetime = "E0201";
inline constexpr const char * k_cyclic_lifetime = "E0202";
inline constexpr const char * k_ambiguous_elision = "E0203";
inline constexpr const char * k_closure_limit = "E0204";

inline constexpr const char * k_associated_type_unbound = "E0301";
inline constexpr const char * k_conflicting_associated_type = "E0302";
inline constexpr const char * k_too_many_bounds = "E0303";

inline constexpr const char * k_invalid_input = "E0901";

inline constexpr const char * k_unused_lifetime = "W0001";
inline constexpr const char * k_ambiguous_elision_warning = "W0002";
}  // namespace codes

/// `location` is the logical HIR location, e.g. "fn parse, argument 2".
[[nodiscard]] Diagnostic to_diagnostic(const TypeError & error, std::string_view location);
[[nodiscard]] Diagnostic to_diagnostic(const ConstraintError & error, std::string_view location);
[[nodiscard]] Diagnostic to_diagnostic(const LifetimeError & error, std::string_view location);
[[nodiscard]] Diagnostic to_diagnostic(const BindingError & error, std::string_view location);
[[nodiscard]] Diagnostic to_diagnostic(const WhereClauseError & error, std::string_view location);

}  // namespace rsema
