// rsema/driver/error_reporting.cpp - Structured errors to diagnostics
//
#include "rsema/driver/error_reporting.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <utility>
#include <variant>

#include "rsema/sema/types/type_utils.hpp"

namespace rsema
{

namespace
{

Diagnostic make_error(
  const char * code, std::string message, std::string_view location, std::string label)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = code;
  d.message = std::move(message);
  if (!location.empty() || !label.empty()) {
    d.labels.push_back(Label{std::string(location), std::move(label), LabelStyle::Primary});
  }
  return d;
}

std::string ordinal(size_t zero_based)
{
  const size_t n = zero_based + 1;
  const char * suffix = "th";
  if (n % 100 < 11 || n % 100 > 13) {
    switch (n % 10) {
      case 1:
        suffix = "st";
        break;
      case 2:
        suffix = "nd";
        break;
      case 3:
        suffix = "rd";
        break;
      default:
        break;
    }
  }
  return fmt::format("{}{}", n, suffix);
}

}  // namespace

// ============================================================================
// Type Errors
// ============================================================================

Diagnostic to_diagnostic(const TypeError & error, std::string_view location)
{
  switch (error.kind) {
    case TypeErrorKind::UnboundVariable:
      return make_error(
        codes::k_unbound_variable, fmt::format("cannot find value `{}` in this scope", error.name),
        location, "not found in this scope");

    case TypeErrorKind::UnknownFunction:
      return make_error(
        codes::k_unknown_function, fmt::format("cannot find function `{}`", error.name), location,
        "not found in this scope");

    case TypeErrorKind::ArityMismatch:
      return make_error(
        codes::k_arity_mismatch,
        fmt::format(
          "function `{}` takes {} argument{} but {} {} supplied", error.name, error.expected_arity,
          error.expected_arity == 1 ? "" : "s", error.found_arity,
          error.found_arity == 1 ? "was" : "were"),
        location, fmt::format("expected {} argument{}", error.expected_arity,
                              error.expected_arity == 1 ? "" : "s"));

    case TypeErrorKind::TypeMismatch: {
      std::string label = fmt::format(
        "expected `{}`, found `{}`", to_string(error.expected), to_string(error.found));
      if (error.position) {
        label = fmt::format("{} argument: {}", ordinal(*error.position), label);
      }
      return make_error(codes::k_type_mismatch, "mismatched types", location, std::move(label));
    }

    case TypeErrorKind::InvalidOperand: {
      Diagnostic d = make_error(
        codes::k_invalid_operand,
        fmt::format("cannot apply `{}` to a value of type `{}`", error.name, to_string(error.found)),
        location, "invalid operand");
      if (error.name == "&&" || error.name == "||") {
        d.help_message = "logical operators require `bool` operands";
      }
      return d;
    }

    case TypeErrorKind::CyclicTypeConstraint: {
      Diagnostic d = make_error(
        codes::k_cyclic_type,
        fmt::format(
          "type variable `{}` would have to contain itself", to_string(error.expected)),
        location, fmt::format("`{}` occurs in `{}`", to_string(error.expected), to_string(error.found)));
      d.notes.emplace_back("infinite types are not allowed");
      return d;
    }
  }
  return make_error(codes::k_type_mismatch, "type error", location, "");
}

// ============================================================================
// Constraint Errors
// ============================================================================

Diagnostic to_diagnostic(const ConstraintError & error, std::string_view location)
{
  switch (error.kind) {
    case ConstraintErrorKind::ConflictingEquality: {
      Diagnostic d = make_error(
        codes::k_conflicting_equality,
        fmt::format("conflicting type equalities: `{}` cannot equal `{}`", error.lhs, error.rhs),
        location, "from these constraints");
      if (!error.path.empty()) {
        d.notes.push_back(fmt::format("equality chain: {}", fmt::join(error.path, " == ")));
      }
      return d;
    }

    case ConstraintErrorKind::PropagationLimitExceeded: {
      Diagnostic d = make_error(
        codes::k_propagation_limit, "constraint propagation did not settle", location,
        fmt::format("gave up after {} steps", error.limit));
      d.help_message = "raise `analysis.max_propagation_steps` in rsema.yaml";
      return d;
    }
  }
  return make_error(codes::k_conflicting_equality, "constraint error", location, "");
}

// ============================================================================
// Lifetime Errors
// ============================================================================

Diagnostic to_diagnostic(const LifetimeError & error, std::string_view location)
{
  switch (error.kind) {
    case LifetimeErrorKind::UnregisteredLifetime: {
      Diagnostic d = make_error(
        codes::k_unregistered_lifetime, fmt::format("use of undeclared lifetime name `'{}`", error.name),
        location, "undeclared lifetime");
      d.help_message = fmt::format("declare `'{}` in the lifetime parameter list", error.name);
      return d;
    }

    case LifetimeErrorKind::CyclicLifetime: {
      Diagnostic d = make_error(
        codes::k_cyclic_lifetime, fmt::format("lifetime `{}` is required to outlive itself", error.name),
        location, "cyclic outlives requirement");
      if (!error.path.empty()) {
        d.notes.push_back(fmt::format("outlives chain: {}", fmt::join(error.path, " -> ")));
      }
      for (size_t i = 0; i < error.reasons.size() && i + 1 < error.path.size(); ++i) {
        if (error.reasons[i].empty()) continue;
        d.notes.push_back(
          fmt::format("`{}: {}` from {}", error.path[i], error.path[i + 1], error.reasons[i]));
      }
      return d;
    }

    case LifetimeErrorKind::AmbiguousElision: {
      Diagnostic d = make_error(
        codes::k_ambiguous_elision, "missing lifetime specifier", location,
        "expected named lifetime parameter");
      if (error.ref_params == 0) {
        d.notes.push_back(fmt::format(
          "the return type of `{}` contains a borrowed value, but there is no value for it to be "
          "borrowed from",
          error.name));
      } else {
        d.notes.push_back(fmt::format(
          "the return type of `{}` contains a borrowed value, but the signature has {} reference "
          "parameters and the first parameter is not a reference",
          error.name, error.ref_params));
      }
      d.help_message = "consider introducing a named lifetime parameter";
      return d;
    }

    case LifetimeErrorKind::ClosureLimitExceeded: {
      Diagnostic d = make_error(
        codes::k_closure_limit, "lifetime closure did not settle", location,
        fmt::format("gave up after {} iterations", error.limit));
      d.help_message = "raise `analysis.max_closure_iterations` in rsema.yaml";
      return d;
    }
  }
  return make_error(codes::k_unregistered_lifetime, "lifetime error", location, "");
}

// ============================================================================
// Binding Errors
// ============================================================================

Diagnostic to_diagnostic(const BindingError & error, std::string_view location)
{
  switch (error.kind) {
    case BindingErrorKind::AssociatedTypeUnbound: {
      Diagnostic d = make_error(
        codes::k_associated_type_unbound,
        fmt::format("associated type `{}` is not bound by `{}`", error.name, error.owner), location,
        "unbound associated type");
      d.help_message = fmt::format("add `type {} = ...;` to the impl", error.name);
      return d;
    }

    case BindingErrorKind::ConflictingAssociatedType:
      return make_error(
        codes::k_conflicting_associated_type,
        fmt::format("conflicting bindings for associated type `{}` in `{}`", error.name, error.owner),
        location,
        fmt::format(
          "already bound to `{}`, cannot rebind to `{}`", to_string(error.existing),
          to_string(error.requested)));

    case BindingErrorKind::TooManyBounds: {
      Diagnostic d = make_error(
        codes::k_too_many_bounds,
        fmt::format("too many bounds on generic parameter `{}`", error.owner), location,
        fmt::format("{} bounds, at most {} allowed", error.count, error.limit));
      d.help_message = "raise `analysis.max_bounds_per_param` in rsema.yaml";
      return d;
    }
  }
  return make_error(codes::k_associated_type_unbound, "binding error", location, "");
}

Diagnostic to_diagnostic(const WhereClauseError & error, std::string_view location)
{
  return std::visit([location](const auto & e) { return to_diagnostic(e, location); }, error);
}

}  // namespace rsema
