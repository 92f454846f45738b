// rsema/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "rsema/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <vector>

namespace rsema
{

namespace
{

[[nodiscard]] constexpr std::string_view severity_name(Severity s) noexcept
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

[[nodiscard]] int severity_rank(Severity s) noexcept { return static_cast<int>(s); }

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, std::string_view origin)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> origin: item ===
  const std::string location = diag.primary_location();
  if (!origin.empty() && !location.empty()) {
    fmt::print(os_, "{} {}: {}\n", gutter_arrow(), origin, location);
  } else if (!origin.empty() || !location.empty()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), origin.empty() ? location : std::string(origin));
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  // === Labels ===
  for (const auto & label : diag.labels) {
    print_label(label);
  }

  for (const auto & note : diag.notes) {
    print_note(note);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, std::string_view origin)
{
  std::vector<const Diagnostic *> sorted;
  sorted.reserve(diags.size());
  for (const auto & d : diags) {
    sorted.push_back(&d);
  }

  // Errors before warnings; emission order is kept within a severity
  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return severity_rank(a->severity) < severity_rank(b->severity);
  });

  for (const auto * d : sorted) {
    print(*d, origin);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.errors().size();
  const size_t warnings = diags.warnings().size();
  if (errors == 0 && warnings == 0) {
    return;
  }

  if (use_color_) {
    os_ << rang::style::bold << (errors > 0 ? rang::fg::red : rang::fg::yellow);
  }
  fmt::print(
    os_, "{} error{}, {} warning{} emitted\n", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s");
  if (use_color_) {
    os_ << rang::fg::reset << rang::style::reset;
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (!use_color_) {
    fmt::print(os_, "{}{}: {}\n", name, code, diag.message);
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
    case Severity::Hint:
      os_ << rang::fg::green;
      break;
  }
  os_ << name << code << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_label(const Label & label)
{
  if (label.message.empty()) {
    return;
  }

  const char marker = (label.style == LabelStyle::Primary) ? '^' : '-';
  fmt::print(os_, "{} ", gutter_pipe());

  if (use_color_) {
    if (label.style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{} {}", marker, label.message);
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }

  // Secondary labels usually point somewhere other than the header location
  if (label.style == LabelStyle::Secondary && !label.location.empty()) {
    fmt::print(os_, " ({})", label.location);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}  -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace rsema
