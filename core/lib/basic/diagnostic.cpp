// rsema/basic/diagnostic.cpp - Diagnostic implementation
#include "rsema/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace rsema
{

namespace
{

Diagnostic make_diagnostic(
  Severity severity, std::string location, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  if (!location.empty() || !label_message.empty()) {
    d.labels.push_back(
      Label{std::move(location), std::move(label_message), LabelStyle::Primary});
  }
  return d;
}

}  // namespace

const Label * Diagnostic::primary_label() const noexcept
{
  auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) {
    return &*it;
  }
  return labels.empty() ? nullptr : &labels.front();
}

std::string Diagnostic::primary_location() const
{
  const Label * l = primary_label();
  return l == nullptr ? std::string() : l->location;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  std::string location, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{std::move(location), std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(std::string location, std::string msg)
{
  return with_label(std::move(location), std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(
  std::string location, std::string message, std::string label_message)
{
  return {
    *this, make_diagnostic(
             Severity::Error, std::move(location), std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  std::string location, std::string message, std::string label_message)
{
  return {
    *this, make_diagnostic(
             Severity::Warning, std::move(location), std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_info(
  std::string location, std::string message, std::string label_message)
{
  return {
    *this, make_diagnostic(
             Severity::Info, std::move(location), std::move(message), std::move(label_message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

bool DiagnosticBag::has_code(std::string_view code) const
{
  return std::any_of(
    diagnostics_.begin(), diagnostics_.end(), [code](const Diagnostic & d) { return d.code == code; });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace rsema
