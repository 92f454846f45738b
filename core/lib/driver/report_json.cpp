// rsema/driver/report_json.cpp - JSON output for analysis results
//
#include "rsema/driver/report_json.hpp"

#include <string>

#include "rsema/sema/types/type_utils.hpp"

namespace rsema
{
namespace
{

using nlohmann::json;

const char * severity_name(Severity s)
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

json j_type(const Type * t) { return t ? json(to_string(t)) : json(nullptr); }

}  // namespace

json to_json(const Diagnostic & diag)
{
  json labels = json::array();
  for (const auto & label : diag.labels) {
    labels.push_back(json{
      {"location", label.location},
      {"message", label.message},
      {"primary", label.style == LabelStyle::Primary}});
  }

  json j{
    {"severity", severity_name(diag.severity)},
    {"code", diag.code},
    {"message", diag.message},
    {"labels", std::move(labels)},
    {"notes", diag.notes}};
  if (diag.help_message) {
    j["help"] = *diag.help_message;
  }
  return j;
}

json to_json(const ItemReport & item)
{
  json bindings = json::object();
  for (const auto & [name, type] : item.solution) {
    bindings[name] = j_type(type);
  }

  json statements = json::array();
  for (const Type * t : item.statement_types) {
    statements.push_back(j_type(t));
  }

  json j{
    {"name", item.name},
    {"success", item.success},
    {"bindings", std::move(bindings)},
    {"statement_types", std::move(statements)},
    {"tail_type", j_type(item.tail_type)},
    {"constraints", item.constraints},
    {"derived_constraints", item.derived_constraints},
    {"equality_cycles", item.equality_cycles},
    {"outlives", item.outlives}};
  if (item.elision_rule) {
    j["elision_rule"] = static_cast<int>(*item.elision_rule);
  }
  return j;
}

json to_json(const AnalysisResult & result, const DiagnosticBag & diags)
{
  json items = json::array();
  for (const auto & item : result.items) {
    items.push_back(to_json(item));
  }

  json diagnostics = json::array();
  for (const auto & diag : diags) {
    diagnostics.push_back(to_json(diag));
  }

  return json{
    {"success", result.success},
    {"items", std::move(items)},
    {"diagnostics", std::move(diagnostics)}};
}

}  // namespace rsema
