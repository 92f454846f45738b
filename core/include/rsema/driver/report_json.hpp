// rsema/driver/report_json.hpp - JSON output for analysis results
//
// Machine-readable form of `rsemac check --json`. Types are rendered in
// their surface syntax, diagnostics keep their code, labels and notes.
//
#pragma once

#include <nlohmann/json.hpp>

#include "rsema/basic/diagnostic.hpp"
#include "rsema/driver/analyzer.hpp"

namespace rsema
{

[[nodiscard]] nlohmann::json to_json(const Diagnostic & diag);

[[nodiscard]] nlohmann::json to_json(const ItemReport & item);

/**
 * Serialize the outcome of one input.
 *
 * @code
 *   { "success": false,
 *     "items": [ { "name": "first", "success": true, "bindings": { "xs": "&'a Vec<i32>" }, ... } ],
 *     "diagnostics": [ { "severity": "error", "code": "E0003", ... } ] }
 * @endcode
 */
[[nodiscard]] nlohmann::json to_json(const AnalysisResult & result, const DiagnosticBag & diags);

}  // namespace rsema
