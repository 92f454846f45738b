// rsema/test_support/hir_helpers.hpp - helpers for unit/integration tests
//
// Tests describe programs in the HIR JSON interchange form and run them
// through the reader and the analyzer. Contexts are heap-allocated so the
// returned bundles can be moved around freely.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "rsema/basic/diagnostic.hpp"
#include "rsema/driver/analyzer.hpp"
#include "rsema/hir/hir_context.hpp"
#include "rsema/hir/json_reader.hpp"
#include "rsema/sema/types/type.hpp"
#include "rsema/sema/types/type_utils.hpp"

namespace rsema::test_support
{

struct TestProgram
{
  std::unique_ptr<HirContext> hir;
  Program * program = nullptr;
  /// Reader error, empty on success
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return program != nullptr; }
};

[[nodiscard]] inline TestProgram read(std::string_view json_text)
{
  TestProgram out;
  out.hir = std::make_unique<HirContext>();
  auto r = read_program_json(json_text, *out.hir);
  if (r) {
    out.program = r.value();
  } else {
    out.error = r.error();
  }
  return out;
}

struct TestAnalysis
{
  TestProgram input;
  std::unique_ptr<TypeContext> types;
  DiagnosticBag diags;
  AnalysisResult result;

  [[nodiscard]] const ItemReport * item(std::string_view name) const { return result.find(name); }

  /// Type bound to `name` in `item`, spelled as source text; empty if absent
  [[nodiscard]] std::string binding(std::string_view item_name, std::string_view name) const
  {
    const ItemReport * report = result.find(item_name);
    if (!report) return {};
    const Type * t = report->solution.lookup(name);
    return t ? to_string(t) : std::string();
  }
};

[[nodiscard]] inline TestAnalysis analyze(
  std::string_view json_text, const AnalysisOptions & options = AnalysisOptions{})
{
  TestAnalysis out;
  out.input = read(json_text);
  out.types = std::make_unique<TypeContext>();
  if (!out.input.ok()) {
    out.diags.report_error("", out.input.error);
    return out;
  }
  out.result = Analyzer::analyze(*out.input.program, *out.types, options, out.diags);
  return out;
}

}  // namespace rsema::test_support
