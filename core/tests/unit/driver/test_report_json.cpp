// tests/driver/test_report_json.cpp - Unit tests for JSON analysis reports
//

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "rsema/driver/error_reporting.hpp"
#include "rsema/driver/report_json.hpp"
#include "rsema/test_support/hir_helpers.hpp"

using namespace rsema;

TEST(ReportJsonTest, SuccessfulItem)
{
  auto a = test_support::analyze(R"({
    "items": [
      { "kind": "fn", "name": "first", "generic_params": ["T"],
        "where": [ { "param": "T", "bounds": [ { "trait": "Clone" } ] } ],
        "params": [ { "name": "xs", "type": { "kind": "ref", "inner": "i32" } } ],
        "return": { "kind": "ref", "inner": "i32" },
        "tail": { "kind": "var", "name": "xs" } }
    ]
  })");
  ASSERT_TRUE(a.result.success);

  const nlohmann::json j = to_json(a.result, a.diags);
  EXPECT_TRUE(j["success"].get<bool>());
  ASSERT_EQ(j["items"].size(), 1U);
  EXPECT_TRUE(j["diagnostics"].empty());

  const nlohmann::json & item = j["items"][0];
  EXPECT_EQ(item["name"].get<std::string>(), "first");
  EXPECT_TRUE(item["success"].get<bool>());
  EXPECT_EQ(item["bindings"]["xs"].get<std::string>(), "&i32");
  EXPECT_EQ(item["tail_type"].get<std::string>(), "&i32");
  EXPECT_TRUE(item["statement_types"].empty());
  EXPECT_EQ(item["constraints"].get<std::vector<std::string>>(), std::vector<std::string>{"T: Clone"});
  EXPECT_EQ(item["derived_constraints"].get<int>(), 0);
  EXPECT_EQ(item["elision_rule"].get<int>(), 1);
}

TEST(ReportJsonTest, MissingTailAndElision)
{
  auto a = test_support::analyze(R"({ "items": [ { "kind": "fn", "name": "main" } ] })");
  ASSERT_TRUE(a.result.success);

  const nlohmann::json item = to_json(a.result.items.front());
  EXPECT_TRUE(item["tail_type"].is_null());
  EXPECT_FALSE(item.contains("elision_rule"));
  EXPECT_TRUE(item["bindings"].is_object());
}

TEST(ReportJsonTest, DiagnosticFields)
{
  Diagnostic d = to_diagnostic(LifetimeError::unregistered("c"), "fn f, signature");
  d.notes.emplace_back("declared lifetimes: 'a");

  const nlohmann::json j = to_json(d);
  EXPECT_EQ(j["severity"].get<std::string>(), "error");
  EXPECT_EQ(j["code"].get<std::string>(), "E0201");
  EXPECT_EQ(j["message"].get<std::string>(), "use of undeclared lifetime name `'c`");
  ASSERT_EQ(j["labels"].size(), 1U);
  EXPECT_EQ(j["labels"][0]["location"].get<std::string>(), "fn f, signature");
  EXPECT_TRUE(j["labels"][0]["primary"].get<bool>());
  EXPECT_EQ(j["notes"].size(), 1U);
  EXPECT_EQ(j["help"].get<std::string>(), "declare `'c` in the lifetime parameter list");
}

TEST(ReportJsonTest, FailedAnalysisListsDiagnostics)
{
  auto a = test_support::analyze(R"({
    "items": [ { "kind": "fn", "name": "f", "return": "bool", "tail": 1 } ]
  })");
  const nlohmann::json j = to_json(a.result, a.diags);
  EXPECT_FALSE(j["success"].get<bool>());
  EXPECT_FALSE(j["items"][0]["success"].get<bool>());
  ASSERT_EQ(j["diagnostics"].size(), 1U);
  EXPECT_EQ(j["diagnostics"][0]["code"].get<std::string>(), "E0003");
  EXPECT_FALSE(j["diagnostics"][0].contains("help"));
}
