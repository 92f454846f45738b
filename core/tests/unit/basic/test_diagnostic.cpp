// tests/basic/test_diagnostic.cpp - Unit tests for DiagnosticBag and DiagnosticPrinter
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "rsema/basic/diagnostic.hpp"
#include "rsema/basic/diagnostic_printer.hpp"
#include "rsema/basic/result.hpp"

using namespace rsema;

// ============================================================================
// DiagnosticBag
// ============================================================================

TEST(DiagnosticBagTest, BuilderAddsOnDestruction)
{
  DiagnosticBag diags;
  {
    auto builder = diags.report_error("fn main", "mismatched types", "expected `i32`");
    EXPECT_TRUE(diags.empty());
  }
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_TRUE(diags.has_errors());
  EXPECT_EQ(diags.all()[0].primary_location(), "fn main");
}

TEST(DiagnosticBagTest, SeparatesErrorsAndWarnings)
{
  DiagnosticBag diags;
  diags.report_warning("fn f", "lifetime parameter `'a` is never used").with_code("W0001");
  diags.report_error("fn g", "cannot find value `x` in this scope").with_code("E0001");

  EXPECT_EQ(diags.errors().size(), 1U);
  EXPECT_EQ(diags.warnings().size(), 1U);
  EXPECT_TRUE(diags.has_code("W0001"));
  EXPECT_TRUE(diags.has_code("E0001"));
  EXPECT_FALSE(diags.has_code("E0003"));
}

TEST(DiagnosticBagTest, MergeKeepsOrder)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_error("fn a", "first");
  b.report_error("fn b", "second");
  a.merge(std::move(b));

  ASSERT_EQ(a.size(), 2U);
  EXPECT_EQ(a.all()[0].message, "first");
  EXPECT_EQ(a.all()[1].message, "second");
}

// ============================================================================
// DiagnosticPrinter
// ============================================================================

TEST(DiagnosticPrinterTest, PlainOutputHasHeaderLocationAndHelp)
{
  Diagnostic d;
  d.code = "E0202";
  d.message = "lifetime `'a` is required to outlive itself";
  d.labels.push_back(Label{"fn swap", "cyclic outlives requirement", LabelStyle::Primary});
  d.notes.emplace_back("outlives chain: 'a -> 'b -> 'a");
  d.help_message = "remove one of the outlives bounds";

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(d, "main.json");

  const std::string text = out.str();
  EXPECT_NE(text.find("error[E0202]: lifetime `'a` is required to outlive itself"), std::string::npos);
  EXPECT_NE(text.find("main.json: fn swap"), std::string::npos);
  EXPECT_NE(text.find("^ cyclic outlives requirement"), std::string::npos);
  EXPECT_NE(text.find("= note: outlives chain: 'a -> 'b -> 'a"), std::string::npos);
  EXPECT_NE(text.find("= help: remove one of the outlives bounds"), std::string::npos);
}

TEST(DiagnosticPrinterTest, PrintAllPutsErrorsFirst)
{
  DiagnosticBag diags;
  diags.report_warning("fn f", "a warning");
  diags.report_error("fn g", "an error");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags);
  printer.print_summary(diags);

  const std::string text = out.str();
  EXPECT_LT(text.find("error: an error"), text.find("warning: a warning"));
  EXPECT_NE(text.find("1 error, 1 warning emitted"), std::string::npos);
}

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, OkAndFail)
{
  auto ok = Result<int, std::string>::ok(7);
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok.value(), 7);

  auto bad = Result<int, std::string>::fail("boom");
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error(), "boom");

  auto done = Result<void, std::string>::ok();
  EXPECT_TRUE(done.is_ok());
  auto failed = Result<void, std::string>::fail("nope");
  EXPECT_TRUE(failed.is_err());
  EXPECT_EQ(std::move(failed).error(), "nope");
}
