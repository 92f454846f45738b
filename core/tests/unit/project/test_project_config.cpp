// tests/project/test_project_config.cpp - Unit tests for rsema.yaml loading
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include "rsema/project/project_config.hpp"

using namespace rsema;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(ProjectConfigTest, EmptyTextGivesDefaults)
{
  auto r = parse_project_config("", "/proj");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.config.analysis.inputs.empty());
  EXPECT_EQ(r.config.analysis.max_propagation_steps, 100000U);
  EXPECT_EQ(r.config.analysis.max_closure_iterations, 100000U);
  EXPECT_EQ(r.config.analysis.max_bounds_per_param, 16U);
  EXPECT_TRUE(r.config.analysis.reject_ambiguous_elision);
  EXPECT_TRUE(r.config.analysis.warn_unused_lifetimes);
  EXPECT_EQ(r.config.project_root.string(), "/proj");
}

TEST(ProjectConfigTest, FullConfiguration)
{
  auto r = parse_project_config(
    "package:\n"
    "  name: demo\n"
    "  version: 0.2.0\n"
    "analysis:\n"
    "  inputs:\n"
    "    - hir/main.json\n"
    "    - /abs/other.json\n"
    "  max_propagation_steps: 50\n"
    "  max_closure_iterations: 60\n"
    "  max_bounds_per_param: 4\n"
    "  reject_ambiguous_elision: false\n"
    "  warn_unused_lifetimes: false\n",
    "/proj");
  ASSERT_TRUE(r.success) << r.error;

  const ProjectConfig & c = r.config;
  EXPECT_EQ(c.package.name, "demo");
  EXPECT_EQ(c.package.version, "0.2.0");
  ASSERT_EQ(c.analysis.inputs.size(), 2U);
  EXPECT_EQ(c.analysis.max_propagation_steps, 50U);
  EXPECT_EQ(c.analysis.max_closure_iterations, 60U);
  EXPECT_EQ(c.analysis.max_bounds_per_param, 4U);
  EXPECT_FALSE(c.analysis.reject_ambiguous_elision);
  EXPECT_FALSE(c.analysis.warn_unused_lifetimes);

  const auto inputs = c.resolved_inputs();
  ASSERT_EQ(inputs.size(), 2U);
  EXPECT_EQ(inputs[0].string(), "/proj/hir/main.json");
  EXPECT_EQ(inputs[1].string(), "/abs/other.json");
}

TEST(ProjectConfigTest, LimitMustBePositive)
{
  auto r = parse_project_config("analysis:\n  max_closure_iterations: 0\n", "/proj");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "analysis.max_closure_iterations must be positive (got 0)");
}

TEST(ProjectConfigTest, LimitMustBeInteger)
{
  auto r = parse_project_config("analysis:\n  max_bounds_per_param: many\n", "/proj");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "analysis.max_bounds_per_param must be an integer");
}

TEST(ProjectConfigTest, FlagMustBeBoolean)
{
  auto r = parse_project_config("analysis:\n  warn_unused_lifetimes: sometimes\n", "/proj");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "analysis.warn_unused_lifetimes must be true or false");
}

TEST(ProjectConfigTest, InputsMustBeAList)
{
  auto r = parse_project_config("analysis:\n  inputs: main.json\n", "/proj");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "analysis.inputs must be a list");
}

TEST(ProjectConfigTest, RootMustBeAMap)
{
  auto r = parse_project_config("- a\n- b\n", "/proj");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "configuration root must be a map");
}

TEST(ProjectConfigTest, MalformedYaml)
{
  auto r = parse_project_config("analysis: [unclosed\n", "/proj");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("failed to parse YAML", 0), 0U);
}

// ============================================================================
// Files
// ============================================================================

TEST(ProjectConfigTest, LoadResolvesAgainstConfigDirectory)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "rsema_config_test");
  const auto config_path = temp_dir.path / k_project_config_file_name;
  {
    std::ofstream f(config_path);
    f << "analysis:\n  inputs:\n    - main.json\n";
  }

  auto r = load_project_config(config_path);
  ASSERT_TRUE(r.success) << r.error;
  const auto inputs = r.config.resolved_inputs();
  ASSERT_EQ(inputs.size(), 1U);
  EXPECT_EQ(inputs[0].string(), (std::filesystem::absolute(temp_dir.path) / "main.json").string());
}

TEST(ProjectConfigTest, LoadMissingFile)
{
  auto r = load_project_config("/nonexistent/rsema.yaml");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "configuration file not found: /nonexistent/rsema.yaml");
}

TEST(ProjectConfigTest, FindSearchesParentDirectories)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "rsema_find_test");
  const auto nested = temp_dir.path / "a" / "b";
  std::filesystem::create_directories(nested);
  {
    std::ofstream f(temp_dir.path / k_project_config_file_name);
    f << "package:\n  name: found\n";
  }

  auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename().string(), k_project_config_file_name);
  EXPECT_EQ(found->parent_path().string(), std::filesystem::absolute(temp_dir.path).string());
}
