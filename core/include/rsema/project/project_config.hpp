// rsema/project/project_config.hpp - Project configuration (rsema.yaml)
//
// Parses and validates rsema.yaml. The analysis limits feed the constraint
// propagator, the lifetime closure and the where-clause binder.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rsema
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * `analysis` section. Every limit must be positive.
 */
struct AnalysisConfig
{
  /// HIR JSON files analyzed by `rsemac check --project`
  std::vector<std::filesystem::path> inputs;

  size_t max_propagation_steps = 100000;
  size_t max_closure_iterations = 100000;
  size_t max_bounds_per_param = 16;

  /// Reference return with no applicable elision rule is an error (else a warning)
  bool reject_ambiguous_elision = true;

  /// Report declared lifetime parameters that the signature never uses
  bool warn_unused_lifetimes = true;
};

struct ProjectConfig
{
  PackageConfig package;
  AnalysisConfig analysis;

  /// Directory containing rsema.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Inputs resolved against project_root
  [[nodiscard]] std::vector<std::filesystem::path> resolved_inputs() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from an rsema.yaml file.
 *
 * @param config_path Path to rsema.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. Relative inputs resolve against `project_root`.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root);

/**
 * Search upward from `start_dir` for rsema.yaml.
 *
 * @return Path to rsema.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "rsema.yaml";

}  // namespace rsema
