// rsema/project/project_config.cpp - Project configuration (rsema.yaml)
//
#include "rsema/project/project_config.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace rsema
{

namespace
{

/// Read a positive integer limit. Leaves `out` untouched when absent.
bool read_limit(const YAML::Node & section, const char * key, size_t & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) return true;

  long long value = 0;
  try {
    value = node.as<long long>();
  } catch (const YAML::Exception &) {
    error = fmt::format("analysis.{} must be an integer", key);
    return false;
  }
  if (value <= 0) {
    error = fmt::format("analysis.{} must be positive (got {})", key, value);
    return false;
  }
  out = static_cast<size_t>(value);
  return true;
}

bool read_flag(const YAML::Node & section, const char * key, bool & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) return true;
  try {
    out = node.as<bool>();
  } catch (const YAML::Exception &) {
    error = fmt::format("analysis.{} must be true or false", key);
    return false;
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  if (const YAML::Node pkg = root["package"]) {
    if (pkg["name"]) config.package.name = pkg["name"].as<std::string>();
    if (pkg["version"]) config.package.version = pkg["version"].as<std::string>();
  }

  if (const YAML::Node analysis = root["analysis"]) {
    if (!analysis.IsMap()) {
      return ConfigLoadResult::fail("analysis must be a map");
    }

    if (const YAML::Node inputs = analysis["inputs"]) {
      if (!inputs.IsSequence()) {
        return ConfigLoadResult::fail("analysis.inputs must be a list");
      }
      for (const auto & input : inputs) {
        config.analysis.inputs.emplace_back(input.as<std::string>());
      }
    }

    std::string error;
    AnalysisConfig & a = config.analysis;
    const bool ok = read_limit(analysis, "max_propagation_steps", a.max_propagation_steps, error) &&
                    read_limit(analysis, "max_closure_iterations", a.max_closure_iterations, error) &&
                    read_limit(analysis, "max_bounds_per_param", a.max_bounds_per_param, error) &&
                    read_flag(analysis, "reject_ambiguous_elision", a.reject_ambiguous_elision, error) &&
                    read_flag(analysis, "warn_unused_lifetimes", a.warn_unused_lifetimes, error);
    if (!ok) {
      return ConfigLoadResult::fail(std::move(error));
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::vector<std::filesystem::path> ProjectConfig::resolved_inputs() const
{
  std::vector<std::filesystem::path> out;
  out.reserve(analysis.inputs.size());
  for (const auto & input : analysis.inputs) {
    out.push_back(input.is_absolute() ? input : project_root / input);
  }
  return out;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root, project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  for (;;) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }
    const fs::path parent = current.parent_path();
    if (parent == current) break;
    current = parent;
  }
  return std::nullopt;
}

}  // namespace rsema
