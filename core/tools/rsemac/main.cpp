// rsemac - Type and lifetime checker command line interface
//
// Usage:
//   rsemac check <file.json>... [--json]
//   rsemac check --project [--config rsema.yaml]
//   rsemac init <project-name>
//
#include <fmt/core.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "rsema/basic/diagnostic_printer.hpp"
#include "rsema/driver/analyzer.hpp"
#include "rsema/driver/error_reporting.hpp"
#include "rsema/driver/report_json.hpp"
#include "rsema/hir/hir_context.hpp"
#include "rsema/hir/json_reader.hpp"
#include "rsema/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "rsema checker v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [file.json...]     Infer types and check lifetimes of HIR inputs\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  --project                Check the inputs listed in rsema.yaml\n"
            << "  --config <path>          Use this rsema.yaml instead of searching for one\n"
            << "  --json                   Print results as JSON on stdout\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::string config_path;
  bool use_project = false;
  bool json_output = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
        args.use_project = true;
      }
    } else if (arg == "--json") {
      args.json_output = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-') {
      args.inputs.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

/// Analyze one input file. Returns true when it has no errors.
bool check_file(
  const fs::path & path, const rsema::AnalysisOptions & options, const CommandArgs & args,
  rsema::DiagnosticPrinter & printer, nlohmann::json & json_out)
{
  rsema::HirContext hir;
  rsema::TypeContext types;
  rsema::DiagnosticBag diags;
  rsema::AnalysisResult result;

  auto program = rsema::read_program_file(path, hir);
  if (program) {
    if (args.verbose) {
      fmt::print(stderr, "Checking: {}\n", path.string());
    }
    result = rsema::Analyzer::analyze(*program.value(), types, options, diags);
  } else {
    diags.report_error("", program.error()).with_code(rsema::codes::k_invalid_input);
  }

  if (args.json_output) {
    nlohmann::json entry = rsema::to_json(result, diags);
    entry["file"] = path.string();
    json_out.push_back(std::move(entry));
    return result.success;
  }

  if (!diags.empty()) {
    printer.print_all(diags, path.string());
    printer.print_summary(diags);
  }
  if (result.success) {
    std::cout << path.string() << ": OK (" << result.items.size() << " items)\n";
  }
  return result.success;
}

int cmd_check(const CommandArgs & args)
{
  rsema::AnalysisOptions options;
  std::vector<fs::path> inputs;

  if (args.use_project || args.inputs.empty()) {
    std::optional<fs::path> config_path;
    if (!args.config_path.empty()) {
      config_path = fs::path(args.config_path);
    } else {
      config_path = rsema::find_project_config(fs::current_path());
    }
    if (!config_path) {
      std::cerr << "error: no rsema.yaml found in current directory or parents\n";
      return 1;
    }

    const auto config_result = rsema::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    if (args.verbose) {
      fmt::print(stderr, "Checking project: {}\n", config_result.config.package.name);
    }

    options = rsema::AnalysisOptions::from_config(config_result.config.analysis);
    inputs = config_result.config.resolved_inputs();
  }

  for (const auto & input : args.inputs) {
    inputs.push_back(fs::absolute(input));
  }

  if (inputs.empty()) {
    std::cerr << "error: no input files\n";
    return 1;
  }

  const bool use_color = !args.no_color && !args.json_output && isatty(fileno(stderr)) != 0;
  rsema::DiagnosticPrinter printer(std::cerr, use_color);
  nlohmann::json json_out = nlohmann::json::array();

  bool all_ok = true;
  for (const auto & path : inputs) {
    if (!fs::exists(path)) {
      std::cerr << "error: file not found: " << path.string() << "\n";
      all_ok = false;
      continue;
    }
    all_ok = check_file(path, options, args, printer, json_out) && all_ok;
  }

  if (args.json_output) {
    std::cout << json_out.dump(2) << "\n";
  }

  return all_ok ? 0 : 1;
}

int cmd_init(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: rsemac init <project-name>\n";
    return 1;
  }

  const std::string & name = args.inputs.front();
  const fs::path project_dir = fs::current_path() / name;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "hir");

    std::ofstream config(project_dir / rsema::k_project_config_file_name);
    config << "package:\n"
           << "  name: '" << name << "'\n"
           << "  version: '0.1.0'\n\n"
           << "analysis:\n"
           << "  inputs:\n"
           << "    - './hir/main.json'\n"
           << "  reject_ambiguous_elision: true\n"
           << "  warn_unused_lifetimes: true\n";
    config.close();

    std::ofstream main(project_dir / "hir" / "main.json");
    main << "{\n"
         << "  \"items\": [\n"
         << "    { \"kind\": \"fn\", \"name\": \"main\", \"params\": [], \"body\": [] }\n"
         << "  ]\n"
         << "}\n";
    main.close();

    std::cout << "Initialized new rsema project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << name << "\n"
              << "  rsemac check\n";

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
