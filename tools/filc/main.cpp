// filc - Filament compiler command line interface
//
// Usage:
//   filc <file.fil> [options]      Check and build a single file
//   filc build [options]           Build the project described by fil.yaml
//   filc check [options]           Check the project described by fil.yaml
//
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "filament/basic/diagnostic_printer.hpp"
#include "filament/driver/compiler.hpp"
#include "filament/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Filament Compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <file.fil> [options]\n"
            << "       " << program_name << " build|check [options]\n\n"
            << "Commands:\n"
            << "  build                    Build the project described by fil.yaml\n"
            << "  check                    Check the project described by fil.yaml\n\n"
            << "Options:\n"
            << "  --check                  Type-check only (no monomorphization or output)\n"
            << "  --top <name>             Entry component (default: main)\n"
            << "  --param <name>=<value>   Value parameter of the entry component (repeatable)\n"
            << "  -o, --output <dir>       Output directory\n"
            << "  --show-models            Include solver models in diagnostics\n"
            << "  --dump-queries <file>    Append every solver query to <file> (SMT-LIB)\n"
            << "  --fail-fast              Stop at the first component with errors\n"
            << "  -j, --jobs <n>           Worker threads\n"
            << "  --no-color               Disable coloured diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const filament::CompileResult & result, bool use_color)
{
  filament::DiagnosticPrinter printer(std::cerr, use_color);
  if (result.module_graph) {
    printer.print_all(result.diagnostics, result.module_graph->sources());
  } else {
    const filament::SourceRegistry empty;
    printer.print_all(result.diagnostics, empty);
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;  ///< "build", "check" or empty for single-file mode
  std::string input_file;
  std::string output_path;
  std::optional<std::string> top;
  std::map<std::string, int64_t> params;
  std::string dump_queries;
  size_t jobs = 1;
  bool check_only = false;
  bool show_models = false;
  bool fail_fast = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

std::optional<int64_t> parse_natural(std::string_view text)
{
  int64_t value = 0;
  const auto * end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end || value < 0) {
    return std::nullopt;
  }
  return value;
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  int i = 1;
  const std::string first = argv[1];
  if (first == "build" || first == "check") {
    args.command = first;
    i = 2;
  }

  auto next = [&](const std::string & flag) -> std::optional<std::string> {
    if (i + 1 < argc) {
      return std::string(argv[++i]);
    }
    args.error = "missing value for " + flag;
    return std::nullopt;
  };

  for (; i < argc && args.error.empty(); ++i) {
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (auto v = next(arg)) args.output_path = *v;
    } else if (arg == "--top") {
      if (auto v = next(arg)) args.top = *v;
    } else if (arg == "--param") {
      const auto v = next(arg);
      if (!v) break;
      const size_t eq = v->find('=');
      const auto value =
        eq == std::string::npos ? std::nullopt : parse_natural(std::string_view(*v).substr(eq + 1));
      if (eq == 0 || !value) {
        args.error = "invalid --param '" + *v + "' (expected NAME=VALUE with a natural VALUE)";
        break;
      }
      args.params[v->substr(0, eq)] = *value;
    } else if (arg == "--dump-queries") {
      if (auto v = next(arg)) args.dump_queries = *v;
    } else if (arg == "-j" || arg == "--jobs") {
      const auto v = next(arg);
      if (!v) break;
      const auto n = parse_natural(*v);
      if (!n || *n == 0) {
        args.error = "invalid job count '" + *v + "'";
        break;
      }
      args.jobs = static_cast<size_t>(*n);
    } else if (arg == "--check") {
      args.check_only = true;
    } else if (arg == "--show-models") {
      args.show_models = true;
    } else if (arg == "--fail-fast") {
      args.fail_fast = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unknown option '" + arg + "'";
    }
  }

  return args;
}

filament::CompileOptions make_options(const CommandArgs & args)
{
  filament::CompileOptions options;
  const bool check = args.check_only || args.command == "check";
  options.mode = check ? filament::CompileMode::Check : filament::CompileMode::Build;
  options.top = args.top;
  options.params = args.params;
  options.show_models = args.show_models;
  options.fail_fast = args.fail_fast;
  options.jobs = args.jobs;
  options.verbose = args.verbose;
  if (!args.output_path.empty()) {
    options.output_dir = args.output_path;
  }
  if (!args.dump_queries.empty()) {
    options.dump_queries = fs::absolute(args.dump_queries);
  }
  return options;
}

// ============================================================================
// Commands
// ============================================================================

int report(const filament::CompileResult & result, const CommandArgs & args, const std::string & what)
{
  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
  if (!result.diagnostics.empty()) {
    print_diagnostics(result, use_color);
  }

  if (args.verbose) {
    std::cerr << "Solver queries: " << result.solver_queries << "\n";
  }

  if (!result.success) {
    std::cerr << what << ": " << result.diagnostics.error_count() << " error(s)\n";
    return 1;
  }

  for (const auto & file : result.generated_files) {
    std::cerr << "Generated: " << file.string() << "\n";
  }
  if (result.generated_files.empty()) {
    std::cout << what << ": OK\n";
  }
  return 0;
}

int cmd_project(const CommandArgs & args)
{
  auto config_path = filament::find_project_config(fs::current_path());
  if (!config_path) {
    std::cerr << "error: no " << filament::k_project_config_file_name
              << " found in current directory or parents\n";
    return 1;
  }

  const auto config_result = filament::load_project_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return 1;
  }

  if (args.verbose) {
    std::cerr << (args.command == "check" ? "Checking" : "Building")
              << " project: " << config_result.config.package.name << "\n";
  }

  const auto result = filament::Compiler::compile_project(config_result.config, make_options(args));
  const std::string name =
    config_result.config.package.name.empty() ? "project" : config_result.config.package.name;
  return report(result, args, name);
}

int cmd_file(const CommandArgs & args)
{
  const fs::path input_path = fs::absolute(args.input_file);

  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return 1;
  }

  if (args.verbose) {
    std::cerr << (args.check_only ? "Checking: " : "Building: ") << input_path.string() << "\n";
  }

  const auto result = filament::Compiler::compile_single_file(input_path, make_options(args));
  return report(result, args, args.input_file);
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  if (!args.command.empty()) {
    return cmd_project(args);
  }

  if (args.input_file.empty()) {
    std::cerr << "error: no input file\n";
    print_usage(argv[0]);
    return 1;
  }

  return cmd_file(args);
}
