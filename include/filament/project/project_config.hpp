// filament/project/project_config.hpp - Project configuration (fil.yaml)
//
// Parses and validates fil.yaml project configuration files.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace filament
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// Entry point files to compile
  std::vector<std::filesystem::path> entry_points;

  /// Component to monomorphize from
  std::string top = "main";

  /// Value arguments of the top component
  std::map<std::string, int64_t> params;

  /// Output directory for generated files
  std::filesystem::path output_dir = "build";

  /// Worker threads for checking and specialization
  size_t jobs = 1;

  bool fail_fast = false;
};

/**
 * Solver configuration section.
 */
struct SolverConfig
{
  bool show_models = false;
  unsigned timeout_ms = 0;
  /// Append every solver query to this file (relative to fil.yaml)
  std::optional<std::filesystem::path> dump_queries;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (fil.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;
  SolverConfig solver;

  /// Directory containing fil.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
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
 * Load a project configuration from a fil.yaml file.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse fil.yaml contents; relative paths are resolved against `project_root`.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @return Path to fil.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "fil.yaml";

}  // namespace filament
