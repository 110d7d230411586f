// filament/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline.
// Used by the CLI and by tests.
//
#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "filament/basic/diagnostic.hpp"
#include "filament/mono/mono_component.hpp"
#include "filament/project/project_config.hpp"
#include "filament/sema/model/component.hpp"
#include "filament/sema/resolution/module_graph.hpp"

namespace filament
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Resolution, type checking and discharge only
  Build,  ///< Full build including monomorphization and IR emission
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Build;

  /// Output directory for generated files (overrides project config)
  std::optional<std::filesystem::path> output_dir;

  /// Entry component (overrides project config; default `main`)
  std::optional<std::string> top;

  /// Value arguments of the entry component (merged over project config)
  std::map<std::string, int64_t> params;

  /// Add solver models to diagnostics
  bool show_models = false;

  /// Per-query solver timeout in milliseconds; 0 means none
  unsigned timeout_ms = 0;

  /// Append every solver query to this file
  std::optional<std::filesystem::path> dump_queries;

  /// Stop at the first component that fails to check
  bool fail_fast = false;

  /// Worker threads for checking and specialization
  size_t jobs = 1;

  /// Enable verbose output
  bool verbose = false;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Generated files (only populated for Build mode)
  std::vector<std::filesystem::path> generated_files;

  /// Module graph (sources for diagnostic rendering)
  std::unique_ptr<ModuleGraph> module_graph;

  /// Semantic model of every loaded component
  std::unique_ptr<ComponentTable> components;

  /// Monomorphized program (Build mode, on success)
  std::optional<MonoProgram> program;

  size_t checked_components = 0;
  size_t failed_components = 0;
  size_t solver_queries = 0;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the full compilation pipeline.
 *
 * The pipeline consists of:
 * 1. Module resolution (parsing and import loading, symbol table)
 * 2. Name resolution
 * 3. Model building
 * 4. Type checking and discharge, callees first
 * 5. Monomorphization and IR emission (Build mode only)
 *
 * Any error before step 5 stops the pipeline there.
 */
class Compiler
{
public:
  /**
   * Compile a single source file.
   *
   * @param file Path to the .fil source file
   * @param options Compile options
   * @return CompileResult with success status and diagnostics
   */
  [[nodiscard]] static CompileResult compile_single_file(
    const std::filesystem::path & file, const CompileOptions & options);

  /**
   * Compile source text as if it were the file `virtual_path`. Imports are
   * read from disk relative to it.
   */
  [[nodiscard]] static CompileResult compile_source(
    const std::filesystem::path & virtual_path, std::string source, const CompileOptions & options);

  /**
   * Compile a project defined by a ProjectConfig.
   *
   * All entry points are loaded into one compilation; the top component is
   * looked up among all of them.
   *
   * @param config Project configuration (from fil.yaml)
   * @param options Compile options (override config settings)
   */
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);
};

}  // namespace filament
