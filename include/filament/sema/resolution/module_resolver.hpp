// filament/sema/resolution/module_resolver.hpp - Import resolution
//
// Loads the entry file and everything it imports into a ModuleGraph.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "filament/basic/diagnostic.hpp"
#include "filament/sema/resolution/module_graph.hpp"

namespace filament
{

/**
 * Resolves `import "./file.fil";` declarations and builds the module graph.
 *
 * Rules:
 * - Import paths are relative to the importing file ("./" or "../").
 * - Absolute paths are rejected; a file extension is required.
 * - Every file is parsed once, however many modules import it.
 * - An import reaching a module that is still being processed is a
 *   CyclicImport error naming the chain (`a.fil -> b.fil -> a.fil`).
 */
class ModuleResolver
{
public:
  ModuleResolver(ModuleGraph & graph, DiagnosticBag * diags = nullptr)
  : graph_(graph), diags_(diags)
  {
  }

  /**
   * Resolve all modules starting from an entry file on disk.
   *
   * @return true if the entry module was loaded (it may still contain
   *         errors; check has_errors())
   */
  bool resolve(const std::filesystem::path & entry_point);

  /**
   * Same as resolve(), but the entry module's text is supplied directly.
   * Imports are still read from disk relative to `entry_point`.
   */
  bool resolve_source(const std::filesystem::path & entry_point, std::string source_text);

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  bool process_module(const std::filesystem::path & path, std::optional<std::string> text);

  bool validate_import_path(std::string_view path, SourceRange range);

  static std::optional<std::filesystem::path> resolve_import_path(
    const std::filesystem::path & base_path, std::string_view import_path);

  /// Read and parse a file; `text` overrides the file contents when set.
  ModuleInfo * parse_file(const std::filesystem::path & path, std::optional<std::string> text);

  void report_cycle(const std::filesystem::path & target, SourceRange range);

  void report_error(ErrorKind kind, SourceRange range, std::string_view message);
  void report_error(const std::filesystem::path & file, std::string_view message);

  ModuleGraph & graph_;
  DiagnosticBag * diags_;

  /// Modules currently being processed, outermost first.
  std::vector<std::filesystem::path> stack_;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace filament
