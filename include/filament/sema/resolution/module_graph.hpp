// filament/sema/resolution/module_graph.hpp - Loaded .fil modules
//
// Owns every parsed file of a compilation together with the component-level
// symbol table shared by all of them.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "filament/ast/ast.hpp"
#include "filament/ast/ast_context.hpp"
#include "filament/basic/diagnostic.hpp"
#include "filament/basic/source_manager.hpp"
#include "filament/sema/resolution/symbol_table.hpp"

namespace filament
{

/**
 * One source file and its parse result.
 */
struct ModuleInfo
{
  FileId file_id = FileId::invalid();

  /// Arena holding this module's AST
  std::unique_ptr<AstContext> ast;

  /// Diagnostics produced while parsing this file
  DiagnosticBag parse_diags;

  Program * program = nullptr;

  /// Direct imports, in source order
  std::vector<ModuleInfo *> imports;
};

class ModuleGraph
{
public:
  ModuleGraph() = default;

  ModuleGraph(const ModuleGraph &) = delete;
  ModuleGraph & operator=(const ModuleGraph &) = delete;
  ModuleGraph(ModuleGraph &&) = default;
  ModuleGraph & operator=(ModuleGraph &&) = default;

  [[nodiscard]] SourceRegistry & sources() noexcept { return sources_; }
  [[nodiscard]] const SourceRegistry & sources() const noexcept { return sources_; }

  [[nodiscard]] SymbolTable & symbols() noexcept { return symbols_; }
  [[nodiscard]] const SymbolTable & symbols() const noexcept { return symbols_; }

  /// Create the module for `file_id`, or return the existing one.
  ModuleInfo * add_module(FileId file_id)
  {
    if (!file_id.is_valid()) {
      return nullptr;
    }
    const auto idx = static_cast<size_t>(file_id.value);
    if (modules_.size() <= idx) {
      modules_.resize(idx + 1);
    }
    if (!modules_[idx]) {
      auto info = std::make_unique<ModuleInfo>();
      info->file_id = file_id;
      modules_[idx] = std::move(info);
      load_order_.push_back(modules_[idx].get());
    }
    return modules_[idx].get();
  }

  [[nodiscard]] ModuleInfo * get_module(FileId file_id) const
  {
    if (!file_id.is_valid()) {
      return nullptr;
    }
    const auto idx = static_cast<size_t>(file_id.value);
    return idx < modules_.size() ? modules_[idx].get() : nullptr;
  }

  [[nodiscard]] ModuleInfo * get_module(const std::filesystem::path & path) const
  {
    const std::optional<FileId> id = sources_.find_by_path(path);
    return id ? get_module(*id) : nullptr;
  }

  [[nodiscard]] bool has_module(const std::filesystem::path & path) const
  {
    return get_module(path) != nullptr;
  }

  /// Modules in the order they were first loaded (entry file first).
  [[nodiscard]] const std::vector<ModuleInfo *> & modules() const noexcept { return load_order_; }

  [[nodiscard]] ModuleInfo * entry() const noexcept
  {
    return load_order_.empty() ? nullptr : load_order_.front();
  }

  [[nodiscard]] size_t size() const noexcept { return load_order_.size(); }
  [[nodiscard]] bool empty() const noexcept { return load_order_.empty(); }

private:
  SourceRegistry sources_;
  SymbolTable symbols_;
  std::vector<std::unique_ptr<ModuleInfo>> modules_;  // indexed by FileId::value
  std::vector<ModuleInfo *> load_order_;
};

}  // namespace filament
