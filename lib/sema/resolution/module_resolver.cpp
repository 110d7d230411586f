// filament/sema/module_resolver.cpp - Module resolution implementation
//
#include "filament/sema/resolution/module_resolver.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "filament/sema/resolution/symbol_table_builder.hpp"
#include "filament/syntax/frontend.hpp"

namespace filament
{

namespace
{

std::filesystem::path normalize(const std::filesystem::path & p)
{
  return std::filesystem::weakly_canonical(std::filesystem::absolute(p));
}

}  // namespace

// ============================================================================
// Entry Point
// ============================================================================

bool ModuleResolver::resolve(const std::filesystem::path & entry_point)
{
  has_errors_ = false;
  error_count_ = 0;

  std::filesystem::path abs_path;
  try {
    abs_path = normalize(entry_point);
  } catch (const std::filesystem::filesystem_error & e) {
    report_error(entry_point, "cannot resolve path: " + std::string(e.what()));
    return false;
  }

  if (!std::filesystem::exists(abs_path)) {
    report_error(abs_path, "file not found");
    return false;
  }

  process_module(abs_path, std::nullopt);
  return graph_.has_module(abs_path);
}

bool ModuleResolver::resolve_source(
  const std::filesystem::path & entry_point, std::string source_text)
{
  has_errors_ = false;
  error_count_ = 0;

  std::filesystem::path abs_path;
  try {
    abs_path = normalize(entry_point);
  } catch (const std::filesystem::filesystem_error & e) {
    report_error(entry_point, "cannot resolve path: " + std::string(e.what()));
    return false;
  }

  process_module(abs_path, std::move(source_text));
  return graph_.has_module(abs_path);
}

// ============================================================================
// Module Processing
// ============================================================================

bool ModuleResolver::process_module(
  const std::filesystem::path & path, std::optional<std::string> text)
{
  // Reached through another import path earlier; each file is parsed once.
  if (graph_.has_module(path)) {
    return true;
  }

  ModuleInfo * module = parse_file(path, std::move(text));
  if (!module) {
    return false;
  }

  SymbolTableBuilder builder(graph_.symbols(), diags_);
  if (!builder.build(*module->program)) {
    has_errors_ = true;
    error_count_ += builder.error_count();
  }

  stack_.push_back(path);
  const std::filesystem::path base_dir = path.parent_path();

  for (const auto * import_decl : module->program->imports) {
    if (!validate_import_path(import_decl->path, import_decl->get_range())) {
      continue;
    }

    const auto resolved = resolve_import_path(base_dir, import_decl->path);
    if (!resolved) {
      report_error(
        ErrorKind::Io, import_decl->get_range(),
        "cannot resolve import path: " + std::string(import_decl->path));
      continue;
    }

    if (std::find(stack_.begin(), stack_.end(), *resolved) != stack_.end()) {
      report_cycle(*resolved, import_decl->get_range());
      continue;
    }

    if (!std::filesystem::exists(*resolved)) {
      report_error(
        ErrorKind::Io, import_decl->get_range(), "imported file not found: " + resolved->string());
      continue;
    }

    process_module(*resolved, std::nullopt);

    if (ModuleInfo * imported = graph_.get_module(*resolved)) {
      module->imports.push_back(imported);
    }
  }

  stack_.pop_back();
  return true;
}

// ============================================================================
// Path Validation
// ============================================================================

bool ModuleResolver::validate_import_path(std::string_view path, SourceRange range)
{
  if (path.empty()) {
    report_error(ErrorKind::Io, range, "import path cannot be empty");
    return false;
  }
  if (path[0] == '/') {
    report_error(ErrorKind::Io, range, "absolute import paths are not allowed");
    return false;
  }
  if (std::filesystem::path(path).extension().empty()) {
    report_error(ErrorKind::Io, range, "import path must have a file extension (e.g. '.fil')");
    return false;
  }
  return true;
}

std::optional<std::filesystem::path> ModuleResolver::resolve_import_path(
  const std::filesystem::path & base_path, std::string_view import_path)
{
  try {
    return std::filesystem::weakly_canonical(base_path / std::filesystem::path(import_path));
  } catch (const std::filesystem::filesystem_error &) {
    return std::nullopt;
  }
}

// ============================================================================
// File Parsing
// ============================================================================

ModuleInfo * ModuleResolver::parse_file(
  const std::filesystem::path & path, std::optional<std::string> text)
{
  std::string source;
  if (text) {
    source = std::move(*text);
  } else {
    std::ifstream file(path);
    if (!file.is_open()) {
      report_error(path, "cannot open file");
      return nullptr;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    source = buffer.str();
  }

  const FileId file_id = graph_.sources().register_file(path, "");
  ModuleInfo * module = graph_.add_module(file_id);
  if (!module) {
    report_error(path, "internal error: failed to create module");
    return nullptr;
  }

  module->ast = std::make_unique<AstContext>();
  module->parse_diags = DiagnosticBag{};

  const ParseOutput out =
    parse_source(graph_.sources(), path, std::move(source), *module->ast, module->parse_diags);
  module->program = out.program;

  if (!module->parse_diags.empty()) {
    if (diags_) {
      diags_->merge(module->parse_diags);
    }
    if (module->parse_diags.has_errors()) {
      has_errors_ = true;
      error_count_ += module->parse_diags.error_count();
    }
  }

  return module;
}

// ============================================================================
// Error Reporting
// ============================================================================

void ModuleResolver::report_cycle(const std::filesystem::path & target, SourceRange range)
{
  auto it = std::find(stack_.begin(), stack_.end(), target);
  std::string chain;
  for (; it != stack_.end(); ++it) {
    chain += it->filename().string() + " -> ";
  }
  chain += target.filename().string();

  report_error(ErrorKind::CyclicImport, range, "cyclic import: " + chain);
}

void ModuleResolver::report_error(ErrorKind kind, SourceRange range, std::string_view message)
{
  has_errors_ = true;
  error_count_++;

  if (diags_) {
    diags_->report(kind, range, std::string(message));
  }
}

void ModuleResolver::report_error(const std::filesystem::path & file, std::string_view message)
{
  has_errors_ = true;
  error_count_++;

  if (diags_) {
    diags_->report(ErrorKind::Io, SourceRange{}, std::string(message))
      .with_note("file: " + file.string());
  }
}

}  // namespace filament
