// filament/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>

#include "filament/ast/ast.hpp"
#include "filament/ast/ast_context.hpp"
#include "filament/basic/diagnostic.hpp"
#include "filament/basic/source_manager.hpp"

namespace filament
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  Program * program = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
//
// The file is registered in `sources`; the returned program is never null.
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags);

}  // namespace filament
