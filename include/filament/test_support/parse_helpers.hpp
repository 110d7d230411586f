// filament/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// A lightweight single-file parsing pipeline for tests. Ownership stays
// explicit (SourceRegistry + AstContext) behind a convenient wrapper.
//
#pragma once

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "filament/ast/ast_context.hpp"
#include "filament/basic/diagnostic.hpp"
#include "filament/basic/source_manager.hpp"
#include "filament/syntax/frontend.hpp"

namespace filament::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Program * program = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }

  [[nodiscard]] const ComponentDecl * component(std::string_view name) const
  {
    if (program == nullptr) return nullptr;
    for (const auto * c : program->components) {
      if (c != nullptr && c->name == name) return c;
    }
    return nullptr;
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.fil")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();

  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ast, out.diags);
  out.file_id = parsed.file_id;
  out.program = parsed.program;
  return out;
}

/// True if some error message contains `needle`.
[[nodiscard]] inline bool has_error_containing(const DiagnosticBag & diags, std::string_view needle)
{
  const auto & all = diags.all();
  return std::any_of(all.begin(), all.end(), [&](const Diagnostic & d) {
    return d.severity == Severity::Error && d.message.find(needle) != std::string::npos;
  });
}

/// All messages, one per line; for assertion output.
[[nodiscard]] inline std::string dump_messages(const DiagnosticBag & diags)
{
  std::string out;
  for (const auto & d : diags) {
    out += d.code + ": " + d.message + "\n";
    for (const auto & n : d.notes) {
      out += "    note: " + n + "\n";
    }
  }
  return out;
}

}  // namespace filament::test_support
