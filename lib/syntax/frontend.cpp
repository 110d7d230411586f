// filament/syntax/frontend.cpp - High-level parse pipeline
#include "filament/syntax/frontend.hpp"

#include <utility>
#include <vector>

#include "filament/syntax/lexer.hpp"
#include "filament/syntax/parser.hpp"

namespace filament
{

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;
  out.file_id = sources.register_file(path, "");
  sources.update_content(out.file_id, std::move(source_text));
  const SourceFile * file = sources.get_file(out.file_id);

  syntax::Lexer lexer(out.file_id, file->content());
  std::vector<syntax::Token> raw = lexer.lex_all();

  // Malformed tokens are reported once here and dropped, so the parser only
  // complains about what is structurally wrong.
  std::vector<syntax::Token> tokens;
  tokens.reserve(raw.size());
  for (const auto & tok : raw) {
    if (tok.kind != syntax::TokenKind::Unknown) {
      tokens.push_back(tok);
      continue;
    }
    if (tok.text == "/*") {
      diags.report(ErrorKind::Syntax, tok.range, "unterminated block comment");
    } else if (!tok.text.empty() && tok.text.front() == '"') {
      diags.report(ErrorKind::Syntax, tok.range, "unterminated string literal");
    } else {
      diags.report(
        ErrorKind::Syntax, tok.range, "unrecognized token '" + std::string(tok.text) + "'");
    }
  }

  syntax::Parser parser(ast, out.file_id, *file, diags, std::move(tokens));
  out.program = parser.parse_program();
  return out;
}

}  // namespace filament
