// filament/syntax/parser.hpp - Recursive-descent parser for .fil sources
#pragma once

#include <string_view>
#include <vector>

#include "filament/ast/ast.hpp"
#include "filament/ast/ast_context.hpp"
#include "filament/basic/diagnostic.hpp"
#include "filament/basic/source_manager.hpp"
#include "filament/syntax/token.hpp"

namespace filament::syntax
{

/**
 * Builds the AST of one file from its token stream.
 *
 * Syntax errors are reported as ErrorKind::Syntax. The parser recovers at
 * statement boundaries inside a component body and at the next top-level
 * keyword otherwise, so one file can yield several errors.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, FileId file_id, const SourceFile & source, DiagnosticBag & diags,
    std::vector<Token> tokens)
  : ast_(ast), file_id_(file_id), source_(source), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Program * parse_program();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] const Token & prev() const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what);
  bool expect_kw(std::string_view kw);

  void error_at(const Token & t, std::string_view msg);
  void synchronize_to_stmt();
  void synchronize_to_decl();

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] static bool is_reserved_ident(std::string_view ident);
  [[nodiscard]] bool expect_identifier(std::string_view what, std::string_view & out);
  [[nodiscard]] SourceRange range_from(const Token & first) const;

  // Top-level
  [[nodiscard]] ImportDecl * parse_import_decl();
  [[nodiscard]] ComponentDecl * parse_component_decl();
  [[nodiscard]] bool parse_params(std::vector<ParamDecl *> & out);
  [[nodiscard]] TimeParamDecl * parse_time_param();
  [[nodiscard]] bool parse_port_list(PortDirection dir, std::vector<PortDecl *> & out);
  [[nodiscard]] PortDecl * parse_port(PortDirection dir);
  [[nodiscard]] bool parse_with_block(std::vector<ExistsDecl *> & out);
  [[nodiscard]] bool parse_where_clause(std::vector<Expr *> & out);
  [[nodiscard]] bool parse_body(std::vector<Stmt *> & out);

  // Statements
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] InstanceStmt * parse_instance_stmt(const Token & name);
  [[nodiscard]] InvokeStmt * parse_invoke_stmt(const Token & name);
  [[nodiscard]] ConnectStmt * parse_connect_stmt();
  [[nodiscard]] ExistsDefStmt * parse_exists_def_stmt();

  // Supporting nodes
  [[nodiscard]] TimePoint * parse_time_point();
  [[nodiscard]] PortRef * parse_port_ref();

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_comparison();
  [[nodiscard]] Expr * parse_add();
  [[nodiscard]] Expr * parse_mul();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] bool parse_int(const Token & tok, int64_t & out);

  AstContext & ast_;
  FileId file_id_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace filament::syntax
