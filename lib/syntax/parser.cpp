#include "filament/syntax/parser.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>

namespace filament::syntax
{
namespace
{

std::string describe(const Token & t)
{
  if (t.kind == TokenKind::Eof) {
    return "end of file";
  }
  return "'" + std::string(t.text) + "'";
}

std::optional<BinaryOp> comparison_op(TokenKind k)
{
  switch (k) {
    case TokenKind::EqEq:
      return BinaryOp::Eq;
    case TokenKind::Ne:
      return BinaryOp::Ne;
    case TokenKind::Lt:
      return BinaryOp::Lt;
    case TokenKind::Le:
      return BinaryOp::Le;
    case TokenKind::Gt:
      return BinaryOp::Gt;
    case TokenKind::Ge:
      return BinaryOp::Ge;
    default:
      return std::nullopt;
  }
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::prev() const { return tokens_[idx_ > 0 ? idx_ - 1 : 0]; }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }

  // A missing ';' at the end of a line is reported after the previous token.
  if (k == TokenKind::Semicolon && idx_ > 0) {
    const Token & p = prev();
    const auto prev_lc = source_.get_line_column(p.end());
    const auto cur_lc = source_.get_line_column(cur().begin());
    if (cur_lc.line > prev_lc.line) {
      diags_.report(ErrorKind::Syntax, p.range, "expected " + std::string(what), "expected `;`");
      return false;
    }
  }

  error_at(cur(), "expected " + std::string(what) + ", found " + describe(cur()));
  return false;
}

bool Parser::expect_kw(std::string_view kw)
{
  if (is_kw(kw, cur())) {
    advance();
    return true;
  }
  error_at(cur(), "expected '" + std::string(kw) + "', found " + describe(cur()));
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  diags_.report(ErrorKind::Syntax, t.range, std::string(msg));
}

void Parser::synchronize_to_stmt()
{
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      return;
    }
    if (at(TokenKind::RBrace)) {
      return;
    }
    if (is_kw("comp", cur()) || is_kw("extern", cur()) || is_kw("import", cur())) {
      return;
    }
    advance();
  }
}

void Parser::synchronize_to_decl()
{
  int depth = 0;
  while (!at_eof()) {
    if (depth == 0 && (is_kw("comp", cur()) || is_kw("extern", cur()) || is_kw("import", cur()))) {
      return;
    }
    if (at(TokenKind::LBrace)) {
      ++depth;
    } else if (at(TokenKind::RBrace) && depth > 0) {
      --depth;
    }
    advance();
  }
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == kw;
}

bool Parser::is_reserved_ident(std::string_view ident)
{
  static constexpr std::string_view k_reserved[] = {
    "import", "extern", "comp", "new", "with", "exists", "where", "interface",
  };
  return std::any_of(
    std::begin(k_reserved), std::end(k_reserved), [&](std::string_view k) { return k == ident; });
}

bool Parser::expect_identifier(std::string_view what, std::string_view & out)
{
  if (at(TokenKind::Identifier)) {
    if (is_reserved_ident(cur().text)) {
      error_at(
        cur(), "'" + std::string(cur().text) + "' is a keyword and cannot be used as " +
                 std::string(what));
      return false;
    }
    out = ast_.intern(advance().text);
    return true;
  }
  error_at(cur(), "expected " + std::string(what) + ", found " + describe(cur()));
  return false;
}

SourceRange Parser::range_from(const Token & first) const
{
  return {first.range.get_begin(), prev().range.get_end()};
}

bool Parser::parse_int(const Token & tok, int64_t & out)
{
  const char * begin = tok.text.data();
  const char * end = begin + tok.text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out);
  if (ec != std::errc{} || ptr != end) {
    error_at(tok, "integer literal '" + std::string(tok.text) + "' is out of range");
    return false;
  }
  return true;
}

// ============================================================================
// Top-level
// ============================================================================

Program * Parser::parse_program()
{
  auto * prog =
    ast_.create<Program>(SourceRange(file_id_, 0, static_cast<uint32_t>(source_.size())));

  std::vector<ImportDecl *> imports;
  std::vector<ComponentDecl *> components;

  while (!at_eof()) {
    if (is_kw("import", cur())) {
      if (!components.empty()) {
        error_at(cur(), "imports must appear before the first component");
      }
      if (auto * imp = parse_import_decl()) {
        imports.push_back(imp);
      } else {
        synchronize_to_decl();
      }
      continue;
    }

    if (is_kw("extern", cur()) || is_kw("comp", cur())) {
      if (auto * comp = parse_component_decl()) {
        components.push_back(comp);
      } else {
        synchronize_to_decl();
      }
      continue;
    }

    error_at(cur(), "expected 'import' or 'comp', found " + describe(cur()));
    advance();
    synchronize_to_decl();
  }

  prog->imports = ast_.copy_to_arena(imports);
  prog->components = ast_.copy_to_arena(components);
  return prog;
}

ImportDecl * Parser::parse_import_decl()
{
  const Token & first = advance();  // import
  if (!at(TokenKind::StringLiteral)) {
    error_at(cur(), "expected import path string, found " + describe(cur()));
    return nullptr;
  }
  const std::string_view path = ast_.intern(advance().text);
  if (!expect(TokenKind::Semicolon, "';' after import")) {
    return nullptr;
  }
  return ast_.create<ImportDecl>(path, range_from(first));
}

ComponentDecl * Parser::parse_component_decl()
{
  const Token & first = cur();
  const bool is_extern = is_kw("extern", cur());
  if (is_extern) {
    advance();
  }
  if (!expect_kw("comp")) {
    return nullptr;
  }

  std::string_view name;
  if (!expect_identifier("component name", name)) {
    return nullptr;
  }
  const SourceRange name_range = prev().range;

  std::vector<ParamDecl *> params;
  if (at(TokenKind::LBracket) && !parse_params(params)) {
    return nullptr;
  }

  TimeParamDecl * time = parse_time_param();
  if (time == nullptr) {
    return nullptr;
  }

  std::vector<PortDecl *> inputs;
  std::vector<PortDecl *> outputs;
  if (!parse_port_list(PortDirection::In, inputs)) {
    return nullptr;
  }
  if (match(TokenKind::Arrow) && !parse_port_list(PortDirection::Out, outputs)) {
    return nullptr;
  }

  std::vector<ExistsDecl *> existentials;
  if (is_kw("with", cur()) && !parse_with_block(existentials)) {
    return nullptr;
  }

  std::vector<Expr *> guards;
  if (is_kw("where", cur()) && !parse_where_clause(guards)) {
    return nullptr;
  }

  std::vector<Stmt *> body;
  if (is_extern) {
    if (at(TokenKind::LBrace)) {
      error_at(cur(), "extern component '" + std::string(name) + "' cannot have a body");
      std::vector<Stmt *> ignored;
      (void)parse_body(ignored);
    } else if (!expect(TokenKind::Semicolon, "';' after extern component")) {
      return nullptr;
    }
  } else if (at(TokenKind::Semicolon)) {
    diags_.report(ErrorKind::Syntax, cur().range, "component '" + std::string(name) + "' has no body")
      .with_help("declare it 'extern comp' if it is implemented outside the program");
    advance();
  } else if (!parse_body(body)) {
    return nullptr;
  }

  auto * decl = ast_.create<ComponentDecl>(name, range_from(first));
  decl->nameRange = name_range;
  decl->isExtern = is_extern;
  decl->params = ast_.copy_to_arena(params);
  decl->timeParam = time;
  decl->inputs = ast_.copy_to_arena(inputs);
  decl->outputs = ast_.copy_to_arena(outputs);
  decl->existentials = ast_.copy_to_arena(existentials);
  decl->guards = ast_.copy_to_arena(guards);
  decl->body = ast_.copy_to_arena(body);
  return decl;
}

bool Parser::parse_params(std::vector<ParamDecl *> & out)
{
  advance();  // [
  if (match(TokenKind::RBracket)) {
    return true;
  }
  do {
    std::string_view name;
    if (!expect_identifier("parameter name", name)) {
      return false;
    }
    out.push_back(ast_.create<ParamDecl>(name, prev().range));
  } while (match(TokenKind::Comma));
  return expect(TokenKind::RBracket, "']' after parameters");
}

TimeParamDecl * Parser::parse_time_param()
{
  const Token & first = cur();
  if (!expect(TokenKind::Lt, "'<' to start the event declaration")) {
    return nullptr;
  }
  std::string_view name;
  if (!expect_identifier("event name", name)) {
    return nullptr;
  }
  if (!expect(TokenKind::Colon, "':' and the event delay")) {
    return nullptr;
  }
  Expr * delay = parse_add();
  if (delay == nullptr || !expect(TokenKind::Gt, "'>' after the event delay")) {
    return nullptr;
  }
  return ast_.create<TimeParamDecl>(name, delay, range_from(first));
}

bool Parser::parse_port_list(PortDirection dir, std::vector<PortDecl *> & out)
{
  if (!expect(TokenKind::LParen, "'(' to start the port list")) {
    return false;
  }
  if (match(TokenKind::RParen)) {
    return true;
  }
  do {
    PortDecl * port = parse_port(dir);
    if (port == nullptr) {
      return false;
    }
    out.push_back(port);
  } while (match(TokenKind::Comma));
  return expect(TokenKind::RParen, "')' after ports");
}

PortDecl * Parser::parse_port(PortDirection dir)
{
  const Token & first = cur();
  std::string_view name;
  if (!expect_identifier("port name", name)) {
    return nullptr;
  }
  if (!expect(TokenKind::Colon, "':' after port name")) {
    return nullptr;
  }

  if (is_kw("interface", cur())) {
    const Token & kw = advance();
    if (!expect(TokenKind::LBracket, "'[' after 'interface'")) {
      return nullptr;
    }
    TimePoint * at_time = parse_time_point();
    if (at_time == nullptr || !expect(TokenKind::RBracket, "']' after interface event")) {
      return nullptr;
    }
    if (dir == PortDirection::Out) {
      error_at(kw, "interface port '" + std::string(name) + "' must be an input");
    }
    auto * port = ast_.create<PortDecl>(name, dir, range_from(first));
    port->isInterface = true;
    port->start = at_time;
    return port;
  }

  if (!expect(TokenKind::LBracket, "'[' to start the port interval")) {
    return nullptr;
  }
  TimePoint * start = parse_time_point();
  if (start == nullptr || !expect(TokenKind::Comma, "',' between interval bounds")) {
    return nullptr;
  }
  TimePoint * end = parse_time_point();
  if (end == nullptr || !expect(TokenKind::RBracket, "']' to close the port interval")) {
    return nullptr;
  }
  Expr * width = parse_add();
  if (width == nullptr) {
    return nullptr;
  }

  auto * port = ast_.create<PortDecl>(name, dir, range_from(first));
  port->start = start;
  port->end = end;
  port->width = width;
  return port;
}

bool Parser::parse_with_block(std::vector<ExistsDecl *> & out)
{
  advance();  // with
  if (!expect(TokenKind::LBrace, "'{' after 'with'")) {
    return false;
  }
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token & first = cur();
    if (!expect_kw("exists")) {
      return false;
    }
    std::string_view name;
    if (!expect_identifier("existential name", name)) {
      return false;
    }
    auto * decl = ast_.create<ExistsDecl>(name);
    if (match(TokenKind::Eq)) {
      decl->definition = parse_add();
      if (decl->definition == nullptr) {
        return false;
      }
    }
    if (is_kw("where", cur())) {
      std::vector<Expr *> guards;
      if (!parse_where_clause(guards)) {
        return false;
      }
      decl->guards = ast_.copy_to_arena(guards);
    }
    if (!expect(TokenKind::Semicolon, "';' after existential declaration")) {
      return false;
    }
    decl->range_ = range_from(first);
    out.push_back(decl);
  }
  return expect(TokenKind::RBrace, "'}' to close the 'with' block");
}

bool Parser::parse_where_clause(std::vector<Expr *> & out)
{
  advance();  // where
  do {
    Expr * cmp = parse_comparison();
    if (cmp == nullptr) {
      return false;
    }
    out.push_back(cmp);
  } while (match(TokenKind::Comma));
  return true;
}

bool Parser::parse_body(std::vector<Stmt *> & out)
{
  if (!expect(TokenKind::LBrace, "'{' to start the component body")) {
    return false;
  }
  while (!at(TokenKind::RBrace) && !at_eof()) {
    if (is_kw("comp", cur()) || is_kw("extern", cur()) || is_kw("import", cur())) {
      break;
    }
    if (Stmt * s = parse_stmt()) {
      out.push_back(s);
    } else {
      synchronize_to_stmt();
    }
  }
  // Statements parsed so far are kept even when the closing brace is missing.
  (void)expect(TokenKind::RBrace, "'}' to close the component body");
  return true;
}

// ============================================================================
// Statements
// ============================================================================

Stmt * Parser::parse_stmt()
{
  if (is_kw("exists", cur())) {
    return parse_exists_def_stmt();
  }

  if (at(TokenKind::Identifier) && cur(1).kind == TokenKind::ColonEq) {
    const Token & name = cur();
    if (is_reserved_ident(name.text)) {
      error_at(name, "'" + std::string(name.text) + "' is a keyword and cannot be used as a name");
      return nullptr;
    }
    advance();
    advance();
    if (is_kw("new", cur())) {
      return parse_instance_stmt(name);
    }
    return parse_invoke_stmt(name);
  }

  if (at(TokenKind::Identifier) || at(TokenKind::IntLiteral)) {
    return parse_connect_stmt();
  }

  error_at(cur(), "expected a statement, found " + describe(cur()));
  return nullptr;
}

InstanceStmt * Parser::parse_instance_stmt(const Token & name)
{
  advance();  // new
  std::string_view component;
  if (!expect_identifier("component name", component)) {
    return nullptr;
  }
  const SourceRange comp_range = prev().range;

  std::vector<Expr *> args;
  if (match(TokenKind::LBracket)) {
    if (!at(TokenKind::RBracket)) {
      do {
        Expr * e = parse_add();
        if (e == nullptr) {
          return nullptr;
        }
        args.push_back(e);
      } while (match(TokenKind::Comma));
    }
    if (!expect(TokenKind::RBracket, "']' after instance arguments")) {
      return nullptr;
    }
  }
  if (!expect(TokenKind::Semicolon, "';' after instance")) {
    return nullptr;
  }

  auto * stmt = ast_.create<InstanceStmt>(ast_.intern(name.text), component, range_from(name));
  stmt->componentRange = comp_range;
  stmt->args = ast_.copy_to_arena(args);
  return stmt;
}

InvokeStmt * Parser::parse_invoke_stmt(const Token & name)
{
  std::string_view instance;
  if (!expect_identifier("instance name", instance)) {
    return nullptr;
  }
  const SourceRange inst_range = prev().range;

  if (!expect(TokenKind::Lt, "'<' and the invocation time")) {
    return nullptr;
  }
  TimePoint * time = parse_time_point();
  if (time == nullptr || !expect(TokenKind::Gt, "'>' after the invocation time")) {
    return nullptr;
  }
  if (!expect(TokenKind::LParen, "'(' to start invocation arguments")) {
    return nullptr;
  }

  std::vector<PortRef *> args;
  if (!at(TokenKind::RParen)) {
    do {
      PortRef * ref = parse_port_ref();
      if (ref == nullptr) {
        return nullptr;
      }
      args.push_back(ref);
    } while (match(TokenKind::Comma));
  }
  if (!expect(TokenKind::RParen, "')' after invocation arguments")) {
    return nullptr;
  }
  if (!expect(TokenKind::Semicolon, "';' after invocation")) {
    return nullptr;
  }

  auto * stmt = ast_.create<InvokeStmt>(ast_.intern(name.text), instance, range_from(name));
  stmt->instanceRange = inst_range;
  stmt->time = time;
  stmt->args = ast_.copy_to_arena(args);
  return stmt;
}

ConnectStmt * Parser::parse_connect_stmt()
{
  const Token & first = cur();
  PortRef * dst = parse_port_ref();
  if (dst == nullptr) {
    return nullptr;
  }
  if (dst->isConstant) {
    error_at(first, "cannot bind to a constant");
    return nullptr;
  }
  if (!expect(TokenKind::Eq, "'=' in port binding")) {
    return nullptr;
  }
  PortRef * src = parse_port_ref();
  if (src == nullptr || !expect(TokenKind::Semicolon, "';' after port binding")) {
    return nullptr;
  }
  return ast_.create<ConnectStmt>(dst, src, range_from(first));
}

ExistsDefStmt * Parser::parse_exists_def_stmt()
{
  const Token & first = advance();  // exists
  std::string_view name;
  if (!expect_identifier("existential name", name)) {
    return nullptr;
  }
  if (!expect(TokenKind::Eq, "'=' in existential definition")) {
    return nullptr;
  }
  Expr * value = parse_add();
  if (value == nullptr || !expect(TokenKind::Semicolon, "';' after existential definition")) {
    return nullptr;
  }
  return ast_.create<ExistsDefStmt>(name, value, range_from(first));
}

// ============================================================================
// Supporting nodes
// ============================================================================

TimePoint * Parser::parse_time_point()
{
  const Token & first = cur();
  std::string_view event;
  if (!expect_identifier("event name", event)) {
    return nullptr;
  }
  Expr * offset = nullptr;
  if (match(TokenKind::Plus)) {
    offset = parse_add();
    if (offset == nullptr) {
      return nullptr;
    }
  }
  auto * tp = ast_.create<TimePoint>(event, offset, range_from(first));
  tp->eventRange = first.range;
  return tp;
}

PortRef * Parser::parse_port_ref()
{
  const Token & first = cur();
  if (at(TokenKind::IntLiteral)) {
    int64_t value = 0;
    if (!parse_int(advance(), value)) {
      return nullptr;
    }
    auto * ref = ast_.create<PortRef>(std::string_view{}, std::string_view{}, first.range);
    ref->isConstant = true;
    ref->constant = value;
    return ref;
  }

  std::string_view head;
  if (!expect_identifier("port reference", head)) {
    return nullptr;
  }
  if (match(TokenKind::Dot)) {
    std::string_view port;
    if (!expect_identifier("port name", port)) {
      return nullptr;
    }
    return ast_.create<PortRef>(head, port, range_from(first));
  }
  return ast_.create<PortRef>(std::string_view{}, head, range_from(first));
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr() { return parse_add(); }

Expr * Parser::parse_comparison()
{
  Expr * lhs = parse_add();
  if (lhs == nullptr) {
    return nullptr;
  }
  const auto op = comparison_op(cur().kind);
  if (!op) {
    error_at(cur(), "expected a comparison operator, found " + describe(cur()));
    return nullptr;
  }
  advance();
  Expr * rhs = parse_add();
  if (rhs == nullptr) {
    return nullptr;
  }
  return ast_.create<BinaryExpr>(lhs, *op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
}

Expr * Parser::parse_add()
{
  Expr * lhs = parse_mul();
  while (lhs != nullptr && (at(TokenKind::Plus) || at(TokenKind::Minus))) {
    const BinaryOp op = advance().kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub;
    Expr * rhs = parse_mul();
    if (rhs == nullptr) {
      return nullptr;
    }
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_mul()
{
  Expr * lhs = parse_primary();
  while (lhs != nullptr &&
         (at(TokenKind::Star) || at(TokenKind::Slash) || at(TokenKind::Percent))) {
    const TokenKind k = advance().kind;
    const BinaryOp op = k == TokenKind::Star    ? BinaryOp::Mul
                        : k == TokenKind::Slash ? BinaryOp::Div
                                                : BinaryOp::Mod;
    Expr * rhs = parse_primary();
    if (rhs == nullptr) {
      return nullptr;
    }
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_primary()
{
  const Token & first = cur();

  if (at(TokenKind::IntLiteral)) {
    int64_t value = 0;
    if (!parse_int(advance(), value)) {
      return nullptr;
    }
    return ast_.create<IntLiteralExpr>(value, first.range);
  }

  if (match(TokenKind::LParen)) {
    Expr * inner = parse_add();
    if (inner == nullptr || !expect(TokenKind::RParen, "')' to close the expression")) {
      return nullptr;
    }
    return inner;
  }

  if (at(TokenKind::Identifier) && cur(1).kind == TokenKind::LParen) {
    std::optional<Builtin> fn;
    if (first.text == "pow2") fn = Builtin::Pow2;
    if (first.text == "log2") fn = Builtin::Log2;
    if (!fn) {
      error_at(first, "unknown function '" + std::string(first.text) + "'");
      return nullptr;
    }
    advance();
    advance();
    Expr * arg = parse_add();
    if (arg == nullptr || !expect(TokenKind::RParen, "')' after function argument")) {
      return nullptr;
    }
    return ast_.create<CallExpr>(*fn, arg, range_from(first));
  }

  if (at(TokenKind::Identifier)) {
    std::string_view name;
    if (!expect_identifier("expression", name)) {
      return nullptr;
    }
    if (match(TokenKind::Dot)) {
      std::string_view member;
      if (!expect_identifier("existential name", member)) {
        return nullptr;
      }
      return ast_.create<MemberExpr>(name, member, range_from(first));
    }
    return ast_.create<NameExpr>(name, first.range);
  }

  error_at(first, "expected an expression, found " + describe(first));
  return nullptr;
}

}  // namespace filament::syntax
