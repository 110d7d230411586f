#include "filament/syntax/lexer.hpp"

#include <cctype>

namespace filament::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

bool Lexer::skip_trivia(Token & out)
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance(1);
      continue;
    }
    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }
    if (starts_with("/*")) {
      const auto start = static_cast<uint32_t>(pos_);
      advance(2);
      while (!eof() && !starts_with("*/")) {
        advance(1);
      }
      if (eof()) {
        // Unterminated: hand the whole tail to the parser as one bad token.
        out.kind = TokenKind::Unknown;
        out.range = make_range(start, static_cast<uint32_t>(pos_));
        out.text = src_.substr(start, 2);
        return false;
      }
      advance(2);
      continue;
    }
    break;
  }
  return true;
}

Token Lexer::make_token(TokenKind kind, uint32_t start) const noexcept
{
  const auto end = static_cast<uint32_t>(pos_);
  return {kind, make_range(start, end), src_.substr(start, end - start)};
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
    advance(1);
  }
  // `12abc` is one malformed token rather than a number followed by a name.
  bool invalid = false;
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    invalid = true;
    advance(1);
  }
  return make_token(invalid ? TokenKind::Unknown : TokenKind::IntLiteral, start);
}

Token Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof() && peek() != '"' && peek() != '\n') {
    advance(1);
  }
  if (eof() || peek() != '"') {
    return make_token(TokenKind::Unknown, start);
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(1);

  Token t;
  t.kind = TokenKind::StringLiteral;
  t.range = make_range(start, static_cast<uint32_t>(pos_));
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::next_token()
{
  Token bad;
  if (!skip_trivia(bad)) {
    return bad;
  }

  if (eof()) {
    const auto at = static_cast<uint32_t>(src_.size());
    return {TokenKind::Eof, make_range(at, at), {}};
  }

  const auto c = static_cast<unsigned char>(peek());
  if (is_ident_start(c)) {
    return lex_identifier();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }
  if (c == '"') {
    return lex_string();
  }

  const auto start = static_cast<uint32_t>(pos_);

  struct TwoChar
  {
    std::string_view text;
    TokenKind kind;
  };
  static constexpr TwoChar k_two_char[] = {
    {":=", TokenKind::ColonEq}, {"->", TokenKind::Arrow}, {"==", TokenKind::EqEq},
    {"!=", TokenKind::Ne},      {"<=", TokenKind::Le},    {">=", TokenKind::Ge},
  };
  for (const auto & op : k_two_char) {
    if (starts_with(op.text)) {
      advance(2);
      return make_token(op.kind, start);
    }
  }

  const char ch = peek();
  advance(1);

  switch (ch) {
    case '(':
      return make_token(TokenKind::LParen, start);
    case ')':
      return make_token(TokenKind::RParen, start);
    case '{':
      return make_token(TokenKind::LBrace, start);
    case '}':
      return make_token(TokenKind::RBrace, start);
    case '[':
      return make_token(TokenKind::LBracket, start);
    case ']':
      return make_token(TokenKind::RBracket, start);
    case ',':
      return make_token(TokenKind::Comma, start);
    case ':':
      return make_token(TokenKind::Colon, start);
    case ';':
      return make_token(TokenKind::Semicolon, start);
    case '.':
      return make_token(TokenKind::Dot, start);
    case '+':
      return make_token(TokenKind::Plus, start);
    case '-':
      return make_token(TokenKind::Minus, start);
    case '*':
      return make_token(TokenKind::Star, start);
    case '/':
      return make_token(TokenKind::Slash, start);
    case '%':
      return make_token(TokenKind::Percent, start);
    case '=':
      return make_token(TokenKind::Eq, start);
    case '<':
      return make_token(TokenKind::Lt, start);
    case '>':
      return make_token(TokenKind::Gt, start);
    default:
      break;
  }

  return make_token(TokenKind::Unknown, start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
    // An unterminated block comment swallowed the rest of the input.
    if (t.kind == TokenKind::Unknown && t.text == "/*") {
      const auto at = static_cast<uint32_t>(src_.size());
      out.push_back({TokenKind::Eof, make_range(at, at), {}});
      break;
    }
  }
  return out;
}

}  // namespace filament::syntax
