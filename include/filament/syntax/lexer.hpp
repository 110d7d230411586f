// filament/syntax/lexer.hpp - Hand-written lexer for .fil sources
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "filament/syntax/token.hpp"

namespace filament::syntax
{

/**
 * Splits a source buffer into tokens. Comments and whitespace are dropped.
 *
 * The lexer never fails: malformed input (stray characters, unterminated
 * strings or block comments) becomes a TokenKind::Unknown token that the
 * front end reports.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  /// Lex the whole buffer; the last token is always Eof.
  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Skip whitespace and comments. Returns false (with `out` set) on an
  /// unterminated block comment.
  bool skip_trivia(Token & out);

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const noexcept;

  [[nodiscard]] SourceRange make_range(uint32_t start, uint32_t end) const noexcept
  {
    return {file_id_, start, end};
  }

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace filament::syntax
