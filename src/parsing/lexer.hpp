#ifndef ARBOR_PARSING_LEXER_HPP
#define ARBOR_PARSING_LEXER_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "stream.hpp"

namespace arbor::parsing {
#include "macros_open.hpp"

  // Thrown on malformed input; `position` is a byte offset into the source text.
  class ParseError: public std::runtime_error {
  public:
    size_t position;
    ParseError(std::string const& s, size_t position):
        std::runtime_error(s + " (at offset " + std::to_string(position) + ")"),
        position(position) {}
  };

  // clang-format off
  enum class TokenKind: uint32_t {
    Ident,      // `x`, `Nat.succ`, `h'`
    Meta,       // `?x`
    Hole,       // `_`
    LParen,     // `(`
    RParen,     // `)`
    Colon,      // `:`
    Assign,     // `:=`
    Arrow,      // `->` or `→`
    FatArrow,   // `=>` or `⇒`
    Lambda,     // `\` or `λ`
    Semicolon,  // `;`
    Comma       // `,`
  };
  // clang-format on

  // A token emitted by a lexer.
  struct Token {
    TokenKind kind;
    std::string_view lexeme; // Lexeme. `lexeme.size() == end - begin`.
    size_t begin;            // Start index in original character stream.
    size_t end;              // End index in original character stream.
  };

  // Hand-written lexer; a "revertable stream" of `Token`.
  // Whitespace and `--` line comments are skipped.
  class Lexer: public IStream<Token> {
  public:
    // Given reference must be valid over the `Lexer`'s lifetime.
    explicit Lexer(CharStream& stream):
        _stream(stream) {}

    // Throws `ParseError` on characters that cannot start a token.
    auto advance() -> std::optional<Token> override;
    auto position() const -> size_t override {
      return _offsets.size();
    }
    auto revert(size_t i) -> void override {
      assert(i <= _offsets.size());
      if (i < _offsets.size())
        _stream.revert(_offsets[i]);
      _offsets.resize(i);
    }

    // Byte offset where the next token (if any) would be scanned from, after skipping blanks.
    auto offset() -> size_t;

  private:
    CharStream& _stream;          // Underlying stream.
    std::vector<size_t> _offsets; // Stream offsets before each token read.

    auto _skipBlanks() -> void;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_PARSING_LEXER_HPP
