#include "lexer.hpp"

namespace arbor::parsing {
#include "macros_open.hpp"

  namespace {

    constexpr Char utf8Lead2 = 0xCE, lambdaTrail = 0xBB;           // "λ"
    constexpr Char utf8Lead3 = 0xE2, arrowMid = 0x86, fatMid = 0x87; // "→", "⇒"
    constexpr Char arrowTrail = 0x92;

    auto isAlpha(Char c) -> bool {
      return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }
    auto isDigit(Char c) -> bool {
      return c >= '0' && c <= '9';
    }
    auto isSpace(Char c) -> bool {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    // Length of a Unicode symbol token starting at the current position, or 0.
    auto symbolLength(CharStream const& s, TokenKind& kind) -> size_t {
      auto const c0 = s.peek(0), c1 = s.peek(1), c2 = s.peek(2);
      if (c0 == utf8Lead2 && c1 == lambdaTrail) {
        kind = TokenKind::Lambda;
        return 2;
      }
      if (c0 == utf8Lead3 && (c1 == arrowMid || c1 == fatMid) && c2 == arrowTrail) {
        kind = (c1 == arrowMid) ? TokenKind::Arrow : TokenKind::FatArrow;
        return 3;
      }
      return 0;
    }

    auto isIdentChar(CharStream const& s) -> bool {
      auto const c = s.peek();
      if (!c) return false;
      auto kind = TokenKind::Ident;
      if (symbolLength(s, kind) > 0) return false;
      return isAlpha(*c) || isDigit(*c) || *c == '_' || *c == '.' || *c == '\'' || *c >= 0x80;
    }

  }

  auto Lexer::_skipBlanks() -> void {
    while (true) {
      auto const c = _stream.peek();
      if (c && isSpace(*c)) {
        _stream.advance();
      } else if (c == '-' && _stream.peek(1) == '-') {
        while (_stream.peek() && _stream.peek() != '\n') _stream.advance();
      } else {
        return;
      }
    }
  }

  auto Lexer::offset() -> size_t {
    _skipBlanks();
    return _stream.position();
  }

  auto Lexer::advance() -> std::optional<Token> {
    _offsets.push_back(_stream.position());
    _skipBlanks();
    auto const begin = _stream.position();
    auto const c = _stream.peek();
    if (!c) return {};

    auto token = [this, begin](TokenKind kind) {
      auto const end = _stream.position();
      return Token{kind, _stream.slice(begin, end), begin, end};
    };
    auto single = [this, &token](TokenKind kind) {
      _stream.advance();
      return token(kind);
    };
    auto ident = [this]() {
      while (isIdentChar(_stream)) _stream.advance();
    };

    auto kind = TokenKind::Ident;
    if (auto const n = symbolLength(_stream, kind); n > 0) {
      for (auto i = 0uz; i < n; i++) _stream.advance();
      return token(kind);
    }

    switch (*c) {
      case '(': return single(TokenKind::LParen);
      case ')': return single(TokenKind::RParen);
      case ';': return single(TokenKind::Semicolon);
      case ',': return single(TokenKind::Comma);
      case '\\': return single(TokenKind::Lambda);
      case ':':
        _stream.advance();
        if (_stream.peek() == '=') return single(TokenKind::Assign);
        return token(TokenKind::Colon);
      case '-':
        if (_stream.peek(1) == '>') {
          _stream.advance();
          return single(TokenKind::Arrow);
        }
        break;
      case '=':
        if (_stream.peek(1) == '>') {
          _stream.advance();
          return single(TokenKind::FatArrow);
        }
        break;
      case '?':
        _stream.advance();
        if (!isIdentChar(_stream)) throw ParseError("expected metavariable name after '?'", begin);
        ident();
        return token(TokenKind::Meta);
      default:
        if (isAlpha(*c) || *c == '_' || *c >= 0x80) {
          ident();
          return token((_stream.position() - begin == 1 && *c == '_') ? TokenKind::Hole : TokenKind::Ident);
        }
        break;
    }
    throw ParseError("unexpected character '" + std::string(1, static_cast<char>(*c)) + "'", begin);
  }

#include "macros_close.hpp"
}
