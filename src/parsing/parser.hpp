#ifndef ARBOR_PARSING_PARSER_HPP
#define ARBOR_PARSING_PARSER_HPP

#include <memory>
#include <optional>
#include <string>
#include "lexer.hpp"
#include "syntax.hpp"

namespace arbor::parsing {
#include "macros_open.hpp"

  // Recursive descent parser for expressions and tactic steps.
  //
  //   expr   ::= lambda binders "=>" expr
  //            | ("(" ident+ ":" expr ")")+ "->" expr
  //            | app ["->" expr]
  //   lambda ::= "\" | "λ" | "fun"
  //   app    ::= atom atom*
  //   atom   ::= ident | "?" ident | "_" | "Prop" | "Type" | "(" expr ")"
  //
  //   step   ::= tactic (";" tactic)*
  //   tactic ::= "intro" ident* | "intros" ident* | "exact" expr | "apply" expr | "have" ident ":" expr
  //            | "assumption" | "exfalso" | "rfl" | "sorry" | "admit" | "skip"
  //
  // All functions throw `ParseError` on failure.
  class Parser {
  public:
    // Limit on the height of syntax trees, and on the nesting of expressions while parsing them.
    static constexpr size_t maxDepth = 1000;

    // Parses a whole string as a single expression.
    static auto expression(std::string const& s) -> std::unique_ptr<ParsedExpr>;

    // Parses a whole string as a tactic step.
    static auto step(std::string const& s) -> std::unique_ptr<ParsedStep>;

  private:
    CharStream _stream;
    Lexer _lexer;
    Allocator<Syntax>& _pool;
    size_t _lastEnd = 0; // End index of the last consumed token.
    size_t _nesting = 0;

    Parser(std::string const& s, Allocator<Syntax>& pool):
        _stream(s),
        _lexer(_stream),
        _pool(pool) {}

    auto _peek() -> std::optional<Token>;
    auto _next() -> std::optional<Token>;
    auto _expect(TokenKind kind, char const* what) -> Token;
    auto _isKeyword(std::optional<Token> const& t, std::string_view word) -> bool;
    auto _expectEnd() -> void;

    auto _expr() -> Syntax const*;
    auto _exprUnchecked() -> Syntax const*;
    auto _lambda(size_t begin) -> Syntax const*;
    auto _piGroups(size_t begin) -> Syntax const*;
    auto _app() -> Syntax const*;
    auto _atom() -> Syntax const*;
    auto _startsAtom(std::optional<Token> const& t) -> bool;
    auto _binderGroup(std::vector<std::pair<std::string, Syntax const*>>& out) -> bool;
    auto _tactic() -> Tactic;

    template <typename T>
    auto _node(T&& val, size_t begin, size_t end) -> Syntax const* {
      auto const res = _pool.make(std::forward<T>(val));
      res->begin = begin;
      res->end = end;
      _setDepth(res);
      return res;
    }

    auto _setDepth(Syntax* node) -> void;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_PARSING_PARSER_HPP
