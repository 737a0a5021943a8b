#include "parser.hpp"
#include <algorithm>
#include <unordered_map>

using std::string;
using std::string_view;
using std::vector;
using std::pair;

namespace arbor::parsing {
#include "macros_open.hpp"

  auto Parser::expression(string const& s) -> std::unique_ptr<ParsedExpr> {
    auto res = std::make_unique<ParsedExpr>();
    auto parser = Parser(s, res->pool);
    res->root = parser._expr();
    parser._expectEnd();
    return res;
  }

  auto Parser::step(string const& s) -> std::unique_ptr<ParsedStep> {
    auto res = std::make_unique<ParsedStep>();
    auto parser = Parser(s, res->pool);
    res->tactics.push_back(parser._tactic());
    while (true) {
      auto const t = parser._peek();
      if (!t || t->kind != TokenKind::Semicolon) break;
      parser._next();
      res->tactics.push_back(parser._tactic());
    }
    parser._expectEnd();
    return res;
  }

  auto Parser::_peek() -> std::optional<Token> {
    auto const pos = _lexer.position();
    auto const res = _lexer.advance();
    _lexer.revert(pos);
    return res;
  }

  auto Parser::_next() -> std::optional<Token> {
    auto const res = _lexer.advance();
    if (res) _lastEnd = res->end;
    return res;
  }

  auto Parser::_expect(TokenKind kind, char const* what) -> Token {
    auto const t = _next();
    if (!t || t->kind != kind) throw ParseError(string("expected ") + what, t ? t->begin : _lexer.offset());
    return *t;
  }

  auto Parser::_isKeyword(std::optional<Token> const& t, string_view word) -> bool {
    return t && t->kind == TokenKind::Ident && t->lexeme == word;
  }

  auto Parser::_expectEnd() -> void {
    if (auto const t = _peek(); t) throw ParseError("unexpected token '" + string(t->lexeme) + "'", t->begin);
  }

  auto Parser::_setDepth(Syntax* node) -> void {
    node->depth = 1 + match(
      *node,
      [](Application const& x) { return std::max(x.l->depth, x.r->depth); },
      [](Binder const& x) { return std::max(x.t->depth, x.r->depth); },
      [](auto const&) { return 0uz; }
    );
    if (node->depth > maxDepth) throw ParseError("expression nested too deeply", node->begin);
  }

  auto Parser::_expr() -> Syntax const* {
    if (_nesting >= maxDepth) throw ParseError("expression nested too deeply", _lexer.offset());
    _nesting++;
    auto const res = _exprUnchecked();
    _nesting--;
    return res;
  }

  auto Parser::_exprUnchecked() -> Syntax const* {
    auto const t = _peek();
    if (!t) throw ParseError("expected expression", _lexer.offset());
    if (t->kind == TokenKind::Lambda || _isKeyword(t, "fun")) {
      _next();
      return _lambda(t->begin);
    }
    if (t->kind == TokenKind::LParen) {
      if (auto const res = _piGroups(t->begin); res) return res;
    }
    auto const l = _app();
    if (auto const u = _peek(); u && u->kind == TokenKind::Arrow) {
      _next();
      auto const r = _expr();
      return _node(Binder{true, "", l, r}, l->begin, r->end);
    }
    return l;
  }

  // Tries to read `"(" ident+ ":" expr ")"`. Returns false without consuming anything if the input does not start
  // with `"(" ident+ ":"`; after the colon, failures are errors.
  auto Parser::_binderGroup(vector<pair<string, Syntax const*>>& out) -> bool {
    auto const pos = _lexer.position();
    auto const lp = _next();
    if (!lp || lp->kind != TokenKind::LParen) {
      _lexer.revert(pos);
      return false;
    }
    auto names = vector<string>();
    while (true) {
      auto const t = _peek();
      if (!t) break;
      if (t->kind == TokenKind::Hole) names.emplace_back();
      else if (t->kind == TokenKind::Ident && t->lexeme != "Prop" && t->lexeme != "Type" && t->lexeme != "fun")
        names.emplace_back(t->lexeme);
      else break;
      _next();
    }
    auto const colon = _peek();
    if (names.empty() || !colon || colon->kind != TokenKind::Colon) {
      _lexer.revert(pos);
      return false;
    }
    _next();
    auto const type = _expr();
    _expect(TokenKind::RParen, "')'");
    for (auto const& name: names) out.emplace_back(name, type);
    return true;
  }

  auto Parser::_piGroups(size_t begin) -> Syntax const* {
    auto groups = vector<pair<string, Syntax const*>>();
    while (_binderGroup(groups)) {}
    if (groups.empty()) return nullptr;
    _expect(TokenKind::Arrow, "'->' after binder");
    auto res = _expr();
    for (auto i = groups.size(); i-- > 0;) res = _node(Binder{true, groups[i].first, groups[i].second, res}, begin, res->end);
    return res;
  }

  auto Parser::_lambda(size_t begin) -> Syntax const* {
    auto groups = vector<pair<string, Syntax const*>>();
    if (auto const t = _peek(); t && t->kind == TokenKind::LParen) {
      while (_binderGroup(groups)) {}
      if (groups.empty()) throw ParseError("expected binder", t->begin);
    } else {
      auto names = vector<string>();
      while (true) {
        auto const u = _peek();
        if (u && u->kind == TokenKind::Hole) names.emplace_back();
        else if (u && u->kind == TokenKind::Ident) names.emplace_back(u->lexeme);
        else break;
        _next();
      }
      if (names.empty()) throw ParseError("expected binder name", _lexer.offset());
      _expect(TokenKind::Colon, "':' after binder name");
      auto const type = _expr();
      for (auto const& name: names) groups.emplace_back(name, type);
    }
    _expect(TokenKind::FatArrow, "'=>'");
    auto res = _expr();
    for (auto i = groups.size(); i-- > 0;)
      res = _node(Binder{false, groups[i].first, groups[i].second, res}, begin, res->end);
    return res;
  }

  auto Parser::_startsAtom(std::optional<Token> const& t) -> bool {
    if (!t) return false;
    switch (t->kind) {
      case TokenKind::Ident:
      case TokenKind::Meta:
      case TokenKind::Hole:
      case TokenKind::LParen:
      case TokenKind::Lambda: return true;
      default: return false;
    }
  }

  auto Parser::_app() -> Syntax const* {
    auto res = _atom();
    while (_startsAtom(_peek())) {
      auto const r = _atom();
      res = _node(Application{res, r}, res->begin, r->end);
    }
    return res;
  }

  auto Parser::_atom() -> Syntax const* {
    auto const t = _next();
    if (!t) throw ParseError("expected expression", _lexer.offset());
    switch (t->kind) {
      case TokenKind::Ident:
        if (t->lexeme == "Prop") return _node(Universe{false}, t->begin, t->end);
        if (t->lexeme == "Type") return _node(Universe{true}, t->begin, t->end);
        if (t->lexeme == "fun") return _lambda(t->begin);
        return _node(Ident{string(t->lexeme)}, t->begin, t->end);
      case TokenKind::Meta: return _node(MetaRef{string(t->lexeme.substr(1))}, t->begin, t->end);
      case TokenKind::Hole: return _node(Hole{}, t->begin, t->end);
      case TokenKind::Lambda: return _lambda(t->begin);
      case TokenKind::LParen: {
        auto const res = _expr();
        _expect(TokenKind::RParen, "')'");
        return res;
      }
      default: break;
    }
    throw ParseError("unexpected token '" + string(t->lexeme) + "'", t->begin);
  }

  auto Parser::_tactic() -> Tactic {
    using enum Tactic::Kind;
    static auto const kinds = std::unordered_map<string_view, Tactic::Kind>{
      {     "intro",      Intro},
      {    "intros",     Intros},
      {     "exact",      Exact},
      {     "apply",      Apply},
      {"assumption", Assumption},
      {   "exfalso",    Exfalso},
      {       "rfl",        Rfl},
      {      "have",       Have},
      {     "sorry",      Sorry},
      {     "admit",      Admit},
      {      "skip",       Skip},
    };

    auto const t = _next();
    if (!t) throw ParseError("expected tactic", _lexer.offset());
    if (t->kind != TokenKind::Ident) throw ParseError("expected tactic", t->begin);
    auto const it = kinds.find(t->lexeme);
    if (it == kinds.end()) throw ParseError("unknown tactic '" + string(t->lexeme) + "'", t->begin);

    auto res = Tactic{it->second};
    res.begin = t->begin;
    switch (res.kind) {
      case Intro:
      case Intros:
        while (true) {
          auto const u = _peek();
          if (u && u->kind == TokenKind::Hole) res.names.emplace_back();
          else if (u && u->kind == TokenKind::Ident) res.names.emplace_back(u->lexeme);
          else break;
          _next();
        }
        break;
      case Exact:
      case Apply: res.expr = _expr(); break;
      case Have:
        res.names.emplace_back(_expect(TokenKind::Ident, "hypothesis name").lexeme);
        _expect(TokenKind::Colon, "':'");
        res.expr = _expr();
        break;
      case Assumption:
      case Exfalso:
      case Rfl:
      case Sorry:
      case Admit:
      case Skip: break;
    }
    res.end = _lastEnd;
    return res;
  }

#include "macros_close.hpp"
}
