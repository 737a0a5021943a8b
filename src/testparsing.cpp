#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <parsing/lexer.hpp>
#include <parsing/parser.hpp>

using namespace arbor;
using namespace arbor::parsing;

namespace {

  auto tokenize(std::string const& s) -> std::vector<Token> {
    auto stream = CharStream(s);
    auto lexer = Lexer(stream);
    auto res = std::vector<Token>();
    while (auto const t = lexer.advance()) res.push_back(*t);
    return res;
  }

  auto kinds(std::string const& s) -> std::vector<TokenKind> {
    auto res = std::vector<TokenKind>();
    for (auto const& t: tokenize(s)) res.push_back(t.kind);
    return res;
  }

  // Prints parsed syntax back, fully parenthesized.
  auto show(Syntax const* s) -> std::string {
    return match(
      *s,
      [](Ident const& x) -> std::string { return x.name; },
      [](MetaRef const& x) -> std::string { return "?" + x.name; },
      [](Hole const&) -> std::string { return "_"; },
      [](Universe const& x) -> std::string { return x.type ? "Type" : "Prop"; },
      [](Application const& x) -> std::string { return "(" + show(x.l) + " " + show(x.r) + ")"; },
      [](Binder const& x) -> std::string {
        auto const name = x.name.empty() ? "_" : x.name;
        return (x.pi ? "(pi " : "(lam ") + name + " : " + show(x.t) + ", " + show(x.r) + ")";
      }
    );
  }

  auto parse(std::string const& s) -> std::string {
    auto const res = Parser::expression(s);
    return show(res->root);
  }

  auto errorOffset(std::string const& s, bool step) -> size_t {
    try {
      if (step) Parser::step(s);
      else Parser::expression(s);
    } catch (ParseError& e) { return e.position; }
    ADD_FAILURE() << "no error for \"" << s << "\"";
    return 0;
  }

}

TEST(Lexer, Tokens) {
  using enum TokenKind;
  EXPECT_EQ(kinds("\\x : Nat => x"), (std::vector{Lambda, Ident, Colon, Ident, FatArrow, Ident}));
  EXPECT_EQ(kinds("(a b : Prop) -> ?m _"), (std::vector{LParen, Ident, Ident, Colon, Ident, RParen, Arrow, Meta, Hole}));
  EXPECT_EQ(kinds("intro h; exact h, x := y"), (std::vector{Ident, Ident, Semicolon, Ident, Ident, Comma, Ident, Assign, Ident}));
  EXPECT_EQ(kinds("λ x ⇒ x → x"), (std::vector{Lambda, Ident, FatArrow, Ident, Arrow, Ident}));
  EXPECT_TRUE(kinds("  -- just a comment\n  ").empty());
}

TEST(Lexer, IdentifiersAndPositions) {
  auto const ts = tokenize("Nat.succ  h' ?x_1 _a");
  ASSERT_EQ(ts.size(), 4u);
  EXPECT_EQ(ts[0].lexeme, "Nat.succ");
  EXPECT_EQ(ts[0].begin, 0u);
  EXPECT_EQ(ts[0].end, 8u);
  EXPECT_EQ(ts[1].lexeme, "h'");
  EXPECT_EQ(ts[1].begin, 10u);
  EXPECT_EQ(ts[2].kind, TokenKind::Meta);
  EXPECT_EQ(ts[2].lexeme, "?x_1");
  EXPECT_EQ(ts[3].kind, TokenKind::Ident);
  EXPECT_EQ(ts[3].lexeme, "_a");
}

TEST(Lexer, Revert) {
  auto stream = CharStream("f x y");
  auto lexer = Lexer(stream);
  auto const first = lexer.advance();
  auto const pos = lexer.position();
  auto const second = lexer.advance();
  lexer.revert(pos);
  auto const again = lexer.advance();
  ASSERT_TRUE(first && second && again);
  EXPECT_EQ(second->lexeme, "x");
  EXPECT_EQ(again->lexeme, "x");
  EXPECT_EQ(again->begin, second->begin);
}

TEST(Lexer, Errors) {
  EXPECT_THROW(tokenize("a # b"), ParseError);
  EXPECT_THROW(tokenize("? x"), ParseError);
  try {
    tokenize("abc $");
    FAIL();
  } catch (ParseError& e) { EXPECT_EQ(e.position, 4u); }
}

TEST(Parser, Expressions) {
  EXPECT_EQ(parse("f x y"), "((f x) y)");
  EXPECT_EQ(parse("f (g x)"), "(f (g x))");
  EXPECT_EQ(parse("A -> B -> C"), "(pi _ : A, (pi _ : B, C))");
  EXPECT_EQ(parse("(A -> B) -> C"), "(pi _ : (pi _ : A, B), C)");
  EXPECT_EQ(parse("(A : Type) -> A -> A"), "(pi A : Type, (pi _ : A, A))");
  EXPECT_EQ(parse("(a b : Prop) (h : a) -> b"), "(pi a : Prop, (pi b : Prop, (pi h : a, b)))");
  EXPECT_EQ(parse("\\x : Nat => f x"), "(lam x : Nat, (f x))");
  EXPECT_EQ(parse("fun (x : A) (y : B) => x"), "(lam x : A, (lam y : B, x))");
  EXPECT_EQ(parse("λ x y : A ⇒ x"), "(lam x : A, (lam y : A, x))");
  EXPECT_EQ(parse("Eq ?A _ (Nat.succ Nat.zero)"), "(((Eq ?A) _) (Nat.succ Nat.zero))");
  EXPECT_EQ(parse("f \\x : A => x"), "(f (lam x : A, x))");
  EXPECT_EQ(parse("(((Prop)))"), "Prop");
}

TEST(Parser, SyntaxRanges) {
  auto const res = Parser::expression("  f  x ");
  EXPECT_EQ(res->root->begin, 2u);
  EXPECT_EQ(res->root->end, 6u);
}

TEST(Parser, ExpressionErrors) {
  EXPECT_EQ(errorOffset("f (x", false), 4u);
  EXPECT_EQ(errorOffset("f x)", false), 3u);
  EXPECT_EQ(errorOffset("", false), 0u);
  EXPECT_EQ(errorOffset("\\x => x", false), 3u);
  EXPECT_EQ(errorOffset("(x : A)", false), 7u);
  EXPECT_THROW(Parser::expression("A ->"), ParseError);
}

TEST(Parser, DepthLimit) {
  auto const depth = Parser::maxDepth;
  auto const within = std::string(depth - 1, '(') + "x" + std::string(depth - 1, ')');
  EXPECT_EQ(parse(within), "x");
  EXPECT_THROW(Parser::expression(std::string(depth, '(') + "x" + std::string(depth, ')')), ParseError);

  auto spine = std::string("f");
  for (auto i = 0uz; i + 1 < depth; i++) spine += " x";
  EXPECT_EQ(Parser::expression(spine)->root->depth, depth);
  spine += " x";
  EXPECT_EQ(errorOffset(spine, false), 0u);

  try {
    Parser::step("exact " + std::string(depth, '('));
    FAIL();
  } catch (ParseError& e) { EXPECT_EQ(std::string(e.what()).find("expression nested too deeply"), 0u); }
}

TEST(Parser, Steps) {
  using enum Tactic::Kind;
  auto const res = Parser::step("intro x _ y; exact f x; apply And.intro; have h : A -> B; assumption");
  ASSERT_EQ(res->tactics.size(), 5u);
  EXPECT_EQ(res->tactics[0].kind, Intro);
  EXPECT_EQ(res->tactics[0].names, (std::vector<std::string>{"x", "", "y"}));
  EXPECT_EQ(res->tactics[1].kind, Exact);
  EXPECT_EQ(show(res->tactics[1].expr), "(f x)");
  EXPECT_EQ(res->tactics[2].kind, Apply);
  EXPECT_EQ(show(res->tactics[2].expr), "And.intro");
  EXPECT_EQ(res->tactics[3].kind, Have);
  EXPECT_EQ(res->tactics[3].names, (std::vector<std::string>{"h"}));
  EXPECT_EQ(show(res->tactics[3].expr), "(pi _ : A, B)");
  EXPECT_EQ(res->tactics[4].kind, Assumption);
  EXPECT_EQ(res->tactics[1].begin, 13u);
  EXPECT_EQ(res->tactics[1].end, 22u);

  auto const simple = Parser::step("intros; exfalso; rfl; sorry; admit; skip");
  auto expected = std::vector{Intros, Exfalso, Rfl, Sorry, Admit, Skip};
  ASSERT_EQ(simple->tactics.size(), expected.size());
  for (auto i = 0uz; i < expected.size(); i++) EXPECT_EQ(simple->tactics[i].kind, expected[i]);
  EXPECT_TRUE(simple->tactics[0].names.empty());
}

TEST(Parser, StepErrors) {
  EXPECT_EQ(errorOffset("malformed(((", true), 0u);
  EXPECT_EQ(errorOffset("intro x; frobnicate", true), 9u);
  EXPECT_EQ(errorOffset("exact", true), 5u);
  EXPECT_EQ(errorOffset("rfl rfl", true), 4u);
  EXPECT_EQ(errorOffset("have : A", true), 5u);
  EXPECT_EQ(errorOffset("intro x;", true), 8u);
  EXPECT_EQ(errorOffset("", true), 0u);
  try {
    Parser::step("intro x; frobnicate");
    FAIL();
  } catch (ParseError& e) { EXPECT_EQ(std::string(e.what()), "unknown tactic 'frobnicate' (at offset 9)"); }
}
