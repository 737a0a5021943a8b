#ifndef ARBOR_PARSING_SYNTAX_HPP
#define ARBOR_PARSING_SYNTAX_HPP

#include <string>
#include <variant>
#include <vector>
#include <common.hpp>

namespace arbor::parsing {
#include "macros_open.hpp"

  // Surface syntax, before name resolution.
  // Nodes are allocated in the `Allocator<Syntax>` of the object returned by the parser.

  // clang-format off
  class Syntax;
  struct Ident    { std::string name; };                          // `x`, `Nat.succ`
  struct MetaRef  { std::string name; };                          // `?x`
  struct Hole     {};                                             // `_`
  struct Universe { bool type; };                                 // `Prop` (false) or `Type` (true)
  struct Application { Syntax const *l, *r; };                   // `l r`
  struct Binder   { bool pi; std::string name; Syntax const *t, *r; }; // `\x: t => r` or `(x: t) -> r`
  // clang-format on

  class Syntax: public std::variant<Ident, MetaRef, Hole, Universe, Application, Binder> {
  public:
    using variant::variant;

    size_t begin = 0; // Start index in the source text.
    size_t end = 0;   // End index in the source text.
    size_t depth = 1; // Height of the subtree.
  };

  // A parsed expression.
  struct ParsedExpr {
    Allocator<Syntax> pool;
    Syntax const* root = nullptr;
  };

  // A single tactic invocation.
  struct Tactic {
    enum class Kind: uint32_t { Intro, Intros, Exact, Apply, Assumption, Exfalso, Rfl, Have, Sorry, Admit, Skip };
    using enum Kind;

    Kind kind;
    std::vector<std::string> names; // Introduced names (`intro`, `intros`, `have`).
    Syntax const* expr = nullptr;   // Argument expression (`exact`, `apply`, `have`).
    size_t begin = 0;
    size_t end = 0;
  };

  // A parsed step: tactics separated by `;`, run left to right.
  struct ParsedStep {
    Allocator<Syntax> pool;
    std::vector<Tactic> tactics;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_PARSING_SYNTAX_HPP
