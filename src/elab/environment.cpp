#include "environment.hpp"
#include <fstream>
#include <stdexcept>
#include <utility>
#include <parsing/parser.hpp>
#include "elaborator.hpp"

using std::string;

namespace arbor::elab {
#include "macros_open.hpp"

  namespace {

    // clang-format off
    constexpr std::pair<char const*, char const*> prelude[] = {
      {"Nat",        "Type"},
      {"Nat.zero",   "Nat"},
      {"Nat.succ",   "Nat -> Nat"},
      {"Eq",         "(A : Type) -> A -> A -> Prop"},
      {"Eq.refl",    "(A : Type) (a : A) -> Eq A a a"},
      {"True",       "Prop"},
      {"True.intro", "True"},
      {"False",      "Prop"},
      {"False.elim", "(C : Prop) -> False -> C"},
      {"Not",        "Prop -> Prop"},
      {"Not.intro",  "(a : Prop) -> (a -> False) -> Not a"},
      {"Not.elim",   "(a : Prop) -> Not a -> a -> False"},
      {"And",        "Prop -> Prop -> Prop"},
      {"And.intro",  "(a b : Prop) -> a -> b -> And a b"},
      {"And.left",   "(a b : Prop) -> And a b -> a"},
      {"And.right",  "(a b : Prop) -> And a b -> b"},
      {"Or",         "Prop -> Prop -> Prop"},
      {"Or.inl",     "(a b : Prop) -> a -> Or a b"},
      {"Or.inr",     "(a b : Prop) -> b -> Or a b"},
      {"Or.elim",    "(a b c : Prop) -> Or a b -> (a -> c) -> (b -> c) -> c"},
    };
    // clang-format on

    auto trim(string const& s) -> string {
      auto const first = s.find_first_not_of(" \t\r");
      if (first == string::npos) return "";
      auto const last = s.find_last_not_of(" \t\r");
      return s.substr(first, last + 1 - first);
    }

  }

  Environment::Environment(Allocator<Expr>& pool):
      _pool(pool) {
    for (auto const& [name, type]: prelude) declare(name, type);
  }

  auto Environment::declare(string const& name, string const& type) -> void {
    auto const parsed = parsing::Parser::expression(name);
    auto const ident = std::get_if<parsing::Ident>(parsed->root);
    if (!ident || ident->name != name) throw ElabError("invalid constant name '" + name + "'");
    if (_ctx.lookup(name)) throw ElabError("'" + name + "' has already been declared");

    auto const syntax = parsing::Parser::expression(type);
    auto state = ProofState();
    auto elab = Elaborator(state, _pool);
    auto ctx = _ctx;
    auto const e = elab.elaborate(syntax->root, ctx);
    if (!elab.inferSort(e, ctx)) throw ElabError("cannot infer the sort of " + state.show(e, ctx, _pool));
    auto const res = state.instantiate(e, _pool);
    if (!res->isGround()) throw ElabError("type of '" + name + "' contains placeholders");
    _ctx.push(name, res);
  }

  auto Environment::load(string const& path) -> void {
    auto in = std::ifstream(path);
    if (!in) throw std::runtime_error("cannot open " + path);
    auto line = string();
    auto last = std::optional<size_t>();
    for (auto i = 0uz; std::getline(in, line); i++) {
      if (auto const p = line.find("--"); p != string::npos) line.resize(p);
      if (trim(line).empty()) continue;
      auto const colon = line.find(':');
      auto const name = trim(line.substr(0, colon));
      try {
        if (colon == string::npos || name.empty()) throw std::runtime_error("expected `name : type`");
        declare(name, line.substr(colon + 1));
      } catch (std::runtime_error& e) {
        throw std::runtime_error(path + ":" + std::to_string(i + 1) + ": " + e.what());
      }
      last = i;
    }
    _location = Location{path, last ? *last + 1 : 0};
  }

#include "macros_close.hpp"
}
