#ifndef ARBOR_ELAB_TACTICS_HPP
#define ARBOR_ELAB_TACTICS_HPP

#include <stdexcept>
#include <string>
#include <parsing/syntax.hpp>
#include "state.hpp"

namespace arbor::elab {
#include "macros_open.hpp"

  // A tactic could not be applied to the main goal.
  class TacticError: public std::runtime_error {
  public:
    explicit TacticError(std::string const& s):
        std::runtime_error(s) {}
  };

  // Runs tactics against the first goal of a proof state, in place.
  // Throws `TacticError`, `ElabError` or `core::BudgetExceeded`; the state is then left half-updated, so callers run
  // this on a copy.
  class TacticRunner {
  public:
    TacticRunner(ProofState& state, Allocator<Expr>& pool):
        _state(state),
        _pool(pool) {}

    auto run(parsing::Tactic const& tactic) -> void;

  private:
    ProofState& _state;
    Allocator<Expr>& _pool;

    auto _main() -> Goal&;
    auto _close(Expr const* proof) -> void;
    auto _global(Goal const& g, char const* name) -> Expr const*;

    auto _intro(std::vector<std::string> const& names, bool all) -> void;
    auto _exact(parsing::Syntax const* s) -> void;
    auto _apply(parsing::Syntax const* s) -> void;
    auto _assumption() -> void;
    auto _exfalso() -> void;
    auto _rfl() -> void;
    auto _have(std::string const& name, parsing::Syntax const* s) -> void;
    auto _admit() -> void;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_ELAB_TACTICS_HPP
