#ifndef ARBOR_ELAB_ELABORATOR_HPP
#define ARBOR_ELAB_ELABORATOR_HPP

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <parsing/syntax.hpp>
#include "state.hpp"

namespace arbor::elab {
#include "macros_open.hpp"

  // Name resolution or type inference failure. `begin` and `end` locate the offending syntax, when known.
  class ElabError: public std::runtime_error {
  public:
    size_t begin, end;
    explicit ElabError(std::string const& s, size_t begin = 0, size_t end = 0):
        std::runtime_error(s),
        begin(begin),
        end(end) {}
  };

  // Turns surface syntax into core expressions inside a proof state, and infers their types.
  // Holes and `?x` become metavariables of the state; equations between types are solved as they arise.
  // Types may be unknown (`nullptr`), e.g. for auto-bound atoms and metavariables without a type, in which case the
  // corresponding checks are skipped.
  class Elaborator {
  public:
    // When `autoBound` is set, unknown identifiers are pushed into the context as opaque atoms of unknown type.
    Elaborator(ProofState& state, Allocator<Expr>& pool, bool autoBound = false):
        _state(state),
        _pool(pool),
        _autoBound(autoBound) {}

    // Throws `ElabError`. May extend `ctx` (auto-bound atoms only).
    auto elaborate(parsing::Syntax const* s, Context& ctx) -> Expr const*;

    // Returns the type of `e` (normalized), or `nullptr` if unknown. Throws `ElabError`.
    auto infer(Expr const* e, Context const& ctx) -> Expr const*;

    // Same as `infer`, but throws if the result is not a sort (or unknown).
    auto inferSort(Expr const* e, Context const& ctx) -> Expr const*;

    // Requires the two types to be equal, solving metavariables as needed. Throws `ElabError` on mismatch.
    auto equate(Expr const* expected, Expr const* actual, Context const& ctx) -> void;

    // Metavariables created from `?name` during this elaboration, in order of first appearance.
    auto namedMetas() const -> std::vector<std::pair<std::string, uint64_t>> const& {
      return _named;
    }

  private:
    ProofState& _state;
    Allocator<Expr>& _pool;
    bool _autoBound;
    std::vector<std::pair<std::string, uint64_t>> _named;
    std::vector<std::string> _bound; // Names of binders above the current node.
    std::vector<Expr const*> _stk;   // Types of binders above the current node (for `infer`).

    auto _elaborate(parsing::Syntax const* s, Context& ctx) -> Expr const*;
    auto _infer(Expr const* e, Context const& ctx) -> Expr const*;
    auto _show(Expr const* e, Context const& ctx) -> std::string;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_ELAB_ELABORATOR_HPP
