#ifndef ARBOR_ELAB_PROCS_HPP
#define ARBOR_ELAB_PROCS_HPP

#include <optional>
#include <utility>
#include <vector>
#include <core/expr.hpp>

// Some syntactic operations on metavariables
namespace arbor::elab::procs {
#include "macros_open.hpp"

  using namespace core;

  // A substitution of meta-variables with id in the interval [0, `ts.size()`).
  // `ts` should not contain circular dependencies. Use `nullptr` to represent unmodified variables.
  using Subs = std::vector<Expr const*>;

  // Replaces every assigned metavariable, recursively.
  inline auto applySubs(Expr const* e, Subs const& subs, Allocator<Expr>& pool) -> Expr const* {
    return e->updateVars(
      [&subs, &pool](uint64_t, Expr const* x) {
        return (x->var.tag == Expr::VMeta && x->var.id < subs.size() && subs[x->var.id])
               ? applySubs(subs[x->var.id], subs, pool)
               : x;
      },
      pool
    );
  }

  // First-order (syntactical) unification.
  // All variables with `var.tag == VMeta` are considered as undetermined variables; others are just constants.
  // Metavariables stand for closed terms: they are never assigned an expression with loose bound variables.
  // Returns { mgu }, or `nullopt` if mgu does not exist.
  // Each processed equation costs one step of the current `budget()`.
  auto unify(std::vector<std::pair<Expr const*, Expr const*>> eqs, Allocator<Expr>& pool) -> std::optional<Subs>;

#include "macros_close.hpp"
}

#endif // ARBOR_ELAB_PROCS_HPP
