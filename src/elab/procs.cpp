#include "procs.hpp"

using std::vector;
using std::pair;
using std::optional;

namespace arbor::elab::procs {
#include "macros_open.hpp"

  using enum Expr::Tag;
  using enum Expr::VarTag;

  // The Robinson's unification algorithm (could take exponential time for certain cases).
  // See: https://en.wikipedia.org/wiki/Unification_(computer_science)#A_unification_algorithm
  auto unify(vector<pair<Expr const*, Expr const*>> eqs, Allocator<Expr>& pool) -> optional<Subs> {
    auto res = Subs();
    auto& a = eqs;

    // Add a new substitution to `res`, then update the rest of `a` to eliminate the variable with id `id`.
    // Pre: `e` has no loose bound variables, so it needs no lifting when moved under binders.
    auto putsubs = [&res, &pool, &a](uint64_t id, Expr const* e, size_t i0) -> void {
      // Make enough space
      while (id >= res.size()) res.push_back(nullptr);
      res[id] = e;
      // Update the rest of `a`
      auto f = [id, e](uint64_t, Expr const* x) { return (x->var.tag == VMeta && x->var.id == id) ? e : x; };
      for (auto i = i0; i < a.size(); i++) {
        a[i].first = a[i].first->updateVars(f, pool);
        a[i].second = a[i].second->updateVars(f, pool);
      }
    };

    // Variable elimination. Fails on occurrence, or when `e` refers to a bound variable.
    auto eliminate = [&putsubs](uint64_t id, Expr const* e, size_t i0) -> bool {
      if (e->occurs(VMeta, id)) return false;
      if (e->hasLooseBound()) return false;
      putsubs(id, e, i0);
      return true;
    };

    // Each step transforms `a` into an equivalent set of equations
    // (in `a` and `res`; the latter contains equations in triangular/solved form.)
    for (auto i = 0uz; i < a.size(); i++) {
      budget().tick();
      auto const [lhs, rhs] = a[i];
      if (lhs->tag == Var && lhs->var.tag == VMeta) {
        if (*lhs != *rhs && !eliminate(lhs->var.id, rhs, i + 1)) return {};
      } else if (rhs->tag == Var && rhs->var.tag == VMeta) {
        if (!eliminate(rhs->var.id, lhs, i + 1)) return {};
      } else {
        // Try term reduction.
        if (lhs->tag != rhs->tag) return {};
        switch (lhs->tag) {
          case Sort:
            if (lhs->sort.tag != rhs->sort.tag) return {};
            break;
          case Var:
            if (lhs->var.tag != rhs->var.tag || lhs->var.id != rhs->var.id) return {};
            break;
          case App:
            a.emplace_back(lhs->app.l, rhs->app.l);
            a.emplace_back(lhs->app.r, rhs->app.r);
            break;
          case Lam:
            a.emplace_back(lhs->lam.t, rhs->lam.t);
            a.emplace_back(lhs->lam.r, rhs->lam.r);
            break;
          case Pi:
            a.emplace_back(lhs->pi.t, rhs->pi.t);
            a.emplace_back(lhs->pi.r, rhs->pi.r);
            break;
        }
      }
    }
    return res;
  }

#include "macros_close.hpp"
}
