#include "state.hpp"
#include <algorithm>

namespace arbor::elab {
#include "macros_open.hpp"

  auto ProofState::assign(procs::Subs const& subs, Allocator<Expr>& pool) -> bool {
    auto next = assignment;
    if (next.size() < subs.size()) next.resize(subs.size(), nullptr);
    for (auto i = 0uz; i < subs.size(); i++)
      if (subs[i]) next[i] = subs[i];

    // Check scopes, and shrink the scopes of metavariables occurring in solutions
    auto scopes = std::vector<size_t>();
    for (auto const& decl: metas) scopes.push_back(decl.scope);
    for (auto i = 0uz; i < subs.size(); i++) {
      if (!subs[i]) continue;
      auto const scope = (i < scopes.size()) ? scopes[i] : 0uz;
      auto ok = true;
      procs::applySubs(subs[i], next, pool)->updateVars(
        [&](uint64_t, Expr const* x) {
          if (x->var.tag == Expr::VFree && x->var.id >= scope) ok = false;
          if (x->var.tag == Expr::VMeta && x->var.id < scopes.size())
            scopes[x->var.id] = std::min(scopes[x->var.id], scope);
          return x;
        },
        pool
      );
      if (!ok) return false;
    }

    assignment = std::move(next);
    for (auto i = 0uz; i < metas.size(); i++) metas[i].scope = scopes[i];
    return true;
  }

  auto ProofState::unify(Expr const* lhs, Expr const* rhs, Allocator<Expr>& pool) -> bool {
    auto const res = procs::unify({{normalize(lhs, pool), normalize(rhs, pool)}}, pool);
    return res && assign(*res, pool);
  }

  auto ProofState::prune() -> void {
    std::erase_if(goals, [this](Goal const& g) { return assigned(g.meta); });
  }

  auto ProofState::show(Expr const* e, Context const& ctx, Allocator<Expr>& pool) const -> std::string {
    auto names = std::vector<std::string>();
    for (auto const& decl: metas) names.push_back(decl.name);
    return instantiate(e, pool)->toString(ctx, names);
  }

#include "macros_close.hpp"
}
