#include "expr.hpp"
#include <algorithm>

using std::string;
using std::vector;

namespace arbor::core {
#include "macros_open.hpp"

  auto Expr::operator==(Expr const& rhs) const noexcept -> bool {
    if (this == &rhs) return true;
    if (tag != rhs.tag) return false;
    // Mid: tag == rhs.tag
    switch (tag) {
      case Sort: return sort.tag == rhs.sort.tag;
      case Var: return var.tag == rhs.var.tag && var.id == rhs.var.id;
      case App: return *app.l == *rhs.app.l && *app.r == *rhs.app.r;
      case Lam: return *lam.t == *rhs.lam.t && *lam.r == *rhs.lam.r; // Ignore bound variable names
      case Pi: return *pi.t == *rhs.pi.t && *pi.r == *rhs.pi.r;      // Ignore bound variable names
    }
    unreachable;
  }

  // Give unnamed bound variables a generated name
  auto Expr::newName(size_t i) -> string {
    constexpr size_t Letters = 26;
    auto res = string("__");
    do {
      res.push_back(static_cast<char>('a' + i % Letters));
      i /= Letters;
    } while (i > 0);
    return res;
  }

  // Undefined variables should be OK, as long as pointers are valid.
  auto Expr::toString(Context const& ctx, vector<string> const& metas, vector<string>& stk) const -> string {
    switch (tag) {
      case Sort:
        switch (sort.tag) {
          case SProp: return "Prop";
          case SType: return "Type";
          case SKind: return "Kind";
        }
        unreachable;
      case Var:
        switch (var.tag) {
          case VBound:
            if (var.id < stk.size()) return stk[stk.size() - 1 - var.id];
            return "?b" + std::to_string(var.id - stk.size());
          case VFree:
            if (var.id < ctx.size()) return ctx.identifier(var.id);
            return "?f" + std::to_string(var.id - ctx.size());
          case VMeta:
            if (var.id < metas.size() && !metas[var.id].empty()) return "?" + metas[var.id];
            return "?m" + std::to_string(var.id);
        }
        unreachable;
      case App: {
        auto const fl = (app.l->tag != Sort && app.l->tag != Var && app.l->tag != App);
        auto const fr = (app.r->tag != Sort && app.r->tag != Var);
        return (fl ? "(" : "") + app.l->toString(ctx, metas, stk) + (fl ? ")" : "") + " " + (fr ? "(" : "")
             + app.r->toString(ctx, metas, stk) + (fr ? ")" : "");
      }
      case Lam: {
        auto const name = lam.s.empty() ? newName(stk.size()) : lam.s;
        auto res = "\\" + name + ": " + lam.t->toString(ctx, metas, stk);
        stk.push_back(name);
        res += " => " + lam.r->toString(ctx, metas, stk);
        stk.pop_back();
        return res;
      }
      case Pi: {
        auto const name = pi.s.empty() ? newName(stk.size()) : pi.s;
        auto res = string();
        if (!pi.r->occursBound(0)) {
          // Non-dependent arrow
          auto const f = (pi.t->tag == Pi || pi.t->tag == Lam);
          res = (f ? "(" : "") + pi.t->toString(ctx, metas, stk) + (f ? ")" : "");
        } else {
          res = "(" + name + ": " + pi.t->toString(ctx, metas, stk) + ")";
        }
        stk.push_back(name);
        res += " -> " + pi.r->toString(ctx, metas, stk);
        stk.pop_back();
        return res;
      }
    }
    unreachable;
  }

  auto Expr::reduce(Allocator<Expr>& pool) const -> Expr const* {
    budget().tick();
    switch (tag) {
      case Sort: return this;
      case Var: return this;
      case App: {
        // Applicative order: reduce subexpressions first
        auto const l = app.l->reduce(pool);
        auto const r = app.r->reduce(pool);
        if (l->tag == Lam) return l->lam.r->makeReplace(r, pool)->reduce(pool);
        return (l == app.l && r == app.r) ? this : pool.make(l, r);
      }
      case Lam: {
        auto const t = lam.t->reduce(pool);
        auto const r = lam.r->reduce(pool);
        return (t == lam.t && r == lam.r) ? this : pool.make(LLam, lam.s, t, r);
      }
      case Pi: {
        auto const t = pi.t->reduce(pool);
        auto const r = pi.r->reduce(pool);
        return (t == pi.t && r == pi.r) ? this : pool.make(PPi, pi.s, t, r);
      }
    }
    unreachable;
  }

  auto Expr::occurs(VarTag vartag, uint64_t id) const noexcept -> bool {
    switch (tag) {
      case Sort: return false;
      case Var: return var.tag == vartag && var.id == id;
      case App: return app.l->occurs(vartag, id) || app.r->occurs(vartag, id);
      case Lam: return lam.t->occurs(vartag, id) || lam.r->occurs(vartag, id);
      case Pi: return pi.t->occurs(vartag, id) || pi.r->occurs(vartag, id);
    }
    unreachable;
  }

  auto Expr::occursBound(uint64_t n) const noexcept -> bool {
    switch (tag) {
      case Sort: return false;
      case Var: return var.tag == VBound && var.id == n;
      case App: return app.l->occursBound(n) || app.r->occursBound(n);
      case Lam: return lam.t->occursBound(n) || lam.r->occursBound(n + 1);
      case Pi: return pi.t->occursBound(n) || pi.r->occursBound(n + 1);
    }
    unreachable;
  }

  auto Expr::hasLooseBound(uint64_t n) const noexcept -> bool {
    switch (tag) {
      case Sort: return false;
      case Var: return var.tag == VBound && var.id >= n;
      case App: return app.l->hasLooseBound(n) || app.r->hasLooseBound(n);
      case Lam: return lam.t->hasLooseBound(n) || lam.r->hasLooseBound(n + 1);
      case Pi: return pi.t->hasLooseBound(n) || pi.r->hasLooseBound(n + 1);
    }
    unreachable;
  }

  auto Expr::numMeta() const noexcept -> size_t {
    switch (tag) {
      case Sort: return 0;
      case Var: return (var.tag == VMeta) ? (var.id + 1) : 0;
      case App: return std::max(app.l->numMeta(), app.r->numMeta());
      case Lam: return std::max(lam.t->numMeta(), lam.r->numMeta());
      case Pi: return std::max(pi.t->numMeta(), pi.r->numMeta());
    }
    unreachable;
  }

#include "macros_close.hpp"
}
