#include "elaborator.hpp"

using std::string;
using std::vector;

namespace arbor::elab {
#include "macros_open.hpp"

  using enum Expr::Tag;
  using enum Expr::SortTag;
  using enum Expr::VarTag;
  using enum Expr::LamTag;
  using enum Expr::PiTag;

  namespace {
    auto isMeta(Expr const* e) -> bool {
      return e->tag == Var && e->var.tag == VMeta;
    }
  }

  auto Elaborator::elaborate(parsing::Syntax const* s, Context& ctx) -> Expr const* {
    _bound.clear();
    return _elaborate(s, ctx);
  }

  auto Elaborator::_elaborate(parsing::Syntax const* s, Context& ctx) -> Expr const* {
    using namespace parsing;
    return match(
      *s,
      [&](Ident const& x) -> Expr const* {
        for (auto i = _bound.size(); i-- > 0;)
          if (!_bound[i].empty() && _bound[i] == x.name) return _pool.make(VBound, _bound.size() - 1 - i);
        if (auto const id = ctx.lookup(x.name); id) return _pool.make(VFree, *id);
        if (_autoBound) return _pool.make(VFree, ctx.push(x.name, nullptr));
        throw ElabError("unknown identifier '" + x.name + "'", s->begin, s->end);
      },
      [&](MetaRef const& x) -> Expr const* {
        for (auto const& [name, id]: _named)
          if (name == x.name) return _pool.make(VMeta, id);
        auto const id = _state.newMeta(x.name, ctx.size(), nullptr);
        _named.emplace_back(x.name, id);
        return _pool.make(VMeta, id);
      },
      [&](Hole const&) -> Expr const* { return _pool.make(VMeta, _state.newMeta("", ctx.size(), nullptr)); },
      [&](Universe const& x) -> Expr const* { return _pool.make(x.type ? SType : SProp); },
      [&](Application const& x) -> Expr const* {
        auto const l = _elaborate(x.l, ctx);
        auto const r = _elaborate(x.r, ctx);
        return _pool.make(l, r);
      },
      [&](Binder const& x) -> Expr const* {
        auto const t = _elaborate(x.t, ctx);
        _bound.push_back(x.name);
        auto const r = _elaborate(x.r, ctx);
        _bound.pop_back();
        return x.pi ? _pool.make(PPi, x.name, t, r) : _pool.make(LLam, x.name, t, r);
      }
    );
  }

  auto Elaborator::infer(Expr const* e, Context const& ctx) -> Expr const* {
    _bound.clear();
    _stk.clear();
    auto const res = _infer(e, ctx);
    return res ? _state.normalize(res, _pool) : nullptr;
  }

  auto Elaborator::inferSort(Expr const* e, Context const& ctx) -> Expr const* {
    auto const res = infer(e, ctx);
    if (res && res->tag != Sort && !isMeta(res))
      throw ElabError("expected proposition or type, got " + _show(e, ctx) + " : " + _show(res, ctx));
    return res;
  }

  auto Elaborator::equate(Expr const* expected, Expr const* actual, Context const& ctx) -> void {
    if (!_state.unify(expected, actual, _pool))
      throw ElabError("type mismatch, expected " + _show(expected, ctx) + ", got " + _show(actual, ctx));
  }

  // Mirrors the typing rules of the Calculus of Constructions, with unknowns.
  auto Elaborator::_infer(Expr const* e, Context const& ctx) -> Expr const* {
    core::budget().tick();
    auto const normalize = [this](Expr const* t) { return t ? _state.normalize(t, _pool) : nullptr; };
    auto const expectSort = [&, this](Expr const* t, Expr const* x) {
      if (t && t->tag != Sort && !isMeta(t))
        throw ElabError("expected proposition or type, got " + _show(x, ctx) + " : " + _show(t, ctx));
    };

    switch (e->tag) {
      case Sort:
        switch (e->sort.tag) {
          case SProp: return _pool.make(SType);
          case SType: return _pool.make(SKind);
          case SKind: throw ElabError("\"Kind\" does not have a type");
        }
        unreachable;
      case Var:
        switch (e->var.tag) {
          case VBound: {
            if (e->var.id >= _stk.size()) throw ElabError("de Bruijn index overflow");
            auto const t = _stk[_stk.size() - 1 - e->var.id];
            return t ? t->lift(e->var.id + 1, _pool) : nullptr;
          }
          case VFree:
            if (e->var.id >= ctx.size()) throw ElabError("free variable not in context");
            return ctx[e->var.id];
          case VMeta:
            if (e->var.id >= _state.metas.size()) throw ElabError("unknown metavariable");
            return _state.metas[e->var.id].type;
        }
        unreachable;
      case App: { // Π-elimination
        auto const tl = normalize(_infer(e->app.l, ctx));
        auto const tr = normalize(_infer(e->app.r, ctx));
        if (!tl || isMeta(tl)) return nullptr;
        if (tl->tag != Pi)
          throw ElabError("function expected, " + _show(e->app.l, ctx) + " has type " + _show(tl, ctx));
        if (tr) {
          equate(tl->pi.t, tr, ctx);
        } else if (isMeta(e->app.r) && !tl->pi.t->hasLooseBound()) {
          // An untyped hole gets the type of the parameter it fills
          auto& decl = _state.metas[e->app.r->var.id];
          if (!decl.type) decl.type = tl->pi.t;
        }
        return tl->pi.r->makeReplace(e->app.r, _pool);
      }
      case Lam: { // Π-introduction
        expectSort(normalize(_infer(e->lam.t, ctx)), e->lam.t);
        _bound.push_back(e->lam.s);
        _stk.push_back(e->lam.t);
        auto const tr = _infer(e->lam.r, ctx);
        _stk.pop_back();
        _bound.pop_back();
        return tr ? _pool.make(PPi, e->lam.s, e->lam.t, tr) : nullptr;
      }
      case Pi: { // Π-formation
        auto const tt = normalize(_infer(e->pi.t, ctx));
        expectSort(tt, e->pi.t);
        _bound.push_back(e->pi.s);
        _stk.push_back(e->pi.t);
        auto const tr = normalize(_infer(e->pi.r, ctx));
        expectSort(tr, e->pi.r);
        _stk.pop_back();
        _bound.pop_back();
        if (!tr || tr->tag != Sort) return nullptr;
        if (tr->sort.tag == SProp) return tr;
        if (!tt || tt->tag != Sort) return nullptr;
        return _pool.make(Expr::imax(tt->sort.tag, tr->sort.tag));
      }
    }
    unreachable;
  }

  auto Elaborator::_show(Expr const* e, Context const& ctx) -> string {
    auto names = vector<string>();
    for (auto const& decl: _state.metas) names.push_back(decl.name);
    auto stk = _bound;
    return _state.instantiate(e, _pool)->toString(ctx, names, stk);
  }

#include "macros_close.hpp"
}
