#include "tactics.hpp"
#include "elaborator.hpp"

using std::string;
using std::vector;

namespace arbor::elab {
#include "macros_open.hpp"

  using enum Expr::Tag;
  using enum Expr::VarTag;

  auto TacticRunner::run(parsing::Tactic const& tactic) -> void {
    using enum parsing::Tactic::Kind;
    switch (tactic.kind) {
      case Intro: _intro(tactic.names, false); return;
      case Intros: _intro(tactic.names, true); return;
      case Exact: _exact(tactic.expr); return;
      case Apply: _apply(tactic.expr); return;
      case Assumption: _assumption(); return;
      case Exfalso: _exfalso(); return;
      case Rfl: _rfl(); return;
      case Have: _have(tactic.names.at(0), tactic.expr); return;
      case Sorry:
      case Admit: _admit(); return;
      case Skip: return;
    }
    unreachable;
  }

  auto TacticRunner::_main() -> Goal& {
    _state.prune();
    if (_state.goals.empty()) throw TacticError("no goals to be proved");
    return _state.goals.front();
  }

  // Discharges the main goal. The proof term is recorded only when it fits the scope of the goal's metavariable.
  auto TacticRunner::_close(Expr const* proof) -> void {
    auto const meta = _state.goals.front().meta;
    auto subs = procs::Subs(meta + 1, nullptr);
    subs[meta] = _state.instantiate(proof, _pool);
    if (subs[meta]->occurs(VMeta, meta) || !_state.assign(subs, _pool)) _state.goals.erase(_state.goals.begin());
    _state.prune();
  }

  auto TacticRunner::_global(Goal const& g, char const* name) -> Expr const* {
    for (auto i = 0uz; i < _state.globals && i < g.ctx.size(); i++)
      if (g.ctx.identifier(i) == name) return _pool.make(VFree, i);
    throw TacticError(string("'") + name + "' is not declared");
  }

  auto TacticRunner::_intro(vector<string> const& names, bool all) -> void {
    auto& g = _main();
    auto const untilStuck = all && names.empty();
    auto const count = names.empty() ? 1uz : names.size();
    auto introduced = 0uz;
    while (untilStuck || introduced < count) {
      auto const t = _state.normalize(g.target, _pool);
      if (t->tag != Pi) {
        if (untilStuck) break;
        throw TacticError("no additional binders in goal " + _state.show(t, g.ctx, _pool));
      }
      auto name = (introduced < names.size()) ? names[introduced] : string();
      if (name.empty()) name = t->pi.s.empty() ? "h" : t->pi.s;
      auto const id = g.ctx.push(name, t->pi.t);
      g.target = t->pi.r->makeReplace(_pool.make(VFree, id), _pool);
      introduced++;
    }
    // The goal now lives in a larger context, so it gets a new metavariable
    if (introduced > 0) g.meta = _state.newMeta(g.name, g.ctx.size(), g.target);
  }

  auto TacticRunner::_exact(parsing::Syntax const* s) -> void {
    auto const g = _main();
    auto const first = _state.metas.size();
    auto elab = Elaborator(_state, _pool);
    auto ctx = g.ctx;
    auto const e = elab.elaborate(s, ctx);
    auto const t = elab.infer(e, ctx);
    if (!t) throw TacticError("cannot infer the type of " + _state.show(e, ctx, _pool));
    elab.equate(g.target, t, ctx);

    auto const proof = _state.instantiate(e, _pool);
    for (auto id = first; id < _state.metas.size(); id++) {
      if (!_state.assigned(id) && proof->occurs(VMeta, id)) {
        _state.log(Message::Error, "don't know how to synthesize placeholder in " + _state.show(proof, ctx, _pool));
        break;
      }
    }
    _close(proof);
  }

  // Tries `f ?1 ... ?k` for k = 0, 1, ... until the conclusion matches the goal.
  // Arguments left unassigned become new goals, in order.
  auto TacticRunner::_apply(parsing::Syntax const* s) -> void {
    auto const g = _main();
    auto const first = _state.metas.size();
    auto elab = Elaborator(_state, _pool);
    auto ctx = g.ctx;
    auto const f = elab.elaborate(s, ctx);
    auto const tf = elab.infer(f, ctx);
    if (!tf) throw TacticError("cannot infer the type of " + _state.show(f, ctx, _pool));

    auto arity = 0uz;
    for (auto t = tf; t->tag == Pi; t = t->pi.r) arity++;

    for (auto k = 0uz; k <= arity; k++) {
      auto attempt = _state;
      auto const holes = attempt.metas.size();
      auto t = tf;
      auto proof = f;
      auto args = vector<uint64_t>();
      for (auto i = 0uz; i < k; i++) {
        auto const m = attempt.newMeta(t->pi.s, ctx.size(), t->pi.t);
        auto const mv = _pool.make(VMeta, m);
        args.push_back(m);
        proof = _pool.make(proof, mv);
        t = attempt.normalize(t->pi.r->makeReplace(mv, _pool), _pool);
      }
      if (!attempt.unify(t, g.target, _pool)) continue;

      // Holes of `f` come first, then arguments
      auto subgoals = vector<Goal>();
      auto const addGoal = [&](uint64_t m) {
        if (attempt.assigned(m)) return;
        auto const& decl = attempt.metas[m];
        if (!decl.type) throw TacticError("cannot infer the type of placeholder in " + attempt.show(f, ctx, _pool));
        subgoals.push_back({m, decl.name, g.ctx, decl.type});
      };
      auto const instantiated = attempt.instantiate(f, _pool);
      for (auto m = first; m < holes; m++)
        if (instantiated->occurs(VMeta, m)) addGoal(m);
      for (auto const m: args) addGoal(m);

      _state = std::move(attempt);
      _close(proof);
      _state.goals.insert(_state.goals.begin(), subgoals.begin(), subgoals.end());
      return;
    }
    throw TacticError(
      "failed to apply " + _state.show(f, ctx, _pool) + " : " + _state.show(tf, ctx, _pool) + " to goal "
      + _state.show(g.target, g.ctx, _pool)
    );
  }

  auto TacticRunner::_assumption() -> void {
    auto const g = _main();
    for (auto i = g.ctx.size(); i-- > _state.globals;) {
      if (!g.ctx[i]) continue;
      auto attempt = _state;
      if (attempt.unify(g.ctx[i], g.target, _pool)) {
        _state = std::move(attempt);
        _close(_pool.make(VFree, i));
        return;
      }
    }
    throw TacticError("no hypothesis matches the goal " + _state.show(g.target, g.ctx, _pool));
  }

  auto TacticRunner::_exfalso() -> void {
    auto& g = _main();
    g.target = _global(g, "False");
    g.meta = _state.newMeta(g.name, g.ctx.size(), g.target);
  }

  auto TacticRunner::_rfl() -> void {
    auto const g = _main();
    auto const t = _state.normalize(g.target, _pool);
    auto const eq = _global(g, "Eq");
    // Expecting `Eq A a b`
    if (t->tag != App || t->app.l->tag != App || t->app.l->app.l->tag != App || *t->app.l->app.l->app.l != *eq)
      throw TacticError("rfl expects an equality, got " + _state.show(t, g.ctx, _pool));
    auto const type = t->app.l->app.l->app.r, lhs = t->app.l->app.r, rhs = t->app.r;
    auto attempt = _state;
    if (!attempt.unify(lhs, rhs, _pool))
      throw TacticError(
        "rfl failed, the two sides are not equal: " + _state.show(lhs, g.ctx, _pool) + " and "
        + _state.show(rhs, g.ctx, _pool)
      );
    _state = std::move(attempt);
    _close(_pool.make(_pool.make(_global(g, "Eq.refl"), type), lhs));
  }

  auto TacticRunner::_have(string const& name, parsing::Syntax const* s) -> void {
    auto const g = _main();
    auto elab = Elaborator(_state, _pool);
    auto ctx = g.ctx;
    auto const e = elab.elaborate(s, ctx);
    auto const sort = elab.inferSort(e, ctx);
    if (!sort || sort->tag != Sort) throw TacticError("cannot infer the sort of " + _state.show(e, ctx, _pool));
    auto const type = _state.instantiate(e, _pool);

    auto& main = _state.goals.front();
    main.ctx.push(name, type);
    main.meta = _state.newMeta(main.name, main.ctx.size(), main.target);
    auto const m = _state.newMeta(name, g.ctx.size(), type);
    _state.goals.insert(_state.goals.begin(), Goal{m, name, g.ctx, type});
  }

  auto TacticRunner::_admit() -> void {
    auto& g = _main();
    _state.admitted.push_back(g);
    _state.goals.erase(_state.goals.begin());
    _state.log(Message::Warning, "declaration uses 'sorry'");
  }

#include "macros_close.hpp"
}
