#include "engine.hpp"
#include <stdexcept>
#include <parsing/parser.hpp>
#include "elaborator.hpp"
#include "tactics.hpp"

using std::string;
using std::vector;
using std::optional;
using std::unique_ptr;

namespace arbor::elab {
#include "macros_open.hpp"

  namespace {

    class ParsedStepSyntax: public session::StepSyntax {
    public:
      unique_ptr<parsing::ParsedStep> step;
      explicit ParsedStepSyntax(unique_ptr<parsing::ParsedStep> step):
          step(std::move(step)) {}
    };

    class ParsedExprSyntax: public session::ExprSyntax {
    public:
      unique_ptr<parsing::ParsedExpr> expr;
      explicit ParsedExprSyntax(unique_ptr<parsing::ParsedExpr> expr):
          expr(std::move(expr)) {}
    };

    auto severityName(Message::Severity severity) -> string {
      switch (severity) {
        case Message::Error: return "error";
        case Message::Warning: return "warning";
        case Message::Information: return "information";
      }
      unreachable;
    }

    auto split(string const& s, char sep) -> vector<string> {
      auto res = vector<string>{""};
      for (auto const c: s) {
        if (c == sep) res.emplace_back();
        else res.back().push_back(c);
      }
      return res;
    }

  }

  ProofEngine::ProofEngine(optional<string> const& load, uint64_t budget):
      _env(_pool),
      _budget(budget) {
    if (load) _env.load(*load);
    _state = _emptyState();
  }

  auto ProofEngine::_emptyState() const -> ProofState {
    auto res = ProofState();
    res.globals = _env.size();
    return res;
  }

  auto ProofEngine::_show(Expr const* e, Context const& ctx) const -> string {
    return _state.show(e, ctx, _pool);
  }

  auto ProofEngine::restore(session::Snapshot const& snapshot) -> void {
    if (snapshot.owner() != this || !snapshot.payload())
      throw std::logic_error("snapshot was not captured by this engine");
    _state = *std::static_pointer_cast<ProofState const>(snapshot.payload());
  }

  auto ProofEngine::captureSnapshot() const -> session::Snapshot {
    return session::Snapshot(this, std::make_shared<ProofState const>(_state));
  }

  auto ProofEngine::currentGoals() const -> vector<session::GoalView> {
    auto res = vector<session::GoalView>();
    for (auto const& g: _state.goals) {
      if (_state.assigned(g.meta)) continue;
      auto view = session::GoalView{g.name, {}, _show(g.target, g.ctx)};
      for (auto i = _state.globals; i < g.ctx.size(); i++)
        view.hypotheses.push_back({g.ctx.identifier(i), g.ctx[i] ? _show(g.ctx[i], g.ctx) : "?"});
      res.push_back(std::move(view));
    }
    return res;
  }

  auto ProofEngine::accumulatedDiagnostics() const -> vector<session::Diagnostic> {
    auto res = vector<session::Diagnostic>();
    for (auto const& msg: _state.messages) res.push_back({severityName(msg.severity), msg.text});
    return res;
  }

  auto ProofEngine::parseStep(string const& text) const -> session::Result<unique_ptr<session::StepSyntax>> {
    try {
      return std::make_unique<ParsedStepSyntax>(parsing::Parser::step(text));
    } catch (parsing::ParseError& e) { return session::fail(session::Error::StepParse, e.what()); }
  }

  auto ProofEngine::executeStep(session::StepSyntax const& step, uint64_t budget) -> session::Result<unit> {
    auto const parsed = dynamic_cast<ParsedStepSyntax const*>(&step);
    if (!parsed) throw std::logic_error("step was not parsed by this engine");

    auto const failed = [](std::exception const& e) {
      return session::fail(session::Error::StepExecution, e.what(), {e.what()});
    };
    auto next = _state;
    try {
      auto const scope = core::Budget::Scope(budget);
      auto runner = TacticRunner(next, _pool);
      for (auto const& tactic: parsed->step->tactics) runner.run(tactic);
    } catch (TacticError& e) {
      return failed(e);
    } catch (ElabError& e) {
      return failed(e);
    } catch (core::BudgetExceeded& e) {
      return failed(e);
    }
    next.prune();
    _state = std::move(next);
    return unit{};
  }

  auto ProofEngine::admitAllOpenGoals() -> void {
    _state.prune();
    if (_state.goals.empty()) return;
    _state.admitted.insert(_state.admitted.end(), _state.goals.begin(), _state.goals.end());
    _state.log(Message::Warning, "declaration uses 'sorry'");
    _state.goals.clear();
  }

  auto ProofEngine::buildContext(vector<session::GoalSpec> const& goals) -> session::Result<session::Snapshot> {
    auto state = _emptyState();
    for (auto const& spec: goals) {
      auto type = unique_ptr<parsing::ParsedExpr>();
      try {
        type = parsing::Parser::expression(spec.type);
      } catch (parsing::ParseError& e) {
        return session::fail(session::Error::ExpressionParse, "type of '" + spec.name + "': " + e.what());
      }
      try {
        auto const scope = core::Budget::Scope(_budget);
        auto elab = Elaborator(state, _pool);
        auto ctx = _env.context();
        auto const e = elab.elaborate(type->root, ctx);
        auto const sort = elab.inferSort(e, ctx);
        if (!sort || sort->tag != Expr::Sort) throw ElabError("cannot infer the sort of " + state.show(e, ctx, _pool));
        auto const target = state.instantiate(e, _pool);
        if (!target->isGround()) throw ElabError("type contains placeholders");
        auto const m = state.newMeta(spec.name, ctx.size(), target);
        state.goals.push_back({m, spec.name, ctx, target});
      } catch (ElabError& e) {
        return session::fail(session::Error::Elaboration, "type of '" + spec.name + "': " + e.what());
      } catch (core::BudgetExceeded& e) {
        return session::fail(session::Error::Elaboration, "type of '" + spec.name + "': " + e.what());
      }
    }
    return session::Snapshot(this, std::make_shared<ProofState const>(std::move(state)));
  }

  auto ProofEngine::resolveGlobalName(string const& name) const -> vector<session::Candidate> {
    auto const& ctx = _state.goals.empty() ? _env.context() : _state.goals.front().ctx;
    auto const parts = split(name, '.');
    auto res = vector<session::Candidate>();
    for (auto k = parts.size(); k > 0; k--) {
      auto prefix = parts[0];
      for (auto i = 1uz; i < k; i++) prefix += "." + parts[i];
      if (ctx.lookup(prefix))
        res.push_back({prefix, vector<string>(parts.begin() + static_cast<ptrdiff_t>(k), parts.end())});
    }
    return res;
  }

  auto ProofEngine::parseExpression(string const& text) const -> session::Result<unique_ptr<session::ExprSyntax>> {
    try {
      return std::make_unique<ParsedExprSyntax>(parsing::Parser::expression(text));
    } catch (parsing::ParseError& e) { return session::fail(session::Error::ExpressionParse, e.what()); }
  }

  // Unknown identifiers are taken as distinct opaque atoms. Works on a copy of the current state.
  auto ProofEngine::unifyExpressions(session::ExprSyntax const& lhs, session::ExprSyntax const& rhs)
    -> session::Result<optional<session::Unifier>> {
    auto const l = dynamic_cast<ParsedExprSyntax const*>(&lhs);
    auto const r = dynamic_cast<ParsedExprSyntax const*>(&rhs);
    if (!l || !r) throw std::logic_error("expression was not parsed by this engine");

    auto state = _state;
    auto ctx = state.goals.empty() ? _env.context() : state.goals.front().ctx;
    try {
      auto const scope = core::Budget::Scope(_budget);
      auto elab = Elaborator(state, _pool, true);
      auto const first = state.metas.size();
      auto const el = elab.elaborate(l->expr->root, ctx);
      auto const er = elab.elaborate(r->expr->root, ctx);
      // Solutions may refer to atoms bound by either side
      for (auto i = first; i < state.metas.size(); i++) state.metas[i].scope = ctx.size();

      auto const tl = elab.infer(el, ctx);
      auto const tr = elab.infer(er, ctx);
      if (tl && tr && !state.unify(tl, tr, _pool)) return optional<session::Unifier>();
      if (!state.unify(el, er, _pool)) return optional<session::Unifier>();

      auto res = session::Unifier();
      for (auto const& [name, id]: elab.namedMetas()) {
        if (state.assigned(id)) res.emplace_back(name, state.show(_pool.make(Expr::VMeta, id), ctx, _pool));
        else res.emplace_back(name, std::nullopt);
      }
      return res;
    } catch (ElabError& e) {
      return session::fail(session::Error::Elaboration, e.what());
    } catch (core::BudgetExceeded& e) {
      return session::fail(session::Error::Elaboration, e.what());
    }
  }

  auto ProofEngine::currentSourcePosition() const -> optional<session::Position> {
    auto const& location = _env.location();
    if (!location) return std::nullopt;
    return session::Position{location->file, location->line, 0};
  }

#include "macros_close.hpp"
}
