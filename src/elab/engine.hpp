#ifndef ARBOR_ELAB_ENGINE_HPP
#define ARBOR_ELAB_ENGINE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <parsing/syntax.hpp>
#include <session/engine.hpp>
#include "environment.hpp"
#include "state.hpp"

namespace arbor::elab {
#include "macros_open.hpp"

  // The tactic engine behind a session.
  // Owns the expression arena; snapshots share it, so they stay valid as long as the engine does.
  class ProofEngine: public session::Engine {
  public:
    // `load` names an environment file to declare after the prelude (may throw, see `Environment::load`).
    // `budget` bounds the operations that take no explicit budget (expression unification).
    explicit ProofEngine(std::optional<std::string> const& load = {}, uint64_t budget = core::Budget::unlimited);
    ProofEngine(ProofEngine const&) = delete;
    auto operator=(ProofEngine const&) -> ProofEngine& = delete;

    auto restore(session::Snapshot const& snapshot) -> void override;
    auto captureSnapshot() const -> session::Snapshot override;
    auto currentGoals() const -> std::vector<session::GoalView> override;
    auto accumulatedDiagnostics() const -> std::vector<session::Diagnostic> override;
    auto parseStep(std::string const& text) const -> session::Result<std::unique_ptr<session::StepSyntax>> override;
    auto executeStep(session::StepSyntax const& step, uint64_t budget) -> session::Result<unit> override;
    auto admitAllOpenGoals() -> void override;
    auto buildContext(std::vector<session::GoalSpec> const& goals) -> session::Result<session::Snapshot> override;
    auto resolveGlobalName(std::string const& name) const -> std::vector<session::Candidate> override;
    auto parseExpression(std::string const& text) const
      -> session::Result<std::unique_ptr<session::ExprSyntax>> override;
    auto unifyExpressions(session::ExprSyntax const& lhs, session::ExprSyntax const& rhs)
      -> session::Result<std::optional<session::Unifier>> override;
    auto currentSourcePosition() const -> std::optional<session::Position> override;

    auto environment() const -> Environment const& {
      return _env;
    }
    auto state() const -> ProofState const& {
      return _state;
    }

  private:
    // Declared first: everything below points into it.
    mutable Allocator<Expr> _pool;
    Environment _env;
    ProofState _state;
    uint64_t _budget;

    auto _emptyState() const -> ProofState;
    auto _show(Expr const* e, Context const& ctx) const -> std::string;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_ELAB_ENGINE_HPP
