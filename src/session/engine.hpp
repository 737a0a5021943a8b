#ifndef ARBOR_SESSION_ENGINE_HPP
#define ARBOR_SESSION_ENGINE_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <common.hpp>
#include "error.hpp"

namespace arbor::session {
#include "macros_open.hpp"

  // Opaque, restorable capture of an engine's state. Immutable; copies share the payload.
  class Snapshot {
  public:
    Snapshot(void const* owner, std::shared_ptr<void const> payload):
        _owner(owner),
        _payload(std::move(payload)) {}

    // The engine that captured this snapshot.
    auto owner() const -> void const* {
      return _owner;
    }
    auto payload() const -> std::shared_ptr<void const> const& {
      return _payload;
    }

    // Identity of the capture, not structural equality.
    auto operator==(Snapshot const& r) const -> bool {
      return _owner == r._owner && _payload == r._payload;
    }

  private:
    void const* _owner;
    std::shared_ptr<void const> _payload;
  };

  // Pretty-printed views of engine state.
  struct Hypothesis {
    std::string name;
    std::string type;
  };

  struct GoalView {
    std::string name; // May be empty.
    std::vector<Hypothesis> hypotheses;
    std::string target;
  };

  struct Diagnostic {
    std::string severity; // "error", "warning" or "information"
    std::string message;
  };

  // A way of reading a dotted name: `name` resolves, `fields` are the remaining components.
  struct Candidate {
    std::string name;
    std::vector<std::string> fields;
  };

  struct Position {
    std::string file;
    size_t line;
    size_t column;
  };

  // A named proof obligation, with its type as text.
  struct GoalSpec {
    std::string name;
    std::string type;
  };

  // Named metavariables with their solutions (`nullopt` if left unsolved), in order of appearance.
  using Unifier = std::vector<std::pair<std::string, std::optional<std::string>>>;

  // Parsed step and expression; only meaningful to the engine that produced them.
  class StepSyntax {
    interface(StepSyntax);
  };

  class ExprSyntax {
    interface(ExprSyntax);
  };

  // What a session needs from a proof engine.
  // An engine has one mutable "current" state; every query and action applies to it.
  class Engine {
    interface(Engine);

  public:
    // Makes `snapshot` the current state. Throws `std::logic_error` if it was not captured by this engine.
    virtual auto restore(Snapshot const& snapshot) -> void required;
    virtual auto captureSnapshot() const -> Snapshot required;

    virtual auto currentGoals() const -> std::vector<GoalView> required;
    virtual auto accumulatedDiagnostics() const -> std::vector<Diagnostic> required;

    virtual auto parseStep(std::string const& text) const -> Result<std::unique_ptr<StepSyntax>> required;

    // Runs a parsed step on the current state, performing at most `budget` computation steps.
    // On failure, the current state is unchanged.
    virtual auto executeStep(StepSyntax const& step, uint64_t budget) -> Result<unit> required;

    // Moves every open goal of the current state to the admitted ones.
    virtual auto admitAllOpenGoals() -> void required;

    // A fresh state with the given obligations and no local hypotheses. The current state is unchanged.
    virtual auto buildContext(std::vector<GoalSpec> const& goals) -> Result<Snapshot> required;

    virtual auto resolveGlobalName(std::string const& name) const -> std::vector<Candidate> required;

    virtual auto parseExpression(std::string const& text) const -> Result<std::unique_ptr<ExprSyntax>> required;

    // `nullopt` if no unifier exists. The current state is unchanged.
    virtual auto unifyExpressions(ExprSyntax const& lhs, ExprSyntax const& rhs) -> Result<std::optional<Unifier>> required;

    virtual auto currentSourcePosition() const -> std::optional<Position> required;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_SESSION_ENGINE_HPP
