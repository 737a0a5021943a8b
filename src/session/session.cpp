#include "session.hpp"

using std::string;
using std::vector;
using std::optional;

namespace arbor::session {
#include "macros_open.hpp"

  Session::Session(Engine& engine, uint64_t defaultBudget):
      _engine(engine),
      _defaultBudget(defaultBudget) {
    _nodes.push_back({_engine.captureSnapshot(), 0, ""});
  }

  auto Session::append(Node node) -> NodeId {
    assert(node.parent < _nodes.size());
    _nodes.push_back(std::move(node));
    return _nodes.size() - 1;
  }

  auto Session::lookup(NodeId id) const -> Result<Node const*> {
    if (id >= _nodes.size())
      return fail(
        Error::InvalidParams, "node " + std::to_string(id) + " does not exist (" + std::to_string(_nodes.size()) + " nodes)"
      );
    return &_nodes[id];
  }

  auto Session::_restore(NodeId sid) -> Result<Node const*> {
    auto const node = lookup(sid);
    if (node) _engine.restore((*node)->snapshot);
    return node;
  }

  auto Session::applyStep(NodeId sid, string const& step, optional<uint64_t> budget) -> Result<NodeId> {
    auto const node = _restore(sid);
    if (!node) return std::unexpected(node.error());
    auto const snapshot = (*node)->snapshot;

    auto const parsed = _engine.parseStep(step);
    if (!parsed) return std::unexpected(parsed.error());

    auto const before = _engine.accumulatedDiagnostics().size();
    if (auto const res = _engine.executeStep(**parsed, budget.value_or(_defaultBudget)); !res) {
      _engine.restore(snapshot);
      return std::unexpected(res.error());
    }

    // A step that logged errors is void, even though it ran to completion
    auto errors = vector<string>();
    auto const diagnostics = _engine.accumulatedDiagnostics();
    for (auto i = before; i < diagnostics.size(); i++)
      if (diagnostics[i].severity == "error") errors.push_back(diagnostics[i].message);
    if (!errors.empty()) {
      _engine.restore(snapshot);
      return fail(Error::StepExecution, errors.front(), std::move(errors));
    }

    return append({_engine.captureSnapshot(), sid, step});
  }

  auto Session::queryState(NodeId sid) -> Result<vector<GoalView>> {
    if (auto const node = _restore(sid); !node) return std::unexpected(node.error());
    return _engine.currentGoals();
  }

  auto Session::queryMessages(NodeId sid) -> Result<vector<Diagnostic>> {
    if (auto const node = _restore(sid); !node) return std::unexpected(node.error());
    return _engine.accumulatedDiagnostics();
  }

  auto Session::resolveName(NodeId sid, string const& name) -> Result<vector<Candidate>> {
    if (auto const node = _restore(sid); !node) return std::unexpected(node.error());
    return _engine.resolveGlobalName(name);
  }

  auto Session::unify(NodeId sid, string const& lhs, string const& rhs) -> Result<optional<Unifier>> {
    if (auto const node = _restore(sid); !node) return std::unexpected(node.error());
    auto const l = _engine.parseExpression(lhs);
    if (!l) return std::unexpected(l.error());
    auto const r = _engine.parseExpression(rhs);
    if (!r) return std::unexpected(r.error());
    return _engine.unifyExpressions(**l, **r);
  }

  auto Session::newState(vector<GoalSpec> const& goals) -> Result<NodeId> {
    auto snapshot = _engine.buildContext(goals);
    if (!snapshot) return std::unexpected(snapshot.error());
    return append({std::move(*snapshot), 0, ""});
  }

  auto Session::giveUp(NodeId sid) -> Result<NodeId> {
    if (auto const node = _restore(sid); !node) return std::unexpected(node.error());
    _engine.admitAllOpenGoals();
    return append({_engine.captureSnapshot(), sid, ""});
  }

  auto Session::commit(NodeId sid) -> Result<unit> {
    if (auto const node = _restore(sid); !node) return std::unexpected(node.error());
    _running = false;
    return unit{};
  }

  auto Session::position() -> Result<optional<Position>> {
    return _engine.currentSourcePosition();
  }

  auto Session::nodeInfo(NodeId sid) -> Result<NodeInfo> {
    auto const node = lookup(sid);
    if (!node) return std::unexpected(node.error());
    return NodeInfo{sid, (*node)->parent, (*node)->step};
  }

#include "macros_close.hpp"
}
