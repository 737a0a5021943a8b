#ifndef ARBOR_SESSION_SESSION_HPP
#define ARBOR_SESSION_SESSION_HPP

#include <optional>
#include <string>
#include <vector>
#include <common.hpp>
#include "engine.hpp"
#include "error.hpp"

namespace arbor::session {
#include "macros_open.hpp"

  using NodeId = uint64_t;

  // One checkpoint in the proof tree.
  struct Node {
    Snapshot snapshot;
    NodeId parent;    // Strictly less than the node's own id, except for the root (its own parent).
    std::string step; // Empty for the root and administrative transitions.
  };

  struct NodeInfo {
    NodeId id;
    NodeId parent;
    std::string step;
  };

  // The operations a client can invoke. Each one acts on the engine state of the node it names.
  class Operations {
    interface(Operations);

  public:
    // Runs `step` from node `sid`. The new node is appended only if the step parses, executes within `budget` (or the
    // default one) and logs no new errors.
    virtual auto applyStep(NodeId sid, std::string const& step, std::optional<uint64_t> budget) -> Result<NodeId> required;
    virtual auto queryState(NodeId sid) -> Result<std::vector<GoalView>> required;
    virtual auto queryMessages(NodeId sid) -> Result<std::vector<Diagnostic>> required;
    virtual auto resolveName(NodeId sid, std::string const& name) -> Result<std::vector<Candidate>> required;
    virtual auto unify(NodeId sid, std::string const& lhs, std::string const& rhs) -> Result<std::optional<Unifier>> required;
    // Appends a node with the given obligations as a child of the root.
    virtual auto newState(std::vector<GoalSpec> const& goals) -> Result<NodeId> required;
    // Appends a node where every open goal of `sid` is admitted.
    virtual auto giveUp(NodeId sid) -> Result<NodeId> required;
    // Ends the session.
    virtual auto commit(NodeId sid) -> Result<unit> required;
    virtual auto position() -> Result<std::optional<Position>> required;
    virtual auto nodeInfo(NodeId sid) -> Result<NodeInfo> required;

    virtual auto running() const -> bool required;
  };

  // The proof tree over an engine: an append-only array of nodes, indexed by `NodeId`.
  class Session: public Operations {
  public:
    // The root node is captured from the engine's current state.
    // The engine must outlive the session.
    Session(Engine& engine, uint64_t defaultBudget);

    auto append(Node node) -> NodeId;
    auto lookup(NodeId id) const -> Result<Node const*>;
    auto size() const -> size_t {
      return _nodes.size();
    }

    auto applyStep(NodeId sid, std::string const& step, std::optional<uint64_t> budget) -> Result<NodeId> override;
    auto queryState(NodeId sid) -> Result<std::vector<GoalView>> override;
    auto queryMessages(NodeId sid) -> Result<std::vector<Diagnostic>> override;
    auto resolveName(NodeId sid, std::string const& name) -> Result<std::vector<Candidate>> override;
    auto unify(NodeId sid, std::string const& lhs, std::string const& rhs) -> Result<std::optional<Unifier>> override;
    auto newState(std::vector<GoalSpec> const& goals) -> Result<NodeId> override;
    auto giveUp(NodeId sid) -> Result<NodeId> override;
    auto commit(NodeId sid) -> Result<unit> override;
    auto position() -> Result<std::optional<Position>> override;
    auto nodeInfo(NodeId sid) -> Result<NodeInfo> override;

    auto running() const -> bool override {
      return _running;
    }

  private:
    Engine& _engine;
    uint64_t _defaultBudget;
    std::vector<Node> _nodes;
    bool _running = true;

    // Looks up `sid` and makes its snapshot current.
    auto _restore(NodeId sid) -> Result<Node const*>;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_SESSION_SESSION_HPP
