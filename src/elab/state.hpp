#ifndef ARBOR_ELAB_STATE_HPP
#define ARBOR_ELAB_STATE_HPP

#include <optional>
#include <string>
#include <vector>
#include <core/context.hpp>
#include <core/expr.hpp>
#include "procs.hpp"

namespace arbor::elab {
#include "macros_open.hpp"

  using core::Expr;
  using core::Context;

  // A metavariable declaration.
  struct MetaDecl {
    std::string name;  // User-facing name (from `?name` or a binder), may be empty.
    size_t scope;      // Number of context entries an assignment may refer to.
    Expr const* type;  // `nullptr` if not known.
  };

  // An open proof obligation. Its proof is the metavariable `meta`.
  struct Goal {
    uint64_t meta;
    std::string name;
    Context ctx; // Global constants, then local hypotheses.
    Expr const* target;
  };

  struct Message {
    enum class Severity: uint32_t { Error, Warning, Information };
    using enum Severity;
    Severity severity;
    std::string text;
  };

  // Everything mutable about a proof in progress. Plain value type: copying it takes a checkpoint.
  // Expressions are not owned; they live in the engine's arena.
  class ProofState {
  public:
    std::vector<Goal> goals;
    std::vector<Goal> admitted;
    std::vector<Message> messages;
    std::vector<MetaDecl> metas;
    procs::Subs assignment;
    size_t globals = 0; // Number of global constants at the bottom of every goal context.

    auto newMeta(std::string name, size_t scope, Expr const* type) -> uint64_t {
      metas.push_back({std::move(name), scope, type});
      return metas.size() - 1;
    }

    auto assigned(uint64_t id) const -> bool {
      return id < assignment.size() && assignment[id];
    }

    // Replaces all assigned metavariables in `e`.
    auto instantiate(Expr const* e, Allocator<Expr>& pool) const -> Expr const* {
      return procs::applySubs(e, assignment, pool);
    }

    // Instantiates, then beta-reduces.
    auto normalize(Expr const* e, Allocator<Expr>& pool) const -> Expr const* {
      return instantiate(e, pool)->reduce(pool);
    }

    // Merges a unifier (over instantiated expressions) into the assignment.
    // Returns false, leaving the state unchanged, if some solution mentions context entries outside the scope of its
    // metavariable.
    auto assign(procs::Subs const& subs, Allocator<Expr>& pool) -> bool;

    // Unifies the two expressions under the current assignment, merging the result on success.
    auto unify(Expr const* lhs, Expr const* rhs, Allocator<Expr>& pool) -> bool;

    // Drops goals whose metavariable has been assigned.
    auto prune() -> void;

    // Pretty-prints with metavariable names.
    auto show(Expr const* e, Context const& ctx, Allocator<Expr>& pool) const -> std::string;

    auto log(Message::Severity severity, std::string text) -> void {
      messages.push_back({severity, std::move(text)});
    }
  };

#include "macros_close.hpp"
}

#endif // ARBOR_ELAB_STATE_HPP
