#ifndef ARBOR_ELAB_ENVIRONMENT_HPP
#define ARBOR_ELAB_ENVIRONMENT_HPP

#include <optional>
#include <string>
#include <core/context.hpp>
#include <core/expr.hpp>

namespace arbor::elab {
#include "macros_open.hpp"

  using core::Expr;
  using core::Context;

  // Global constants (axioms), shared by all proof states.
  // Types live in the arena passed to the constructor, which must outlive the environment.
  class Environment {
  public:
    // Starts with the built-in prelude (`Nat`, `Eq`, `True`, `False`, `Not`, `And`, `Or` and their rules).
    explicit Environment(Allocator<Expr>& pool);

    // Adds a constant. Throws `parsing::ParseError` or `ElabError` if `type` is not a well-formed type, or if the name is
    // taken.
    auto declare(std::string const& name, std::string const& type) -> void;

    // Declares every `name : type` line of a file. Blank lines and `--` comments are skipped.
    // Throws `std::runtime_error` (with file name and line number) on the first failure.
    auto load(std::string const& path) -> void;

    auto context() const -> Context const& {
      return _ctx;
    }
    auto size() const -> size_t {
      return _ctx.size();
    }

    // The file loaded last, and the zero-based line following its last declaration.
    struct Location {
      std::string file;
      size_t line;
    };
    auto location() const -> std::optional<Location> const& {
      return _location;
    }

  private:
    Allocator<Expr>& _pool;
    Context _ctx;
    std::optional<Location> _location;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_ELAB_ENVIRONMENT_HPP
