#ifndef ARBOR_CORE_CONTEXT_HPP
#define ARBOR_CORE_CONTEXT_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <common.hpp>

namespace arbor::core {
#include "macros_open.hpp"

  class Expr;

  // The context is stored as a stack (an std::vector whose last element denotes the topmost layer).
  // Global constants come first, then local hypotheses. Free variables (`Expr::VFree`) are indices into it.
  // Entries do not own their types: those live in the arena of whoever built the context, which must outlive it.
  // An entry may have a null type ("auto-bound" atoms, whose type is not known).
  class Context {
  public:
    struct Entry {
      std::string name;
      Expr const* type;
      auto operator==(Entry const&) const -> bool = default;
    };

    // Adds an entry on top, returning its index.
    auto push(std::string const& s, Expr const* e) -> size_t;

    // Pops the topmost entry. Returns false if the context is empty.
    auto pop() -> bool;

    auto size() const -> size_t {
      return _entries.size();
    }
    auto operator[](size_t index) const -> Expr const* {
      return _entries.at(index).type;
    }
    auto identifier(size_t index) const -> std::string const& {
      return _entries.at(index).name;
    }
    auto entries() const -> std::vector<Entry> const& {
      return _entries;
    }

    // Look up by literal name; later entries shadow earlier ones.
    auto lookup(std::string const& s) const -> std::optional<size_t> {
      // Unsigned count down: https://nachtimwald.com/2019/06/02/unsigned-count-down/
      for (auto i = _entries.size(); i-- > 0;)
        if (_entries[i].name == s)
          return i;
      return {};
    }

  private:
    std::vector<Entry> _entries;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_CORE_CONTEXT_HPP
