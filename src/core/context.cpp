#include "context.hpp"

namespace arbor::core {
#include "macros_open.hpp"

  auto Context::push(std::string const& s, Expr const* e) -> size_t {
    _entries.push_back({s, e});
    return _entries.size() - 1;
  }

  auto Context::pop() -> bool {
    if (_entries.empty())
      return false;
    _entries.pop_back();
    return true;
  }

#include "macros_close.hpp"
}
