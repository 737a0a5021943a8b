#ifndef ARBOR_CORE_BUDGET_HPP
#define ARBOR_CORE_BUDGET_HPP

#include <limits>
#include <stdexcept>
#include <string>
#include <common.hpp>

namespace arbor::core {
#include "macros_open.hpp"

  // Thrown by `Budget::tick()` once the step limit is reached.
  class BudgetExceeded: public std::runtime_error {
  public:
    uint64_t limit;
    explicit BudgetExceeded(uint64_t limit):
        std::runtime_error("maximum number of computation steps (" + std::to_string(limit) + ") exceeded"),
        limit(limit) {}
  };

  // A cooperative cap on the number of computation steps (reductions, inference steps) performed by the kernel.
  // It does not preempt anything: loops that never call `tick()` are not bounded.
  class Budget {
  public:
    static constexpr uint64_t unlimited = std::numeric_limits<uint64_t>::max();

    auto tick() -> void {
      if (_used >= _limit)
        throw BudgetExceeded(_limit);
      _used++;
    }
    auto used() const -> uint64_t {
      return _used;
    }
    auto limit() const -> uint64_t {
      return _limit;
    }

    // Sets a new limit for the current thread until destroyed, then restores the previous one.
    class Scope {
    public:
      explicit Scope(uint64_t limit);
      ~Scope();
      Scope(Scope const&) = delete;
      auto operator=(Scope const&) -> Scope& = delete;

    private:
      uint64_t _savedLimit, _savedUsed;
    };

  private:
    uint64_t _limit = unlimited;
    uint64_t _used = 0;
  };

  // The budget consulted by kernel operations on this thread.
  inline auto budget() -> Budget& {
    thread_local Budget current;
    return current;
  }

  inline Budget::Scope::Scope(uint64_t limit):
      _savedLimit(budget()._limit),
      _savedUsed(budget()._used) {
    budget()._limit = limit;
    budget()._used = 0;
  }

  inline Budget::Scope::~Scope() {
    budget()._limit = _savedLimit;
    budget()._used = _savedUsed;
  }

#include "macros_close.hpp"
}

#endif // ARBOR_CORE_BUDGET_HPP
