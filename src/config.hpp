#ifndef ARBOR_CONFIG_HPP
#define ARBOR_CONFIG_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <common.hpp>

namespace arbor {
#include "macros_open.hpp"

  class ConfigError: public std::runtime_error {
  public:
    explicit ConfigError(std::string const& s):
        std::runtime_error(s) {}
  };

  // Command-line options of the REPL server.
  struct Config {
    static constexpr uint64_t defaultBudget = 100000;
    static constexpr char const* usage =
      "usage: arbor-repl [--budget N] [--load FILE] [--verbose] [--help]\n"
      "  --budget N   default step budget for step.apply (default 100000)\n"
      "  --load FILE  declare the axioms in FILE before starting\n"
      "  --verbose    log every request to stderr\n"
      "  --help       print this message and exit\n";

    uint64_t budget = defaultBudget;
    std::optional<std::string> load;
    bool verbose = false;
    bool help = false;

    // Parses `args` (including the program name). Throws `ConfigError` on invalid options.
    static auto parse(std::vector<std::string> const& args) -> Config;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_CONFIG_HPP
