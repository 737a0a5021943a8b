#include "config.hpp"
#include <charconv>
#include <string_view>

namespace arbor {
#include "macros_open.hpp"

  auto Config::parse(std::vector<std::string> const& args) -> Config {
    auto res = Config();
    for (auto i = 1uz; i < args.size(); i++) {
      auto const arg = std::string_view(args[i]);
      auto const value = [&]() {
        if (i + 1 >= args.size()) throw ConfigError("missing value for " + std::string(arg));
        return std::string_view(args[++i]);
      };
      if (arg == "--budget") {
        auto const s = value();
        auto n = uint64_t{};
        auto const [end, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
        if (ec != std::errc() || end != s.data() + s.size() || s.empty())
          throw ConfigError("invalid budget \"" + std::string(s) + "\"");
        res.budget = n;
      } else if (arg == "--load") {
        res.load = std::string(value());
      } else if (arg == "--verbose") {
        res.verbose = true;
      } else if (arg == "--help") {
        res.help = true;
      } else {
        throw ConfigError("unknown option \"" + std::string(arg) + "\"");
      }
    }
    return res;
  }

#include "macros_close.hpp"
}
