#ifndef ARBOR_SERVER_DISPATCHER_HPP
#define ARBOR_SERVER_DISPATCHER_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <session/session.hpp>
#include "protocol.hpp"
#include "registry.hpp"

namespace arbor::server {
#include "macros_open.hpp"

  // Reads requests from `in` and writes one response line per request to `out`.
  // Handlers run on the calling thread, one at a time.
  class Dispatcher {
  public:
    Dispatcher(session::Operations& ops, std::istream& in, std::ostream& out, std::ostream& log, bool verbose = false):
        _ops(ops),
        _registry(makeRegistry()),
        _in(in),
        _out(out),
        _log(log),
        _verbose(verbose) {}

    // Handles one line. Returns `false` if read past EOF.
    auto dispatchOne() -> bool;

    // Handles lines until the session stops running (returns `true`) or the input ends (returns `false`).
    auto run() -> bool;

    // The response for one request line, without writing it.
    auto handle(std::string const& line) -> nlohmann::json;

  private:
    session::Operations& _ops;
    Registry _registry;
    std::istream& _in;
    std::ostream& _out;
    std::ostream& _log;
    bool _verbose;

    auto _readNextLine() -> std::optional<std::string>;
    auto _handleRequest(nlohmann::json const& j) -> nlohmann::json;
    auto _send(nlohmann::json const& j) -> void;
  };

#include "macros_close.hpp"
}

#endif // ARBOR_SERVER_DISPATCHER_HPP
