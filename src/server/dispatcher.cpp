#include "dispatcher.hpp"
#include <iostream>

using nlohmann::json;
using std::string;

namespace arbor::server {
#include "macros_open.hpp"

  namespace {

    auto withId(json const* id, json res) -> json {
      if (id) res["id"] = *id;
      return res;
    }

    auto resultResponse(json const* id, json const& result) -> json {
      return withId(id, {{"result", result}});
    }

    auto errorResponse(json const* id, json const& error) -> json {
      return withId(id, {{"error", error}});
    }

  }

  // Returns `nullopt` if read past EOF.
  auto Dispatcher::_readNextLine() -> std::optional<string> {
    auto res = string();
    if (!std::getline(_in, res)) return {};
    // Accept "\r\n" line endings
    if (!res.empty() && res.back() == '\r') res.pop_back();
    return res;
  }

  auto Dispatcher::handle(string const& line) -> json {
    auto j = json();
    try {
      j = json::parse(line);
    } catch (json::parse_error& e) {
      _log << "parse error: " << e.what() << std::endl;
      return errorResponse(nullptr, errorObject(parseError, e.what()));
    }
    return _handleRequest(j);
  }

  auto Dispatcher::_handleRequest(json const& j) -> json {
    auto const invalid = [this](string const& msg) {
      _log << "invalid request: " << msg << std::endl;
      return errorResponse(nullptr, errorObject(invalidRequest, msg));
    };
    if (!j.is_object()) return invalid("ill-formed request, expected object");
    if (!j.contains("method") || !j["method"].is_string()) return invalid("ill-formed request, expected string method");
    auto params = json::object();
    if (j.contains("params")) {
      if (!j["params"].is_object()) return invalid("ill-formed request, expected object params");
      params = j["params"];
    }

    auto const id = j.contains("id") ? &j["id"] : nullptr;
    auto const method = j["method"].get<string>();
    if (_verbose) _log << "<< " << method << " " << (id ? id->dump() : "(no id)") << " " << params.dump() << std::endl;

    auto const it = _registry.find(method);
    if (it == _registry.end()) {
      _log << "method \"" << method << "\" not found" << std::endl;
      return errorResponse(id, errorObject(methodNotFound, "method \"" + method + "\" not found"));
    }

    try {
      auto const res = it->second(_ops, params);
      if (!res) {
        _log << method << " failed: " << res.error().message << std::endl;
        return errorResponse(id, errorObject(res.error()));
      }
      if (_verbose) _log << ">> " << res->dump() << std::endl;
      return resultResponse(id, *res);
    } catch (json::exception& e) {
      _log << method << " failed: " << e.what() << std::endl;
      return errorResponse(id, errorObject(invalidParams, e.what()));
    } catch (ParamsError& e) {
      _log << method << " failed: " << e.what() << std::endl;
      return errorResponse(id, errorObject(invalidParams, e.what()));
    }
  }

  auto Dispatcher::_send(json const& j) -> void {
    _out << j.dump() << "\n";
    _out.flush();
  }

  auto Dispatcher::dispatchOne() -> bool {
    auto const line = _readNextLine();
    if (!line) return false;
    _send(handle(*line));
    return true;
  }

  auto Dispatcher::run() -> bool {
    while (_ops.running())
      if (!dispatchOne()) return false;
    return true;
  }

#include "macros_close.hpp"
}
