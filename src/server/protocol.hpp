#ifndef ARBOR_SERVER_PROTOCOL_HPP
#define ARBOR_SERVER_PROTOCOL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <session/engine.hpp>
#include <session/error.hpp>
#include <session/session.hpp>

namespace arbor::server {
#include "macros_open.hpp"

  // One JSON object per line, in both directions:
  //   Request:  {"id"?: any, "method": string, "params"?: object}
  //   Response: {"id"?: any, "result": any} or {"id"?: any, "error": {"code": int, "message": string, "data"?: any}}
  // Codes follow JSON-RPC 2.0 for transport failures.
  // See: https://www.jsonrpc.org/specification
  enum ErrorCode: int32_t {
    stepParseError = 0,
    stepExecutionError = 1,
    expressionParseError = 2,
    elaborationError = 3,
    parseError = -32700,
    invalidRequest = -32600,
    methodNotFound = -32601,
    invalidParams = -32602
  };

  auto errorCode(session::Error::Kind kind) -> ErrorCode;

  // The `error` member of a response.
  auto errorObject(ErrorCode code, std::string const& message, std::optional<nlohmann::json> const& data = {})
    -> nlohmann::json;
  auto errorObject(session::Error const& e) -> nlohmann::json;

#include "macros_close.hpp"
}

// Conversions are found by ADL, so they live beside the types.
namespace arbor::session {

  void to_json(nlohmann::json& j, Hypothesis const& o);
  void to_json(nlohmann::json& j, GoalView const& o);
  void to_json(nlohmann::json& j, Diagnostic const& o);
  void to_json(nlohmann::json& j, Candidate const& o);
  void to_json(nlohmann::json& j, Position const& o);
  void to_json(nlohmann::json& j, NodeInfo const& o);
  void from_json(nlohmann::json const& j, GoalSpec& o);

}

#endif // ARBOR_SERVER_PROTOCOL_HPP
