#include "protocol.hpp"

using nlohmann::json;

namespace arbor::server {
#include "macros_open.hpp"

  auto errorCode(session::Error::Kind kind) -> ErrorCode {
    using enum session::Error::Kind;
    switch (kind) {
      case InvalidParams: return invalidParams;
      case StepParse: return stepParseError;
      case StepExecution: return stepExecutionError;
      case ExpressionParse: return expressionParseError;
      case Elaboration: return elaborationError;
    }
    unreachable;
  }

  auto errorObject(ErrorCode code, std::string const& message, std::optional<json> const& data) -> json {
    auto res = json{
      {   "code",    code},
      {"message", message}
    };
    if (data) res["data"] = *data;
    return res;
  }

  auto errorObject(session::Error const& e) -> json {
    if (e.kind == session::Error::StepExecution) return errorObject(errorCode(e.kind), e.message, json(e.details));
    return errorObject(errorCode(e.kind), e.message);
  }

#include "macros_close.hpp"
}

namespace arbor::session {

  // clang-format off
#define TO(name) j[#name] = o.name
#define FROM(name) j.at(#name).get_to(o.name)

  void to_json   (json& j, Hypothesis const& o) { j = json::object(); TO(name); TO(type); }
  void to_json   (json& j, GoalView const& o)   { j = json::object(); if (!o.name.empty()) TO(name); TO(hypotheses); TO(target); }
  void to_json   (json& j, Diagnostic const& o) { j = json::object(); TO(severity); TO(message); }
  void to_json   (json& j, Candidate const& o)  { j = json::object(); TO(name); TO(fields); }
  void to_json   (json& j, Position const& o)   { j = json::object(); TO(file); TO(line); TO(column); }
  void to_json   (json& j, NodeInfo const& o)   { j = {{"nodeId", o.id}, {"parent", o.parent}, {"step", o.step}}; }
  void from_json (json const& j, GoalSpec& o)   { o = {}; FROM(name); FROM(type); }

  // clang-format on
#undef TO
#undef FROM

}
