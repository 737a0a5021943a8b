#include "registry.hpp"
#include <optional>
#include <string>
#include <vector>
#include "protocol.hpp"

using nlohmann::json;
using std::string;
using arbor::session::NodeId;
using arbor::session::Operations;
using arbor::session::Result;

namespace arbor::server {
#include "macros_open.hpp"

  namespace {

    // Encodes the value of a successful result.
    template <typename T, typename F>
    auto encode(Result<T> const& res, F f) -> Result<json> {
      if (!res) return std::unexpected(res.error());
      return f(*res);
    }

    // Non-negative integers only: nlohmann would otherwise wrap `-1` and truncate `1.9`.
    auto natural(json const& params, char const* key) -> uint64_t {
      auto const& v = params.at(key);
      if (!v.is_number_unsigned()) throw ParamsError(string("expected non-negative integer for \"") + key + "\"");
      return v.get<uint64_t>();
    }

    auto nodeId(json const& params) -> NodeId {
      return natural(params, "nodeId");
    }

  }

  auto makeRegistry() -> Registry {
    auto res = Registry();

    res["step.apply"] = [](Operations& ops, json const& params) {
      auto budget = std::optional<uint64_t>();
      if (params.contains("budget") && !params["budget"].is_null()) budget = natural(params, "budget");
      return encode(ops.applyStep(nodeId(params), params.at("step").get<std::string>(), budget), [](NodeId id) {
        return json{{"nodeId", id}};
      });
    };

    res["state.goals"] = [](Operations& ops, json const& params) {
      return encode(ops.queryState(nodeId(params)), [](auto const& goals) { return json{{"goals", goals}}; });
    };

    res["state.messages"] = [](Operations& ops, json const& params) {
      return encode(ops.queryMessages(nodeId(params)), [](auto const& msgs) { return json{{"messages", msgs}}; });
    };

    res["name.resolve"] = [](Operations& ops, json const& params) {
      return encode(ops.resolveName(nodeId(params), params.at("name").get<std::string>()), [](auto const& cands) {
        return json{{"candidates", cands}};
      });
    };

    res["expr.unify"] = [](Operations& ops, json const& params) {
      auto const lhs = params.at("lhs").get<std::string>(), rhs = params.at("rhs").get<std::string>();
      return encode(ops.unify(nodeId(params), lhs, rhs), [](std::optional<session::Unifier> const& unifier) {
        if (!unifier) return json{{"unifier", nullptr}};
        auto obj = json::object();
        for (auto const& [name, solution]: *unifier) obj[name] = solution ? json(*solution) : json(nullptr);
        return json{{"unifier", obj}};
      });
    };

    res["state.new"] = [](Operations& ops, json const& params) {
      auto const goals = params.at("goals").get<std::vector<session::GoalSpec>>();
      return encode(ops.newState(goals), [](NodeId id) { return json{{"nodeId", id}}; });
    };

    res["state.giveUp"] = [](Operations& ops, json const& params) {
      return encode(ops.giveUp(nodeId(params)), [](NodeId id) { return json{{"nodeId", id}}; });
    };

    res["commit"] = [](Operations& ops, json const& params) {
      return encode(ops.commit(nodeId(params)), [](unit) { return json::object(); });
    };

    res["position"] = [](Operations& ops, json const&) {
      return encode(ops.position(), [](std::optional<session::Position> const& pos) {
        return pos ? json{{"position", *pos}} : json{{"position", nullptr}};
      });
    };

    res["node.info"] = [](Operations& ops, json const& params) {
      return encode(ops.nodeInfo(nodeId(params)), [](session::NodeInfo const& info) { return json(info); });
    };

    return res;
  }

#include "macros_close.hpp"
}
