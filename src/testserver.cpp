#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <elab/engine.hpp>
#include <server/dispatcher.hpp>
#include <session/session.hpp>
#include "config.hpp"

using nlohmann::json;
using namespace arbor;
using server::Dispatcher;

class DispatcherTest: public testing::Test {
protected:
  elab::ProofEngine engine;
  session::Session session{engine, 100000};
  std::ostringstream log;

  // Feeds `input` to a dispatcher until it stops. Returns whether it stopped on commit, and the responses.
  auto serve(std::string const& input, bool verbose = false) -> std::pair<bool, std::vector<json>> {
    auto in = std::istringstream(input);
    auto out = std::ostringstream();
    auto dispatcher = Dispatcher(session, in, out, log, verbose);
    auto const committed = dispatcher.run();
    auto res = std::vector<json>();
    auto lines = std::istringstream(out.str());
    for (auto line = std::string(); std::getline(lines, line);) res.push_back(json::parse(line));
    return {committed, res};
  }

  // Sends one request, returns its response.
  auto call(json const& request) -> json {
    auto const [committed, responses] = serve(request.dump() + "\n");
    EXPECT_EQ(responses.size(), 1u);
    return responses.empty() ? json() : responses[0];
  }

  auto call(std::string const& method, json const& params, json const& id = 1) -> json {
    return call(json{{"id", id}, {"method", method}, {"params", params}});
  }

  // `state.new` parameters with a single goal.
  static auto goal(std::string const& name, std::string const& type) -> json {
    return {{"goals", json::array({json{{"name", name}, {"type", type}}})}};
  }

  static auto code(json const& response) -> int {
    return response.at("error").at("code").get<int>();
  }
};

TEST_F(DispatcherTest, OneCompactLinePerRequest) {
  auto in = std::istringstream(
    "{\"id\": 1, \"method\": \"position\"}\n"
    "{\"id\": 2, \"method\": \"node.info\", \"params\": {\"nodeId\": 0}}\n"
  );
  auto out = std::ostringstream();
  auto dispatcher = Dispatcher(session, in, out, log);
  EXPECT_FALSE(dispatcher.run());
  EXPECT_EQ(
    out.str(),
    "{\"id\":1,\"result\":{\"position\":null}}\n"
    "{\"id\":2,\"result\":{\"nodeId\":0,\"parent\":0,\"step\":\"\"}}\n"
  );
}

TEST_F(DispatcherTest, EchoesIds) {
  EXPECT_EQ(call("position", json::object(), "abc")["id"], "abc");
  EXPECT_EQ(call("position", json::object(), json{{"k", 1}})["id"], (json{{"k", 1}}));
  EXPECT_TRUE(call("position", json::object(), nullptr)["id"].is_null());
  EXPECT_TRUE(call("position", json::object(), nullptr).contains("id"));

  auto const anonymous = call(json{{"method", "position"}});
  EXPECT_FALSE(anonymous.contains("id"));
  EXPECT_EQ(anonymous["result"], (json{{"position", nullptr}}));
}

TEST_F(DispatcherTest, TransportErrors) {
  auto const [committed, responses] = serve(
    "not json\n"
    "[1, 2]\n"
    "{\"id\": 1}\n"
    "{\"id\": 2, \"method\": 3}\n"
    "{\"id\": 3, \"method\": \"position\", \"params\": [1]}\n"
    "{\"id\": 4, \"method\": \"nope\"}\n"
  );
  EXPECT_FALSE(committed);
  ASSERT_EQ(responses.size(), 6u);
  EXPECT_EQ(code(responses[0]), -32700);
  for (auto i = 0uz; i < 5; i++) EXPECT_FALSE(responses[i].contains("id")) << i;
  for (auto i = 1uz; i < 5; i++) EXPECT_EQ(code(responses[i]), -32600) << i;
  EXPECT_EQ(code(responses[5]), -32601);
  EXPECT_EQ(responses[5]["id"], 4);
  EXPECT_EQ(responses[5]["error"]["message"], "method \"nope\" not found");
}

TEST_F(DispatcherTest, InvalidParams) {
  EXPECT_EQ(code(call("state.goals", json::object())), -32602);
  EXPECT_EQ(code(call("state.goals", {{"nodeId", "zero"}})), -32602);
  EXPECT_EQ(code(call("step.apply", {{"nodeId", 0}})), -32602);
  EXPECT_EQ(code(call("step.apply", {{"nodeId", 0}, {"step", "skip"}, {"budget", "lots"}})), -32602);
  EXPECT_EQ(code(call("state.new", {{"goals", json::array({json{{"name", "h"}}})}})), -32602);

  // Ids and budgets are non-negative integers
  EXPECT_EQ(code(call("state.goals", {{"nodeId", -1}})), -32602);
  EXPECT_EQ(code(call("state.goals", {{"nodeId", 0.5}})), -32602);
  EXPECT_EQ(code(call("node.info", {{"nodeId", 0.0}})), -32602);
  EXPECT_EQ(code(call("step.apply", {{"nodeId", 0}, {"step", "skip"}, {"budget", -1}})), -32602);
  EXPECT_EQ(code(call("step.apply", {{"nodeId", 0}, {"step", "skip"}, {"budget", 2.5}})), -32602);
  auto const negative = call("step.apply", {{"nodeId", 0}, {"step", "skip"}, {"budget", -1}});
  EXPECT_EQ(negative["error"]["message"], "expected non-negative integer for \"budget\"");
  EXPECT_EQ(call("step.apply", {{"nodeId", 0}, {"step", "skip"}, {"budget", 10}})["result"], (json{{"nodeId", 1}}));

  auto const missing = call("state.goals", {{"nodeId", 99}}, 5);
  EXPECT_EQ(code(missing), -32602);
  EXPECT_EQ(missing["id"], 5);
  EXPECT_EQ(missing["error"]["message"], "node 99 does not exist (1 nodes)");
}

TEST_F(DispatcherTest, ProofSession) {
  auto const created = call("state.new", goal("h", "Nat"));
  ASSERT_EQ(created["result"], (json{{"nodeId", 1}}));

  auto const goals = call("state.goals", {{"nodeId", 1}});
  EXPECT_EQ(
    goals["result"],
    json::parse(R"({"goals": [{"name": "h", "hypotheses": [], "target": "Nat"}]})")
  );

  auto const stepped = call("step.apply", {{"nodeId", 1}, {"step", "exact Nat.zero"}, {"budget", nullptr}});
  ASSERT_EQ(stepped["result"], (json{{"nodeId", 2}}));
  EXPECT_EQ(call("state.goals", {{"nodeId", 2}})["result"], json::parse(R"({"goals": []})"));
  EXPECT_EQ(call("state.messages", {{"nodeId", 2}})["result"], json::parse(R"({"messages": []})"));
  EXPECT_EQ(
    call("node.info", {{"nodeId", 2}})["result"],
    json::parse(R"({"nodeId": 2, "parent": 1, "step": "exact Nat.zero"})")
  );

  auto const gaveUp = call("state.giveUp", {{"nodeId", 1}});
  ASSERT_EQ(gaveUp["result"], (json{{"nodeId", 3}}));
  EXPECT_EQ(
    call("state.messages", {{"nodeId", 3}})["result"],
    json::parse(R"({"messages": [{"severity": "warning", "message": "declaration uses 'sorry'"}]})")
  );
}

TEST_F(DispatcherTest, HypothesesAndUnnamedGoals) {
  call("state.new", goal("c", "(a b : Prop) -> a -> b -> And a b"));
  call("step.apply", {{"nodeId", 1}, {"step", "intro a b ha hb; apply And.intro"}});
  auto const goals = call("state.goals", {{"nodeId", 2}})["result"]["goals"];
  ASSERT_EQ(goals.size(), 2u);
  EXPECT_EQ(goals[0]["target"], "a");
  EXPECT_EQ(goals[1]["target"], "b");
  EXPECT_EQ(goals[0]["hypotheses"].size(), 4u);
  EXPECT_EQ(goals[0]["hypotheses"][2], (json{{"name", "ha"}, {"type", "a"}}));

  call("state.new", goal("", "Nat"));
  auto const unnamed = call("state.goals", {{"nodeId", 3}})["result"]["goals"];
  ASSERT_EQ(unnamed.size(), 1u);
  EXPECT_FALSE(unnamed[0].contains("name"));
}

TEST_F(DispatcherTest, SessionErrors) {
  call("state.new", goal("h", "Nat"));

  auto const parse = call("step.apply", {{"nodeId", 1}, {"step", "malformed((("}});
  EXPECT_EQ(code(parse), 0);
  EXPECT_FALSE(parse["error"].contains("data"));

  auto const exec = call("step.apply", {{"nodeId", 1}, {"step", "exact True.intro"}});
  EXPECT_EQ(code(exec), 1);
  EXPECT_EQ(exec["error"]["message"], "type mismatch, expected Nat, got True");
  EXPECT_EQ(exec["error"]["data"], (json::array({"type mismatch, expected Nat, got True"})));

  EXPECT_EQ(code(call("expr.unify", {{"nodeId", 0}, {"lhs", "f ("}, {"rhs", "x"}})), 2);
  EXPECT_EQ(code(call("state.new", goal("h", "Nat.zero"))), 3);

  // Nothing was appended
  EXPECT_EQ(code(call("node.info", {{"nodeId", 2}})), -32602);
}

TEST_F(DispatcherTest, Queries) {
  EXPECT_EQ(call("expr.unify", {{"nodeId", 0}, {"lhs", "x"}, {"rhs", "y"}})["result"], json::parse(R"({"unifier": null})"));
  EXPECT_EQ(
    call("expr.unify", {{"nodeId", 0}, {"lhs", "Nat.succ ?n"}, {"rhs", "Nat.succ Nat.zero"}})["result"],
    json::parse(R"({"unifier": {"n": "Nat.zero"}})")
  );
  EXPECT_EQ(
    call("expr.unify", {{"nodeId", 0}, {"lhs", "?a"}, {"rhs", "?b"}})["result"],
    json::parse(R"({"unifier": {"a": "?b", "b": null}})")
  );
  EXPECT_EQ(
    call("name.resolve", {{"nodeId", 0}, {"name", "Or.inl.foo"}})["result"],
    json::parse(R"({"candidates": [{"name": "Or.inl", "fields": ["foo"]}, {"name": "Or", "fields": ["inl", "foo"]}]})")
  );
  EXPECT_EQ(call("position", json::object())["result"], json::parse(R"({"position": null})"));
}

TEST_F(DispatcherTest, CommitStopsTheLoop) {
  auto const [committed, responses] = serve(
    "{\"id\": 1, \"method\": \"state.new\", \"params\": {\"goals\": [{\"name\": \"h\", \"type\": \"Nat\"}]}}\n"
    "{\"id\": 2, \"method\": \"step.apply\", \"params\": {\"nodeId\": 1, \"step\": \"exact Nat.zero\", \"budget\": 1000}}\n"
    "{\"id\": 3, \"method\": \"commit\", \"params\": {\"nodeId\": 2}}\n"
    "{\"id\": 4, \"method\": \"position\"}\n"
  );
  EXPECT_TRUE(committed);
  ASSERT_EQ(responses.size(), 3u);
  EXPECT_EQ(responses[2], json::parse(R"({"id": 3, "result": {}})"));
  EXPECT_FALSE(session.running());
}

TEST_F(DispatcherTest, FailedCommitKeepsRunning) {
  auto const [committed, responses] = serve("{\"id\": 1, \"method\": \"commit\", \"params\": {\"nodeId\": 4}}\n");
  EXPECT_FALSE(committed);
  ASSERT_EQ(responses.size(), 1u);
  EXPECT_EQ(code(responses[0]), -32602);
  EXPECT_TRUE(session.running());
}

TEST_F(DispatcherTest, EndOfInput) {
  auto const [committed, responses] = serve("");
  EXPECT_FALSE(committed);
  EXPECT_TRUE(responses.empty());
}

TEST_F(DispatcherTest, CarriageReturns) {
  auto const [committed, responses] = serve("{\"id\": 1, \"method\": \"position\"}\r\n");
  ASSERT_EQ(responses.size(), 1u);
  EXPECT_EQ(responses[0]["id"], 1);
  EXPECT_TRUE(responses[0].contains("result"));
}

TEST_F(DispatcherTest, Logging) {
  serve("{\"id\": 1, \"method\": \"position\"}\n");
  EXPECT_TRUE(log.str().empty());
  serve("{\"id\": 1, \"method\": \"position\"}\n", true);
  EXPECT_NE(log.str().find("position"), std::string::npos);

  log.str("");
  serve("{\"id\": 1, \"method\": \"state.goals\", \"params\": {\"nodeId\": 8}}\n");
  EXPECT_NE(log.str().find("node 8 does not exist"), std::string::npos);
}

TEST_F(DispatcherTest, ForeignSnapshotPassesThrough) {
  auto other = elab::ProofEngine();
  session.append({other.captureSnapshot(), 0, ""});
  EXPECT_THROW(serve("{\"id\": 1, \"method\": \"state.goals\", \"params\": {\"nodeId\": 1}}\n"), std::logic_error);
}

// =======================
// Command line
// =======================

TEST(Config, Defaults) {
  auto const config = Config::parse({"arbor-repl"});
  EXPECT_EQ(config.budget, Config::defaultBudget);
  EXPECT_FALSE(config.load.has_value());
  EXPECT_FALSE(config.verbose);
  EXPECT_FALSE(config.help);
}

TEST(Config, Options) {
  auto const config = Config::parse({"arbor-repl", "--budget", "500", "--load", "axioms.txt", "--verbose"});
  EXPECT_EQ(config.budget, 500u);
  EXPECT_EQ(config.load, "axioms.txt");
  EXPECT_TRUE(config.verbose);
  EXPECT_TRUE(Config::parse({"arbor-repl", "--help"}).help);
}

TEST(Config, Errors) {
  EXPECT_THROW(Config::parse({"arbor-repl", "--budget"}), ConfigError);
  EXPECT_THROW(Config::parse({"arbor-repl", "--budget", "many"}), ConfigError);
  EXPECT_THROW(Config::parse({"arbor-repl", "--budget", "-1"}), ConfigError);
  EXPECT_THROW(Config::parse({"arbor-repl", "--budget", "12x"}), ConfigError);
  EXPECT_THROW(Config::parse({"arbor-repl", "--load"}), ConfigError);
  EXPECT_THROW(Config::parse({"arbor-repl", "--fast"}), ConfigError);
  EXPECT_THROW(Config::parse({"arbor-repl", "extra"}), ConfigError);
}
