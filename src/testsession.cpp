#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <elab/engine.hpp>
#include <session/session.hpp>

using namespace arbor;
using session::Error, session::NodeId, session::Session;

class SessionTest: public testing::Test {
protected:
  elab::ProofEngine engine;
  Session session{engine, 100000};

  // Unwraps a successful result.
  template <typename T>
  static auto ok(session::Result<T> const& res) -> T {
    EXPECT_TRUE(res.has_value()) << res.error().message;
    return *res;
  }

  template <typename T>
  static auto kind(session::Result<T> const& res) -> std::optional<Error::Kind> {
    if (res) return std::nullopt;
    return res.error().kind;
  }
};

TEST_F(SessionTest, RootNode) {
  EXPECT_EQ(session.size(), 1u);
  EXPECT_TRUE(session.running());
  auto const info = ok(session.nodeInfo(0));
  EXPECT_EQ(info.id, 0u);
  EXPECT_EQ(info.parent, 0u);
  EXPECT_EQ(info.step, "");
  EXPECT_TRUE(ok(session.queryState(0)).empty());
  EXPECT_TRUE(ok(session.queryMessages(0)).empty());
}

// Scenarios A to F in sequence
TEST_F(SessionTest, Walkthrough) {
  // A: a fresh obligation becomes node 1
  auto const s1 = ok(session.newState({{"h", "Nat"}}));
  EXPECT_EQ(s1, 1u);
  auto const goals = ok(session.queryState(1));
  ASSERT_EQ(goals.size(), 1u);
  EXPECT_EQ(goals[0].name, "h");
  EXPECT_EQ(goals[0].target, "Nat");

  // B: a malformed step is rejected and appends nothing
  auto const bad = session.applyStep(0, "malformed(((", 1000);
  EXPECT_EQ(kind(bad), Error::StepParse);
  EXPECT_EQ(session.size(), 2u);

  // C: a proof step closes the goal
  auto const s2 = ok(session.applyStep(1, "exact Nat.zero", 1000));
  EXPECT_EQ(s2, 2u);
  EXPECT_TRUE(ok(session.queryState(2)).empty());
  auto const info = ok(session.nodeInfo(2));
  EXPECT_EQ(info.parent, 1u);
  EXPECT_EQ(info.step, "exact Nat.zero");

  // D: unknown plain identifiers are distinct atoms
  auto const unifier = ok(session.unify(0, "x", "y"));
  EXPECT_FALSE(unifier.has_value());
  EXPECT_EQ(session.size(), 3u);

  // E: lookups past the end fail
  auto const missing = session.lookup(99);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().kind, Error::InvalidParams);
  EXPECT_EQ(missing.error().message, "node 99 does not exist (3 nodes)");

  // F: commit stops the session
  ok(session.commit(2));
  EXPECT_FALSE(session.running());
  EXPECT_EQ(session.size(), 3u);
}

TEST_F(SessionTest, IdsAreSequential) {
  auto const a = ok(session.newState({{"a", "Nat"}, {"b", "Nat"}}));
  auto const b = ok(session.applyStep(a, "exact Nat.zero", std::nullopt));
  auto const c = ok(session.applyStep(a, "sorry", std::nullopt));
  auto const d = ok(session.giveUp(b));
  EXPECT_EQ((std::vector<NodeId>{a, b, c, d}), (std::vector<NodeId>{1, 2, 3, 4}));
  EXPECT_EQ(session.size(), 5u);
  for (auto id = 1uz; id < session.size(); id++) EXPECT_LT(ok(session.nodeInfo(id)).parent, id);
}

TEST_F(SessionTest, BranchesAreIndependent) {
  auto const root = ok(session.newState({{"a", "Nat"}, {"b", "True"}}));
  auto const left = ok(session.applyStep(root, "exact Nat.zero", std::nullopt));
  auto const right = ok(session.applyStep(root, "sorry", std::nullopt));

  EXPECT_EQ(ok(session.queryState(root)).size(), 2u);
  auto const l = ok(session.queryState(left));
  ASSERT_EQ(l.size(), 1u);
  EXPECT_EQ(l[0].name, "b");
  EXPECT_TRUE(ok(session.queryMessages(left)).empty());

  auto const r = ok(session.queryState(right));
  ASSERT_EQ(r.size(), 1u);
  EXPECT_EQ(r[0].name, "b");
  auto const messages = ok(session.queryMessages(right));
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].severity, "warning");

  // Continuing from the left branch does not see the right one
  auto const done = ok(session.applyStep(left, "exact True.intro", std::nullopt));
  EXPECT_TRUE(ok(session.queryState(done)).empty());
  EXPECT_TRUE(ok(session.queryMessages(done)).empty());
}

TEST_F(SessionTest, FailedStepsAppendNothing) {
  auto const s = ok(session.newState({{"h", "Nat"}}));
  auto const before = session.size();

  auto const mismatch = session.applyStep(s, "exact True.intro", std::nullopt);
  ASSERT_FALSE(mismatch.has_value());
  EXPECT_EQ(mismatch.error().kind, Error::StepExecution);
  EXPECT_EQ(mismatch.error().message, "type mismatch, expected Nat, got True");
  EXPECT_EQ(mismatch.error().details, std::vector<std::string>{"type mismatch, expected Nat, got True"});

  EXPECT_EQ(kind(session.applyStep(s, "intro x y z", std::nullopt)), Error::StepExecution);
  EXPECT_EQ(kind(session.applyStep(s, "exact (", std::nullopt)), Error::StepParse);
  EXPECT_EQ(kind(session.applyStep(42, "skip", std::nullopt)), Error::InvalidParams);

  EXPECT_EQ(session.size(), before);
  EXPECT_EQ(ok(session.queryState(s)).size(), 1u);
  EXPECT_EQ(ok(session.nodeInfo(s)).step, "");
}

TEST_F(SessionTest, StepsLoggingErrorsAreVoid) {
  auto const s = ok(session.newState({{"t", "True"}}));
  auto const before = session.size();
  auto const res = session.applyStep(s, "exact False.elim True _", std::nullopt);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, Error::StepExecution);
  EXPECT_TRUE(res.error().message.starts_with("don't know how to synthesize placeholder")) << res.error().message;
  ASSERT_EQ(res.error().details.size(), 1u);
  EXPECT_EQ(res.error().details[0], res.error().message);

  EXPECT_EQ(session.size(), before);
  EXPECT_TRUE(ok(session.queryMessages(s)).empty());
  EXPECT_EQ(ok(session.queryState(s)).size(), 1u);
}

TEST_F(SessionTest, WarningsDoNotVoidSteps) {
  auto const s = ok(session.newState({{"t", "True"}}));
  auto const next = ok(session.applyStep(s, "sorry", std::nullopt));
  EXPECT_TRUE(ok(session.queryState(next)).empty());
  // Nothing is left open, so giving up adds no second warning
  auto const again = ok(session.giveUp(next));
  EXPECT_EQ(ok(session.queryMessages(again)).size(), 1u);
}

TEST_F(SessionTest, GiveUp) {
  auto const s = ok(session.newState({{"a", "Nat"}, {"b", "False"}}));
  auto const before = session.size();
  auto const g = ok(session.giveUp(s));
  EXPECT_EQ(g, before);
  EXPECT_EQ(session.size(), before + 1);
  auto const info = ok(session.nodeInfo(g));
  EXPECT_EQ(info.parent, s);
  EXPECT_EQ(info.step, "");
  EXPECT_TRUE(ok(session.queryState(g)).empty());
  auto const messages = ok(session.queryMessages(g));
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].message, "declaration uses 'sorry'");
  EXPECT_EQ(ok(session.queryState(s)).size(), 2u);

  EXPECT_EQ(kind(session.giveUp(100)), Error::InvalidParams);
  EXPECT_EQ(session.size(), before + 1);
}

TEST_F(SessionTest, Budgets) {
  auto const s = ok(session.newState({{"b", "Eq Nat ((\\n : Nat => Nat.succ n) Nat.zero) (Nat.succ Nat.zero)"}}));
  auto const exhausted = session.applyStep(s, "rfl", 3);
  ASSERT_FALSE(exhausted.has_value());
  EXPECT_EQ(exhausted.error().kind, Error::StepExecution);
  EXPECT_EQ(exhausted.error().message, "maximum number of computation steps (3) exceeded");
  ok(session.applyStep(s, "rfl", std::nullopt));

  // The default applies when no budget is given
  auto tight = Session(engine, 3);
  auto const t = ok(tight.newState({{"b", "Eq Nat ((\\n : Nat => Nat.succ n) Nat.zero) (Nat.succ Nat.zero)"}}));
  EXPECT_EQ(kind(tight.applyStep(t, "rfl", std::nullopt)), Error::StepExecution);
  ok(tight.applyStep(t, "rfl", 100000));
}

TEST_F(SessionTest, OversizedInputFailsCleanly) {
  auto const s = ok(session.newState({{"h", "Nat"}}));
  auto const isTooDeep = [](Error const& e) { return e.message.find("nested too deeply") != std::string::npos; };

  auto const parens = "exact " + std::string(200000, '(') + "Nat.zero" + std::string(200000, ')');
  auto const nested = session.applyStep(s, parens, 1000);
  ASSERT_FALSE(nested.has_value());
  EXPECT_EQ(nested.error().kind, Error::StepParse);
  EXPECT_TRUE(isTooDeep(nested.error())) << nested.error().message;

  auto spine = std::string("exact Nat.succ");
  for (auto i = 0; i < 100000; i++) spine += " Nat.zero";
  auto const applied = session.applyStep(s, spine, 1000);
  ASSERT_FALSE(applied.has_value());
  EXPECT_EQ(applied.error().kind, Error::StepParse);
  EXPECT_TRUE(isTooDeep(applied.error())) << applied.error().message;

  auto arrows = std::string("Nat");
  for (auto i = 0; i < 5000; i++) arrows += " -> Nat";
  auto const goal = session.newState({{"f", arrows}});
  ASSERT_FALSE(goal.has_value());
  EXPECT_EQ(goal.error().kind, Error::ExpressionParse);
  EXPECT_EQ(kind(session.unify(0, std::string(5000, '(') + "x" + std::string(5000, ')'), "x")), Error::ExpressionParse);

  // Below the limit, the budget still bounds the work
  auto shorter = std::string("exact Nat.succ");
  for (auto i = 0; i < 900; i++) shorter += " Nat.zero";
  auto const exhausted = session.applyStep(s, shorter, 100);
  ASSERT_FALSE(exhausted.has_value());
  EXPECT_EQ(exhausted.error().kind, Error::StepExecution);
  EXPECT_EQ(exhausted.error().message, "maximum number of computation steps (100) exceeded");

  EXPECT_EQ(session.size(), 2u);
  EXPECT_EQ(ok(session.queryState(s)).size(), 1u);
}

TEST_F(SessionTest, NewStateErrors) {
  EXPECT_EQ(kind(session.newState({{"h", "Nat ->"}})), Error::ExpressionParse);
  EXPECT_EQ(kind(session.newState({{"h", "Nat.zero"}})), Error::Elaboration);
  EXPECT_EQ(kind(session.newState({{"h", "nonsense"}})), Error::Elaboration);
  EXPECT_EQ(session.size(), 1u);
}

TEST_F(SessionTest, ResolveName) {
  auto const root = ok(session.resolveName(0, "And.intro"));
  ASSERT_EQ(root.size(), 2u);
  EXPECT_EQ(root[0].name, "And.intro");
  EXPECT_TRUE(root[0].fields.empty());

  auto const s = ok(session.newState({{"g", "(h : And True True) -> True"}}));
  auto const t = ok(session.applyStep(s, "intro h", std::nullopt));
  EXPECT_EQ(ok(session.resolveName(t, "h.left")).size(), 1u);
  EXPECT_TRUE(ok(session.resolveName(s, "h.left")).empty());
  EXPECT_EQ(kind(session.resolveName(17, "h")), Error::InvalidParams);
}

TEST_F(SessionTest, Unify) {
  auto const solved = ok(session.unify(0, "Eq Nat ?a ?a", "Eq Nat Nat.zero ?b"));
  ASSERT_TRUE(solved.has_value());
  EXPECT_EQ(*solved, (session::Unifier{{"a", "Nat.zero"}, {"b", "Nat.zero"}}));

  EXPECT_EQ(kind(session.unify(0, "f (", "x")), Error::ExpressionParse);
  EXPECT_EQ(kind(session.unify(0, "x", "Nat Nat")), Error::Elaboration);
  EXPECT_EQ(kind(session.unify(5, "x", "x")), Error::InvalidParams);
  EXPECT_EQ(session.size(), 1u);
}

TEST_F(SessionTest, Commit) {
  EXPECT_EQ(kind(session.commit(3)), Error::InvalidParams);
  EXPECT_TRUE(session.running());
  ok(session.commit(0));
  EXPECT_FALSE(session.running());
  EXPECT_EQ(session.size(), 1u);
}

TEST_F(SessionTest, Position) {
  EXPECT_FALSE(ok(session.position()).has_value());
}

TEST_F(SessionTest, ForeignSnapshotIsFatal) {
  auto other = elab::ProofEngine();
  auto const id = session.append({other.captureSnapshot(), 0, "imported"});
  EXPECT_EQ(ok(session.nodeInfo(id)).step, "imported");
  EXPECT_THROW(session.queryState(id), std::logic_error);
}
