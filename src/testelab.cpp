#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <gtest/gtest.h>
#include <elab/elaborator.hpp>
#include <elab/engine.hpp>
#include <elab/environment.hpp>
#include <parsing/parser.hpp>

using namespace arbor;
using elab::ProofEngine;
using session::Error;

namespace {

  // A file in the temporary directory, removed at scope exit.
  class TempFile {
  public:
    TempFile(std::string const& name, std::string const& content):
        _path((std::filesystem::temp_directory_path() / name).string()) {
      auto out = std::ofstream(_path);
      out << content;
    }
    ~TempFile() {
      auto ec = std::error_code();
      std::filesystem::remove(_path, ec);
    }
    auto path() const -> std::string const& {
      return _path;
    }

  private:
    std::string _path;
  };

  auto targets(std::vector<session::GoalView> const& goals) -> std::vector<std::string> {
    auto res = std::vector<std::string>();
    for (auto const& g: goals) res.push_back(g.target);
    return res;
  }

}

// =======================
// Environment
// =======================

TEST(Environment, Prelude) {
  auto pool = Allocator<core::Expr>();
  auto env = elab::Environment(pool);
  EXPECT_EQ(env.size(), 20u);
  for (auto const name: {"Nat", "Nat.succ", "Eq.refl", "False.elim", "And.intro", "Or.elim"})
    EXPECT_TRUE(env.context().lookup(name).has_value()) << name;
  EXPECT_FALSE(env.location().has_value());
}

TEST(Environment, DeclareChecksTypes) {
  auto pool = Allocator<core::Expr>();
  auto env = elab::Environment(pool);
  env.declare("le", "Nat -> Nat -> Prop");
  EXPECT_EQ(env.size(), 21u);
  EXPECT_THROW(env.declare("le", "Prop"), elab::ElabError);
  EXPECT_THROW(env.declare("f x", "Prop"), elab::ElabError);
  EXPECT_THROW(env.declare("bad", "Nat Nat"), elab::ElabError);
  EXPECT_THROW(env.declare("bad", "undefined -> Prop"), elab::ElabError);
  EXPECT_THROW(env.declare("bad", "_ -> Nat"), elab::ElabError);
  EXPECT_THROW(env.declare("bad", "Nat ->"), parsing::ParseError);
  EXPECT_EQ(env.size(), 21u);
}

TEST(Environment, Load) {
  auto const file = TempFile(
    "arbor_env_load.txt",
    "-- Orders on natural numbers\n"
    "le : Nat -> Nat -> Prop\n"
    "\n"
    "le.refl : (n : Nat) -> le n n -- reflexivity\n"
  );
  auto pool = Allocator<core::Expr>();
  auto env = elab::Environment(pool);
  env.load(file.path());
  EXPECT_TRUE(env.context().lookup("le.refl").has_value());
  ASSERT_TRUE(env.location().has_value());
  EXPECT_EQ(env.location()->file, file.path());
  EXPECT_EQ(env.location()->line, 4u);
}

TEST(Environment, LoadErrors) {
  auto pool = Allocator<core::Expr>();
  auto env = elab::Environment(pool);
  EXPECT_THROW(env.load("/nonexistent/arbor/axioms.txt"), std::runtime_error);

  auto const file = TempFile("arbor_env_bad.txt", "good : Prop\nbad : Nat Nat\n");
  try {
    env.load(file.path());
    FAIL();
  } catch (std::runtime_error& e) {
    EXPECT_TRUE(std::string(e.what()).starts_with(file.path() + ":2: ")) << e.what();
  }

  auto const noColon = TempFile("arbor_env_nocolon.txt", "just words\n");
  EXPECT_THROW(env.load(noColon.path()), std::runtime_error);
}

// =======================
// Elaborator
// =======================

class ElaboratorTest: public testing::Test {
protected:
  Allocator<core::Expr> pool;
  elab::Environment env{pool};
  elab::ProofState state;

  auto typeOf(std::string const& s) -> std::string {
    auto const parsed = parsing::Parser::expression(s);
    auto ctx = env.context();
    auto elaborator = elab::Elaborator(state, pool);
    auto const e = elaborator.elaborate(parsed->root, ctx);
    auto const t = elaborator.infer(e, ctx);
    return t ? state.show(t, ctx, pool) : "?";
  }

  auto errorOf(std::string const& s) -> std::string {
    try {
      typeOf(s);
    } catch (elab::ElabError& e) { return e.what(); }
    return "";
  }
};

TEST_F(ElaboratorTest, InfersTypes) {
  EXPECT_EQ(typeOf("Nat.succ Nat.zero"), "Nat");
  EXPECT_EQ(typeOf("Nat -> Prop"), "Type");
  EXPECT_EQ(typeOf("(a : Prop) -> a"), "Prop");
  EXPECT_EQ(typeOf("(A : Type) -> A -> A"), "Kind");
  EXPECT_EQ(typeOf("\\x : Nat => Nat.succ x"), "Nat -> Nat");
  EXPECT_EQ(typeOf("Eq.refl Nat"), "(a: Nat) -> Eq Nat a a");
  EXPECT_EQ(typeOf("(\\x : Nat => x) Nat.zero"), "Nat");
  EXPECT_EQ(typeOf("And.intro True True True.intro"), "True -> And True True");
}

TEST_F(ElaboratorTest, SolvesHoles) {
  EXPECT_EQ(typeOf("Eq.refl _ Nat.zero"), "Eq Nat Nat.zero Nat.zero");
  EXPECT_EQ(typeOf("Or.inl _ False True.intro"), "Or True False");
}

TEST_F(ElaboratorTest, Errors) {
  EXPECT_EQ(errorOf("foo"), "unknown identifier 'foo'");
  EXPECT_EQ(errorOf("Nat.succ True"), "type mismatch, expected Nat, got Prop");
  EXPECT_EQ(errorOf("Nat.zero Nat.zero"), "function expected, Nat.zero has type Nat");
  EXPECT_EQ(errorOf("\\x : Nat.zero => x"), "expected proposition or type, got Nat.zero : Nat");
}

TEST_F(ElaboratorTest, AutoBound) {
  auto const parsed = parsing::Parser::expression("f x ?y");
  auto ctx = env.context();
  auto elaborator = elab::Elaborator(state, pool, true);
  auto const e = elaborator.elaborate(parsed->root, ctx);
  EXPECT_EQ(ctx.size(), env.size() + 2);
  EXPECT_EQ(state.show(e, ctx, pool), "f x ?y");
  ASSERT_EQ(elaborator.namedMetas().size(), 1u);
  EXPECT_EQ(elaborator.namedMetas()[0].first, "y");
  EXPECT_EQ(elaborator.infer(e, ctx), nullptr);
}

// =======================
// Engine and tactics
// =======================

class EngineTest: public testing::Test {
protected:
  ProofEngine engine;

  auto start(std::vector<session::GoalSpec> const& goals) -> void {
    auto const snapshot = engine.buildContext(goals);
    ASSERT_TRUE(snapshot.has_value()) << snapshot.error().message;
    engine.restore(*snapshot);
  }

  auto run(std::string const& step, uint64_t budget = 100000) -> session::Result<unit> {
    auto const parsed = engine.parseStep(step);
    if (!parsed) return std::unexpected(parsed.error());
    return engine.executeStep(**parsed, budget);
  }

  auto goals() const -> std::vector<session::GoalView> {
    return engine.currentGoals();
  }

  auto unify(std::string const& lhs, std::string const& rhs) -> session::Result<std::optional<session::Unifier>> {
    auto const l = engine.parseExpression(lhs);
    auto const r = engine.parseExpression(rhs);
    if (!l) return std::unexpected(l.error());
    if (!r) return std::unexpected(r.error());
    return engine.unifyExpressions(**l, **r);
  }
};

TEST_F(EngineTest, BuildContext) {
  start({{"h", "Nat"}, {"p", "(a : Prop) -> a -> a"}});
  auto const gs = goals();
  ASSERT_EQ(gs.size(), 2u);
  EXPECT_EQ(gs[0].name, "h");
  EXPECT_TRUE(gs[0].hypotheses.empty());
  EXPECT_EQ(gs[0].target, "Nat");
  EXPECT_EQ(gs[1].name, "p");
  EXPECT_EQ(gs[1].target, "(a: Prop) -> a -> a");
}

TEST_F(EngineTest, BuildContextErrors) {
  auto const parse = engine.buildContext({{"h", "Nat ->"}});
  ASSERT_FALSE(parse.has_value());
  EXPECT_EQ(parse.error().kind, Error::ExpressionParse);
  EXPECT_TRUE(parse.error().message.starts_with("type of 'h': ")) << parse.error().message;

  auto const elaboration = engine.buildContext({{"ok", "Nat"}, {"x", "Nat.zero"}});
  ASSERT_FALSE(elaboration.has_value());
  EXPECT_EQ(elaboration.error().kind, Error::Elaboration);
  EXPECT_TRUE(elaboration.error().message.starts_with("type of 'x': ")) << elaboration.error().message;

  auto const unknown = engine.buildContext({{"x", "Foo"}});
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().message, "type of 'x': unknown identifier 'Foo'");

  // The current state is untouched
  EXPECT_TRUE(goals().empty());
}

TEST_F(EngineTest, ExactClosesGoal) {
  start({{"h", "Nat"}});
  ASSERT_TRUE(run("exact Nat.zero").has_value());
  EXPECT_TRUE(goals().empty());
  EXPECT_TRUE(engine.accumulatedDiagnostics().empty());
}

TEST_F(EngineTest, IntroAndAssumption) {
  start({{"t", "(a : Prop) -> a -> a"}});
  ASSERT_TRUE(run("intro").has_value());
  auto gs = goals();
  ASSERT_EQ(gs.size(), 1u);
  ASSERT_EQ(gs[0].hypotheses.size(), 1u);
  EXPECT_EQ(gs[0].hypotheses[0].name, "a");
  EXPECT_EQ(gs[0].hypotheses[0].type, "Prop");
  EXPECT_EQ(gs[0].target, "a -> a");

  ASSERT_TRUE(run("intro ha").has_value());
  gs = goals();
  ASSERT_EQ(gs[0].hypotheses.size(), 2u);
  EXPECT_EQ(gs[0].hypotheses[1].name, "ha");
  EXPECT_EQ(gs[0].hypotheses[1].type, "a");
  EXPECT_EQ(gs[0].target, "a");

  ASSERT_TRUE(run("assumption").has_value());
  EXPECT_TRUE(goals().empty());
}

TEST_F(EngineTest, IntroErrors) {
  start({{"h", "Nat"}});
  auto const res = run("intro x");
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, Error::StepExecution);
  EXPECT_EQ(res.error().message, "no additional binders in goal Nat");
  EXPECT_EQ(res.error().details, std::vector<std::string>{"no additional binders in goal Nat"});

  // `intros` without names stops at the first non-binder
  ASSERT_TRUE(run("intros").has_value());
  EXPECT_EQ(goals().size(), 1u);
}

TEST_F(EngineTest, ApplyCreatesSubgoals) {
  start({{"c", "(a b : Prop) -> a -> b -> And a b"}});
  ASSERT_TRUE(run("intros").has_value());
  auto gs = goals();
  ASSERT_EQ(gs.size(), 1u);
  EXPECT_EQ(gs[0].hypotheses.size(), 4u);
  EXPECT_EQ(gs[0].target, "And a b");

  ASSERT_TRUE(run("apply And.intro").has_value());
  EXPECT_EQ(targets(goals()), (std::vector<std::string>{"a", "b"}));

  ASSERT_TRUE(run("assumption; assumption").has_value());
  EXPECT_TRUE(goals().empty());
}

TEST_F(EngineTest, ApplyWithExplicitArguments) {
  start({{"g", "(a : Prop) -> False -> a"}});
  ASSERT_TRUE(run("intro a h").has_value());
  ASSERT_TRUE(run("apply False.elim a").has_value());
  EXPECT_EQ(targets(goals()), std::vector<std::string>{"False"});
  ASSERT_TRUE(run("exact h").has_value());
  EXPECT_TRUE(goals().empty());
}

TEST_F(EngineTest, ApplyFailure) {
  start({{"h", "Nat"}});
  auto const res = run("apply True.intro");
  ASSERT_FALSE(res.has_value());
  EXPECT_TRUE(res.error().message.starts_with("failed to apply True.intro : True to goal Nat")) << res.error().message;
}

TEST_F(EngineTest, ExactMismatchLeavesStateUnchanged) {
  start({{"h", "Nat"}});
  auto const res = run("exact True.intro");
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, Error::StepExecution);
  EXPECT_EQ(res.error().message, "type mismatch, expected Nat, got True");
  EXPECT_EQ(goals().size(), 1u);

  auto const unknown = run("exact foo");
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().message, "unknown identifier 'foo'");
}

TEST_F(EngineTest, StepsAreAtomic) {
  start({{"a", "Nat"}, {"b", "Nat"}});
  ASSERT_FALSE(run("exact Nat.zero; exact foo").has_value());
  EXPECT_EQ(goals().size(), 2u);
  ASSERT_TRUE(run("exact Nat.zero; exact Nat.succ Nat.zero").has_value());
  EXPECT_TRUE(goals().empty());
}

TEST_F(EngineTest, UnsolvedPlaceholderIsLogged) {
  start({{"t", "True"}});
  ASSERT_TRUE(run("exact False.elim True _").has_value());
  auto const diags = engine.accumulatedDiagnostics();
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(diags[0].severity, "error");
  EXPECT_TRUE(diags[0].message.starts_with("don't know how to synthesize placeholder in False.elim True ?m"))
    << diags[0].message;
}

TEST_F(EngineTest, ExactSolvesHoles) {
  start({{"p", "Eq Nat Nat.zero Nat.zero"}});
  ASSERT_TRUE(run("exact Eq.refl _ _").has_value());
  EXPECT_TRUE(goals().empty());
  EXPECT_TRUE(engine.accumulatedDiagnostics().empty());
}

TEST_F(EngineTest, Rfl) {
  start({
    {"a", "Eq Nat (Nat.succ Nat.zero) (Nat.succ Nat.zero)"},
    {"b", "Eq Nat ((\\n : Nat => Nat.succ n) Nat.zero) (Nat.succ Nat.zero)"},
    {"c", "Eq Nat Nat.zero (Nat.succ Nat.zero)"},
    {"d", "Nat"}
  });
  ASSERT_TRUE(run("rfl").has_value());
  ASSERT_TRUE(run("rfl").has_value());

  auto const unequal = run("rfl");
  ASSERT_FALSE(unequal.has_value());
  EXPECT_EQ(unequal.error().message, "rfl failed, the two sides are not equal: Nat.zero and Nat.succ Nat.zero");

  ASSERT_TRUE(run("sorry").has_value());
  auto const notEq = run("rfl");
  ASSERT_FALSE(notEq.has_value());
  EXPECT_EQ(notEq.error().message, "rfl expects an equality, got Nat");
}

TEST_F(EngineTest, Exfalso) {
  start({{"g", "(a : Prop) -> False -> a"}});
  ASSERT_TRUE(run("intro a h; exfalso").has_value());
  EXPECT_EQ(targets(goals()), std::vector<std::string>{"False"});
  ASSERT_TRUE(run("exact h").has_value());
  EXPECT_TRUE(goals().empty());
}

TEST_F(EngineTest, Have) {
  start({{"mp", "(a b : Prop) -> a -> (a -> b) -> b"}});
  ASSERT_TRUE(run("intro a b ha hab; have hb : b").has_value());
  auto const gs = goals();
  ASSERT_EQ(gs.size(), 2u);
  EXPECT_EQ(gs[0].name, "hb");
  EXPECT_EQ(gs[0].target, "b");
  EXPECT_EQ(gs[0].hypotheses.size(), 4u);
  EXPECT_EQ(gs[1].name, "mp");
  ASSERT_EQ(gs[1].hypotheses.size(), 5u);
  EXPECT_EQ(gs[1].hypotheses[4].name, "hb");

  ASSERT_TRUE(run("exact hab ha").has_value());
  ASSERT_TRUE(run("exact hb").has_value());
  EXPECT_TRUE(goals().empty());
}

TEST_F(EngineTest, SorryAndAdmitAll) {
  start({{"a", "Nat"}, {"b", "False"}, {"c", "True"}});
  ASSERT_TRUE(run("sorry").has_value());
  EXPECT_EQ(goals().size(), 2u);
  auto diags = engine.accumulatedDiagnostics();
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(diags[0].severity, "warning");
  EXPECT_EQ(diags[0].message, "declaration uses 'sorry'");

  engine.admitAllOpenGoals();
  EXPECT_TRUE(goals().empty());
  EXPECT_EQ(engine.state().admitted.size(), 3u);
  EXPECT_EQ(engine.accumulatedDiagnostics().size(), 2u);

  // Nothing left to admit: no new warning
  engine.admitAllOpenGoals();
  EXPECT_EQ(engine.accumulatedDiagnostics().size(), 2u);
}

TEST_F(EngineTest, NoGoals) {
  start({});
  ASSERT_TRUE(run("skip").has_value());
  auto const res = run("exact Nat.zero");
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().message, "no goals to be proved");
}

TEST_F(EngineTest, ParseErrors) {
  auto const res = engine.parseStep("malformed(((");
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, Error::StepParse);

  auto const expr = engine.parseExpression("f (");
  ASSERT_FALSE(expr.has_value());
  EXPECT_EQ(expr.error().kind, Error::ExpressionParse);
}

TEST_F(EngineTest, BudgetExceeded) {
  start({{"b", "Eq Nat ((\\n : Nat => Nat.succ n) Nat.zero) (Nat.succ Nat.zero)"}});
  auto const res = run("rfl", 3);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, Error::StepExecution);
  EXPECT_EQ(res.error().message, "maximum number of computation steps (3) exceeded");
  EXPECT_EQ(goals().size(), 1u);
  // The limit applies to one step only
  ASSERT_TRUE(run("rfl").has_value());
}

TEST_F(EngineTest, SnapshotRestore) {
  start({{"h", "Nat"}});
  auto const before = engine.captureSnapshot();
  EXPECT_EQ(before, before);
  EXPECT_FALSE(before == engine.captureSnapshot());

  ASSERT_TRUE(run("exact Nat.zero").has_value());
  EXPECT_TRUE(goals().empty());
  engine.restore(before);
  EXPECT_EQ(goals().size(), 1u);

  auto other = ProofEngine();
  EXPECT_THROW(other.restore(before), std::logic_error);
}

TEST_F(EngineTest, ResolveGlobalName) {
  auto const res = engine.resolveGlobalName("Nat.succ.foo");
  ASSERT_EQ(res.size(), 2u);
  EXPECT_EQ(res[0].name, "Nat.succ");
  EXPECT_EQ(res[0].fields, std::vector<std::string>{"foo"});
  EXPECT_EQ(res[1].name, "Nat");
  EXPECT_EQ(res[1].fields, (std::vector<std::string>{"succ", "foo"}));

  EXPECT_TRUE(engine.resolveGlobalName("x.y").empty());

  // Local hypotheses of the main goal count too
  start({{"g", "(h : And True True) -> True"}});
  ASSERT_TRUE(run("intro h").has_value());
  auto const local = engine.resolveGlobalName("h.left");
  ASSERT_EQ(local.size(), 1u);
  EXPECT_EQ(local[0].name, "h");
  EXPECT_EQ(local[0].fields, std::vector<std::string>{"left"});
}

TEST_F(EngineTest, UnifyExpressions) {
  auto const distinct = unify("x", "y");
  ASSERT_TRUE(distinct.has_value());
  EXPECT_FALSE(distinct->has_value());

  auto const solved = unify("Nat.succ ?n", "Nat.succ Nat.zero");
  ASSERT_TRUE(solved.has_value() && solved->has_value());
  EXPECT_EQ(**solved, (session::Unifier{{"n", "Nat.zero"}}));

  auto const atoms = unify("f ?a", "f x");
  ASSERT_TRUE(atoms.has_value() && atoms->has_value());
  EXPECT_EQ(**atoms, (session::Unifier{{"a", "x"}}));

  auto const partial = unify("?a", "?b");
  ASSERT_TRUE(partial.has_value() && partial->has_value());
  EXPECT_EQ(**partial, (session::Unifier{{"a", "?b"}, {"b", std::nullopt}}));

  auto const mistyped = unify("Nat.zero", "True.intro");
  ASSERT_TRUE(mistyped.has_value());
  EXPECT_FALSE(mistyped->has_value());

  auto const illTyped = unify("Nat Nat", "x");
  ASSERT_FALSE(illTyped.has_value());
  EXPECT_EQ(illTyped.error().kind, Error::Elaboration);

  // Unification does not touch the current state
  EXPECT_TRUE(engine.state().metas.empty());
  EXPECT_EQ(engine.environment().size(), 20u);
}

TEST(EngineLoad, SourcePosition) {
  EXPECT_FALSE(ProofEngine().currentSourcePosition().has_value());

  auto const file = TempFile("arbor_engine_load.txt", "le : Nat -> Nat -> Prop\nle.refl : (n : Nat) -> le n n\n");
  auto engine = ProofEngine(file.path());
  auto const pos = engine.currentSourcePosition();
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->file, file.path());
  EXPECT_EQ(pos->line, 2u);
  EXPECT_EQ(pos->column, 0u);
  EXPECT_EQ(engine.resolveGlobalName("le.refl").size(), 2u);
}
