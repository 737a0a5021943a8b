#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <core/budget.hpp>
#include <core/context.hpp>
#include <core/expr.hpp>
#include <elab/procs.hpp>

using namespace arbor;
using core::Expr, core::Context, core::Budget, core::BudgetExceeded;
using enum Expr::SortTag;
using enum Expr::VarTag;
using enum Expr::LamTag;
using enum Expr::PiTag;

#define N(...) pool.make(__VA_ARGS__)

#define fv(id)       N(VFree, uint64_t{id})
#define bv(id)       N(VBound, uint64_t{id})
#define mv(id)       N(VMeta, uint64_t{id})
#define sprop        N(SProp)
#define stype        N(SType)
#define app(l, r)    N(static_cast<Expr const*>(l), static_cast<Expr const*>(r))
#define lam(s, t, r) N(LLam, std::string(s), t, r)
#define pi(s, t, r)  N(PPi, std::string(s), t, r)

class CoreTest: public testing::Test {
protected:
  Allocator<Expr> pool;
  Context ctx;
  Expr const* nat = nullptr;
  Expr const* zero = nullptr;
  Expr const* succ = nullptr;

  void SetUp() override {
    ctx.push("Nat", stype);
    nat = fv(0);
    ctx.push("Nat.zero", nat);
    zero = fv(1);
    ctx.push("Nat.succ", pi("", nat, nat));
    succ = fv(2);
  }
};

TEST_F(CoreTest, EqualityIgnoresBinderNames) {
  EXPECT_EQ(*lam("x", nat, bv(0)), *lam("y", nat, bv(0)));
  EXPECT_NE(*lam("x", nat, bv(0)), *lam("x", sprop, bv(0)));
  EXPECT_NE(*app(succ, zero), *app(succ, app(succ, zero)));
  EXPECT_NE(*fv(0), *mv(0));
}

TEST_F(CoreTest, ToString) {
  EXPECT_EQ(pi("", nat, nat)->toString(ctx), "Nat -> Nat");
  EXPECT_EQ(pi("", pi("", nat, nat), nat)->toString(ctx), "(Nat -> Nat) -> Nat");
  EXPECT_EQ(pi("A", stype, pi("a", bv(0), bv(1)))->toString(ctx), "(A: Type) -> A -> A");
  EXPECT_EQ(lam("n", nat, app(succ, bv(0)))->toString(ctx), "\\n: Nat => Nat.succ n");
  EXPECT_EQ(app(succ, app(succ, zero))->toString(ctx), "Nat.succ (Nat.succ Nat.zero)");
  EXPECT_EQ(mv(0)->toString(ctx, {"x"}), "?x");
  EXPECT_EQ(mv(1)->toString(ctx, {"x"}), "?m1");
  EXPECT_EQ(fv(7)->toString(ctx), "?f4");
}

TEST_F(CoreTest, BetaReduction) {
  auto const id = lam("n", nat, bv(0));
  EXPECT_EQ(*app(id, zero)->reduce(pool), *zero);

  // (\f => \x => f (f x)) Nat.succ Nat.zero
  auto const twice = lam("f", pi("", nat, nat), lam("x", nat, app(bv(1), app(bv(1), bv(0)))));
  EXPECT_EQ(*app(app(twice, succ), zero)->reduce(pool), *app(succ, app(succ, zero)));

  // Reduction under binders
  auto const e = lam("x", nat, app(id, bv(0)));
  EXPECT_EQ(*e->reduce(pool), *lam("x", nat, bv(0)));
}

TEST_F(CoreTest, LiftAndReplace) {
  EXPECT_EQ(*bv(0)->lift(2, pool), *bv(2));
  EXPECT_EQ(*lam("x", nat, bv(0))->lift(2, pool), *lam("x", nat, bv(0)));
  EXPECT_EQ(*lam("x", nat, bv(1))->lift(2, pool), *lam("x", nat, bv(3)));

  // Replacing the outermost binder lifts the argument under inner binders
  auto const body = lam("y", nat, app(bv(1), bv(0)));
  EXPECT_EQ(*body->makeReplace(bv(5), pool), *lam("y", nat, app(bv(6), bv(0))));
  EXPECT_EQ(*app(bv(0), bv(1))->makeReplace(zero, pool), *app(zero, bv(0)));
}

TEST_F(CoreTest, Occurrences) {
  auto const e = lam("x", nat, app(mv(3), bv(0)));
  EXPECT_TRUE(e->occurs(VMeta, 3));
  EXPECT_FALSE(e->occurs(VMeta, 2));
  EXPECT_FALSE(e->occursBound(0));
  EXPECT_TRUE(e->lam.r->occursBound(0));
  EXPECT_FALSE(e->hasLooseBound());
  EXPECT_TRUE(lam("x", nat, bv(1))->hasLooseBound());
  EXPECT_EQ(e->numMeta(), 4u);
  EXPECT_FALSE(e->isGround());
  EXPECT_TRUE(pi("", nat, nat)->isGround());
}

TEST_F(CoreTest, Imax) {
  EXPECT_EQ(Expr::imax(SType, SProp), SProp);
  EXPECT_EQ(Expr::imax(SProp, SType), SProp);
  EXPECT_EQ(Expr::imax(SType, SType), SType);
  EXPECT_EQ(Expr::imax(SKind, SType), SKind);
}

TEST_F(CoreTest, ContextShadowing) {
  EXPECT_EQ(ctx.lookup("Nat"), 0u);
  EXPECT_FALSE(ctx.lookup("h").has_value());
  auto const h1 = ctx.push("h", nat);
  auto const h2 = ctx.push("h", sprop);
  EXPECT_EQ(ctx.lookup("h"), h2);
  EXPECT_TRUE(ctx.pop());
  EXPECT_EQ(ctx.lookup("h"), h1);
  EXPECT_EQ(ctx.identifier(h1), "h");
  EXPECT_EQ(ctx[h1], nat);

  auto empty = Context();
  EXPECT_FALSE(empty.pop());
}

TEST_F(CoreTest, BudgetStopsReduction) {
  // (\x => x x x) (\x => x x x) grows without bound
  auto const w = lam("x", nat, app(app(bv(0), bv(0)), bv(0)));
  auto const omega = app(w, w);
  {
    auto const scope = Budget::Scope(1000);
    EXPECT_THROW(omega->reduce(pool), BudgetExceeded);
  }
  // The previous limit is restored when the scope ends
  EXPECT_EQ(core::budget().limit(), Budget::unlimited);
}

TEST_F(CoreTest, BudgetCountsSteps) {
  auto const scope = Budget::Scope(3);
  EXPECT_NO_THROW(core::budget().tick());
  EXPECT_NO_THROW(core::budget().tick());
  EXPECT_NO_THROW(core::budget().tick());
  EXPECT_EQ(core::budget().used(), 3u);
  EXPECT_THROW(core::budget().tick(), BudgetExceeded);
}

TEST_F(CoreTest, UnifyAssignsMetas) {
  // ?0 (Nat.succ ?1) =?= Nat.succ (Nat.succ Nat.zero)
  auto const res = elab::procs::unify({{app(mv(0), app(succ, mv(1))), app(succ, app(succ, zero))}}, pool);
  ASSERT_TRUE(res.has_value());
  auto const& subs = *res;
  ASSERT_GE(subs.size(), 2u);
  EXPECT_EQ(*elab::procs::applySubs(mv(0), subs, pool), *succ);
  EXPECT_EQ(*elab::procs::applySubs(mv(1), subs, pool), *zero);
}

TEST_F(CoreTest, UnifyFollowsChains) {
  // ?0 = Nat.succ ?1, ?1 = Nat.zero
  auto const res = elab::procs::unify({{mv(0), app(succ, mv(1))}, {mv(1), zero}}, pool);
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(*elab::procs::applySubs(mv(0), *res, pool), *app(succ, zero));
}

TEST_F(CoreTest, UnifyFailures) {
  using elab::procs::unify;
  // Clash
  EXPECT_FALSE(unify({{zero, app(succ, zero)}}, pool).has_value());
  EXPECT_FALSE(unify({{sprop, stype}}, pool).has_value());
  // Occurs check
  EXPECT_FALSE(unify({{mv(0), app(succ, mv(0))}}, pool).has_value());
  // A metavariable cannot capture a bound variable
  EXPECT_FALSE(unify({{lam("x", nat, mv(0)), lam("x", nat, bv(0))}}, pool).has_value());
  // Trivial equations succeed with an empty unifier
  auto const m = mv(0);
  auto const res = unify({{m, m}, {zero, zero}}, pool);
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(elab::procs::applySubs(m, *res, pool), m);
}

TEST_F(CoreTest, UnifyIsBudgeted) {
  auto eqs = std::vector<std::pair<Expr const*, Expr const*>>();
  for (auto i = 0u; i < 100; i++) eqs.emplace_back(mv(i), zero);
  auto const scope = Budget::Scope(10);
  EXPECT_THROW(elab::procs::unify(eqs, pool), BudgetExceeded);
}
