// tests/unit/solver/test_solver_session.cpp - Z3 queries over natural-valued constraints
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include "filament/solver/solver_session.hpp"

using namespace filament;

namespace
{

Constraint make_constraint(std::vector<Comparison> terms, bool disjunctive = false)
{
  Constraint c;
  c.terms = std::move(terms);
  c.disjunctive = disjunctive;
  return c;
}

}  // namespace

// ============================================================================
// prove
// ============================================================================

TEST(SolverSession, ValidUnderAssumptions)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * w = pool.param("W");

  SolverQuery q;
  q.assumptions.push_back(Comparison{CmpOp::Gt, w, pool.constant(0)});
  q.constraints.push_back(make_constraint({Comparison{CmpOp::Ge, w, pool.constant(1)}}));
  EXPECT_TRUE(session.prove(q).proved());
  EXPECT_EQ(session.query_count(), 1U);
}

TEST(SolverSession, RefutedWithCounterexample)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * w = pool.param("W");

  SolverQuery q;
  q.constraints.push_back(make_constraint({Comparison{CmpOp::Ge, w, pool.constant(1)}}));
  const ProofResult r = session.prove(q);
  ASSERT_EQ(r.status, ProofStatus::Refuted);
  ASSERT_EQ(r.counterexample.size(), 1U);
  EXPECT_EQ(r.counterexample[0].first, w);
  EXPECT_EQ(r.counterexample[0].second, 0);
  EXPECT_EQ(render(r.counterexample), "W = 0");
}

TEST(SolverSession, ImplicationsHoldOnlyUnderTheirPremises)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * n = pool.param("N");
  const Comparison above_three{CmpOp::Gt, n, pool.constant(3)};

  // `N > 3 -> N > 3` says nothing about N.
  SolverQuery q;
  q.implications.push_back(Implication{{above_three}, above_three});
  q.constraints.push_back(make_constraint({above_three}));
  const ProofResult r = session.prove(q);
  ASSERT_EQ(r.status, ProofStatus::Refuted);
  ASSERT_EQ(r.counterexample.size(), 1U);
  EXPECT_LE(r.counterexample[0].second, 3);

  // With the premise established the conclusion is usable.
  const ValueExpr * l = pool.instance_exist("F", "L");
  SolverQuery usable;
  usable.assumptions.push_back(above_three);
  usable.implications.push_back(Implication{{above_three}, Comparison{CmpOp::Ge, l, pool.constant(1)}});
  usable.constraints.push_back(make_constraint({Comparison{CmpOp::Gt, l, pool.constant(0)}}));
  EXPECT_TRUE(session.prove(usable).proved());
}

TEST(SolverSession, VariablesAreNaturals)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * n = pool.param("N");

  SolverQuery q;
  q.constraints.push_back(make_constraint({Comparison{CmpOp::Ge, n, pool.constant(0)}}));
  EXPECT_TRUE(session.prove(q).proved());
}

TEST(SolverSession, DisjunctiveConstraint)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * t = pool.param("T");

  // Windows [0, 3) and [T, T+3) are disjoint for T >= 3.
  SolverQuery q;
  q.assumptions.push_back(Comparison{CmpOp::Ge, t, pool.constant(3)});
  q.constraints.push_back(make_constraint(
    {Comparison{CmpOp::Le, pool.constant(3), t},
     Comparison{CmpOp::Le, pool.add(t, pool.constant(3)), pool.constant(0)}},
    true));
  EXPECT_TRUE(session.prove(q).proved());

  SolverQuery weaker;
  weaker.assumptions.push_back(Comparison{CmpOp::Ge, t, pool.constant(2)});
  weaker.constraints = q.constraints;
  const ProofResult r = session.prove(weaker);
  ASSERT_EQ(r.status, ProofStatus::Refuted);
  EXPECT_EQ(render(r.counterexample), "T = 2");
}

TEST(SolverSession, ExistentialForEveryParameter)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * w = pool.param("W");
  const ValueExpr * l = pool.exist("L");

  // forall W. exists L. L == W + 2
  SolverQuery q;
  q.unknowns = {l};
  q.constraints.push_back(
    make_constraint({Comparison{CmpOp::Eq, l, pool.add(w, pool.constant(2))}}));
  EXPECT_TRUE(session.prove(q).proved());

  // forall W. exists L. L + 2 == W fails for W < 2.
  SolverQuery bad;
  bad.unknowns = {l};
  bad.constraints.push_back(
    make_constraint({Comparison{CmpOp::Eq, pool.add(l, pool.constant(2)), w}}));
  const ProofResult r = session.prove(bad);
  ASSERT_EQ(r.status, ProofStatus::Refuted);
  ASSERT_EQ(r.counterexample.size(), 1U);
  EXPECT_LT(r.counterexample[0].second, 2);
}

TEST(SolverSession, ExistentialWithoutParameters)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * l = pool.exist("L");

  SolverQuery q;
  q.unknowns = {l};
  q.constraints.push_back(make_constraint({Comparison{CmpOp::Eq, l, pool.constant(22)}}));
  EXPECT_TRUE(session.prove(q).proved());

  SolverQuery none;
  none.unknowns = {l};
  none.constraints.push_back(make_constraint(
    {Comparison{CmpOp::Eq, l, pool.constant(2)}, Comparison{CmpOp::Eq, l, pool.constant(3)}}));
  EXPECT_EQ(session.prove(none).status, ProofStatus::Refuted);
}

// ============================================================================
// prove_unique
// ============================================================================

TEST(SolverSession, UniqueExistential)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * l = pool.exist("L");

  SolverQuery q;
  q.unknowns = {l};
  q.constraints.push_back(make_constraint(
    {Comparison{CmpOp::Eq, l, pool.constant(22)},
     Comparison{CmpOp::Eq, pool.add(l, pool.constant(1)), pool.constant(23)}}));
  EXPECT_TRUE(session.prove_unique(q, l).proved());
}

TEST(SolverSession, AmbiguousExistentialNamesTwoValues)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * l = pool.exist("L");

  SolverQuery q;
  q.unknowns = {l};
  q.constraints.push_back(make_constraint({Comparison{CmpOp::Gt, l, pool.constant(0)}}));
  const ProofResult r = session.prove_unique(q, l);
  ASSERT_EQ(r.status, ProofStatus::Refuted);
  EXPECT_NE(r.first, r.second);
  EXPECT_GT(r.first, 0);
  EXPECT_GT(r.second, 0);
}

// ============================================================================
// solve
// ============================================================================

TEST(SolverSession, SolveUniqueAssignment)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * l = pool.exist("L");

  SolverQuery q;
  q.unknowns = {l};
  q.constraints.push_back(make_constraint({Comparison{CmpOp::Eq, l, pool.constant(22)}}));
  q.constraints.push_back(make_constraint({Comparison{CmpOp::Ge, l, pool.constant(1)}}));
  const SolverResponse r = session.solve(q);
  ASSERT_TRUE(r.is_sat()) << r.reason;
  ASSERT_EQ(r.assignment.size(), 1U);
  EXPECT_EQ(r.assignment[0].second, 22);
  EXPECT_EQ(render(r.assignment), "L = 22");
}

TEST(SolverSession, SolveReportsUnsatCore)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * l = pool.exist("L");

  SolverQuery q;
  q.unknowns = {l};
  q.constraints.push_back(make_constraint({Comparison{CmpOp::Ge, l, pool.constant(1)}}));
  q.constraints.push_back(make_constraint({Comparison{CmpOp::Eq, l, pool.constant(4)}}));
  q.constraints.push_back(make_constraint({Comparison{CmpOp::Eq, l, pool.constant(9)}}));
  const SolverResponse r = session.solve(q);
  ASSERT_EQ(r.status, SolverStatus::Unsat);
  // The two contradicting equalities are in the core.
  const auto & core = r.unsat_core;
  EXPECT_NE(std::find(core.begin(), core.end(), 1U), core.end());
  EXPECT_NE(std::find(core.begin(), core.end(), 2U), core.end());
}

TEST(SolverSession, SolveAmbiguous)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * l = pool.exist("L");

  SolverQuery q;
  q.unknowns = {l};
  q.constraints.push_back(make_constraint({Comparison{CmpOp::Le, l, pool.constant(1)}}));
  const SolverResponse r = session.solve(q);
  ASSERT_EQ(r.status, SolverStatus::Ambiguous);
  EXPECT_EQ(r.ambiguous, l);
  EXPECT_NE(r.first, r.second);
  EXPECT_EQ(to_string(r.status), "ambiguous");
}

TEST(SolverSession, UninterpretedBuiltins)
{
  ExprPool pool;
  SolverSession session;
  const ValueExpr * n = pool.param("N");

  // Nothing is known about the value of pow2(N).
  SolverQuery q;
  q.constraints.push_back(
    make_constraint({Comparison{CmpOp::Ge, pool.call(Builtin::Pow2, n), pool.constant(1)}}));
  EXPECT_NE(session.prove(q).status, ProofStatus::Proved);
}

// ============================================================================
// Bookkeeping
// ============================================================================

TEST(SolverSession, QueryDumpIsAppended)
{
  const auto path =
    std::filesystem::temp_directory_path() /
    ("fil_dump_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
     ".smt2");

  ExprPool pool;
  SolverOptions options;
  options.dump_queries = path.string();
  SolverSession session(options);

  SolverQuery q;
  q.description = "Main: all obligations";
  q.constraints.push_back(
    make_constraint({Comparison{CmpOp::Ge, pool.param("W"), pool.constant(0)}}));
  (void)session.prove(q);
  (void)session.prove(q);

  std::ifstream in(path);
  std::stringstream buf;
  buf << in.rdbuf();
  const std::string text = buf.str();
  EXPECT_NE(text.find("; Main: all obligations"), std::string::npos);
  EXPECT_NE(text.find("; Main: all obligations", text.find("; Main") + 1), std::string::npos);

  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(SolverSession, TotalQueriesCountsEverySession)
{
  ExprPool pool;
  const size_t before = SolverSession::total_queries();
  SolverSession a;
  SolverSession b;
  SolverQuery q;
  q.constraints.push_back(
    make_constraint({Comparison{CmpOp::Ge, pool.param("W"), pool.constant(0)}}));
  (void)a.prove(q);
  (void)b.prove(q);
  EXPECT_GE(SolverSession::total_queries(), before + 2);
  EXPECT_EQ(a.query_count(), 1U);
  EXPECT_EQ(b.query_count(), 1U);
}
