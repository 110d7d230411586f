// tests/unit/sema/test_type_checker.cpp - Unit tests for the temporal type checker
//
// Covers constraint generation and the errors that are decided without a
// solver (ground or syntactically equal sides).
//

#include <gtest/gtest.h>

#include <string>

#include "filament/sema/check/type_checker.hpp"
#include "filament/test_support/check_helpers.hpp"
#include "filament/test_support/parse_helpers.hpp"
#include "filament/test_support/programs.hpp"

using namespace filament;
using filament::test_support::check_source;
using filament::test_support::dump_messages;
using filament::test_support::has_error_containing;
using filament::test_support::model_source;

namespace
{

std::string with_mul(const std::string & body)
{
  return std::string(test_support::k_mul_decl) + body;
}

}  // namespace

// ============================================================================
// Accepted programs
// ============================================================================

TEST(SemaTypeChecker, WorkedExamplePlacesInvocations)
{
  auto unit = check_source(std::string(test_support::k_mul_chain));
  ASSERT_TRUE(unit.ok()) << dump_messages(unit.diags);

  const CheckedComponent * main = unit.result("Main");
  ASSERT_NE(main, nullptr);
  EXPECT_FALSE(main->has_errors);
  ASSERT_EQ(main->free_existentials.size(), 1U);
  EXPECT_EQ(render(main->free_existentials[0]), "L");

  ASSERT_EQ(main->invocations.size(), 3U);
  const CheckedInvocation * m1 = main->find_invocation("m1");
  ASSERT_NE(m1, nullptr);
  EXPECT_TRUE(m1->window.start.offset->is_const(4));
  EXPECT_TRUE(m1->window.end.offset->is_const(13));
  ASSERT_EQ(m1->outputs.size(), 1U);
  EXPECT_TRUE(m1->outputs[0].interval.start.offset->is_const(13));
  EXPECT_TRUE(m1->outputs[0].width->is_const(32));

  const CheckedInvocation * m2 = main->find_invocation("m2");
  ASSERT_NE(m2, nullptr);
  EXPECT_TRUE(m2->outputs[0].interval.start.offset->is_const(22));

  // Only the output binding and the delay mention L; everything else was
  // decided while checking.
  for (const auto & c : main->obligations) {
    EXPECT_TRUE(main->mentions_free_existential(c)) << c.render();
  }
}

TEST(SemaTypeChecker, InstanceExistentialsAreFlattened)
{
  auto unit = check_source(std::string(test_support::k_mul_chain));
  ASSERT_TRUE(unit.ok()) << dump_messages(unit.diags);
  const CheckedComponent * main = unit.result("Main");
  ASSERT_NE(main, nullptr);

  ExprPool & pool = unit.table->pool();
  auto it = main->flattening.find(pool.instance_exist("M2", "L"));
  ASSERT_NE(it, main->flattening.end());
  EXPECT_TRUE(it->second->is_const(4));
  it = main->flattening.find(pool.instance_exist("M3", "L"));
  ASSERT_NE(it, main->flattening.end());
  EXPECT_TRUE(it->second->is_const(9));
}

TEST(SemaTypeChecker, ExternExportsItsDefinition)
{
  auto unit = check_source(std::string(test_support::k_mul_decl));
  ASSERT_TRUE(unit.ok()) << dump_messages(unit.diags);

  const ComponentDef * mul = unit.def("Mul");
  ASSERT_NE(mul, nullptr);
  const auto exports = TypeChecker::signature_exports(*mul, unit.table->pool());
  ASSERT_EQ(exports.size(), 1U);
  ASSERT_NE(exports[0], nullptr);
  EXPECT_EQ(render(exports[0]), "M*M");

  const CheckedComponent * checked = unit.result("Mul");
  ASSERT_NE(checked, nullptr);
  EXPECT_TRUE(checked->free_existentials.empty());
  EXPECT_EQ(checked->exported, exports);
  ASSERT_EQ(checked->assumptions.size(), 2U);
  EXPECT_EQ(checked->assumptions[0].source, "where W > 0");
}

TEST(SemaTypeChecker, BodyDefinitionOfExistential)
{
  auto unit = check_source(with_mul(R"(
comp Sq[W]<G: L>(go: interface[G], a: [G, G+1] W) -> (o: [G+L, G+L+1] W) with {
  exists L;
} where W > 0 {
  M := new Mul[W, 3];
  m := M<G>(a, a);
  exists L = M.L;
  o = m.out;
}
)"));
  ASSERT_TRUE(unit.ok()) << dump_messages(unit.diags);
  const CheckedComponent * sq = unit.result("Sq");
  ASSERT_NE(sq, nullptr);
  EXPECT_TRUE(sq->free_existentials.empty());
  ASSERT_EQ(sq->exported.size(), 1U);
  ASSERT_NE(sq->exported[0], nullptr);
  EXPECT_TRUE(sq->exported[0]->is_const(9));
}

// ============================================================================
// Errors decided while checking
// ============================================================================

TEST(SemaTypeChecker, IntervalMismatchOnArgument)
{
  auto unit = check_source(with_mul(R"(
comp Main<G: 10>(go: interface[G], a: [G, G+1] 32, b: [G, G+1] 32) -> () {
  M2 := new Mul[32, 2];
  M3 := new Mul[32, 3];
  m0 := M2<G>(a, b);
  m1 := M3<G+5>(m0.out, m0.out);
}
)"));
  EXPECT_TRUE(unit.has(ErrorKind::IntervalMismatch)) << dump_messages(unit.diags);
  EXPECT_TRUE(has_error_containing(unit.diags, "interval mismatch for argument 'left' of invocation 'm1'"));
  EXPECT_TRUE(unit.result("Main")->has_errors);
}

TEST(SemaTypeChecker, BitwidthMismatch)
{
  auto unit = check_source(with_mul(R"(
comp Main<G: 4>(go: interface[G], a: [G, G+1] 16) -> () {
  M := new Mul[32, 2];
  m := M<G>(a, a);
}
)"));
  EXPECT_TRUE(unit.has(ErrorKind::BitwidthMismatch)) << dump_messages(unit.diags);
  EXPECT_TRUE(has_error_containing(unit.diags, "bit-width mismatch for argument 'left'"));
}

TEST(SemaTypeChecker, OverlappingInvocationsOfOneInstance)
{
  auto unit = check_source(with_mul(R"(
comp Main<G: 20>(go: interface[G], a: [G, G+1] 32, b: [G+1, G+2] 32) -> () {
  M3 := new Mul[32, 3];
  x := M3<G>(a, a);
  y := M3<G+1>(b, b);
}
)"));
  EXPECT_TRUE(unit.has(ErrorKind::ReuseHazard)) << dump_messages(unit.diags);
  EXPECT_TRUE(has_error_containing(unit.diags, "invocations 'x' and 'y' of instance 'M3' overlap"));
}

TEST(SemaTypeChecker, BackToBackInvocationsAreFine)
{
  auto unit = check_source(with_mul(R"(
comp Main<G: 20>(go: interface[G], a: [G, G+1] 32, b: [G+9, G+10] 32) -> () {
  M3 := new Mul[32, 3];
  x := M3<G>(a, a);
  y := M3<G+9>(b, b);
}
)"));
  EXPECT_FALSE(unit.has(ErrorKind::ReuseHazard)) << dump_messages(unit.diags);
  EXPECT_TRUE(unit.ok()) << dump_messages(unit.diags);
}

TEST(SemaTypeChecker, GroundGuardViolation)
{
  auto unit = check_source(with_mul(R"(
comp Main<G: 1>(go: interface[G]) -> () {
  M := new Mul[32, 0];
}
)"));
  EXPECT_TRUE(unit.has(ErrorKind::GuardViolated)) << dump_messages(unit.diags);
  EXPECT_TRUE(has_error_containing(unit.diags, "instance 'M' violates guard 'M > 0' of component 'Mul'"));
}

TEST(SemaTypeChecker, InstanceArity)
{
  auto unit = check_source(with_mul(R"(
comp Main<G: 1>(go: interface[G]) -> () {
  M := new Mul[32];
}
)"));
  EXPECT_TRUE(unit.has(ErrorKind::ArgumentCount));
  EXPECT_TRUE(has_error_containing(unit.diags, "component 'Mul' expects 2 parameter(s), got 1"))
    << dump_messages(unit.diags);
}

TEST(SemaTypeChecker, InvocationArity)
{
  auto unit = check_source(with_mul(R"(
comp Main<G: 4>(go: interface[G], a: [G, G+1] 32) -> () {
  M := new Mul[32, 2];
  m := M<G>(a);
}
)"));
  EXPECT_TRUE(unit.has(ErrorKind::ArgumentCount));
  EXPECT_TRUE(has_error_containing(unit.diags, "passes 1 argument(s) but 'Mul' has 2 data input(s)"))
    << dump_messages(unit.diags);
}

TEST(SemaTypeChecker, OutputsMustBeBoundOnce)
{
  auto unit = check_source(R"(
comp Wire<G: 1>(go: interface[G], a: [G, G+1] 8) -> (x: [G, G+1] 8, y: [G, G+1] 8) {
  x = a;
  x = a;
}
)");
  EXPECT_TRUE(unit.has(ErrorKind::UnboundOutput));
  EXPECT_TRUE(has_error_containing(unit.diags, "output 'y' of component 'Wire' is never bound"));
  EXPECT_TRUE(has_error_containing(unit.diags, "output 'x' is bound more than once"))
    << dump_messages(unit.diags);
}

TEST(SemaTypeChecker, EmptyPortInterval)
{
  auto unit = check_source("extern comp A<G: 1>(go: interface[G], x: [G+1, G+1] 8) -> ();\n");
  EXPECT_TRUE(unit.has(ErrorKind::MalformedInterval));
  EXPECT_TRUE(has_error_containing(unit.diags, "of port 'x' is empty")) << dump_messages(unit.diags);
}

TEST(SemaTypeChecker, InterfaceMustStartAtEvent)
{
  auto unit = check_source("extern comp A<G: 1>(go: interface[G+1]) -> ();\n");
  EXPECT_TRUE(unit.has(ErrorKind::MalformedInterval));
  EXPECT_TRUE(has_error_containing(unit.diags, "interface port 'go' must be active in the first cycle"))
    << dump_messages(unit.diags);
}

TEST(SemaTypeChecker, ZeroDelay)
{
  auto unit = check_source("extern comp A<G: 0>(go: interface[G]) -> ();\n");
  EXPECT_TRUE(has_error_containing(unit.diags, "delay of component 'A' must be at least one cycle"))
    << dump_messages(unit.diags);
}

TEST(SemaTypeChecker, CyclicExistentialDefinitions)
{
  auto unit = check_source(R"(
extern comp A<G: 1>(go: interface[G]) -> () with {
  exists P = Q + 1;
  exists Q = P;
};
)");
  EXPECT_TRUE(unit.has(ErrorKind::UnsatisfiableConstraints));
  EXPECT_TRUE(has_error_containing(unit.diags, "existential definitions of 'A' are cyclic"))
    << dump_messages(unit.diags);
}

TEST(SemaTypeChecker, SymbolicObligationsAreDeferred)
{
  // W*2 against W+W is not decided syntactically and is left to the solver.
  auto unit = model_source(R"(
extern comp Id[W]<G: 1>(go: interface[G], x: [G, G+1] W) -> (y: [G, G+1] W) where W > 0;
comp Twice[W]<G: 1>(go: interface[G], a: [G, G+1] W*2) -> (o: [G, G+1] W+W) where W > 0 {
  I := new Id[W+W];
  i := I<G>(a);
  o = i.y;
}
)");
  ASSERT_TRUE(unit.modeled) << dump_messages(unit.diags);

  TypeChecker id_checker(unit.table->pool(), unit.lookup(), &unit.diags);
  unit.checked.emplace(unit.def("Id"), id_checker.check(*unit.def("Id")));

  TypeChecker checker(unit.table->pool(), unit.lookup(), &unit.diags);
  const CheckedComponent twice = checker.check(*unit.def("Twice"));
  EXPECT_FALSE(twice.has_errors) << dump_messages(unit.diags);
  bool has_width = false;
  for (const auto & c : twice.obligations) {
    has_width = has_width || c.origin == ConstraintOrigin::PortWidth;
  }
  EXPECT_TRUE(has_width);
}
