#include <gtest/gtest.h>

#include <string>

#include "filament/ast/ast.hpp"
#include "filament/basic/casting.hpp"
#include "filament/test_support/parse_helpers.hpp"
#include "filament/test_support/programs.hpp"

using namespace filament;
using filament::test_support::dump_messages;
using filament::test_support::has_error_containing;
using filament::test_support::parse;

TEST(SyntaxParser, ExternSignatureWithExistential)
{
  auto unit = parse(std::string(test_support::k_mul_decl));
  ASSERT_FALSE(unit.diags.has_errors()) << dump_messages(unit.diags);

  const ComponentDecl * mul = unit.component("Mul");
  ASSERT_NE(mul, nullptr);
  EXPECT_TRUE(mul->isExtern);
  ASSERT_EQ(mul->params.size(), 2U);
  EXPECT_EQ(mul->params[0]->name, "W");
  EXPECT_EQ(mul->params[1]->name, "M");

  ASSERT_NE(mul->timeParam, nullptr);
  EXPECT_EQ(mul->timeParam->name, "G");
  ASSERT_TRUE(isa<NameExpr>(mul->timeParam->delay));
  EXPECT_EQ(cast<NameExpr>(mul->timeParam->delay)->name, "L");

  ASSERT_EQ(mul->inputs.size(), 3U);
  EXPECT_TRUE(mul->inputs[0]->isInterface);
  EXPECT_EQ(mul->inputs[0]->start->event, "G");
  EXPECT_EQ(mul->inputs[0]->end, nullptr);
  EXPECT_FALSE(mul->inputs[1]->isInterface);
  EXPECT_EQ(unit.slice(mul->inputs[1]->width->get_range()), "W");

  ASSERT_EQ(mul->outputs.size(), 1U);
  EXPECT_EQ(mul->outputs[0]->name, "out");
  EXPECT_EQ(mul->outputs[0]->direction, PortDirection::Out);
  EXPECT_EQ(unit.slice(mul->outputs[0]->start->get_range()), "G+L");

  ASSERT_EQ(mul->existentials.size(), 1U);
  EXPECT_EQ(mul->existentials[0]->name, "L");
  ASSERT_NE(mul->existentials[0]->definition, nullptr);
  EXPECT_EQ(unit.slice(mul->existentials[0]->definition->get_range()), "M*M");

  ASSERT_EQ(mul->guards.size(), 2U);
  const auto * g0 = dyn_cast<BinaryExpr>(mul->guards[0]);
  ASSERT_NE(g0, nullptr);
  EXPECT_EQ(g0->op, BinaryOp::Gt);
  EXPECT_TRUE(mul->body.empty());
}

TEST(SyntaxParser, BodyStatements)
{
  auto unit = parse(std::string(test_support::k_mul_chain));
  ASSERT_FALSE(unit.diags.has_errors()) << dump_messages(unit.diags);

  const ComponentDecl * main = unit.component("Main");
  ASSERT_NE(main, nullptr);
  EXPECT_FALSE(main->isExtern);
  ASSERT_EQ(main->existentials.size(), 1U);
  EXPECT_EQ(main->existentials[0]->definition, nullptr);
  ASSERT_EQ(main->body.size(), 6U);

  const auto * m3 = dyn_cast<InstanceStmt>(main->body[1]);
  ASSERT_NE(m3, nullptr);
  EXPECT_EQ(m3->name, "M3");
  EXPECT_EQ(m3->component, "Mul");
  ASSERT_EQ(m3->args.size(), 2U);
  EXPECT_EQ(cast<IntLiteralExpr>(m3->args[1])->value, 3);

  const auto * m1 = dyn_cast<InvokeStmt>(main->body[3]);
  ASSERT_NE(m1, nullptr);
  EXPECT_EQ(m1->name, "m1");
  EXPECT_EQ(m1->instance, "M3");
  EXPECT_EQ(m1->time->event, "G");
  ASSERT_NE(m1->time->offset, nullptr);
  EXPECT_EQ(cast<IntLiteralExpr>(m1->time->offset)->value, 4);
  ASSERT_EQ(m1->args.size(), 2U);
  EXPECT_EQ(m1->args[0]->invocation, "m0");
  EXPECT_EQ(m1->args[0]->port, "out");

  const auto * bind = dyn_cast<ConnectStmt>(main->body[5]);
  ASSERT_NE(bind, nullptr);
  EXPECT_TRUE(bind->dst->is_own_port());
  EXPECT_EQ(bind->dst->port, "out");
  EXPECT_EQ(bind->src->invocation, "m2");
}

TEST(SyntaxParser, OperatorPrecedenceAndBuiltins)
{
  auto unit = parse(R"(
extern comp Buf[N]<G: 1>(go: interface[G], x: [G, G+1] pow2(N) + 2*N) -> ();
)");
  ASSERT_FALSE(unit.diags.has_errors()) << dump_messages(unit.diags);
  const ComponentDecl * buf = unit.component("Buf");
  ASSERT_NE(buf, nullptr);
  EXPECT_TRUE(buf->outputs.empty());

  const auto * add = dyn_cast<BinaryExpr>(buf->inputs[1]->width);
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->op, BinaryOp::Add);
  const auto * call = dyn_cast<CallExpr>(add->lhs);
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->fn, Builtin::Pow2);
  const auto * mul = dyn_cast<BinaryExpr>(add->rhs);
  ASSERT_NE(mul, nullptr);
  EXPECT_EQ(mul->op, BinaryOp::Mul);
}

TEST(SyntaxParser, ConstantArgumentsAndExistentialDefinitions)
{
  auto unit = parse(R"(
comp Top<G: 1>(go: interface[G]) -> (o: [G, G+1] 8) with {
  exists D where D > 0;
} {
  exists D = 3;
  R := new Reg[8];
  r := R<G>(0);
  o = r.out;
}
)");
  ASSERT_FALSE(unit.diags.has_errors()) << dump_messages(unit.diags);
  const ComponentDecl * top = unit.component("Top");
  ASSERT_NE(top, nullptr);
  ASSERT_EQ(top->existentials.size(), 1U);
  EXPECT_EQ(top->existentials[0]->guards.size(), 1U);

  const auto * def = dyn_cast<ExistsDefStmt>(top->body[0]);
  ASSERT_NE(def, nullptr);
  EXPECT_EQ(def->name, "D");

  const auto * inv = dyn_cast<InvokeStmt>(top->body[2]);
  ASSERT_NE(inv, nullptr);
  ASSERT_EQ(inv->args.size(), 1U);
  EXPECT_TRUE(inv->args[0]->isConstant);
  EXPECT_EQ(inv->args[0]->constant, 0);
}

TEST(SyntaxParser, Imports)
{
  auto unit = parse("import \"lib/mul.fil\";\nimport \"lib/add.fil\";\n");
  ASSERT_FALSE(unit.diags.has_errors()) << dump_messages(unit.diags);
  ASSERT_NE(unit.program, nullptr);
  ASSERT_EQ(unit.program->imports.size(), 2U);
  EXPECT_EQ(unit.program->imports[0]->path, "lib/mul.fil");
  EXPECT_EQ(unit.program->imports[1]->path, "lib/add.fil");
}

TEST(SyntaxParser, ImportAfterComponentIsRejected)
{
  auto unit = parse(R"(
extern comp A<G: 1>(go: interface[G]) -> ();
import "b.fil";
)");
  EXPECT_TRUE(has_error_containing(unit.diags, "imports must appear before the first component"));
}

TEST(SyntaxParser, ExternWithBodyIsRejected)
{
  auto unit = parse(R"(
extern comp A<G: 1>(go: interface[G]) -> () { }
)");
  EXPECT_TRUE(has_error_containing(unit.diags, "extern component 'A' cannot have a body"));
}

TEST(SyntaxParser, MissingBodySuggestsExtern)
{
  auto unit = parse("comp A<G: 1>(go: interface[G]) -> ();\n");
  EXPECT_TRUE(has_error_containing(unit.diags, "component 'A' has no body"));
}

TEST(SyntaxParser, MissingSemicolonRecovers)
{
  auto unit = parse(R"(
comp A<G: 1>(go: interface[G], x: [G, G+1] 8) -> (y: [G, G+1] 8) {
  R := new Reg[8]
  y = x;
}
)");
  EXPECT_TRUE(unit.diags.has(ErrorKind::Syntax));
  EXPECT_TRUE(has_error_containing(unit.diags, "expected ';' after instance"));

  // Recovery skips to the next ';' and keeps the component.
  ASSERT_NE(unit.component("A"), nullptr);
  EXPECT_EQ(unit.diags.count(ErrorKind::Syntax), 1U);
}

TEST(SyntaxParser, InterfaceOutputIsRejected)
{
  auto unit = parse("extern comp A<G: 1>(x: [G, G+1] 1) -> (go: interface[G]);\n");
  EXPECT_TRUE(has_error_containing(unit.diags, "interface port 'go' must be an input"));
}

TEST(SyntaxParser, GuardNeedsComparison)
{
  auto unit = parse("extern comp A[W]<G: 1>(go: interface[G]) -> () where W + 1;\n");
  EXPECT_TRUE(has_error_containing(unit.diags, "expected a comparison operator"));
}

TEST(SyntaxParser, UnknownFunction)
{
  auto unit = parse("extern comp A[W]<G: 1>(x: [G, G+1] exp2(W)) -> ();\n");
  EXPECT_TRUE(has_error_containing(unit.diags, "unknown function 'exp2'"));
}

TEST(SyntaxParser, MalformedTokensReportedOnce)
{
  auto unit = parse("extern comp A<G: 1>(go: interface[G]) -> (); @\n");
  EXPECT_TRUE(has_error_containing(unit.diags, "unrecognized token '@'"));
  EXPECT_NE(unit.component("A"), nullptr);

  auto unterminated = parse("import \"never.fil\n");
  EXPECT_TRUE(has_error_containing(unterminated.diags, "unterminated string literal"));
}
