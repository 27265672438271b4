/***
 * Name: test_parser_expressions
 * Purpose: Expression forms reaching the analyzers: calls, attributes, f-strings, operators.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "ast/Nodes.h"
#include "parser/Parser.h"

using namespace agentrun;

static std::unique_ptr<ast::Module> parseSrc(const char* src) {
  return parse::ParseSource(src, "expr.py");
}

static const ast::Expr& exprOf(const ast::Module& mod, size_t idx = 0) {
  return *static_cast<const ast::ExprStmt&>(*mod.body.at(idx)).value;
}

TEST(ParserExpressions, CallWithAttributeCallee) {
  auto mod = parseSrc("os.path.join(a, *rest, sep='/', **kw)\n");
  const auto& call = static_cast<const ast::Call&>(exprOf(*mod));
  ASSERT_EQ(call.callee->kind, ast::NodeKind::Attribute);
  const auto& attr = static_cast<const ast::Attribute&>(*call.callee);
  EXPECT_EQ(attr.attr, "join");
  EXPECT_EQ(call.args.size(), 2u);
  EXPECT_EQ(call.args[1]->kind, ast::NodeKind::Starred);
  ASSERT_EQ(call.keywords.size(), 2u);
  EXPECT_EQ(call.keywords[0].name, "sep");
  EXPECT_TRUE(call.keywords[1].name.empty());
}

TEST(ParserExpressions, MatMulOperator) {
  auto mod = parseSrc("c = a @ b\nc @= d\n");
  const auto& as = static_cast<const ast::AssignStmt&>(*mod->body[0]);
  ASSERT_EQ(as.value->kind, ast::NodeKind::BinaryExpr);
  EXPECT_EQ(static_cast<const ast::BinaryExpr&>(*as.value).op, ast::BinaryOperator::MatMul);
  ASSERT_EQ(mod->body[1]->kind, ast::NodeKind::AugAssignStmt);
  EXPECT_EQ(static_cast<const ast::AugAssignStmt&>(*mod->body[1]).op, ast::BinaryOperator::MatMul);
}

TEST(ParserExpressions, FStringFieldsAreParsed) {
  auto mod = parseSrc("f'{eval(x)!r:>{width}} and {{literal}}'\n");
  const auto& fs = static_cast<const ast::FStringLiteral&>(exprOf(*mod));
  ASSERT_GE(fs.parts.size(), 2u);
  ASSERT_TRUE(fs.parts[0].isExpr);
  EXPECT_EQ(fs.parts[0].conversion, 'r');
  ASSERT_EQ(fs.parts[0].expr->kind, ast::NodeKind::Call);
  ASSERT_NE(fs.parts[0].formatSpec, nullptr);
  EXPECT_FALSE(fs.parts[1].isExpr);
  EXPECT_EQ(fs.parts[1].text, " and {literal}");
}

TEST(ParserExpressions, ImplicitConcatenationJoinsText) {
  auto mod = parseSrc("'a' \"b\"\n");
  const auto& c = static_cast<const ast::Constant&>(exprOf(*mod));
  EXPECT_EQ(c.valueKind, ast::ConstantKind::String);
  EXPECT_EQ(c.text, "'a' \"b\"");
}

TEST(ParserExpressions, LambdaComprehensionAndWalrus) {
  auto mod = parseSrc("f = lambda x, *a: x\n[y for y in z if y]\n(n := 10)\n{k: v for k, v in d}\n");
  const auto& as = static_cast<const ast::AssignStmt&>(*mod->body[0]);
  EXPECT_EQ(as.value->kind, ast::NodeKind::LambdaExpr);
  EXPECT_EQ(exprOf(*mod, 1).kind, ast::NodeKind::ListComp);
  EXPECT_EQ(exprOf(*mod, 2).kind, ast::NodeKind::NamedExpr);
  EXPECT_EQ(exprOf(*mod, 3).kind, ast::NodeKind::DictComp);
}

TEST(ParserExpressions, ComparisonChainAndBoolOps) {
  auto mod = parseSrc("a < b <= c and not d or e is not None\n");
  EXPECT_EQ(exprOf(*mod).kind, ast::NodeKind::BoolOp);
}

TEST(ParserExpressions, SubscriptsAndSlices) {
  auto mod = parseSrc("x[1:2, ::3]\n");
  const auto& sub = static_cast<const ast::Subscript&>(exprOf(*mod));
  EXPECT_EQ(sub.kind, ast::NodeKind::Subscript);
}

TEST(ParserExpressions, PositionsAreRecorded) {
  auto mod = parseSrc("\n\n    \nvalue = obj.attr\n");
  const auto& as = static_cast<const ast::AssignStmt&>(*mod->body[0]);
  EXPECT_EQ(as.line, 4);
  EXPECT_EQ(as.value->line, 4);
  EXPECT_EQ(as.value->col, 9);
}
