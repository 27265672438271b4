/***
 * Name: test_parser_statements
 * Purpose: Statement forms: imports, definitions, assignments, compound blocks.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "ast/Nodes.h"
#include "parser/Parser.h"

using namespace agentrun;

static std::unique_ptr<ast::Module> parseSrc(const char* src) {
  return parse::ParseSource(src, "stmt.py");
}

TEST(ParserStatements, ImportAliasesAndDottedNames) {
  auto mod = parseSrc("import os, sys as s, pkg.sub as ps\n");
  ASSERT_EQ(mod->body.size(), 1u);
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::Import);
  const auto& im = static_cast<const ast::Import&>(*mod->body[0]);
  ASSERT_EQ(im.names.size(), 3u);
  EXPECT_EQ(im.names[0].name, "os");
  EXPECT_EQ(im.names[1].asname, "s");
  EXPECT_EQ(im.names[2].name, "pkg.sub");
  EXPECT_EQ(im.names[2].asname, "ps");
}

TEST(ParserStatements, FromImportRelativeAndStar) {
  auto mod = parseSrc("from ..pkg.sub import a as b, c\nfrom . import x\nfrom pkg import *\nfrom m import (p,\n q,)\n");
  ASSERT_EQ(mod->body.size(), 4u);
  const auto& rel = static_cast<const ast::ImportFrom&>(*mod->body[0]);
  EXPECT_EQ(rel.level, 2);
  EXPECT_EQ(rel.module, "pkg.sub");
  ASSERT_EQ(rel.names.size(), 2u);
  EXPECT_EQ(rel.names[0].asname, "b");
  const auto& dot = static_cast<const ast::ImportFrom&>(*mod->body[1]);
  EXPECT_EQ(dot.level, 1);
  EXPECT_TRUE(dot.module.empty());
  const auto& star = static_cast<const ast::ImportFrom&>(*mod->body[2]);
  ASSERT_EQ(star.names.size(), 1u);
  EXPECT_EQ(star.names[0].name, "*");
  const auto& paren = static_cast<const ast::ImportFrom&>(*mod->body[3]);
  EXPECT_EQ(paren.names.size(), 2u);
}

TEST(ParserStatements, FunctionAndClassDefinitions) {
  const char* src =
      "@decorator\n"
      "async def fetch(a, /, b=1, *args, c, **kw) -> int:\n"
      "    return await a\n"
      "class Point(Base, metaclass=Meta):\n"
      "    x: int = 0\n";
  auto mod = parseSrc(src);
  ASSERT_EQ(mod->body.size(), 2u);
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::FunctionDef);
  const auto& fn = static_cast<const ast::FunctionDef&>(*mod->body[0]);
  EXPECT_EQ(fn.name, "fetch");
  EXPECT_TRUE(fn.isAsync);
  EXPECT_EQ(fn.decorators.size(), 1u);
  EXPECT_EQ(fn.params.size(), 5u);
  EXPECT_EQ(fn.line, 2);
  ASSERT_EQ(mod->body[1]->kind, ast::NodeKind::ClassDef);
  const auto& cls = static_cast<const ast::ClassDef&>(*mod->body[1]);
  EXPECT_EQ(cls.name, "Point");
  EXPECT_EQ(cls.bases.size(), 1u);
  EXPECT_EQ(cls.keywords.size(), 1u);
  ASSERT_EQ(cls.body.size(), 1u);
  EXPECT_EQ(cls.body[0]->kind, ast::NodeKind::AnnAssignStmt);
}

TEST(ParserStatements, TypeParametersAndAliases) {
  const char* src =
      "def first[T: (int, str), *Ts, **P](xs: list[T]) -> T:\n"
      "    return xs[0]\n"
      "class Box[T = int](Base): pass\n"
      "type Pair[K] = tuple[K, K]\n"
      "type X = int\n"
      "type = 3\n";
  auto mod = parseSrc(src);
  ASSERT_EQ(mod->body.size(), 5u);
  const auto& fn = static_cast<const ast::FunctionDef&>(*mod->body[0]);
  ASSERT_EQ(fn.typeParams.size(), 3u);
  EXPECT_EQ(fn.typeParams[0]->name, "T");
  EXPECT_EQ(fn.typeParams[0]->paramKind, ast::TypeParamKind::TypeVar);
  ASSERT_NE(fn.typeParams[0]->bound, nullptr);
  EXPECT_EQ(fn.typeParams[0]->bound->kind, ast::NodeKind::TupleLiteral);
  EXPECT_EQ(fn.typeParams[1]->paramKind, ast::TypeParamKind::TypeVarTuple);
  EXPECT_EQ(fn.typeParams[2]->paramKind, ast::TypeParamKind::ParamSpec);
  EXPECT_EQ(fn.typeParams[2]->name, "P");
  EXPECT_EQ(fn.params.size(), 1u);
  const auto& cls = static_cast<const ast::ClassDef&>(*mod->body[1]);
  ASSERT_EQ(cls.typeParams.size(), 1u);
  EXPECT_EQ(cls.typeParams[0]->bound, nullptr);
  ASSERT_NE(cls.typeParams[0]->defaultValue, nullptr);
  EXPECT_EQ(cls.bases.size(), 1u);
  ASSERT_EQ(mod->body[2]->kind, ast::NodeKind::TypeAlias);
  const auto& pair = static_cast<const ast::TypeAlias&>(*mod->body[2]);
  EXPECT_EQ(pair.name->id, "Pair");
  EXPECT_EQ(pair.name->ctx, ast::ExprContext::Store);
  EXPECT_EQ(pair.typeParams.size(), 1u);
  EXPECT_EQ(pair.value->kind, ast::NodeKind::Subscript);
  const auto& plain = static_cast<const ast::TypeAlias&>(*mod->body[3]);
  EXPECT_TRUE(plain.typeParams.empty());
  EXPECT_EQ(plain.line, 5);
  EXPECT_EQ(mod->body[4]->kind, ast::NodeKind::AssignStmt);
}

TEST(ParserStatements, ChainedAssignmentKeepsTargetsInOrder) {
  auto mod = parseSrc("a = b = c\n");
  const auto& as = static_cast<const ast::AssignStmt&>(*mod->body[0]);
  ASSERT_EQ(as.targets.size(), 2u);
  EXPECT_EQ(static_cast<const ast::Name&>(*as.targets[0]).id, "a");
  EXPECT_EQ(static_cast<const ast::Name&>(*as.targets[0]).ctx, ast::ExprContext::Store);
  EXPECT_EQ(static_cast<const ast::Name&>(*as.value).ctx, ast::ExprContext::Load);
}

TEST(ParserStatements, CompoundStatements) {
  const char* src =
      "for i in range(3):\n"
      "    pass\n"
      "else:\n"
      "    pass\n"
      "while x: break\n"
      "try:\n"
      "    f()\n"
      "except (ValueError, KeyError) as e:\n"
      "    raise\n"
      "finally:\n"
      "    g()\n"
      "with open(p) as fh, lock:\n"
      "    pass\n"
      "if a:\n"
      "    pass\n"
      "elif b:\n"
      "    pass\n";
  auto mod = parseSrc(src);
  ASSERT_EQ(mod->body.size(), 5u);
  EXPECT_EQ(mod->body[0]->kind, ast::NodeKind::ForStmt);
  EXPECT_EQ(mod->body[1]->kind, ast::NodeKind::WhileStmt);
  EXPECT_EQ(mod->body[2]->kind, ast::NodeKind::TryStmt);
  EXPECT_EQ(mod->body[3]->kind, ast::NodeKind::WithStmt);
  EXPECT_EQ(mod->body[4]->kind, ast::NodeKind::IfStmt);
}

TEST(ParserStatements, SemicolonSeparatedSimpleStatements) {
  auto mod = parseSrc("x = 1; y = 2; del x\n");
  ASSERT_EQ(mod->body.size(), 3u);
  EXPECT_EQ(mod->body[2]->kind, ast::NodeKind::DelStmt);
}

TEST(ParserStatements, GlobalNonlocalAssert) {
  auto mod = parseSrc("def f():\n    global a, b\n    def g():\n        nonlocal c\n    assert a, 'msg'\n");
  const auto& fn = static_cast<const ast::FunctionDef&>(*mod->body[0]);
  ASSERT_EQ(fn.body.size(), 3u);
  EXPECT_EQ(fn.body[0]->kind, ast::NodeKind::GlobalStmt);
  EXPECT_EQ(fn.body[2]->kind, ast::NodeKind::AssertStmt);
}

TEST(ParserStatements, ModuleNameIsRecorded) {
  auto mod = parseSrc("pass\n");
  EXPECT_EQ(mod->name, "stmt.py");
}
