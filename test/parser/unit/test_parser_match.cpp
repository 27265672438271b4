/***
 * Name: test_parser_match
 * Purpose: Soft-keyword match statements and structural patterns.
 */
#include <gtest/gtest.h>
#include <memory>
#include "agentrun/exceptions/parse_error.h"
#include "ast/Nodes.h"
#include "parser/Parser.h"

using namespace agentrun;

TEST(ParserMatch, MatchAsIdentifierStillWorks) {
  auto mod = parse::ParseSource("match = 3\nmatch(x)\n", "m.py");
  ASSERT_EQ(mod->body.size(), 2u);
  EXPECT_EQ(mod->body[0]->kind, ast::NodeKind::AssignStmt);
  EXPECT_EQ(mod->body[1]->kind, ast::NodeKind::ExprStmt);
}

TEST(ParserMatch, PatternsOfEveryShape) {
  const char* src =
      "match cmd:\n"
      "    case [\"go\", direction] if direction:\n"
      "        pass\n"
      "    case {\"k\": v, **rest}:\n"
      "        pass\n"
      "    case Point(x=0, y=_) | Origin() as where:\n"
      "        pass\n"
      "    case (1, *others):\n"
      "        pass\n"
      "    case _:\n"
      "        pass\n";
  auto mod = parse::ParseSource(src, "m.py");
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::MatchStmt);
  const auto& ms = static_cast<const ast::MatchStmt&>(*mod->body[0]);
  ASSERT_EQ(ms.cases.size(), 5u);
  EXPECT_EQ(ms.cases[0]->pattern->kind, ast::NodeKind::PatternSequence);
  EXPECT_NE(ms.cases[0]->guard, nullptr);
  ASSERT_EQ(ms.cases[1]->pattern->kind, ast::NodeKind::PatternMapping);
  EXPECT_EQ(static_cast<const ast::PatternMapping&>(*ms.cases[1]->pattern).restName, "rest");
  ASSERT_EQ(ms.cases[2]->pattern->kind, ast::NodeKind::PatternAs);
  const auto& as = static_cast<const ast::PatternAs&>(*ms.cases[2]->pattern);
  EXPECT_EQ(as.name, "where");
  EXPECT_EQ(as.pattern->kind, ast::NodeKind::PatternOr);
  EXPECT_EQ(ms.cases[3]->pattern->kind, ast::NodeKind::PatternSequence);
  ASSERT_EQ(ms.cases[4]->pattern->kind, ast::NodeKind::PatternCapture);
  EXPECT_EQ(static_cast<const ast::PatternCapture&>(*ms.cases[4]->pattern).name, "_");
}

TEST(ParserMatch, UnderscoreIsNotAnAsTarget) {
  EXPECT_THROW((void)parse::ParseSource("match x:\n    case 1 as _:\n        pass\n", "m.py"), exceptions::ParseError);
}
