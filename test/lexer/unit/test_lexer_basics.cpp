/***
 * Name: test_lexer_basics
 * Purpose: Cover token kinds, positions, indentation and bracket continuation.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "lexer/Lexer.h"

using namespace agentrun;

static std::vector<lex::Token> lexAll(const char* src) {
  lex::Lexer L; L.pushString(src, "lex.py");
  return L.tokens();
}

static std::vector<lex::TokenKind> kindsOf(const char* src) {
  std::vector<lex::TokenKind> out;
  for (const auto& t : lexAll(src)) { out.push_back(t.kind); }
  return out;
}

TEST(LexerBasics, SimpleAssignment) {
  using lex::TokenKind;
  const std::vector<TokenKind> expected{TokenKind::Name, TokenKind::Equal, TokenKind::Int, TokenKind::Newline, TokenKind::End};
  EXPECT_EQ(kindsOf("x = 1\n"), expected);
}

TEST(LexerBasics, MissingTrailingNewlineStillEndsLine) {
  using lex::TokenKind;
  const std::vector<TokenKind> expected{TokenKind::Name, TokenKind::Newline, TokenKind::End};
  EXPECT_EQ(kindsOf("x"), expected);
}

TEST(LexerBasics, CommentsAndBlankLinesProduceNoTokens) {
  using lex::TokenKind;
  const std::vector<TokenKind> expected{TokenKind::Pass, TokenKind::Newline, TokenKind::End};
  EXPECT_EQ(kindsOf("# header\n\n   # indented comment\npass  # trailing\n"), expected);
}

TEST(LexerBasics, PositionsAreOneBased) {
  auto toks = lexAll("a = 1\nbb = 2\n");
  ASSERT_GE(toks.size(), 5u);
  EXPECT_EQ(toks[0].line, 1);
  EXPECT_EQ(toks[0].col, 1);
  EXPECT_EQ(toks[0].file, "lex.py");
  EXPECT_EQ(toks[4].text, "bb");
  EXPECT_EQ(toks[4].line, 2);
  EXPECT_EQ(toks[6].col, 6);
}

TEST(LexerBasics, IndentDedentBalanced) {
  const char* src =
      "def f():\n"
      "    if x:\n"
      "        return 1\n"
      "    return 2\n";
  int indents = 0;
  int dedents = 0;
  for (const auto& t : lexAll(src)) {
    if (t.kind == lex::TokenKind::Indent) ++indents;
    if (t.kind == lex::TokenKind::Dedent) ++dedents;
  }
  EXPECT_EQ(indents, 2);
  EXPECT_EQ(dedents, 2);
}

TEST(LexerBasics, NewlinesSuppressedInsideBrackets) {
  using lex::TokenKind;
  int newlines = 0;
  for (const auto& t : lexAll("x = (1,\n     2,\n)\n")) {
    if (t.kind == TokenKind::Newline) ++newlines;
    EXPECT_NE(t.kind, TokenKind::Indent);
  }
  EXPECT_EQ(newlines, 1);
}

TEST(LexerBasics, BackslashContinuationJoinsLines) {
  int newlines = 0;
  for (const auto& t : lexAll("x = 1 + \\\n    2\n")) {
    if (t.kind == lex::TokenKind::Newline) ++newlines;
  }
  EXPECT_EQ(newlines, 1);
}

TEST(LexerBasics, KeywordsAndSoftKeywords) {
  auto toks = lexAll("import os as o\nmatch = 1\n");
  EXPECT_EQ(toks[0].kind, lex::TokenKind::Import);
  EXPECT_EQ(toks[2].kind, lex::TokenKind::As);
  EXPECT_EQ(toks[5].kind, lex::TokenKind::Name);
  EXPECT_EQ(toks[5].text, "match");
}

TEST(LexerBasics, UnicodeIdentifier) {
  auto toks = lexAll("\xC3\xA9t\xC3\xA9 = 1\n");
  ASSERT_EQ(toks[0].kind, lex::TokenKind::Name);
  EXPECT_EQ(toks[0].text, "\xC3\xA9t\xC3\xA9");
}

TEST(LexerBasics, ToStringNamesKeywords) {
  EXPECT_STREQ(lex::to_string(lex::TokenKind::Def), "def");
  EXPECT_STREQ(lex::to_string(lex::TokenKind::Name), "Name");
  EXPECT_TRUE(lex::isAugAssign(lex::TokenKind::PlusEqual));
  EXPECT_FALSE(lex::isAugAssign(lex::TokenKind::Equal));
}
