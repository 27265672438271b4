/***
 * Name: test_lexer_literals
 * Purpose: Numbers and string prefixes: kinds and raw text preserved.
 */
#include <gtest/gtest.h>
#include <vector>
#include "lexer/Lexer.h"

using namespace agentrun;

static lex::Token first(const char* src) {
  lex::Lexer L; L.pushString(src, "lit.py");
  return L.tokens().front();
}

TEST(LexerLiterals, Numbers) {
  EXPECT_EQ(first("42\n").kind, lex::TokenKind::Int);
  EXPECT_EQ(first("1_000\n").kind, lex::TokenKind::Int);
  EXPECT_EQ(first("0xFF\n").kind, lex::TokenKind::Int);
  EXPECT_EQ(first("0b1010\n").kind, lex::TokenKind::Int);
  EXPECT_EQ(first("1.5\n").kind, lex::TokenKind::Float);
  EXPECT_EQ(first(".5\n").kind, lex::TokenKind::Float);
  EXPECT_EQ(first("1e10\n").kind, lex::TokenKind::Float);
  EXPECT_EQ(first("3j\n").kind, lex::TokenKind::Imag);
  EXPECT_EQ(first("1_000\n").text, "1_000");
}

TEST(LexerLiterals, StringPrefixes) {
  EXPECT_EQ(first("'a'\n").kind, lex::TokenKind::String);
  EXPECT_EQ(first("r'\\d'\n").kind, lex::TokenKind::String);
  EXPECT_EQ(first("b'x'\n").kind, lex::TokenKind::Bytes);
  EXPECT_EQ(first("Rb'x'\n").kind, lex::TokenKind::Bytes);
  EXPECT_EQ(first("f'{x}'\n").kind, lex::TokenKind::FString);
  EXPECT_EQ(first("rf'{x}'\n").kind, lex::TokenKind::FString);
  EXPECT_EQ(first("u'x'\n").text, "u'x'");
}

TEST(LexerLiterals, TripleQuotedSpansLines) {
  lex::Lexer L; L.pushString("s = '''a\nb'''\nt = 1\n", "lit.py");
  auto toks = L.tokens();
  ASSERT_GE(toks.size(), 4u);
  EXPECT_EQ(toks[2].kind, lex::TokenKind::String);
  EXPECT_EQ(toks[2].text, "'''a\nb'''");
  EXPECT_EQ(toks[4].line, 3);
}

TEST(LexerLiterals, EscapedQuoteStaysInside) {
  const auto tok = first("'it\\'s'\n");
  EXPECT_EQ(tok.kind, lex::TokenKind::String);
  EXPECT_EQ(tok.text, "'it\\'s'");
}

TEST(LexerLiterals, KeywordMayFollowNumberDirectly) {
  lex::Lexer L; L.pushString("x = 1if y else 2\n", "lit.py");
  auto toks = L.tokens();
  EXPECT_EQ(toks[2].kind, lex::TokenKind::Int);
  EXPECT_EQ(toks[3].kind, lex::TokenKind::If);
}
