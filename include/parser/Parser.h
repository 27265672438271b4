/***
 * Name: agentrun::parse::Parser
 * Purpose: Build an AST for a Python 3.12 module from a token stream.
 * Inputs:
 *   - Token stream from Lexer (buffered on first use)
 * Outputs:
 *   - Module AST; syntax errors throw exceptions::ParseError.
 * Theory of Operation:
 *   Recursive descent over the buffered token vector. Statement parsing lives
 *   in Parser.cpp, expressions in ParseExpr.cpp, match patterns in
 *   ParsePattern.cpp and string/f-string literals in ParseStrings.cpp.
 *   Soft keywords (match, case) are recognised by trying the compound form and
 *   rewinding to the token position on failure; 'type' needs one token of
 *   lookahead.
 *   Error texts follow the CPython parser so callers can surface them as-is.
 *   Nesting and chain length are bounded so neither parsing nor destroying the
 *   tree can exhaust the native stack.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "lexer/Token.h"

namespace agentrun::parse {

class Parser {
 public:
  explicit Parser(lex::ITokenStream& stream) : ts_(stream) {}
  std::unique_ptr<ast::Module> parseModule();

  // Parse a single expression list followed by end of input (f-string fields).
  std::unique_ptr<ast::Expr> parseStandaloneExpression();

 private:
  // Recursive rules (unary, not, '**', lambda, conditional, nested
  // expressions, blocks) may nest this deep.
  static constexpr int kMaxNesting = 1000;
  // Operator and trailer links per statement. Left-folded chains grow the tree
  // without recursing, so they are counted separately.
  static constexpr int kMaxChainLinks = 10000;

  lex::ITokenStream& ts_;
  std::vector<lex::Token> tokens_{};
  size_t pos_{0};
  bool initialized_{false};
  int nesting_{0};
  int chainLinks_{0};

  // Holds one nesting level for the enclosing scope.
  class NestingGuard {
   public:
    explicit NestingGuard(Parser& parser) : parser_(parser) { parser_.enterNesting(); }
    ~NestingGuard() { --parser_.nesting_; }
    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

   private:
    Parser& parser_;
  };
  void enterNesting();
  void addChainLink();

  void initBuffer();
  [[nodiscard]] const lex::Token& peek() const;
  [[nodiscard]] const lex::Token& peekNext() const;
  lex::Token get();
  bool match(lex::TokenKind tokenKind);
  lex::Token expect(lex::TokenKind tokenKind, const char* msg);
  [[nodiscard]] bool atSoftKeyword(const char* word) const;
  [[noreturn]] void fail(const std::string& msg, const lex::Token& where) const;
  [[noreturn]] void failHere(const std::string& msg) const { fail(msg, peek()); }
  void closeBracket(lex::TokenKind closer);
  static bool startsExpression(lex::TokenKind kind);
  static bool endsStatement(lex::TokenKind kind);

  template <typename NodeT>
  static NodeT& at(NodeT& node, const lex::Token& tok) {
    node.line = tok.line;
    node.col = tok.col;
    return node;
  }
  template <typename NodeT>
  static std::unique_ptr<NodeT> at(std::unique_ptr<NodeT> node, const lex::Token& tok) {
    node->line = tok.line;
    node->col = tok.col;
    return node;
  }

  // statements (Parser.cpp)
  void parseStatementInto(ast::StmtList& out);
  void parseSimpleStatementsInto(ast::StmtList& out);
  std::unique_ptr<ast::Stmt> parseSimpleStatement();
  std::unique_ptr<ast::Stmt> parseExpressionStatement();
  std::unique_ptr<ast::Stmt> parseImportStmt();
  std::unique_ptr<ast::Stmt> parseFromImportStmt();
  std::string parseDottedName();
  ast::Alias parseImportAlias(bool dotted);
  std::unique_ptr<ast::Stmt> parseRaiseStmt();
  std::unique_ptr<ast::Stmt> parseGlobalStmt();
  std::unique_ptr<ast::Stmt> parseNonlocalStmt();
  std::unique_ptr<ast::Stmt> parseAssertStmt();
  std::unique_ptr<ast::Stmt> parseDelStmt();
  std::unique_ptr<ast::Stmt> parseReturnStmt();
  std::vector<std::string> parseNameList();

  void parseBlockInto(ast::StmtList& out, const std::string& what, int headerLine);
  std::unique_ptr<ast::Stmt> parseIfStmt(bool isElif);
  std::unique_ptr<ast::Stmt> parseWhileStmt();
  std::unique_ptr<ast::Stmt> parseForStmt(bool isAsync, const lex::Token& startTok);
  std::unique_ptr<ast::Stmt> parseTryStmt();
  std::unique_ptr<ast::Stmt> parseWithStmt(bool isAsync, const lex::Token& startTok);
  bool tryParseParenthesizedWithItems(std::vector<ast::WithItem>& items);
  ast::WithItem parseWithItem();
  std::unique_ptr<ast::Stmt> parseFunction(std::vector<std::unique_ptr<ast::Expr>> decorators, bool isAsync,
                                           const lex::Token& startTok);
  std::unique_ptr<ast::Stmt> parseClass(std::vector<std::unique_ptr<ast::Expr>> decorators);
  std::unique_ptr<ast::Stmt> parseDecorated();
  void parseTypeParams(std::vector<std::unique_ptr<ast::TypeParam>>& out);
  std::unique_ptr<ast::Stmt> parseTypeAlias();
  void parseParamList(std::vector<std::unique_ptr<ast::Param>>& out, lex::TokenKind closer, bool allowAnnotations);

  // match/case (ParsePattern.cpp)
  std::unique_ptr<ast::Stmt> tryParseMatchStmt();
  std::unique_ptr<ast::MatchCase> parseMatchCase();
  std::unique_ptr<ast::Pattern> parsePatternTop();
  std::unique_ptr<ast::Pattern> parsePattern();
  std::unique_ptr<ast::Pattern> parsePatternOr();
  std::unique_ptr<ast::Pattern> parseClosedPattern();
  std::unique_ptr<ast::Pattern> parseSequencePattern(lex::TokenKind closer, bool isList, const lex::Token& openTok);
  std::unique_ptr<ast::Pattern> parseMappingPattern(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parsePatternValueExpr();
  std::unique_ptr<ast::Expr> parseSignedNumber();

  // expressions (ParseExpr.cpp)
  std::unique_ptr<ast::Expr> parseStarExpressions();
  std::unique_ptr<ast::Expr> parseStarExpression();
  std::unique_ptr<ast::Expr> parseStarNamedExpression();
  std::unique_ptr<ast::Expr> parseNamedExpression();
  std::unique_ptr<ast::Expr> parseExpression();
  std::unique_ptr<ast::Expr> parseLambda();
  std::unique_ptr<ast::Expr> parseDisjunction();
  std::unique_ptr<ast::Expr> parseConjunction();
  std::unique_ptr<ast::Expr> parseInversion();
  std::unique_ptr<ast::Expr> parseComparison();
  std::unique_ptr<ast::Expr> parseBitwiseOr();
  std::unique_ptr<ast::Expr> parseBitwiseXor();
  std::unique_ptr<ast::Expr> parseBitwiseAnd();
  std::unique_ptr<ast::Expr> parseShift();
  std::unique_ptr<ast::Expr> parseAdditive();
  std::unique_ptr<ast::Expr> parseMultiplicative();
  std::unique_ptr<ast::Expr> parseUnary();
  std::unique_ptr<ast::Expr> parsePower();
  std::unique_ptr<ast::Expr> parseAwaitPrimary();
  std::unique_ptr<ast::Expr> parsePostfix(std::unique_ptr<ast::Expr> base);
  std::unique_ptr<ast::Expr> parseAtom();
  std::unique_ptr<ast::Expr> parseYieldExpr();
  std::unique_ptr<ast::Expr> parseParenthesized(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseListDisplay(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseDictOrSetDisplay(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseSlices();
  std::unique_ptr<ast::Expr> parseSlice();
  std::unique_ptr<ast::Expr> parseStarTargets();
  std::unique_ptr<ast::Expr> parseStarTarget();
  void parseCallArgs(ast::Call& call);
  std::vector<ast::ComprehensionFor> parseComprehensionFors();
  [[nodiscard]] bool atComprehensionFor() const;

  // strings (ParseStrings.cpp)
  std::unique_ptr<ast::Expr> parseStrings();
  void parseFStringBody(const std::string& body, const lex::Token& tok, ast::FStringLiteral& out);
  std::unique_ptr<ast::Expr> parseFieldExpression(const std::string& text, const lex::Token& tok);

  // assignment/deletion target rules (TargetRules.cpp)
  enum class TargetUse { Assign, AssignStmt, AugAssign, Delete, Annotated };
  void setTargetContext(ast::Expr& expr, TargetUse use, const lex::Token& where) const;
};

// Tokenize and parse an in-memory source under a display name.
std::unique_ptr<ast::Module> ParseSource(const std::string& source, const std::string& name);

// CPython's description of an expression kind in error messages ("function call", "literal").
const char* DescribeExpr(const ast::Expr& expr);

} // namespace agentrun::parse
