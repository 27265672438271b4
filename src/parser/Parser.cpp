/***
 * Name: agentrun::parse::Parser (impl)
 * Purpose: Token buffering, module and statement parsing.
 */
#include "parser/Parser.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "agentrun/exceptions/parse_error.h"
#include "lexer/Lexer.h"

namespace agentrun::parse {

using TK = lex::TokenKind;

void Parser::initBuffer() {
  if (initialized_) return;
  // Take the full token vector when backed by Lexer; otherwise drain the stream
  if (auto* lx = dynamic_cast<lex::Lexer*>(&ts_)) {
    tokens_ = lx->tokens();
  } else {
    tokens_.clear();
    for (;;) {
      auto t = ts_.next();
      tokens_.push_back(t);
      if (t.kind == TK::End) break;
    }
  }
  if (tokens_.empty() || tokens_.back().kind != TK::End) {
    lex::Token eof;
    eof.kind = TK::End;
    tokens_.push_back(eof);
  }
  pos_ = 0;
  initialized_ = true;
}

const lex::Token& Parser::peek() const {
  // Safe in presence of End sentry
  return tokens_[pos_ < tokens_.size() ? pos_ : (tokens_.size() - 1)];
}

const lex::Token& Parser::peekNext() const {
  const size_t idx = pos_ + 1;
  return tokens_[idx < tokens_.size() ? idx : (tokens_.size() - 1)];
}

lex::Token Parser::get() {
  if (pos_ < tokens_.size() - 1) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

bool Parser::match(const TK tokenKind) {
  if (peek().kind == tokenKind) { (void)get(); return true; }
  return false;
}

lex::Token Parser::expect(const TK tokenKind, const char* msg) {
  if (peek().kind != tokenKind) { failHere(msg); }
  return get();
}

bool Parser::atSoftKeyword(const char* word) const {
  return peek().kind == TK::Name && peek().text == word;
}

void Parser::fail(const std::string& msg, const lex::Token& where) const {
  throw exceptions::ParseError(msg, where.file, where.line, where.col);
}

void Parser::enterNesting() {
  if (nesting_ >= kMaxNesting) { failHere("too many nested expressions"); }
  ++nesting_;
}

void Parser::addChainLink() {
  if (++chainLinks_ > kMaxChainLinks) { failHere("expression too long"); }
}

void Parser::closeBracket(const TK closer) {
  if (match(closer)) { return; }
  if (startsExpression(peek().kind)) { failHere("invalid syntax. Perhaps you forgot a comma?"); }
  failHere("invalid syntax");
}

bool Parser::startsExpression(const TK kind) {
  switch (kind) {
    case TK::Name: case TK::Int: case TK::Float: case TK::Imag:
    case TK::String: case TK::Bytes: case TK::FString:
    case TK::True: case TK::False: case TK::None: case TK::Ellipsis:
    case TK::LParen: case TK::LBracket: case TK::LBrace:
    case TK::Minus: case TK::Plus: case TK::Tilde: case TK::Star:
    case TK::Not: case TK::Lambda: case TK::Await:
      return true;
    default:
      return false;
  }
}

bool Parser::endsStatement(const TK kind) {
  return kind == TK::Newline || kind == TK::Semicolon || kind == TK::End;
}

std::unique_ptr<ast::Module> Parser::parseModule() {
  initBuffer();
  auto module = std::make_unique<ast::Module>();
  module->name = tokens_.front().file;
  module->line = 1;
  module->col = 1;
  while (peek().kind != TK::End) {
    if (match(TK::Newline)) continue;
    parseStatementInto(module->body);
  }
  return module;
}

std::unique_ptr<ast::Expr> Parser::parseStandaloneExpression() {
  initBuffer();
  auto expr = peek().kind == TK::Yield ? parseYieldExpr() : parseStarExpressions();
  (void)match(TK::Newline);
  if (peek().kind != TK::End) { failHere("invalid syntax"); }
  return expr;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::parseStatementInto(ast::StmtList& out) {
  const NestingGuard nested(*this);
  chainLinks_ = 0;
  const lex::Token& tok = peek();
  switch (tok.kind) {
    case TK::Indent: fail("unexpected indent", tok);
    case TK::Dedent: fail("invalid syntax", tok);
    case TK::If: out.push_back(parseIfStmt(false)); return;
    case TK::While: out.push_back(parseWhileStmt()); return;
    case TK::For: out.push_back(parseForStmt(false, tok)); return;
    case TK::Try: out.push_back(parseTryStmt()); return;
    case TK::With: out.push_back(parseWithStmt(false, tok)); return;
    case TK::Def: out.push_back(parseFunction({}, false, tok)); return;
    case TK::Class: out.push_back(parseClass({})); return;
    case TK::At: out.push_back(parseDecorated()); return;
    case TK::Async: {
      const auto asyncTok = get();
      switch (peek().kind) {
        case TK::Def: out.push_back(parseFunction({}, true, asyncTok)); return;
        case TK::For: out.push_back(parseForStmt(true, asyncTok)); return;
        case TK::With: out.push_back(parseWithStmt(true, asyncTok)); return;
        default: failHere("invalid syntax");
      }
    }
    default: break;
  }
  if (atSoftKeyword("match")) {
    if (auto stmt = tryParseMatchStmt()) {
      out.push_back(std::move(stmt));
      return;
    }
  }
  parseSimpleStatementsInto(out);
}

void Parser::parseSimpleStatementsInto(ast::StmtList& out) {
  out.push_back(parseSimpleStatement());
  while (match(TK::Semicolon)) {
    if (peek().kind == TK::Newline || peek().kind == TK::End) break;
    out.push_back(parseSimpleStatement());
  }
  if (peek().kind == TK::End || match(TK::Newline)) { return; }
  const ast::Stmt& last = *out.back();
  if (last.kind == ast::NodeKind::ExprStmt) {
    const auto& value = *static_cast<const ast::ExprStmt&>(last).value;
    if (value.kind == ast::NodeKind::Name && startsExpression(peek().kind)) {
      const auto& id = static_cast<const ast::Name&>(value).id;
      if (id == "print" || id == "exec") {
        lex::Token where = peek();
        where.line = value.line;
        where.col = value.col;
        fail("Missing parentheses in call to '" + id + "'. Did you mean " + id + "(...)?", where);
      }
    }
  }
  failHere("invalid syntax");
}

std::unique_ptr<ast::Stmt> Parser::parseSimpleStatement() {
  chainLinks_ = 0;
  const lex::Token& tok = peek();
  switch (tok.kind) {
    case TK::Pass: (void)get(); return at(std::make_unique<ast::PassStmt>(), tok);
    case TK::Break: (void)get(); return at(std::make_unique<ast::BreakStmt>(), tok);
    case TK::Continue: (void)get(); return at(std::make_unique<ast::ContinueStmt>(), tok);
    case TK::Return: return parseReturnStmt();
    case TK::Raise: return parseRaiseStmt();
    case TK::Global: return parseGlobalStmt();
    case TK::Nonlocal: return parseNonlocalStmt();
    case TK::Del: return parseDelStmt();
    case TK::Assert: return parseAssertStmt();
    case TK::Import: return parseImportStmt();
    case TK::From: return parseFromImportStmt();
    case TK::Name:
      if (atSoftKeyword("type") && peekNext().kind == TK::Name) { return parseTypeAlias(); }
      return parseExpressionStatement();
    default: return parseExpressionStatement();
  }
}

namespace {

ast::BinaryOperator augOpFor(const TK kind) {
  switch (kind) {
    case TK::PlusEqual: return ast::BinaryOperator::Add;
    case TK::MinusEqual: return ast::BinaryOperator::Sub;
    case TK::StarEqual: return ast::BinaryOperator::Mul;
    case TK::AtEqual: return ast::BinaryOperator::MatMul;
    case TK::SlashEqual: return ast::BinaryOperator::Div;
    case TK::SlashSlashEqual: return ast::BinaryOperator::FloorDiv;
    case TK::PercentEqual: return ast::BinaryOperator::Mod;
    case TK::StarStarEqual: return ast::BinaryOperator::Pow;
    case TK::LShiftEqual: return ast::BinaryOperator::LShift;
    case TK::RShiftEqual: return ast::BinaryOperator::RShift;
    case TK::PipeEqual: return ast::BinaryOperator::BitOr;
    case TK::CaretEqual: return ast::BinaryOperator::BitXor;
    default: return ast::BinaryOperator::BitAnd;
  }
}

} // namespace

std::unique_ptr<ast::Stmt> Parser::parseExpressionStatement() {
  const lex::Token startTok = peek();
  auto rhs = [this]() { return peek().kind == TK::Yield ? parseYieldExpr() : parseStarExpressions(); };
  auto first = rhs();

  if (peek().kind == TK::Colon) {
    (void)get();
    setTargetContext(*first, TargetUse::Annotated, startTok);
    auto stmt = at(std::make_unique<ast::AnnAssignStmt>(), startTok);
    stmt->target = std::move(first);
    stmt->annotation = parseExpression();
    if (match(TK::Equal)) { stmt->value = rhs(); }
    return stmt;
  }
  if (lex::isAugAssign(peek().kind)) {
    const auto opTok = get();
    setTargetContext(*first, TargetUse::AugAssign, startTok);
    auto stmt = at(std::make_unique<ast::AugAssignStmt>(), startTok);
    stmt->target = std::move(first);
    stmt->op = augOpFor(opTok.kind);
    stmt->value = rhs();
    return stmt;
  }
  if (peek().kind == TK::Equal) {
    auto stmt = at(std::make_unique<ast::AssignStmt>(), startTok);
    auto current = std::move(first);
    while (match(TK::Equal)) {
      setTargetContext(*current, TargetUse::AssignStmt, startTok);
      stmt->targets.push_back(std::move(current));
      current = rhs();
    }
    stmt->value = std::move(current);
    return stmt;
  }
  return at(std::make_unique<ast::ExprStmt>(std::move(first)), startTok);
}

std::unique_ptr<ast::Stmt> Parser::parseReturnStmt() {
  const auto tok = get();
  std::unique_ptr<ast::Expr> value;
  if (!endsStatement(peek().kind)) { value = parseStarExpressions(); }
  return at(std::make_unique<ast::ReturnStmt>(std::move(value)), tok);
}

std::unique_ptr<ast::Stmt> Parser::parseRaiseStmt() {
  const auto tok = get();
  auto stmt = at(std::make_unique<ast::RaiseStmt>(), tok);
  if (!endsStatement(peek().kind)) {
    stmt->exc = parseExpression();
    if (match(TK::From)) { stmt->cause = parseExpression(); }
  }
  return stmt;
}

std::vector<std::string> Parser::parseNameList() {
  std::vector<std::string> names;
  names.push_back(expect(TK::Name, "invalid syntax").text);
  while (match(TK::Comma)) { names.push_back(expect(TK::Name, "invalid syntax").text); }
  return names;
}

std::unique_ptr<ast::Stmt> Parser::parseGlobalStmt() {
  const auto tok = get();
  auto stmt = at(std::make_unique<ast::GlobalStmt>(), tok);
  stmt->names = parseNameList();
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseNonlocalStmt() {
  const auto tok = get();
  auto stmt = at(std::make_unique<ast::NonlocalStmt>(), tok);
  stmt->names = parseNameList();
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseDelStmt() {
  const auto tok = get();
  auto stmt = at(std::make_unique<ast::DelStmt>(), tok);
  do {
    if (endsStatement(peek().kind) && !stmt->targets.empty()) break;
    auto target = parseBitwiseOr();
    setTargetContext(*target, TargetUse::Delete, tok);
    stmt->targets.push_back(std::move(target));
  } while (match(TK::Comma));
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseAssertStmt() {
  const auto tok = get();
  auto stmt = at(std::make_unique<ast::AssertStmt>(), tok);
  stmt->test = parseExpression();
  if (match(TK::Comma)) { stmt->msg = parseExpression(); }
  return stmt;
}

std::string Parser::parseDottedName() {
  std::string name = expect(TK::Name, "invalid syntax").text;
  while (peek().kind == TK::Dot) {
    (void)get();
    name += '.';
    name += expect(TK::Name, "invalid syntax").text;
  }
  return name;
}

ast::Alias Parser::parseImportAlias(const bool dotted) {
  const lex::Token tok = peek();
  ast::Alias alias;
  at(alias, tok);
  alias.name = dotted ? parseDottedName() : expect(TK::Name, "invalid syntax").text;
  if (match(TK::As)) { alias.asname = expect(TK::Name, "invalid syntax").text; }
  return alias;
}

std::unique_ptr<ast::Stmt> Parser::parseImportStmt() {
  const auto tok = get();
  auto stmt = at(std::make_unique<ast::Import>(), tok);
  stmt->names.push_back(parseImportAlias(true));
  while (match(TK::Comma)) { stmt->names.push_back(parseImportAlias(true)); }
  return stmt;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseFromImportStmt() {
  const auto tok = get();
  auto stmt = at(std::make_unique<ast::ImportFrom>(), tok);
  for (;;) {
    if (match(TK::Dot)) { stmt->level += 1; continue; }
    if (match(TK::Ellipsis)) { stmt->level += 3; continue; }
    break;
  }
  if (peek().kind == TK::Name) {
    stmt->module = parseDottedName();
  } else if (stmt->level == 0) {
    failHere("invalid syntax");
  }
  (void)expect(TK::Import, "invalid syntax");
  if (peek().kind == TK::Star) {
    const auto star = get();
    ast::Alias alias("*", "");
    stmt->names.push_back(std::move(at(alias, star)));
    return stmt;
  }
  if (match(TK::LParen)) {
    stmt->names.push_back(parseImportAlias(false));
    while (match(TK::Comma)) {
      if (peek().kind == TK::RParen) break;
      stmt->names.push_back(parseImportAlias(false));
    }
    closeBracket(TK::RParen);
    return stmt;
  }
  stmt->names.push_back(parseImportAlias(false));
  while (match(TK::Comma)) {
    if (endsStatement(peek().kind)) { failHere("trailing comma not allowed without surrounding parentheses"); }
    stmt->names.push_back(parseImportAlias(false));
  }
  return stmt;
}

void Parser::parseBlockInto(ast::StmtList& out, const std::string& what,
                            const int headerLine) {
  (void)expect(TK::Colon, "expected ':'");
  if (!match(TK::Newline)) {
    if (peek().kind == TK::End) {
      failHere("expected an indented block after " + what + " on line " + std::to_string(headerLine));
    }
    parseSimpleStatementsInto(out);
    return;
  }
  if (peek().kind != TK::Indent) {
    failHere("expected an indented block after " + what + " on line " + std::to_string(headerLine));
  }
  (void)get();
  while (peek().kind != TK::Dedent && peek().kind != TK::End) {
    if (match(TK::Newline)) continue;
    parseStatementInto(out);
  }
  (void)match(TK::Dedent);
}

std::unique_ptr<ast::Stmt> Parser::parseIfStmt(const bool isElif) {
  const auto tok = get();
  auto cond = parseNamedExpression();
  auto stmt = at(std::make_unique<ast::IfStmt>(std::move(cond)), tok);
  parseBlockInto(stmt->body, isElif ? "'elif' statement" : "'if' statement", tok.line);
  if (peek().kind == TK::Elif) {
    stmt->orelse.push_back(parseIfStmt(true));
  } else if (peek().kind == TK::Else) {
    const auto elseTok = get();
    parseBlockInto(stmt->orelse, "'else' statement", elseTok.line);
  }
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseWhileStmt() {
  const auto tok = get();
  auto cond = parseNamedExpression();
  auto stmt = at(std::make_unique<ast::WhileStmt>(std::move(cond)), tok);
  parseBlockInto(stmt->body, "'while' statement", tok.line);
  if (peek().kind == TK::Else) {
    const auto elseTok = get();
    parseBlockInto(stmt->orelse, "'else' statement", elseTok.line);
  }
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseForStmt(const bool isAsync, const lex::Token& startTok) {
  const lex::Token first = startTok;
  const auto forTok = expect(TK::For, "invalid syntax");
  auto stmt = at(std::make_unique<ast::ForStmt>(), first);
  stmt->isAsync = isAsync;
  stmt->target = parseStarTargets();
  setTargetContext(*stmt->target, TargetUse::Assign, forTok);
  (void)expect(TK::In, "invalid syntax");
  stmt->iterable = parseStarExpressions();
  parseBlockInto(stmt->body, "'for' statement", forTok.line);
  if (peek().kind == TK::Else) {
    const auto elseTok = get();
    parseBlockInto(stmt->orelse, "'else' statement", elseTok.line);
  }
  return stmt;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseTryStmt() {
  const auto tok = get();
  auto stmt = at(std::make_unique<ast::TryStmt>(), tok);
  parseBlockInto(stmt->body, "'try' statement", tok.line);
  while (peek().kind == TK::Except) {
    const auto exceptTok = get();
    const bool star = match(TK::Star);
    if (!stmt->handlers.empty() && star != stmt->isStar) {
      fail("cannot have both 'except' and 'except*' on the same 'try'", exceptTok);
    }
    stmt->isStar = star;
    auto handler = at(std::make_unique<ast::ExceptHandler>(), exceptTok);
    if (peek().kind != TK::Colon) {
      handler->type = parseExpression();
      if (peek().kind == TK::Comma) { failHere("multiple exception types must be parenthesized"); }
      if (match(TK::As)) { handler->name = expect(TK::Name, "invalid syntax").text; }
    } else if (star) {
      failHere("expected one or more exception types");
    }
    parseBlockInto(handler->body, star ? "'except*' statement" : "'except' statement", exceptTok.line);
    stmt->handlers.push_back(std::move(handler));
  }
  if (peek().kind == TK::Else) {
    if (stmt->handlers.empty()) { failHere("expected 'except' or 'finally' block"); }
    const auto elseTok = get();
    parseBlockInto(stmt->orelse, "'else' statement", elseTok.line);
  }
  if (peek().kind == TK::Finally) {
    const auto finallyTok = get();
    parseBlockInto(stmt->finalbody, "'finally' statement", finallyTok.line);
  }
  if (stmt->handlers.empty() && stmt->finalbody.empty()) {
    failHere("expected 'except' or 'finally' block");
  }
  return stmt;
}

ast::WithItem Parser::parseWithItem() {
  ast::WithItem item;
  item.context = parseExpression();
  if (match(TK::As)) {
    const lex::Token tok = peek();
    item.target = parseStarTarget();
    setTargetContext(*item.target, TargetUse::Assign, tok);
  }
  return item;
}

bool Parser::tryParseParenthesizedWithItems(std::vector<ast::WithItem>& items) {
  const size_t saved = pos_;
  const int savedLinks = chainLinks_;
  try {
    (void)get();
    items.push_back(parseWithItem());
    while (match(TK::Comma)) {
      if (peek().kind == TK::RParen) break;
      items.push_back(parseWithItem());
    }
    (void)expect(TK::RParen, "invalid syntax");
    if (peek().kind == TK::Colon) { return true; }
  } catch (const exceptions::ParseError&) {
    // not a parenthesized item list; reparse as an expression
  }
  pos_ = saved;
  chainLinks_ = savedLinks;
  items.clear();
  return false;
}

std::unique_ptr<ast::Stmt> Parser::parseWithStmt(const bool isAsync, const lex::Token& startTok) {
  const lex::Token first = startTok;
  const auto withTok = expect(TK::With, "invalid syntax");
  auto stmt = at(std::make_unique<ast::WithStmt>(), first);
  stmt->isAsync = isAsync;
  if (peek().kind != TK::LParen || !tryParseParenthesizedWithItems(stmt->items)) {
    stmt->items.push_back(parseWithItem());
    while (match(TK::Comma)) { stmt->items.push_back(parseWithItem()); }
  }
  parseBlockInto(stmt->body, "'with' statement", withTok.line);
  return stmt;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::parseParamList(std::vector<std::unique_ptr<ast::Param>>& out, const TK closer,
                            const bool allowAnnotations) {
  bool seenStar = false;
  bool seenSlash = false;
  bool seenDefault = false;
  auto annotate = [&](ast::Param& param) {
    if (allowAnnotations && match(TK::Colon)) { param.annotation = parseExpression(); }
  };
  while (peek().kind != closer) {
    const lex::Token tok = peek();
    if (match(TK::Slash)) {
      if (seenSlash) { fail("/ may appear only once", tok); }
      if (seenStar) { fail("/ must be ahead of *", tok); }
      if (out.empty()) { fail("at least one argument must precede /", tok); }
      for (auto& param : out) { param->isPosOnly = true; }
      seenSlash = true;
    } else if (match(TK::StarStar)) {
      const auto nameTok = expect(TK::Name, "invalid syntax");
      auto param = at(std::make_unique<ast::Param>(nameTok.text), nameTok);
      param->isKwVarArg = true;
      annotate(*param);
      if (peek().kind == TK::Equal) { failHere("var-keyword argument cannot have default value"); }
      out.push_back(std::move(param));
      (void)match(TK::Comma);
      if (peek().kind != closer) { failHere("arguments cannot follow var-keyword argument"); }
      break;
    } else if (match(TK::Star)) {
      if (seenStar) { fail("* argument may appear only once", tok); }
      seenStar = true;
      if (peek().kind == TK::Name) {
        const auto nameTok = get();
        auto param = at(std::make_unique<ast::Param>(nameTok.text), nameTok);
        param->isVarArg = true;
        annotate(*param);
        if (peek().kind == TK::Equal) { failHere("var-positional argument cannot have default value"); }
        out.push_back(std::move(param));
      } else if (peek().kind == closer || (peek().kind == TK::Comma && peekNext().kind == closer)) {
        fail("named arguments must follow bare *", tok);
      }
    } else {
      const auto nameTok = expect(TK::Name, "invalid syntax");
      auto param = at(std::make_unique<ast::Param>(nameTok.text), nameTok);
      param->isKwOnly = seenStar;
      annotate(*param);
      if (match(TK::Equal)) {
        param->defaultValue = parseExpression();
        seenDefault = true;
      } else if (seenDefault && !seenStar) {
        fail("parameter without a default follows parameter with a default", nameTok);
      }
      out.push_back(std::move(param));
    }
    if (!match(TK::Comma)) break;
  }
}

std::unique_ptr<ast::Stmt> Parser::parseFunction(std::vector<std::unique_ptr<ast::Expr>> decorators,
                                                 const bool isAsync, const lex::Token& startTok) {
  const lex::Token first = startTok;
  const auto defTok = expect(TK::Def, "invalid syntax");
  const auto nameTok = expect(TK::Name, "invalid syntax");
  auto fn = at(std::make_unique<ast::FunctionDef>(nameTok.text), first);
  fn->isAsync = isAsync;
  fn->decorators = std::move(decorators);
  parseTypeParams(fn->typeParams);
  (void)expect(TK::LParen, "expected '('");
  parseParamList(fn->params, TK::RParen, true);
  closeBracket(TK::RParen);
  if (match(TK::Arrow)) { fn->returns = parseExpression(); }
  parseBlockInto(fn->body, "function definition", defTok.line);
  return fn;
}

std::unique_ptr<ast::Stmt> Parser::parseClass(std::vector<std::unique_ptr<ast::Expr>> decorators) {
  const auto tok = get();
  const auto nameTok = expect(TK::Name, "invalid syntax");
  auto cls = at(std::make_unique<ast::ClassDef>(nameTok.text), tok);
  cls->decorators = std::move(decorators);
  parseTypeParams(cls->typeParams);
  if (match(TK::LParen)) {
    ast::Call args(nullptr);
    parseCallArgs(args);
    cls->bases = std::move(args.args);
    cls->keywords = std::move(args.keywords);
  }
  parseBlockInto(cls->body, "class definition", tok.line);
  return cls;
}

// PEP 695 '[T: bound, *Ts, **P]' after a def, class or type name; absent is fine.
void Parser::parseTypeParams(std::vector<std::unique_ptr<ast::TypeParam>>& out) {
  if (!match(TK::LBracket)) return;
  if (peek().kind == TK::RBracket) { failHere("Type parameter list cannot be empty"); }
  bool seenDefault = false;
  while (peek().kind != TK::RBracket) {
    const lex::Token tok = peek();
    auto kind = ast::TypeParamKind::TypeVar;
    if (match(TK::Star)) {
      kind = ast::TypeParamKind::TypeVarTuple;
    } else if (match(TK::StarStar)) {
      kind = ast::TypeParamKind::ParamSpec;
    }
    const auto nameTok = expect(TK::Name, "invalid syntax");
    auto param = at(std::make_unique<ast::TypeParam>(nameTok.text), tok);
    param->paramKind = kind;
    if (peek().kind == TK::Colon) {
      if (kind == ast::TypeParamKind::TypeVarTuple) { failHere("cannot use bound with TypeVarTuple"); }
      if (kind == ast::TypeParamKind::ParamSpec) { failHere("cannot use bound with ParamSpec"); }
      (void)get();
      param->bound = parseExpression();
    }
    if (match(TK::Equal)) {
      param->defaultValue = kind == ast::TypeParamKind::TypeVarTuple ? parseStarExpression() : parseExpression();
      seenDefault = true;
    } else if (seenDefault) {
      fail("non-default type parameter '" + param->name + "' follows default type parameter", nameTok);
    }
    out.push_back(std::move(param));
    if (!match(TK::Comma)) break;
  }
  closeBracket(TK::RBracket);
}

std::unique_ptr<ast::Stmt> Parser::parseTypeAlias() {
  const auto typeTok = get();
  const auto nameTok = expect(TK::Name, "invalid syntax");
  auto stmt = at(std::make_unique<ast::TypeAlias>(), typeTok);
  stmt->name = at(std::make_unique<ast::Name>(nameTok.text), nameTok);
  stmt->name->ctx = ast::ExprContext::Store;
  parseTypeParams(stmt->typeParams);
  (void)expect(TK::Equal, "invalid syntax");
  stmt->value = parseExpression();
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseDecorated() {
  std::vector<std::unique_ptr<ast::Expr>> decorators;
  while (match(TK::At)) {
    decorators.push_back(parseNamedExpression());
    (void)expect(TK::Newline, "invalid syntax");
  }
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Def: return parseFunction(std::move(decorators), false, tok);
    case TK::Class: return parseClass(std::move(decorators));
    case TK::Async:
      (void)get();
      return parseFunction(std::move(decorators), true, tok);
    default: failHere("invalid syntax");
  }
}

std::unique_ptr<ast::Module> ParseSource(const std::string& source, const std::string& name) {
  lex::Lexer lexer;
  lexer.pushString(source, name);
  Parser parser(lexer);
  return parser.parseModule();
}

} // namespace agentrun::parse
