/***
 * Name: agentrun::parse::Parser (expressions)
 * Purpose: Expression grammar from star_expressions down to atoms.
 * Theory of Operation:
 *   One method per precedence level, lowest first. Binary levels fold left;
 *   '**' folds right through parseUnary. New nodes take the position of their
 *   leftmost token.
 */
#include <memory>
#include <utility>
#include <vector>
#include "parser/Parser.h"

namespace agentrun::parse {

using TK = lex::TokenKind;

namespace {

template <typename NodeT>
std::unique_ptr<NodeT> placedLike(std::unique_ptr<NodeT> node, const ast::Node& from) {
  node->line = from.line;
  node->col = from.col;
  return node;
}

} // namespace

std::unique_ptr<ast::Expr> Parser::parseStarExpressions() {
  const lex::Token tok = peek();
  auto first = parseStarExpression();
  if (peek().kind != TK::Comma) return first;
  auto tuple = at(std::make_unique<ast::TupleLiteral>(), tok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpression(peek().kind)) break;
    tuple->elements.push_back(parseStarExpression());
  }
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseStarExpression() {
  const lex::Token tok = peek();
  if (match(TK::Star)) {
    return at(std::make_unique<ast::Starred>(parseBitwiseOr()), tok);
  }
  return parseExpression();
}

std::unique_ptr<ast::Expr> Parser::parseStarNamedExpression() {
  const lex::Token tok = peek();
  if (match(TK::Star)) {
    return at(std::make_unique<ast::Starred>(parseBitwiseOr()), tok);
  }
  return parseNamedExpression();
}

std::unique_ptr<ast::Expr> Parser::parseNamedExpression() {
  const lex::Token tok = peek();
  if (tok.kind == TK::Name && peekNext().kind == TK::ColonEqual) {
    (void)get();
    (void)get();
    auto target = at(std::make_unique<ast::Name>(tok.text), tok);
    target->ctx = ast::ExprContext::Store;
    auto value = parseExpression();
    return at(std::make_unique<ast::NamedExpr>(std::move(target), std::move(value)), tok);
  }
  auto expr = parseExpression();
  if (peek().kind == TK::ColonEqual) {
    fail(std::string("cannot use assignment expressions with ") + DescribeExpr(*expr), tok);
  }
  return expr;
}

std::unique_ptr<ast::Expr> Parser::parseExpression() {
  const NestingGuard nested(*this);
  if (peek().kind == TK::Lambda) return parseLambda();
  const lex::Token tok = peek();
  auto body = parseDisjunction();
  if (peek().kind != TK::If) return body;
  (void)get();
  auto node = at(std::make_unique<ast::IfExpr>(), tok);
  node->body = std::move(body);
  node->test = parseDisjunction();
  (void)expect(TK::Else, "expected 'else' after 'if' expression");
  node->orelse = parseExpression();
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseLambda() {
  const auto tok = get();
  auto lambda = at(std::make_unique<ast::LambdaExpr>(), tok);
  parseParamList(lambda->params, TK::Colon, false);
  (void)expect(TK::Colon, "expected ':'");
  lambda->body = parseExpression();
  return lambda;
}

std::unique_ptr<ast::Expr> Parser::parseDisjunction() {
  const lex::Token tok = peek();
  auto first = parseConjunction();
  if (peek().kind != TK::Or) return first;
  auto node = at(std::make_unique<ast::BoolOp>(ast::BoolOperator::Or), tok);
  node->values.push_back(std::move(first));
  while (match(TK::Or)) { node->values.push_back(parseConjunction()); }
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseConjunction() {
  const lex::Token tok = peek();
  auto first = parseInversion();
  if (peek().kind != TK::And) return first;
  auto node = at(std::make_unique<ast::BoolOp>(ast::BoolOperator::And), tok);
  node->values.push_back(std::move(first));
  while (match(TK::And)) { node->values.push_back(parseInversion()); }
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseInversion() {
  const lex::Token tok = peek();
  if (match(TK::Not)) {
    const NestingGuard nested(*this);
    return at(std::make_unique<ast::UnaryExpr>(ast::UnaryOperator::Not, parseInversion()), tok);
  }
  return parseComparison();
}

std::unique_ptr<ast::Expr> Parser::parseComparison() {
  const lex::Token tok = peek();
  auto left = parseBitwiseOr();
  std::unique_ptr<ast::Compare> cmp;
  for (;;) {
    ast::CompareOperator op{};
    switch (peek().kind) {
      case TK::EqEq: op = ast::CompareOperator::Eq; break;
      case TK::NotEq: op = ast::CompareOperator::NotEq; break;
      case TK::Lt: op = ast::CompareOperator::Lt; break;
      case TK::Le: op = ast::CompareOperator::LtE; break;
      case TK::Gt: op = ast::CompareOperator::Gt; break;
      case TK::Ge: op = ast::CompareOperator::GtE; break;
      case TK::In: op = ast::CompareOperator::In; break;
      case TK::Is:
        op = peekNext().kind == TK::Not ? ast::CompareOperator::IsNot : ast::CompareOperator::Is;
        break;
      case TK::Not:
        if (peekNext().kind == TK::In) {
          op = ast::CompareOperator::NotIn;
          break;
        }
        [[fallthrough]];
      default:
        if (cmp) return cmp;
        return left;
    }
    (void)get();
    if (op == ast::CompareOperator::IsNot || op == ast::CompareOperator::NotIn) { (void)get(); }
    if (!cmp) {
      cmp = at(std::make_unique<ast::Compare>(), tok);
      cmp->left = std::move(left);
    }
    cmp->ops.push_back(op);
    cmp->comparators.push_back(parseBitwiseOr());
  }
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseOr() {
  auto lhs = parseBitwiseXor();
  while (match(TK::Pipe)) {
    auto rhs = parseBitwiseXor();
    addChainLink();
    const ast::Node& pos = *lhs;
    lhs = placedLike(std::make_unique<ast::BinaryExpr>(ast::BinaryOperator::BitOr, std::move(lhs), std::move(rhs)), pos);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseXor() {
  auto lhs = parseBitwiseAnd();
  while (match(TK::Caret)) {
    auto rhs = parseBitwiseAnd();
    addChainLink();
    const ast::Node& pos = *lhs;
    lhs = placedLike(std::make_unique<ast::BinaryExpr>(ast::BinaryOperator::BitXor, std::move(lhs), std::move(rhs)), pos);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseAnd() {
  auto lhs = parseShift();
  while (match(TK::Amp)) {
    auto rhs = parseShift();
    addChainLink();
    const ast::Node& pos = *lhs;
    lhs = placedLike(std::make_unique<ast::BinaryExpr>(ast::BinaryOperator::BitAnd, std::move(lhs), std::move(rhs)), pos);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseShift() {
  auto lhs = parseAdditive();
  for (;;) {
    ast::BinaryOperator op{};
    if (peek().kind == TK::LShift) op = ast::BinaryOperator::LShift;
    else if (peek().kind == TK::RShift) op = ast::BinaryOperator::RShift;
    else return lhs;
    (void)get();
    auto rhs = parseAdditive();
    addChainLink();
    const ast::Node& pos = *lhs;
    lhs = placedLike(std::make_unique<ast::BinaryExpr>(op, std::move(lhs), std::move(rhs)), pos);
  }
}

std::unique_ptr<ast::Expr> Parser::parseAdditive() {
  auto lhs = parseMultiplicative();
  for (;;) {
    ast::BinaryOperator op{};
    if (peek().kind == TK::Plus) op = ast::BinaryOperator::Add;
    else if (peek().kind == TK::Minus) op = ast::BinaryOperator::Sub;
    else return lhs;
    (void)get();
    auto rhs = parseMultiplicative();
    addChainLink();
    const ast::Node& pos = *lhs;
    lhs = placedLike(std::make_unique<ast::BinaryExpr>(op, std::move(lhs), std::move(rhs)), pos);
  }
}

std::unique_ptr<ast::Expr> Parser::parseMultiplicative() {
  auto lhs = parseUnary();
  for (;;) {
    ast::BinaryOperator op{};
    switch (peek().kind) {
      case TK::Star: op = ast::BinaryOperator::Mul; break;
      case TK::At: op = ast::BinaryOperator::MatMul; break;
      case TK::Slash: op = ast::BinaryOperator::Div; break;
      case TK::SlashSlash: op = ast::BinaryOperator::FloorDiv; break;
      case TK::Percent: op = ast::BinaryOperator::Mod; break;
      default: return lhs;
    }
    (void)get();
    auto rhs = parseUnary();
    addChainLink();
    const ast::Node& pos = *lhs;
    lhs = placedLike(std::make_unique<ast::BinaryExpr>(op, std::move(lhs), std::move(rhs)), pos);
  }
}

std::unique_ptr<ast::Expr> Parser::parseUnary() {
  const lex::Token tok = peek();
  ast::UnaryOperator op{};
  switch (tok.kind) {
    case TK::Minus: op = ast::UnaryOperator::Neg; break;
    case TK::Plus: op = ast::UnaryOperator::Pos; break;
    case TK::Tilde: op = ast::UnaryOperator::Invert; break;
    default: return parsePower();
  }
  (void)get();
  const NestingGuard nested(*this);
  return at(std::make_unique<ast::UnaryExpr>(op, parseUnary()), tok);
}

std::unique_ptr<ast::Expr> Parser::parsePower() {
  auto base = parseAwaitPrimary();
  if (!match(TK::StarStar)) return base;
  const NestingGuard nested(*this);
  auto exponent = parseUnary();
  const ast::Node& pos = *base;
  return placedLike(std::make_unique<ast::BinaryExpr>(ast::BinaryOperator::Pow, std::move(base), std::move(exponent)), pos);
}

std::unique_ptr<ast::Expr> Parser::parseAwaitPrimary() {
  const lex::Token tok = peek();
  if (match(TK::Await)) {
    return at(std::make_unique<ast::AwaitExpr>(parsePostfix(parseAtom())), tok);
  }
  return parsePostfix(parseAtom());
}

std::unique_ptr<ast::Expr> Parser::parsePostfix(std::unique_ptr<ast::Expr> base) {
  for (;;) {
    const ast::Node& pos = *base;
    if (peek().kind == TK::Dot || peek().kind == TK::LParen || peek().kind == TK::LBracket) { addChainLink(); }
    if (match(TK::Dot)) {
      const auto nameTok = expect(TK::Name, "invalid syntax");
      base = placedLike(std::make_unique<ast::Attribute>(std::move(base), nameTok.text), pos);
    } else if (match(TK::LParen)) {
      auto call = placedLike(std::make_unique<ast::Call>(std::move(base)), pos);
      parseCallArgs(*call);
      base = std::move(call);
    } else if (match(TK::LBracket)) {
      auto slice = parseSlices();
      closeBracket(TK::RBracket);
      base = placedLike(std::make_unique<ast::Subscript>(std::move(base), std::move(slice)), pos);
    } else {
      return base;
    }
  }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::parseCallArgs(ast::Call& call) {
  bool seenKeyword = false;
  bool seenKwUnpack = false;
  while (peek().kind != TK::RParen) {
    const lex::Token tok = peek();
    if (match(TK::Star)) {
      if (seenKwUnpack) { fail("iterable argument unpacking follows keyword argument unpacking", tok); }
      call.args.push_back(at(std::make_unique<ast::Starred>(parseExpression()), tok));
    } else if (match(TK::StarStar)) {
      call.keywords.push_back(ast::KeywordArg{"", parseExpression()});
      seenKwUnpack = true;
    } else if (tok.kind == TK::Name && peekNext().kind == TK::Equal) {
      (void)get();
      (void)get();
      call.keywords.push_back(ast::KeywordArg{tok.text, parseExpression()});
      seenKeyword = true;
    } else {
      auto arg = parseNamedExpression();
      if (peek().kind == TK::Equal) {
        failHere("expression cannot contain assignment, perhaps you meant \"==\"?");
      }
      if (atComprehensionFor()) {
        const bool alone = call.args.empty() && call.keywords.empty();
        auto gen = at(std::make_unique<ast::GeneratorExpr>(), tok);
        gen->elt = std::move(arg);
        gen->fors = parseComprehensionFors();
        if (!alone || peek().kind != TK::RParen) { fail("Generator expression must be parenthesized", tok); }
        arg = std::move(gen);
      }
      if (seenKwUnpack) { fail("positional argument follows keyword argument unpacking", tok); }
      if (seenKeyword) { fail("positional argument follows keyword argument", tok); }
      call.args.push_back(std::move(arg));
    }
    if (!match(TK::Comma)) break;
  }
  closeBracket(TK::RParen);
}

bool Parser::atComprehensionFor() const {
  return peek().kind == TK::For || (peek().kind == TK::Async && peekNext().kind == TK::For);
}

std::vector<ast::ComprehensionFor> Parser::parseComprehensionFors() {
  std::vector<ast::ComprehensionFor> fors;
  while (atComprehensionFor()) {
    ast::ComprehensionFor gen;
    gen.isAsync = match(TK::Async);
    const auto forTok = expect(TK::For, "invalid syntax");
    gen.target = parseStarTargets();
    setTargetContext(*gen.target, TargetUse::Assign, forTok);
    (void)expect(TK::In, "invalid syntax");
    gen.iter = parseDisjunction();
    while (match(TK::If)) { gen.ifs.push_back(parseDisjunction()); }
    fors.push_back(std::move(gen));
  }
  return fors;
}

std::unique_ptr<ast::Expr> Parser::parseStarTargets() {
  const lex::Token tok = peek();
  auto first = parseStarTarget();
  if (peek().kind != TK::Comma) return first;
  auto tuple = at(std::make_unique<ast::TupleLiteral>(), tok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpression(peek().kind)) break;
    tuple->elements.push_back(parseStarTarget());
  }
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseStarTarget() {
  const lex::Token tok = peek();
  if (match(TK::Star)) {
    return at(std::make_unique<ast::Starred>(parseBitwiseOr()), tok);
  }
  return parseBitwiseOr();
}

std::unique_ptr<ast::Expr> Parser::parseSlices() {
  const lex::Token tok = peek();
  auto first = parseSlice();
  if (peek().kind != TK::Comma) return first;
  auto tuple = at(std::make_unique<ast::TupleLiteral>(), tok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) break;
    tuple->elements.push_back(parseSlice());
  }
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseSlice() {
  const lex::Token tok = peek();
  std::unique_ptr<ast::Expr> lower;
  if (tok.kind != TK::Colon) {
    if (match(TK::Star)) {
      return at(std::make_unique<ast::Starred>(parseBitwiseOr()), tok);
    }
    lower = parseNamedExpression();
    if (peek().kind != TK::Colon) return lower;
  }
  auto slice = at(std::make_unique<ast::Slice>(), tok);
  slice->lower = std::move(lower);
  (void)get();
  auto boundary = [this]() {
    const TK kind = peek().kind;
    return kind == TK::Colon || kind == TK::RBracket || kind == TK::Comma;
  };
  if (!boundary()) { slice->upper = parseExpression(); }
  if (match(TK::Colon) && !boundary()) { slice->step = parseExpression(); }
  return slice;
}

std::unique_ptr<ast::Expr> Parser::parseYieldExpr() {
  const auto tok = get();
  auto node = at(std::make_unique<ast::YieldExpr>(), tok);
  if (match(TK::From)) {
    node->isFrom = true;
    node->value = parseExpression();
  } else if (startsExpression(peek().kind)) {
    node->value = parseStarExpressions();
  }
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseAtom() {
  const lex::Token& tok = peek();
  switch (tok.kind) {
    case TK::Name:
      (void)get();
      return at(std::make_unique<ast::Name>(tok.text), tok);
    case TK::True:
      (void)get();
      return at(std::make_unique<ast::Constant>(ast::ConstantKind::True, tok.text), tok);
    case TK::False:
      (void)get();
      return at(std::make_unique<ast::Constant>(ast::ConstantKind::False, tok.text), tok);
    case TK::None:
      (void)get();
      return at(std::make_unique<ast::Constant>(ast::ConstantKind::None, tok.text), tok);
    case TK::Ellipsis:
      (void)get();
      return at(std::make_unique<ast::Constant>(ast::ConstantKind::Ellipsis, tok.text), tok);
    case TK::Int:
      (void)get();
      return at(std::make_unique<ast::Constant>(ast::ConstantKind::Int, tok.text), tok);
    case TK::Float:
      (void)get();
      return at(std::make_unique<ast::Constant>(ast::ConstantKind::Float, tok.text), tok);
    case TK::Imag:
      (void)get();
      return at(std::make_unique<ast::Constant>(ast::ConstantKind::Imag, tok.text), tok);
    case TK::String:
    case TK::Bytes:
    case TK::FString:
      return parseStrings();
    case TK::LParen: {
      const auto open = get();
      return parseParenthesized(open);
    }
    case TK::LBracket: {
      const auto open = get();
      return parseListDisplay(open);
    }
    case TK::LBrace: {
      const auto open = get();
      return parseDictOrSetDisplay(open);
    }
    default:
      failHere("invalid syntax");
  }
}

std::unique_ptr<ast::Expr> Parser::parseParenthesized(const lex::Token& openTok) {
  if (match(TK::RParen)) return at(std::make_unique<ast::TupleLiteral>(), openTok);
  if (peek().kind == TK::Yield) {
    auto yield = parseYieldExpr();
    closeBracket(TK::RParen);
    return yield;
  }
  auto first = parseStarNamedExpression();
  if (atComprehensionFor()) {
    auto gen = at(std::make_unique<ast::GeneratorExpr>(), openTok);
    gen->elt = std::move(first);
    gen->fors = parseComprehensionFors();
    closeBracket(TK::RParen);
    return gen;
  }
  if (peek().kind != TK::Comma) {
    if (first->kind == ast::NodeKind::Starred) { fail("cannot use starred expression here", openTok); }
    closeBracket(TK::RParen);
    return first;
  }
  auto tuple = at(std::make_unique<ast::TupleLiteral>(), openTok);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RParen) break;
    tuple->elements.push_back(parseStarNamedExpression());
  }
  closeBracket(TK::RParen);
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseListDisplay(const lex::Token& openTok) {
  auto list = at(std::make_unique<ast::ListLiteral>(), openTok);
  if (match(TK::RBracket)) return list;
  auto first = parseStarNamedExpression();
  if (atComprehensionFor()) {
    auto comp = at(std::make_unique<ast::ListComp>(), openTok);
    comp->elt = std::move(first);
    comp->fors = parseComprehensionFors();
    closeBracket(TK::RBracket);
    return comp;
  }
  list->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) break;
    list->elements.push_back(parseStarNamedExpression());
  }
  closeBracket(TK::RBracket);
  return list;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseDictOrSetDisplay(const lex::Token& openTok) {
  auto dict = at(std::make_unique<ast::DictLiteral>(), openTok);
  if (match(TK::RBrace)) return dict;

  auto parseDictEntry = [this]() {
    ast::DictEntry entry;
    if (match(TK::StarStar)) {
      entry.value = parseBitwiseOr();
      return entry;
    }
    entry.key = parseExpression();
    (void)expect(TK::Colon, "':' expected after dictionary key");
    entry.value = parseExpression();
    return entry;
  };

  if (peek().kind != TK::StarStar) {
    auto first = parseStarNamedExpression();
    if (!match(TK::Colon)) {
      if (atComprehensionFor()) {
        auto comp = at(std::make_unique<ast::SetComp>(), openTok);
        comp->elt = std::move(first);
        comp->fors = parseComprehensionFors();
        closeBracket(TK::RBrace);
        return comp;
      }
      auto set = at(std::make_unique<ast::SetLiteral>(), openTok);
      set->elements.push_back(std::move(first));
      while (match(TK::Comma)) {
        if (peek().kind == TK::RBrace) break;
        set->elements.push_back(parseStarNamedExpression());
      }
      closeBracket(TK::RBrace);
      return set;
    }
    auto value = parseExpression();
    if (atComprehensionFor()) {
      auto comp = at(std::make_unique<ast::DictComp>(), openTok);
      comp->key = std::move(first);
      comp->value = std::move(value);
      comp->fors = parseComprehensionFors();
      closeBracket(TK::RBrace);
      return comp;
    }
    dict->entries.push_back(ast::DictEntry{std::move(first), std::move(value)});
  } else {
    dict->entries.push_back(parseDictEntry());
  }
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBrace) break;
    dict->entries.push_back(parseDictEntry());
  }
  closeBracket(TK::RBrace);
  return dict;
}

} // namespace agentrun::parse
