/***
 * Name: agentrun::parse::Parser (match statements)
 * Purpose: Soft-keyword match/case statements and structural patterns.
 * Theory of Operation:
 *   A line starting with the name 'match' is a match statement only when a
 *   subject expression, ':' and NEWLINE follow; otherwise the parser rewinds
 *   and treats 'match' as an ordinary identifier.
 */
#include <memory>
#include <string>
#include <utility>
#include "agentrun/exceptions/parse_error.h"
#include "parser/Parser.h"

namespace agentrun::parse {

using TK = lex::TokenKind;

std::unique_ptr<ast::Stmt> Parser::tryParseMatchStmt() {
  const size_t saved = pos_;
  const int savedLinks = chainLinks_;
  const auto matchTok = get();
  std::unique_ptr<ast::Expr> subject;
  try {
    const lex::Token subjectTok = peek();
    subject = parseStarNamedExpression();
    if (peek().kind == TK::Comma) {
      auto tuple = at(std::make_unique<ast::TupleLiteral>(), subjectTok);
      tuple->elements.push_back(std::move(subject));
      while (match(TK::Comma)) {
        if (peek().kind == TK::Colon) break;
        tuple->elements.push_back(parseStarNamedExpression());
      }
      subject = std::move(tuple);
    }
  } catch (const exceptions::ParseError&) {
    subject.reset();
  }
  if (!subject || peek().kind != TK::Colon || peekNext().kind != TK::Newline) {
    pos_ = saved;
    chainLinks_ = savedLinks;
    return nullptr;
  }
  (void)get();
  (void)get();
  auto stmt = at(std::make_unique<ast::MatchStmt>(), matchTok);
  stmt->subject = std::move(subject);
  if (peek().kind != TK::Indent) {
    failHere("expected an indented block after 'match' statement on line " + std::to_string(matchTok.line));
  }
  (void)get();
  while (peek().kind != TK::Dedent && peek().kind != TK::End) {
    if (match(TK::Newline)) continue;
    if (!atSoftKeyword("case")) { failHere("invalid syntax"); }
    stmt->cases.push_back(parseMatchCase());
  }
  (void)match(TK::Dedent);
  return stmt;
}

std::unique_ptr<ast::MatchCase> Parser::parseMatchCase() {
  const auto caseTok = get();
  auto mc = at(std::make_unique<ast::MatchCase>(), caseTok);
  mc->pattern = parsePatternTop();
  if (match(TK::If)) { mc->guard = parseNamedExpression(); }
  parseBlockInto(mc->body, "'case' statement", caseTok.line);
  return mc;
}

std::unique_ptr<ast::Pattern> Parser::parsePatternTop() {
  const lex::Token tok = peek();
  auto element = [this]() -> std::unique_ptr<ast::Pattern> {
    const lex::Token starTok = peek();
    if (match(TK::Star)) {
      const auto nameTok = expect(TK::Name, "invalid syntax");
      return at(std::make_unique<ast::PatternStar>(nameTok.text), starTok);
    }
    return parsePattern();
  };
  auto first = element();
  if (peek().kind != TK::Comma) return first;
  auto seq = at(std::make_unique<ast::PatternSequence>(), tok);
  seq->isList = false;
  seq->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::Colon || peek().kind == TK::If) break;
    seq->elements.push_back(element());
  }
  return seq;
}

std::unique_ptr<ast::Pattern> Parser::parsePattern() {
  const lex::Token tok = peek();
  auto pattern = parsePatternOr();
  if (!match(TK::As)) return pattern;
  const lex::Token nameTok = peek();
  if (nameTok.kind != TK::Name) { failHere("invalid pattern target"); }
  if (nameTok.text == "_") { failHere("cannot use '_' as a target"); }
  (void)get();
  return at(std::make_unique<ast::PatternAs>(std::move(pattern), nameTok.text), tok);
}

std::unique_ptr<ast::Pattern> Parser::parsePatternOr() {
  const lex::Token tok = peek();
  auto first = parseClosedPattern();
  if (peek().kind != TK::Pipe) return first;
  auto alt = at(std::make_unique<ast::PatternOr>(), tok);
  alt->patterns.push_back(std::move(first));
  while (match(TK::Pipe)) { alt->patterns.push_back(parseClosedPattern()); }
  return alt;
}

std::unique_ptr<ast::Expr> Parser::parseSignedNumber() {
  const lex::Token tok = peek();
  const bool negative = match(TK::Minus);
  const lex::Token numTok = peek();
  if (numTok.kind != TK::Int && numTok.kind != TK::Float && numTok.kind != TK::Imag) { failHere("invalid syntax"); }
  std::unique_ptr<ast::Expr> value = parseAtom();
  if (negative) { value = at(std::make_unique<ast::UnaryExpr>(ast::UnaryOperator::Neg, std::move(value)), tok); }
  if ((peek().kind == TK::Plus || peek().kind == TK::Minus) && peekNext().kind == TK::Imag) {
    const auto opTok = get();
    const auto op = opTok.kind == TK::Plus ? ast::BinaryOperator::Add : ast::BinaryOperator::Sub;
    auto imag = parseAtom();
    value = at(std::make_unique<ast::BinaryExpr>(op, std::move(value), std::move(imag)), tok);
  }
  return value;
}

std::unique_ptr<ast::Expr> Parser::parsePatternValueExpr() {
  const auto nameTok = expect(TK::Name, "invalid syntax");
  std::unique_ptr<ast::Expr> value = at(std::make_unique<ast::Name>(nameTok.text), nameTok);
  while (match(TK::Dot)) {
    const auto attrTok = expect(TK::Name, "invalid syntax");
    value = at(std::make_unique<ast::Attribute>(std::move(value), attrTok.text), nameTok);
  }
  return value;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Pattern> Parser::parseClosedPattern() {
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Minus:
    case TK::Int:
    case TK::Float:
    case TK::Imag:
      return at(std::make_unique<ast::PatternValue>(parseSignedNumber()), tok);
    case TK::String:
    case TK::Bytes:
    case TK::FString:
    case TK::None:
    case TK::True:
    case TK::False:
      return at(std::make_unique<ast::PatternValue>(parseAtom()), tok);
    case TK::LParen: {
      (void)get();
      if (peek().kind == TK::RParen) { return parseSequencePattern(TK::RParen, false, tok); }
      if (peek().kind == TK::Star) { return parseSequencePattern(TK::RParen, false, tok); }
      auto inner = parsePattern();
      if (peek().kind == TK::Comma) {
        auto seq = parseSequencePattern(TK::RParen, false, tok);
        auto& elements = static_cast<ast::PatternSequence&>(*seq).elements;
        elements.insert(elements.begin(), std::move(inner));
        return seq;
      }
      closeBracket(TK::RParen);
      return inner;
    }
    case TK::LBracket:
      (void)get();
      return parseSequencePattern(TK::RBracket, true, tok);
    case TK::LBrace:
      (void)get();
      return parseMappingPattern(tok);
    case TK::Name: {
      if (peekNext().kind != TK::Dot && peekNext().kind != TK::LParen) {
        (void)get();
        return at(std::make_unique<ast::PatternCapture>(tok.text), tok);
      }
      auto value = parsePatternValueExpr();
      if (!match(TK::LParen)) {
        return at(std::make_unique<ast::PatternValue>(std::move(value)), tok);
      }
      auto cls = at(std::make_unique<ast::PatternClass>(std::move(value)), tok);
      while (peek().kind != TK::RParen) {
        if (peek().kind == TK::Name && peekNext().kind == TK::Equal) {
          const auto kwTok = get();
          (void)get();
          cls->kwargs.emplace_back(kwTok.text, parsePattern());
        } else {
          if (!cls->kwargs.empty()) { failHere("positional patterns follow keyword patterns"); }
          cls->args.push_back(parsePattern());
        }
        if (!match(TK::Comma)) break;
      }
      closeBracket(TK::RParen);
      return cls;
    }
    default:
      failHere("invalid syntax");
  }
}

// Elements up to the closer; the opening bracket is already consumed, and a
// leading element may already have been parsed by the caller.
std::unique_ptr<ast::Pattern> Parser::parseSequencePattern(const TK closer, const bool isList, const lex::Token& openTok) {
  auto seq = at(std::make_unique<ast::PatternSequence>(), openTok);
  seq->isList = isList;
  (void)match(TK::Comma);
  while (peek().kind != closer) {
    const lex::Token tok = peek();
    if (match(TK::Star)) {
      const auto nameTok = expect(TK::Name, "invalid syntax");
      seq->elements.push_back(at(std::make_unique<ast::PatternStar>(nameTok.text), tok));
    } else {
      seq->elements.push_back(parsePattern());
    }
    if (!match(TK::Comma)) break;
  }
  closeBracket(closer);
  return seq;
}

std::unique_ptr<ast::Pattern> Parser::parseMappingPattern(const lex::Token& openTok) {
  auto mapping = at(std::make_unique<ast::PatternMapping>(), openTok);
  while (peek().kind != TK::RBrace) {
    if (match(TK::StarStar)) {
      mapping->restName = expect(TK::Name, "invalid syntax").text;
      (void)match(TK::Comma);
      break;
    }
    std::unique_ptr<ast::Expr> key;
    switch (peek().kind) {
      case TK::Minus:
      case TK::Int:
      case TK::Float:
      case TK::Imag:
        key = parseSignedNumber();
        break;
      case TK::Name:
        key = parsePatternValueExpr();
        break;
      default:
        key = parseAtom();
        break;
    }
    (void)expect(TK::Colon, "invalid syntax");
    mapping->items.emplace_back(std::move(key), parsePattern());
    if (!match(TK::Comma)) break;
  }
  closeBracket(TK::RBrace);
  return mapping;
}

} // namespace agentrun::parse
