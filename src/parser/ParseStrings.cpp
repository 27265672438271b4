/***
 * Name: agentrun::parse::Parser (strings)
 * Purpose: Implicit string concatenation and f-string replacement fields.
 * Theory of Operation:
 *   Adjacent String/Bytes/FString tokens form one literal. Without any
 *   f-string part the result is a Constant holding the joined source text.
 *   Otherwise each f-string body is split into literal text and replacement
 *   fields; every field expression is re-lexed and parsed by a nested Parser
 *   so calls, attributes and names inside it reach the analyzers.
 */
#include <cctype>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "lexer/Lexer.h"
#include "parser/Parser.h"

namespace agentrun::parse {

using TK = lex::TokenKind;

namespace {

bool isQuote(const char chr) { return chr == '\'' || chr == '"'; }

// Text between the quotes of a string token, prefix and quotes removed.
std::string literalBody(const std::string& text) {
  size_t start = 0;
  while (start < text.size() && !isQuote(text[start])) { ++start; }
  if (start >= text.size()) return {};
  const char quote = text[start];
  const bool triple = start + 2 < text.size() && text[start + 1] == quote && text[start + 2] == quote;
  const size_t width = triple ? 3 : 1;
  if (text.size() < start + 2 * width) return {};
  return text.substr(start + width, text.size() - start - 2 * width);
}

bool isBlank(const std::string& text) {
  for (const char chr : text) {
    if (std::isspace(static_cast<unsigned char>(chr)) == 0) return false;
  }
  return true;
}

// Index of the character that ends a replacement field's expression part:
// a top-level '}', '!' (not '!='), ':' or self-documenting '='.
// Returns npos when the body ends first.
size_t scanFieldExpression(const std::string& body, size_t idx) {
  int depth = 0;
  char quote = 0;
  for (; idx < body.size(); ++idx) {
    const char chr = body[idx];
    if (quote != 0) {
      if (chr == '\\') { ++idx; }
      else if (chr == quote) { quote = 0; }
      continue;
    }
    const char nextChr = idx + 1 < body.size() ? body[idx + 1] : '\0';
    switch (chr) {
      case '\'':
      case '"':
        quote = chr;
        break;
      case '(':
      case '[':
      case '{':
        ++depth;
        break;
      case ')':
      case ']':
        --depth;
        break;
      case '}':
        if (depth == 0) return idx;
        --depth;
        break;
      case '!':
        if (depth == 0 && nextChr != '=') return idx;
        break;
      case ':':
        if (depth == 0) return idx;
        break;
      case '=': {
        const char prevChr = idx > 0 ? body[idx - 1] : '\0';
        const bool comparison = nextChr == '=' || prevChr == '=' || prevChr == '!' || prevChr == '<' || prevChr == '>';
        if (depth == 0 && !comparison) return idx;
        break;
      }
      default:
        break;
    }
  }
  return std::string::npos;
}

// End of a format spec: the '}' closing the field, skipping nested fields.
size_t scanFormatSpec(const std::string& body, size_t idx) {
  int depth = 0;
  for (; idx < body.size(); ++idx) {
    if (body[idx] == '{') { ++depth; }
    else if (body[idx] == '}') {
      if (depth == 0) return idx;
      --depth;
    }
  }
  return std::string::npos;
}

} // namespace

std::unique_ptr<ast::Expr> Parser::parseStrings() {
  const lex::Token startTok = peek();
  std::vector<lex::Token> parts;
  bool anyBytes = false;
  bool anyText = false;
  bool anyFString = false;
  while (peek().kind == TK::String || peek().kind == TK::Bytes || peek().kind == TK::FString) {
    const auto tok = get();
    anyBytes = anyBytes || tok.kind == TK::Bytes;
    anyText = anyText || tok.kind != TK::Bytes;
    anyFString = anyFString || tok.kind == TK::FString;
    parts.push_back(tok);
  }
  if (anyBytes && anyText) { fail("cannot mix bytes and nonbytes literals", startTok); }
  if (!anyFString) {
    std::string joined;
    for (const auto& part : parts) {
      if (!joined.empty()) joined += ' ';
      joined += part.text;
    }
    const auto kind = anyBytes ? ast::ConstantKind::Bytes : ast::ConstantKind::String;
    return at(std::make_unique<ast::Constant>(kind, std::move(joined)), startTok);
  }
  auto fstr = at(std::make_unique<ast::FStringLiteral>(), startTok);
  for (const auto& part : parts) {
    if (part.kind == TK::FString) {
      parseFStringBody(literalBody(part.text), part, *fstr);
    } else {
      ast::FStringSegment seg;
      seg.text = literalBody(part.text);
      fstr->parts.push_back(std::move(seg));
    }
  }
  return fstr;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::parseFStringBody(const std::string& body, const lex::Token& tok, ast::FStringLiteral& out) {
  const NestingGuard nested(*this);
  std::string literal;
  auto flush = [&]() {
    if (literal.empty()) return;
    ast::FStringSegment seg;
    seg.text = std::move(literal);
    out.parts.push_back(std::move(seg));
    literal.clear();
  };
  size_t idx = 0;
  while (idx < body.size()) {
    const char chr = body[idx];
    if (chr == '}') {
      if (idx + 1 < body.size() && body[idx + 1] == '}') {
        literal += '}';
        idx += 2;
        continue;
      }
      fail("f-string: single '}' is not allowed", tok);
    }
    if (chr != '{') {
      literal += chr;
      ++idx;
      continue;
    }
    if (idx + 1 < body.size() && body[idx + 1] == '{') {
      literal += '{';
      idx += 2;
      continue;
    }
    flush();
    size_t end = scanFieldExpression(body, idx + 1);
    if (end == std::string::npos) { fail("f-string: expecting '}'", tok); }
    const std::string exprText = body.substr(idx + 1, end - idx - 1);
    if (isBlank(exprText)) { fail("f-string: valid expression required before '" + std::string(1, body[end]) + "'", tok); }

    ast::FStringSegment seg;
    seg.isExpr = true;
    seg.expr = parseFieldExpression(exprText, tok);
    if (body[end] == '=') { ++end; }
    if (end < body.size() && body[end] == '!') {
      const char conversion = end + 1 < body.size() ? body[end + 1] : '\0';
      if (conversion != 's' && conversion != 'r' && conversion != 'a') {
        fail(std::string("f-string: invalid conversion character '") + conversion + "': expected 's', 'r', or 'a'", tok);
      }
      seg.conversion = conversion;
      end += 2;
    }
    if (end < body.size() && body[end] == ':') {
      const size_t specEnd = scanFormatSpec(body, end + 1);
      if (specEnd == std::string::npos) { fail("f-string: expecting '}'", tok); }
      seg.formatSpec = std::make_unique<ast::FStringLiteral>();
      seg.formatSpec->line = tok.line;
      seg.formatSpec->col = tok.col;
      parseFStringBody(body.substr(end + 1, specEnd - end - 1), tok, *seg.formatSpec);
      end = specEnd;
    }
    if (end >= body.size() || body[end] != '}') { fail("f-string: expecting '}'", tok); }
    out.parts.push_back(std::move(seg));
    idx = end + 1;
  }
  flush();
}

std::unique_ptr<ast::Expr> Parser::parseFieldExpression(const std::string& text, const lex::Token& tok) {
  // Leading newlines keep node lines aligned with the enclosing source.
  std::string source(tok.line > 1 ? static_cast<size_t>(tok.line - 1) : 0, '\n');
  source += '(';
  source += text;
  source += ')';
  lex::Lexer lexer;
  lexer.pushString(source, tok.file);
  Parser nested(lexer);
  nested.nesting_ = nesting_;
  nested.chainLinks_ = chainLinks_;
  auto expr = nested.parseStandaloneExpression();
  chainLinks_ = nested.chainLinks_;
  return expr;
}

} // namespace agentrun::parse
