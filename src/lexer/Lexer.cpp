/***
 * Name: agentrun::lex::Lexer
 * Purpose: Tokenize Python 3.12 source into a single token stream.
 */
#include "lexer/Lexer.h"

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include "agentrun/exceptions/parse_error.h"

namespace agentrun::lex {

namespace {

struct Keyword {
  std::string_view text;
  TokenKind kind;
};

constexpr Keyword kKeywords[] = {
    {"False", TokenKind::False},     {"None", TokenKind::None},         {"True", TokenKind::True},
    {"and", TokenKind::And},         {"as", TokenKind::As},             {"assert", TokenKind::Assert},
    {"async", TokenKind::Async},     {"await", TokenKind::Await},       {"break", TokenKind::Break},
    {"class", TokenKind::Class},     {"continue", TokenKind::Continue}, {"def", TokenKind::Def},
    {"del", TokenKind::Del},         {"elif", TokenKind::Elif},         {"else", TokenKind::Else},
    {"except", TokenKind::Except},   {"finally", TokenKind::Finally},   {"for", TokenKind::For},
    {"from", TokenKind::From},       {"global", TokenKind::Global},     {"if", TokenKind::If},
    {"import", TokenKind::Import},   {"in", TokenKind::In},             {"is", TokenKind::Is},
    {"lambda", TokenKind::Lambda},   {"nonlocal", TokenKind::Nonlocal}, {"not", TokenKind::Not},
    {"or", TokenKind::Or},           {"pass", TokenKind::Pass},         {"raise", TokenKind::Raise},
    {"return", TokenKind::Return},   {"try", TokenKind::Try},           {"while", TokenKind::While},
    {"with", TokenKind::With},       {"yield", TokenKind::Yield},
};

struct Operator {
  std::string_view text;
  TokenKind kind;
};

// Longest operators first so a linear scan yields the maximal munch.
constexpr Operator kOperators[] = {
    {"**=", TokenKind::StarStarEqual}, {"//=", TokenKind::SlashSlashEqual},
    {">>=", TokenKind::RShiftEqual},   {"<<=", TokenKind::LShiftEqual},
    {"...", TokenKind::Ellipsis},      {"->", TokenKind::Arrow},
    {":=", TokenKind::ColonEqual},     {"==", TokenKind::EqEq},
    {"!=", TokenKind::NotEq},          {"<=", TokenKind::Le},
    {">=", TokenKind::Ge},             {"**", TokenKind::StarStar},
    {"//", TokenKind::SlashSlash},     {"<<", TokenKind::LShift},
    {">>", TokenKind::RShift},         {"+=", TokenKind::PlusEqual},
    {"-=", TokenKind::MinusEqual},     {"*=", TokenKind::StarEqual},
    {"/=", TokenKind::SlashEqual},     {"%=", TokenKind::PercentEqual},
    {"@=", TokenKind::AtEqual},        {"&=", TokenKind::AmpEqual},
    {"|=", TokenKind::PipeEqual},      {"^=", TokenKind::CaretEqual},
    {"(", TokenKind::LParen},          {")", TokenKind::RParen},
    {"[", TokenKind::LBracket},        {"]", TokenKind::RBracket},
    {"{", TokenKind::LBrace},          {"}", TokenKind::RBrace},
    {":", TokenKind::Colon},           {",", TokenKind::Comma},
    {";", TokenKind::Semicolon},       {".", TokenKind::Dot},
    {"@", TokenKind::At},              {"=", TokenKind::Equal},
    {"!", TokenKind::Exclamation},     {"+", TokenKind::Plus},
    {"-", TokenKind::Minus},           {"*", TokenKind::Star},
    {"/", TokenKind::Slash},           {"%", TokenKind::Percent},
    {"&", TokenKind::Amp},             {"|", TokenKind::Pipe},
    {"^", TokenKind::Caret},           {"~", TokenKind::Tilde},
    {"<", TokenKind::Lt},              {">", TokenKind::Gt},
};

constexpr int kTabWidth = 8;
// CPython's tokenizer limits: MAXLEVEL open brackets, MAXINDENT indent levels.
constexpr std::size_t kMaxBracketDepth = 200;
constexpr std::size_t kMaxIndentDepth = 100;

bool isAsciiIdentStart(const char chr) {
  return (std::isalpha(static_cast<unsigned char>(chr)) != 0) || chr == '_';
}
bool isAsciiIdentChar(const char chr) {
  return (std::isalnum(static_cast<unsigned char>(chr)) != 0) || chr == '_';
}
bool isDigit(const char chr) { return std::isdigit(static_cast<unsigned char>(chr)) != 0; }
bool isQuote(const char chr) { return chr == '\'' || chr == '"'; }

// Decode one UTF-8 code point; cp < 0 on malformed input.
UChar32 decodeAt(const std::string& text, const size_t idx, size_t& length) {
  auto offset = static_cast<int32_t>(idx);
  const auto size = static_cast<int32_t>(text.size());
  UChar32 cp = 0;
  U8_NEXT(reinterpret_cast<const uint8_t*>(text.data()), offset, size, cp);  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
  length = static_cast<size_t>(offset) - idx;
  return cp;
}

// Valid string prefixes, case-insensitive: r u b br rb f fr rf
TokenKind prefixKind(std::string_view word, bool& valid) {
  valid = false;
  if (word.empty() || word.size() > 2) { return TokenKind::String; }
  bool hasB = false; bool hasR = false; bool hasF = false; bool hasU = false;
  for (const char chr : word) {
    switch (std::tolower(static_cast<unsigned char>(chr))) {
      case 'b': if (hasB) return TokenKind::String; hasB = true; break;
      case 'r': if (hasR) return TokenKind::String; hasR = true; break;
      case 'f': if (hasF) return TokenKind::String; hasF = true; break;
      case 'u': if (hasU) return TokenKind::String; hasU = true; break;
      default: return TokenKind::String;
    }
  }
  if (hasU && word.size() != 1) { return TokenKind::String; }
  if (hasB && hasF) { return TokenKind::String; }
  valid = true;
  if (hasB) { return TokenKind::Bytes; }
  if (hasF) { return TokenKind::FString; }
  return TokenKind::String;
}

// str.isprintable() for one code point: no control, format, separator
// (other than ' '), surrogate, private-use or unassigned characters.
bool isPrintable(const UChar32 cp) {
  if (cp == ' ') { return true; }
  switch (u_charType(cp)) {
    case U_CONTROL_CHAR:
    case U_FORMAT_CHAR:
    case U_SPACE_SEPARATOR:
    case U_LINE_SEPARATOR:
    case U_PARAGRAPH_SEPARATOR:
    case U_SURROGATE:
    case U_PRIVATE_USE_CHAR:
    case U_UNASSIGNED:
      return false;
    default:
      return true;
  }
}

std::string codePointLabel(const UChar32 cp) {
  std::array<char, 16> code{};
  std::snprintf(code.data(), code.size(), "U+%04X", static_cast<unsigned>(cp));
  return code.data();
}

char closerFor(const char open) {
  switch (open) {
    case '(': return ')';
    case '[': return ']';
    default: return '}';
  }
}

} // namespace

void Lexer::pushString(const std::string& text, const std::string& name) {
  sources_.push_back(Source{text, name});
  finalized_ = false;
  tokens_.clear();
  pos_ = 0;
}

void Lexer::fail(const State& state, const std::string& msg, const int line, const int col) {
  throw exceptions::ParseError(msg, state.src->name, line, col);
}

void Lexer::emit(State& state, const TokenKind kind, const size_t start, const size_t end,
                 const int line, const int col) {
  Token tok;
  tok.kind = kind;
  tok.text = state.src->text.substr(start, end - start);
  tok.file = state.src->name;
  tok.line = line;
  tok.col = col;
  tokens_.push_back(std::move(tok));
}

void Lexer::newline(State& state) {
  const std::string& text = state.src->text;
  if (text[state.index] == '\r' && state.index + 1 < text.size() && text[state.index + 1] == '\n') {
    ++state.index;
  }
  ++state.index;
  ++state.line;
  state.lineStart = state.index;
  state.atLineStart = state.brackets.empty();
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
bool Lexer::handleIndentation(State& state) {
  const std::string& text = state.src->text;
  int width = 0;
  size_t idx = state.index;
  while (idx < text.size()) {
    const char chr = text[idx];
    if (chr == ' ') { ++width; }
    else if (chr == '\t') { width = (width / kTabWidth + 1) * kTabWidth; }
    else if (chr == '\f') { width = 0; }
    else { break; }
    ++idx;
  }
  state.index = idx;
  if (idx >= text.size()) { return false; }
  const char chr = text[idx];
  if (chr == '#') {
    while (state.index < text.size() && text[state.index] != '\n' && text[state.index] != '\r') { ++state.index; }
    if (state.index >= text.size()) { return false; }
    newline(state);
    return true;
  }
  if (chr == '\n' || chr == '\r') {
    newline(state);
    return true;
  }
  state.atLineStart = false;
  const int col = static_cast<int>(idx - state.lineStart) + 1;
  if (width > state.indentStack.back()) {
    if (state.indentStack.size() >= kMaxIndentDepth) {
      fail(state, "too many levels of indentation", state.line, col);
    }
    state.indentStack.push_back(width);
    emit(state, TokenKind::Indent, idx, idx, state.line, col);
    return true;
  }
  while (width < state.indentStack.back()) {
    state.indentStack.pop_back();
    emit(state, TokenKind::Dedent, idx, idx, state.line, col);
  }
  if (width != state.indentStack.back()) {
    fail(state, "unindent does not match any outer indentation level", state.line, col);
  }
  return true;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Lexer::scanString(State& state, const size_t start, const TokenKind kind) {
  const std::string& text = state.src->text;
  const int startLine = state.line;
  const int startCol = static_cast<int>(start - state.lineStart) + 1;
  size_t quotePos = start;
  while (!isQuote(text[quotePos])) { ++quotePos; }
  const char quote = text[quotePos];
  const bool triple = quotePos + 2 < text.size() && text[quotePos + 1] == quote && text[quotePos + 2] == quote;
  size_t idx = quotePos + (triple ? 3 : 1);
  for (;;) {
    if (idx >= text.size()) {
      if (triple) {
        fail(state, "unterminated triple-quoted string literal (detected at line " + std::to_string(state.line) + ")",
             startLine, startCol);
      }
      fail(state, "unterminated string literal (detected at line " + std::to_string(state.line) + ")",
           startLine, startCol);
    }
    const char chr = text[idx];
    if (chr == '\\') {
      if (idx + 1 < text.size() && (text[idx + 1] == '\n' || text[idx + 1] == '\r')) {
        state.index = idx + 1;
        newline(state);
        state.atLineStart = false;
        idx = state.index;
        continue;
      }
      idx += 2;
      continue;
    }
    if (chr == '\n' || chr == '\r') {
      if (!triple) {
        fail(state, "unterminated string literal (detected at line " + std::to_string(state.line) + ")",
             startLine, startCol);
      }
      state.index = idx;
      newline(state);
      state.atLineStart = false;
      idx = state.index;
      continue;
    }
    if (chr == quote) {
      if (!triple) { ++idx; break; }
      if (idx + 2 < text.size() && text[idx + 1] == quote && text[idx + 2] == quote) { idx += 3; break; }
    }
    ++idx;
  }
  state.index = idx;
  emit(state, kind, start, idx, startLine, startCol);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Lexer::scanNumber(State& state) {
  const std::string& text = state.src->text;
  const size_t start = state.index;
  const int col = static_cast<int>(start - state.lineStart) + 1;
  size_t idx = start;
  auto digitsWhile = [&](auto accept) {
    bool have = false;
    while (idx < text.size()) {
      const char chr = text[idx];
      if (accept(chr)) { have = true; ++idx; continue; }
      if (chr == '_' && have && idx + 1 < text.size() && accept(text[idx + 1])) { ++idx; continue; }
      break;
    }
    return have;
  };
  auto decimal = [](const char chr) { return isDigit(chr); };
  if (text[idx] == '0' && idx + 1 < text.size()) {
    const char base = static_cast<char>(std::tolower(static_cast<unsigned char>(text[idx + 1])));
    if (base == 'x' || base == 'o' || base == 'b') {
      idx += 2;
      bool ok = false;
      if (base == 'x') { ok = digitsWhile([](const char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }); }
      else if (base == 'o') { ok = digitsWhile([](const char c) { return c >= '0' && c <= '7'; }); }
      else { ok = digitsWhile([](const char c) { return c == '0' || c == '1'; }); }
      if (!ok) {
        const char* name = base == 'x' ? "hexadecimal" : (base == 'o' ? "octal" : "binary");
        fail(state, std::string("invalid ") + name + " literal", state.line, col);
      }
      state.index = idx;
      emit(state, TokenKind::Int, start, idx, state.line, col);
      return;
    }
  }
  TokenKind kind = TokenKind::Int;
  if (text[idx] != '.') { digitsWhile(decimal); }
  if (idx < text.size() && text[idx] == '.') {
    kind = TokenKind::Float;
    ++idx;
    digitsWhile(decimal);
  }
  if (idx < text.size() && (text[idx] == 'e' || text[idx] == 'E')) {
    size_t save = idx;
    ++idx;
    if (idx < text.size() && (text[idx] == '+' || text[idx] == '-')) { ++idx; }
    if (digitsWhile(decimal)) { kind = TokenKind::Float; }
    else { idx = save; }
  }
  if (idx < text.size() && (text[idx] == 'j' || text[idx] == 'J')) {
    kind = TokenKind::Imag;
    ++idx;
  }
  if (idx < text.size() && isAsciiIdentStart(text[idx]) && kind != TokenKind::Imag) {
    // Keywords may follow a literal directly ("1if x else 2"); identifiers may not.
    size_t end = idx;
    while (end < text.size() && isAsciiIdentChar(text[end])) { ++end; }
    const std::string_view word(text.data() + idx, end - idx);
    bool keyword = false;
    for (const auto& entry : kKeywords) { if (entry.text == word) { keyword = true; break; } }
    if (!keyword) { fail(state, "invalid decimal literal", state.line, col); }
  }
  state.index = idx;
  emit(state, kind, start, idx, state.line, col);
}

void Lexer::scanIdentifier(State& state) {
  const std::string& text = state.src->text;
  const size_t start = state.index;
  const int col = static_cast<int>(start - state.lineStart) + 1;
  size_t idx = start;
  while (idx < text.size()) {
    const char chr = text[idx];
    if (isAsciiIdentChar(chr)) { ++idx; continue; }
    if (static_cast<unsigned char>(chr) < 0x80) { break; }
    size_t length = 0;
    const UChar32 cp = decodeAt(text, idx, length);
    if (cp < 0 || !u_hasBinaryProperty(cp, UCHAR_XID_CONTINUE)) { break; }
    idx += length;
  }
  const std::string_view word(text.data() + start, idx - start);
  if (idx < text.size() && isQuote(text[idx])) {
    bool valid = false;
    const TokenKind kind = prefixKind(word, valid);
    if (valid) {
      state.index = start;
      scanString(state, start, kind);
      return;
    }
  }
  TokenKind kind = TokenKind::Name;
  for (const auto& entry : kKeywords) {
    if (entry.text == word) { kind = entry.kind; break; }
  }
  state.index = idx;
  emit(state, kind, start, idx, state.line, col);
}

bool Lexer::scanOperator(State& state) {
  const std::string& text = state.src->text;
  const size_t start = state.index;
  const int col = static_cast<int>(start - state.lineStart) + 1;
  const std::string_view rest(text.data() + start, text.size() - start);
  for (const auto& entry : kOperators) {
    if (rest.substr(0, entry.text.size()) != entry.text) { continue; }
    const char chr = entry.text.front();
    if (entry.text.size() == 1 && (chr == '(' || chr == '[' || chr == '{')) {
      if (state.brackets.size() >= kMaxBracketDepth) {
        fail(state, "too many nested parentheses", state.line, col);
      }
      state.brackets.push_back(Bracket{chr, state.line, col});
    } else if (entry.text.size() == 1 && (chr == ')' || chr == ']' || chr == '}')) {
      if (state.brackets.empty()) {
        fail(state, std::string("unmatched '") + chr + "'", state.line, col);
      }
      const Bracket open = state.brackets.back();
      if (closerFor(open.open) != chr) {
        std::string msg = std::string("closing parenthesis '") + chr + "' does not match opening parenthesis '" + open.open + "'";
        if (open.line != state.line) { msg += " on line " + std::to_string(open.line); }
        fail(state, msg, state.line, col);
      }
      state.brackets.pop_back();
    }
    state.index = start + entry.text.size();
    emit(state, entry.kind, start, state.index, state.line, col);
    return true;
  }
  return false;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Lexer::scanSource(const Source& src) {
  State state;
  state.src = &src;
  const std::string& text = src.text;
  bool lineHasTokens = false;
  for (;;) {
    if (state.atLineStart && state.brackets.empty()) {
      if (!handleIndentation(state)) { break; }
      continue;
    }
    if (state.index >= text.size()) { break; }
    const char chr = text[state.index];
    const int col = static_cast<int>(state.index - state.lineStart) + 1;
    if (chr == ' ' || chr == '\t' || chr == '\f') { ++state.index; continue; }
    if (chr == '#') {
      while (state.index < text.size() && text[state.index] != '\n' && text[state.index] != '\r') { ++state.index; }
      continue;
    }
    if (chr == '\n' || chr == '\r') {
      if (state.brackets.empty() && lineHasTokens) {
        emit(state, TokenKind::Newline, state.index, state.index, state.line, col);
        lineHasTokens = false;
      }
      newline(state);
      continue;
    }
    if (chr == '\\') {
      if (state.index + 1 >= text.size()) { fail(state, "unexpected EOF while parsing", state.line, col); }
      const char after = text[state.index + 1];
      if (after != '\n' && after != '\r') {
        fail(state, "unexpected character after line continuation character", state.line, col);
      }
      ++state.index;
      newline(state);
      state.atLineStart = false;
      continue;
    }
    lineHasTokens = true;
    if (isDigit(chr) || (chr == '.' && state.index + 1 < text.size() && isDigit(text[state.index + 1]))) {
      scanNumber(state);
      continue;
    }
    if (isAsciiIdentStart(chr)) {
      scanIdentifier(state);
      continue;
    }
    if (isQuote(chr)) {
      scanString(state, state.index, TokenKind::String);
      continue;
    }
    if (static_cast<unsigned char>(chr) >= 0x80) {
      size_t length = 0;
      const UChar32 cp = decodeAt(text, state.index, length);
      if (cp >= 0 && u_hasBinaryProperty(cp, UCHAR_XID_START)) {
        scanIdentifier(state);
        continue;
      }
      if (cp >= 0 && !isPrintable(cp)) {
        fail(state, "invalid non-printable character " + codePointLabel(cp), state.line, col);
      }
      fail(state, "invalid character '" + text.substr(state.index, length == 0 ? 1 : length) + "' (" +
                      codePointLabel(cp < 0 ? 0xFFFD : cp) + ")",
           state.line, col);
    }
    if (static_cast<unsigned char>(chr) < 0x20 || chr == 0x7f) {
      fail(state, "invalid non-printable character " + codePointLabel(static_cast<unsigned char>(chr)), state.line, col);
    }
    if (scanOperator(state)) { continue; }
    fail(state, "invalid syntax", state.line, col);
  }
  if (!state.brackets.empty()) {
    const Bracket& open = state.brackets.back();
    fail(state, std::string("'") + open.open + "' was never closed", open.line, open.col);
  }
  const int col = static_cast<int>(state.index - state.lineStart) + 1;
  if (lineHasTokens) {
    emit(state, TokenKind::Newline, state.index, state.index, state.line, col);
  }
  while (state.indentStack.size() > 1) {
    state.indentStack.pop_back();
    emit(state, TokenKind::Dedent, state.index, state.index, state.line, col);
  }
}

void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  tokens_.clear();
  for (const auto& src : sources_) { scanSource(src); }
  Token eof;
  eof.kind = TokenKind::End;
  eof.file = sources_.empty() ? std::string{} : sources_.back().name;
  eof.line = tokens_.empty() ? 1 : tokens_.back().line;
  eof.col = tokens_.empty() ? 1 : tokens_.back().col;
  tokens_.push_back(eof);
}

const Token& Lexer::peek(size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

} // namespace agentrun::lex
