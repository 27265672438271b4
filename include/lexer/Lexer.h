/**
 * Name: agentrun::lex::Lexer
 * Purpose: Tokenize Python source into a finite token stream.
 * Theory of Operation:
 *   Sources are tokenized eagerly on first access. Indentation is tracked with
 *   a stack of column widths; NEWLINE/INDENT/DEDENT are suppressed while any
 *   bracket is open. Lexical errors throw exceptions::ParseError carrying the
 *   CPython wording of the equivalent tokenizer error.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "lexer/Token.h"

namespace agentrun::lex {

class Lexer : public ITokenStream {
public:
    Lexer() = default;

    void pushString(const std::string& text, const std::string& name);

    // ITokenStream
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    std::vector<Token> tokens();

private:
    struct Source {
        std::string text;
        std::string name;
    };

    struct Bracket {
        char open;
        int line;
        int col;
    };

    struct State {
        const Source* src{nullptr};
        size_t index{0};
        int line{1};
        size_t lineStart{0}; // index of first byte of current physical line
        bool atLineStart{true};
        std::vector<int> indentStack{0};
        std::vector<Bracket> brackets{};
    };

    bool finalized_{false};
    std::vector<Source> sources_{};
    std::vector<Token> tokens_{};
    size_t pos_{0};

    void buildAll();
    void scanSource(const Source& src);

    // helpers (all advance state.index)
    bool handleIndentation(State& state);
    void scanString(State& state, size_t start, TokenKind kind);
    void scanNumber(State& state);
    void scanIdentifier(State& state);
    bool scanOperator(State& state);
    void newline(State& state);
    void emit(State& state, TokenKind kind, size_t start, size_t end, int line, int col);

    [[noreturn]] static void fail(const State& state, const std::string& msg, int line, int col);
};

} // namespace agentrun::lex
