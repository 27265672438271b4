/**
 * Name: agentrun::lex::Token, agentrun::lex::ITokenStream
 * Purpose: A lexed token with its source position, and the pull interface
 *   the parser reads tokens through.
 */
#pragma once

#include <cstddef>
#include <string>
#include "lexer/TokenKind.h"

namespace agentrun::lex {

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // raw source slice; string literals keep prefix and quotes
    std::string file{};
    int line{1};
    int col{1}; // 1-based byte offset within the line
};

class ITokenStream {
public:
    virtual ~ITokenStream() = default;

    // Token k positions ahead without consuming; End repeats past the last token.
    virtual const Token& peek(size_t k = 0) = 0;
    virtual Token next() = 0;
};

} // namespace agentrun::lex
