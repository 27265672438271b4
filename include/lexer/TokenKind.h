/**
 * Name: agentrun::lex::TokenKind
 * Purpose: Token kinds for the Python 3.12 lexer.
 */
#pragma once

namespace agentrun::lex {

enum class TokenKind {
    End, // EOF
    Newline, // end of logical line
    Indent, // indentation increase
    Dedent, // indentation decrease

    Name, // identifier (includes soft keywords match/case/type/_)
    Int, // integer literal
    Float, // float literal
    Imag, // imaginary numeric (e.g., 1j)
    String, // '...', r'...', u'...'
    Bytes, // b'...'
    FString, // f'...'

    // keywords
    False, True, None,
    And, As, Assert, Async, Await, Break, Class, Continue, Def, Del,
    Elif, Else, Except, Finally, For, From, Global, If, Import, In, Is,
    Lambda, Nonlocal, Not, Or, Pass, Raise, Return, Try, While, With, Yield,

    // delimiters
    LParen, RParen, LBracket, RBracket, LBrace, RBrace,
    Colon, Comma, Semicolon, Dot, Ellipsis, Arrow, At, Equal, ColonEqual,
    Exclamation, // lone '!' (only valid inside f-string fields)

    // operators
    Plus, Minus, Star, StarStar, Slash, SlashSlash, Percent,
    LShift, RShift, Amp, Pipe, Caret, Tilde,
    Lt, Gt, Le, Ge, EqEq, NotEq,

    // augmented assignment
    PlusEqual, MinusEqual, StarEqual, StarStarEqual, SlashEqual, SlashSlashEqual,
    PercentEqual, AtEqual, AmpEqual, PipeEqual, CaretEqual, LShiftEqual, RShiftEqual
};

// Convert TokenKind to a stable string for diagnostics/logging
const char* to_string(TokenKind k);

// True for the augmented-assignment operators (+=, -=, ...)
bool isAugAssign(TokenKind k);

} // namespace agentrun::lex
