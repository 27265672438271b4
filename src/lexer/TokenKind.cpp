/**
 * Name: agentrun::lex::TokenKind helpers
 * Purpose: Implementation for TokenKind utilities.
 */
#include "lexer/TokenKind.h"

namespace agentrun::lex {
    const char *to_string(const TokenKind k) {
        using enum agentrun::lex::TokenKind;
        switch (k) {
            case End: return "End";
            case Newline: return "Newline";
            case Indent: return "Indent";
            case Dedent: return "Dedent";
            case Name: return "Name";
            case Int: return "Int";
            case Float: return "Float";
            case Imag: return "Imag";
            case String: return "String";
            case Bytes: return "Bytes";
            case FString: return "FString";
            case False: return "False";
            case True: return "True";
            case None: return "None";
            case And: return "and";
            case As: return "as";
            case Assert: return "assert";
            case Async: return "async";
            case Await: return "await";
            case Break: return "break";
            case Class: return "class";
            case Continue: return "continue";
            case Def: return "def";
            case Del: return "del";
            case Elif: return "elif";
            case Else: return "else";
            case Except: return "except";
            case Finally: return "finally";
            case For: return "for";
            case From: return "from";
            case Global: return "global";
            case If: return "if";
            case Import: return "import";
            case In: return "in";
            case Is: return "is";
            case Lambda: return "lambda";
            case Nonlocal: return "nonlocal";
            case Not: return "not";
            case Or: return "or";
            case Pass: return "pass";
            case Raise: return "raise";
            case Return: return "return";
            case Try: return "try";
            case While: return "while";
            case With: return "with";
            case Yield: return "yield";
            case LParen: return "(";
            case RParen: return ")";
            case LBracket: return "[";
            case RBracket: return "]";
            case LBrace: return "{";
            case RBrace: return "}";
            case Colon: return ":";
            case Comma: return ",";
            case Semicolon: return ";";
            case Dot: return ".";
            case Ellipsis: return "...";
            case Arrow: return "->";
            case At: return "@";
            case Equal: return "=";
            case ColonEqual: return ":=";
            case Exclamation: return "!";
            case Plus: return "+";
            case Minus: return "-";
            case Star: return "*";
            case StarStar: return "**";
            case Slash: return "/";
            case SlashSlash: return "//";
            case Percent: return "%";
            case LShift: return "<<";
            case RShift: return ">>";
            case Amp: return "&";
            case Pipe: return "|";
            case Caret: return "^";
            case Tilde: return "~";
            case Lt: return "<";
            case Gt: return ">";
            case Le: return "<=";
            case Ge: return ">=";
            case EqEq: return "==";
            case NotEq: return "!=";
            case PlusEqual: return "+=";
            case MinusEqual: return "-=";
            case StarEqual: return "*=";
            case StarStarEqual: return "**=";
            case SlashEqual: return "/=";
            case SlashSlashEqual: return "//=";
            case PercentEqual: return "%=";
            case AtEqual: return "@=";
            case AmpEqual: return "&=";
            case PipeEqual: return "|=";
            case CaretEqual: return "^=";
            case LShiftEqual: return "<<=";
            case RShiftEqual: return ">>=";
        }
        return "<unknown>";
    }

    bool isAugAssign(const TokenKind k) {
        using enum agentrun::lex::TokenKind;
        switch (k) {
            case PlusEqual: case MinusEqual: case StarEqual: case StarStarEqual:
            case SlashEqual: case SlashSlashEqual: case PercentEqual: case AtEqual:
            case AmpEqual: case PipeEqual: case CaretEqual: case LShiftEqual: case RShiftEqual:
                return true;
            default:
                return false;
        }
    }
} // namespace agentrun::lex
