#pragma once
#include <memory>
#include <string>
#include <vector>

#include "ast/Node.h"
#include "ast/Acceptable.h"

namespace agentrun::ast {
    // name is empty for a '**expr' unpack entry.
    struct KeywordArg { std::string name; std::unique_ptr<Expr> value; };

    struct Call final : Expr, Acceptable<Call, NodeKind::Call> {
        std::unique_ptr<Expr> callee;                 // typically Name or Attribute
        std::vector<std::unique_ptr<Expr>> args;      // positional, '*expr' as Starred
        std::vector<KeywordArg> keywords;             // named args
        explicit Call(std::unique_ptr<Expr> c) : Expr(NodeKind::Call), callee(std::move(c)) {}
    };

} // namespace agentrun::ast
