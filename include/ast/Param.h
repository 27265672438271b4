/**
 * @file
 * @brief AST function/lambda parameter declarations.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {
    struct Param final : Node, Acceptable<Param, NodeKind::Param> {
        std::string name;
        std::unique_ptr<Expr> annotation{};   // optional
        std::unique_ptr<Expr> defaultValue{}; // optional
        bool isVarArg{false};   // *args
        bool isKwVarArg{false}; // **kwargs
        bool isKwOnly{false};   // kw-only param (after bare * or *args)
        bool isPosOnly{false};  // positional-only (before '/')
        explicit Param(std::string n) : Node(NodeKind::Param), name(std::move(n)) {}
    };
} // namespace agentrun::ast
