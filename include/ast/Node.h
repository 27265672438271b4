/**
 * @file
 * @brief AST base node, expression and statement roots.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/NodeKind.h"

namespace agentrun::ast {

struct VisitorBase; // fwd

// Every node records the 1-based line and column of its first token.
struct Node {
    NodeKind kind;
    int line{0};
    int col{0};

    explicit Node(const NodeKind k) : kind(k) {}
    virtual ~Node() = default;

    // Double dispatch into VisitorBase; defined in Node.cpp.
    virtual void accept(VisitorBase& v) const;
};

struct Expr : Node {
    using Node::Node;
};

struct Stmt : Node {
    using Node::Node;
};

// Statements of one block, in source order.
using StmtList = std::vector<std::unique_ptr<Stmt>>;

} // namespace agentrun::ast
