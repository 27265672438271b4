/**
 * @file
 * @brief AST assignment statement declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {
    // a = b = value: one entry in targets per '=' in source order.
    struct AssignStmt final : Stmt, Acceptable<AssignStmt, NodeKind::AssignStmt> {
        std::vector<std::unique_ptr<Expr>> targets;
        std::unique_ptr<Expr> value;
        AssignStmt() : Stmt(NodeKind::AssignStmt) {}
    };
}
