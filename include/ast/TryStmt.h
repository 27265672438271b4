/**
 * @file
 * @brief try statements and their except clauses.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

// except [type [as name]]: block
struct ExceptHandler final : Node, Acceptable<ExceptHandler, NodeKind::ExceptHandler> {
    std::unique_ptr<Expr> type; // null for a bare except
    std::string name;           // empty without 'as'
    StmtList body;
    ExceptHandler() : Node(NodeKind::ExceptHandler) {}
};

// The parser guarantees at least one handler or a finally block.
struct TryStmt final : Stmt, Acceptable<TryStmt, NodeKind::TryStmt> {
    StmtList body;
    std::vector<std::unique_ptr<ExceptHandler>> handlers;
    StmtList orelse;
    StmtList finalbody;
    bool isStar{false}; // except*
    TryStmt() : Stmt(NodeKind::TryStmt) {}
};

} // namespace agentrun::ast
