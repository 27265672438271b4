#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Node.h"
#include "ast/HasBody.h"

namespace agentrun::ast {
    // elif chains nest as a single IfStmt inside orelse.
    struct IfStmt final : Stmt, HasBodyPair<Stmt>, Acceptable<IfStmt, NodeKind::IfStmt> {
        std::unique_ptr<Expr> cond;
        explicit IfStmt(std::unique_ptr<Expr> c) : Stmt(NodeKind::IfStmt), cond(std::move(c)) {}
    };
} // namespace agentrun::ast
