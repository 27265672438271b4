#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {
    struct AnnAssignStmt final : Stmt, Acceptable<AnnAssignStmt, NodeKind::AnnAssignStmt> {
        std::unique_ptr<Expr> target;
        std::unique_ptr<Expr> annotation;
        std::unique_ptr<Expr> value; // optional
        AnnAssignStmt() : Stmt(NodeKind::AnnAssignStmt) {}
    };
}
