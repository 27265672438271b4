#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Node.h"
#include "ast/HasBody.h"

namespace agentrun::ast {
    struct WhileStmt final : Stmt, HasBodyPair<Stmt>, Acceptable<WhileStmt, NodeKind::WhileStmt> {
        std::unique_ptr<Expr> cond;
        explicit WhileStmt(std::unique_ptr<Expr> c) : Stmt(NodeKind::WhileStmt), cond(std::move(c)) {}
    };
}
