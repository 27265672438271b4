#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Node.h"
#include "ast/HasBody.h"

namespace agentrun::ast {
    struct ForStmt final : Stmt, HasBodyPair<Stmt>, Acceptable<ForStmt, NodeKind::ForStmt> {
        std::unique_ptr<Expr> target;
        std::unique_ptr<Expr> iterable;
        bool isAsync{false};
        ForStmt() : Stmt(NodeKind::ForStmt) {}
    };
}
