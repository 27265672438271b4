#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Node.h"
#include "ast/Operators.h"

namespace agentrun::ast {
    struct AugAssignStmt final : Stmt, Acceptable<AugAssignStmt, NodeKind::AugAssignStmt> {
        std::unique_ptr<Expr> target;
        BinaryOperator op{BinaryOperator::Add};
        std::unique_ptr<Expr> value;
        AugAssignStmt() : Stmt(NodeKind::AugAssignStmt) {}
    };
}
