#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {
    struct YieldExpr final : Expr, Acceptable<YieldExpr, NodeKind::YieldExpr> {
        std::unique_ptr<Expr> value; // optional
        bool isFrom{false};          // yield from
        YieldExpr() : Expr(NodeKind::YieldExpr) {}
    };
}
