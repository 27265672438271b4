#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {
    struct AwaitExpr final : Expr, Acceptable<AwaitExpr, NodeKind::AwaitExpr> {
        std::unique_ptr<Expr> value;
        explicit AwaitExpr(std::unique_ptr<Expr> v) : Expr(NodeKind::AwaitExpr), value(std::move(v)) {}
    };
}
