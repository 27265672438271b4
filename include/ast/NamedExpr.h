#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {
    struct NamedExpr final : Expr, Acceptable<NamedExpr, NodeKind::NamedExpr> {
        std::unique_ptr<Expr> target; // Name in Store context
        std::unique_ptr<Expr> value;
        NamedExpr(std::unique_ptr<Expr> t, std::unique_ptr<Expr> v)
            : Expr(NodeKind::NamedExpr), target(std::move(t)), value(std::move(v)) {}
    };
}
