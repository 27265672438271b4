#pragma once

#include <memory>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {
    struct SetLiteral final : Expr, Acceptable<SetLiteral, NodeKind::SetLiteral> {
        std::vector<std::unique_ptr<Expr>> elements;
        SetLiteral() : Expr(NodeKind::SetLiteral) {}
    };
}
