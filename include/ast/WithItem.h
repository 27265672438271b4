#pragma once

#include <memory>
#include "ast/Node.h"

namespace agentrun::ast {
    struct WithItem {
        std::unique_ptr<Expr> context;
        std::unique_ptr<Expr> target; // optional 'as' target
    };
}
