#pragma once

#include <vector>
#include "ast/Acceptable.h"
#include "ast/HasBody.h"
#include "ast/Node.h"
#include "ast/WithItem.h"

namespace agentrun::ast {
    struct WithStmt final : Stmt, HasBody<Stmt>, Acceptable<WithStmt, NodeKind::WithStmt> {
        std::vector<WithItem> items;
        bool isAsync{false};
        WithStmt() : Stmt(NodeKind::WithStmt) {}
    };
}
