#pragma once

#include <string>
#include "ast/Acceptable.h"
#include "ast/HasBody.h"
#include "ast/Node.h"

namespace agentrun::ast {
    struct Module final : Node, Acceptable<Module, NodeKind::Module>, HasBody<Stmt> {
        std::string name; // display file name the source was parsed under
        Module() : Node(NodeKind::Module) {}
    };
} // namespace agentrun::ast
