#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"
#include "ast/HasBody.h"
#include "ast/Param.h"
#include "ast/TypeParam.h"

namespace agentrun::ast {
    struct FunctionDef final : Stmt, Acceptable<FunctionDef, NodeKind::FunctionDef>, HasBody<Stmt>, HasParams<Param> {
        std::string name;
        std::vector<std::unique_ptr<Expr>> decorators; // optional decorator expressions
        std::vector<std::unique_ptr<TypeParam>> typeParams;
        std::unique_ptr<Expr> returns;                 // optional return annotation
        bool isAsync{false};
        explicit FunctionDef(std::string n) : Stmt(NodeKind::FunctionDef), name(std::move(n)) {}
    };

} // namespace agentrun::ast
