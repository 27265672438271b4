/**
 * @file
 * @brief The 'type X[T] = value' statement.
 */
#pragma once

#include <memory>
#include <utility>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"
#include "ast/Targets.h"
#include "ast/TypeParam.h"

namespace agentrun::ast {

struct TypeAlias final : Stmt, Acceptable<TypeAlias, NodeKind::TypeAlias> {
    std::unique_ptr<Name> name; // Store context
    std::vector<std::unique_ptr<TypeParam>> typeParams;
    std::unique_ptr<Expr> value;
    TypeAlias() : Stmt(NodeKind::TypeAlias) {}
};

} // namespace agentrun::ast
