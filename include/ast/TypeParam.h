/**
 * @file
 * @brief Generic type parameters of def, class and type statements.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

enum class TypeParamKind { TypeVar, TypeVarTuple, ParamSpec };

// T, T: bound, *Ts, **P; any form may carry '= default'.
struct TypeParam final : Node, Acceptable<TypeParam, NodeKind::TypeParam> {
    TypeParamKind paramKind{TypeParamKind::TypeVar};
    std::string name;
    std::unique_ptr<Expr> bound{};        // TypeVar only
    std::unique_ptr<Expr> defaultValue{}; // optional
    explicit TypeParam(std::string n) : Node(NodeKind::TypeParam), name(std::move(n)) {}
};

} // namespace agentrun::ast
