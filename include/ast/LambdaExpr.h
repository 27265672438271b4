/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Node.h"
#include "ast/HasBody.h"
#include "ast/Param.h"

namespace agentrun::ast {

struct LambdaExpr final : Expr, Acceptable<LambdaExpr, NodeKind::LambdaExpr>, HasParams<Param> {
  std::unique_ptr<Expr> body;
  LambdaExpr() : Expr(NodeKind::LambdaExpr) {}
};

} // namespace agentrun::ast
