#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

// body if test else orelse
struct IfExpr final : Expr, Acceptable<IfExpr, NodeKind::IfExpr> {
  std::unique_ptr<Expr> body;
  std::unique_ptr<Expr> test;
  std::unique_ptr<Expr> orelse;
  IfExpr() : Expr(NodeKind::IfExpr) {}
};

} // namespace agentrun::ast
