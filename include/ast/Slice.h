#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

struct Slice final : Expr, Acceptable<Slice, NodeKind::Slice> {
  std::unique_ptr<Expr> lower; // each part optional
  std::unique_ptr<Expr> upper;
  std::unique_ptr<Expr> step;
  Slice() : Expr(NodeKind::Slice) {}
};

} // namespace agentrun::ast
