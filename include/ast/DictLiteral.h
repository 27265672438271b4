/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <vector>

#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

// key is null for a '**expr' unpack entry.
struct DictEntry {
  std::unique_ptr<Expr> key;
  std::unique_ptr<Expr> value;
};

struct DictLiteral final : Expr, Acceptable<DictLiteral, NodeKind::DictLiteral> {
  std::vector<DictEntry> entries;
  DictLiteral() : Expr(NodeKind::DictLiteral) {}
};

} // namespace agentrun::ast
