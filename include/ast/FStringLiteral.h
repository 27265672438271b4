/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

struct FStringLiteral;

struct FStringSegment {
  bool isExpr{false};
  std::string text;                          // when !isExpr
  std::unique_ptr<Expr> expr;                // when isExpr
  char conversion{0};                        // 's', 'r', 'a' or 0
  std::unique_ptr<FStringLiteral> formatSpec; // nested spec after ':', may hold fields
};

struct FStringLiteral final : Expr, Acceptable<FStringLiteral, NodeKind::FStringLiteral> {
  std::vector<FStringSegment> parts;
  FStringLiteral() : Expr(NodeKind::FStringLiteral) {}
};

} // namespace agentrun::ast
