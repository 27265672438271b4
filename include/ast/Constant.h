/**
 * @file
 * @brief AST literal constant declarations.
 */
#pragma once

#include <string>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

enum class ConstantKind { Int, Float, Imag, String, Bytes, True, False, None, Ellipsis };

// Literals keep their source spelling; implicitly concatenated strings are
// joined with a single space.
struct Constant final : Expr, Acceptable<Constant, NodeKind::Constant> {
  ConstantKind valueKind;
  std::string text;
  Constant(const ConstantKind k, std::string t) : Expr(NodeKind::Constant), valueKind(k), text(std::move(t)) {}
};

} // namespace agentrun::ast
