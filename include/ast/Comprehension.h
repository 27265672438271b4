/**
 * @file
 * @brief AST comprehension declarations (list/set/dict comprehensions and generator expressions).
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"

namespace agentrun::ast {

// One 'for target in iter' clause with its trailing 'if' guards.
struct ComprehensionFor {
  std::unique_ptr<Expr> target;
  std::unique_ptr<Expr> iter;
  std::vector<std::unique_ptr<Expr>> ifs;
  bool isAsync{false};
};

// Shared clause list; the first clause's iter is evaluated in the enclosing scope.
struct Comprehension : Expr {
  std::vector<ComprehensionFor> fors;
  using Expr::Expr;
};

struct ListComp final : Comprehension, Acceptable<ListComp, NodeKind::ListComp> {
  std::unique_ptr<Expr> elt;
  ListComp() : Comprehension(NodeKind::ListComp) {}
};

struct SetComp final : Comprehension, Acceptable<SetComp, NodeKind::SetComp> {
  std::unique_ptr<Expr> elt;
  SetComp() : Comprehension(NodeKind::SetComp) {}
};

struct DictComp final : Comprehension, Acceptable<DictComp, NodeKind::DictComp> {
  std::unique_ptr<Expr> key;
  std::unique_ptr<Expr> value;
  DictComp() : Comprehension(NodeKind::DictComp) {}
};

struct GeneratorExpr final : Comprehension, Acceptable<GeneratorExpr, NodeKind::GeneratorExpr> {
  std::unique_ptr<Expr> elt;
  GeneratorExpr() : Comprehension(NodeKind::GeneratorExpr) {}
};

} // namespace agentrun::ast
