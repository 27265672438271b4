#pragma once

#include <memory>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"
#include "ast/Pattern.h"

namespace agentrun::ast {

struct MatchCase final : Node, Acceptable<MatchCase, NodeKind::MatchCase> {
  std::unique_ptr<Pattern> pattern;
  std::unique_ptr<Expr> guard; // optional; null when absent
  StmtList body;
  MatchCase() : Node(NodeKind::MatchCase) {}
};

struct MatchStmt final : Stmt, Acceptable<MatchStmt, NodeKind::MatchStmt> {
  std::unique_ptr<Expr> subject;
  std::vector<std::unique_ptr<MatchCase>> cases;
  MatchStmt() : Stmt(NodeKind::MatchStmt) {}
};

} // namespace agentrun::ast
