/**
 * @file
 * @brief Pre-order, source-order AST traversal.
 */
#pragma once

#include <vector>
#include "ast/Node.h"
#include "ast/VisitorBase.h"

namespace agentrun::ast {

/***
 * Name: agentrun::ast::Walker
 * Purpose: Visit every node of a tree exactly once, parent before children,
 *          children in the order their source text appears.
 * Theory of Operation:
 *   walk() keeps an explicit stack so deeply nested input cannot exhaust the
 *   native stack. Subclasses override the visit() overloads they need and may
 *   call stop() from inside a visit to end the traversal early.
 */
class Walker : public VisitorBase {
 public:
  void walk(const Node& root);

  // Direct children of a node in field order.
  static std::vector<const Node*> childrenOf(const Node& node);

 protected:
  void stop() { stopped_ = true; }
  [[nodiscard]] bool stopped() const { return stopped_; }

 private:
  bool stopped_{false};
};

} // namespace agentrun::ast
