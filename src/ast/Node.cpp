/**
 * @file
 * @brief AST base Node default accept implementation.
 */
/***
 * Name: agentrun::ast::Node::accept
 * Purpose: Dynamic dispatch via the central switch.
 */
#include "ast/Node.h"
#include "ast/Visitor.h"

namespace agentrun::ast {

void Node::accept(VisitorBase& visitor) const {
    dispatch(*this, visitor);
}

} // namespace agentrun::ast
