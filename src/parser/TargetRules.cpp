/***
 * Name: agentrun::parse::Parser::setTargetContext / DescribeExpr
 * Purpose: Validate assignment and deletion targets and mark their context.
 */
#include <string>
#include "parser/Parser.h"

namespace agentrun::parse {

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
const char* DescribeExpr(const ast::Expr& expr) {
  using ast::NodeKind;
  switch (expr.kind) {
    case NodeKind::Attribute: return "attribute";
    case NodeKind::Subscript: return "subscript";
    case NodeKind::Starred: return "starred";
    case NodeKind::Name: return "name";
    case NodeKind::ListLiteral: return "list";
    case NodeKind::TupleLiteral: return "tuple";
    case NodeKind::LambdaExpr: return "lambda";
    case NodeKind::Call: return "function call";
    case NodeKind::BoolOp:
    case NodeKind::BinaryExpr:
    case NodeKind::UnaryExpr: return "expression";
    case NodeKind::GeneratorExpr: return "generator expression";
    case NodeKind::YieldExpr: return "yield expression";
    case NodeKind::AwaitExpr: return "await expression";
    case NodeKind::ListComp: return "list comprehension";
    case NodeKind::SetComp: return "set comprehension";
    case NodeKind::DictComp: return "dict comprehension";
    case NodeKind::DictLiteral: return "dict literal";
    case NodeKind::SetLiteral: return "set display";
    case NodeKind::FStringLiteral: return "f-string expression";
    case NodeKind::Compare: return "comparison";
    case NodeKind::IfExpr: return "conditional expression";
    case NodeKind::NamedExpr: return "named expression";
    case NodeKind::Slice: return "slice";
    case NodeKind::Constant:
      switch (static_cast<const ast::Constant&>(expr).valueKind) {
        case ast::ConstantKind::True: return "True";
        case ast::ConstantKind::False: return "False";
        case ast::ConstantKind::None: return "None";
        case ast::ConstantKind::Ellipsis: return "ellipsis";
        default: return "literal";
      }
    default: return "expression";
  }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::setTargetContext(ast::Expr& expr, const TargetUse use, const lex::Token& where) const {
  using ast::NodeKind;
  lex::Token loc = where;
  if (expr.line > 0) {
    loc.line = expr.line;
    loc.col = expr.col;
  }
  const auto ctx = use == TargetUse::Delete ? ast::ExprContext::Del : ast::ExprContext::Store;
  const std::string desc = DescribeExpr(expr);
  switch (expr.kind) {
    case NodeKind::Name: static_cast<ast::Name&>(expr).ctx = ctx; return;
    case NodeKind::Attribute: static_cast<ast::Attribute&>(expr).ctx = ctx; return;
    case NodeKind::Subscript: static_cast<ast::Subscript&>(expr).ctx = ctx; return;
    case NodeKind::TupleLiteral:
    case NodeKind::ListLiteral: {
      if (use == TargetUse::AugAssign) { fail("'" + desc + "' is an illegal expression for augmented assignment", loc); }
      if (use == TargetUse::Annotated) { fail("only single target (not " + desc + ") can be annotated", loc); }
      const TargetUse inner = use == TargetUse::AssignStmt ? TargetUse::Assign : use;
      if (expr.kind == NodeKind::TupleLiteral) {
        auto& tuple = static_cast<ast::TupleLiteral&>(expr);
        tuple.ctx = ctx;
        for (auto& element : tuple.elements) { setTargetContext(*element, inner, where); }
      } else {
        auto& list = static_cast<ast::ListLiteral&>(expr);
        list.ctx = ctx;
        for (auto& element : list.elements) { setTargetContext(*element, inner, where); }
      }
      return;
    }
    case NodeKind::Starred:
      if (use == TargetUse::Delete) { fail("cannot delete starred", loc); }
      if (use == TargetUse::Assign || use == TargetUse::AssignStmt) {
        auto& starred = static_cast<ast::Starred&>(expr);
        starred.ctx = ctx;
        setTargetContext(*starred.value, TargetUse::Assign, where);
        return;
      }
      break;
    default:
      break;
  }
  switch (use) {
    case TargetUse::Delete: fail("cannot delete " + desc, loc);
    case TargetUse::AugAssign: fail("'" + desc + "' is an illegal expression for augmented assignment", loc);
    case TargetUse::Annotated: fail("illegal target for annotation", loc);
    case TargetUse::AssignStmt: fail("cannot assign to " + desc + " here. Maybe you meant '==' instead of '='?", loc);
    case TargetUse::Assign: fail("cannot assign to " + desc, loc);
  }
}

} // namespace agentrun::parse
