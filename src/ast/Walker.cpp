/**
 * @file
 * @brief Pre-order AST traversal implementation.
 */
#include "ast/Walker.h"

#include <memory>
#include "ast/Nodes.h"

namespace agentrun::ast {

namespace {

struct ChildList {
  std::vector<const Node*> out;

  void add(const Node* node) {
    if (node != nullptr) { out.push_back(node); }
  }
  template <typename T>
  void add(const std::unique_ptr<T>& node) { add(node.get()); }
  template <typename T>
  void addAll(const std::vector<std::unique_ptr<T>>& nodes) {
    for (const auto& node : nodes) { add(node.get()); }
  }
  void addFors(const std::vector<ComprehensionFor>& fors) {
    for (const auto& gen : fors) {
      add(gen.target);
      add(gen.iter);
      addAll(gen.ifs);
    }
  }
  void addKeywords(const std::vector<KeywordArg>& keywords) {
    for (const auto& kw : keywords) { add(kw.value); }
  }
  void addFString(const FStringLiteral& fstr) {
    for (const auto& part : fstr.parts) {
      if (!part.isExpr) { continue; }
      add(part.expr);
      add(part.formatSpec);
    }
  }
};

} // namespace

std::vector<const Node*> Walker::childrenOf(const Node& node) { // NOLINT(readability-function-cognitive-complexity)
  ChildList c;
  switch (node.kind) {
    case NodeKind::Module: c.addAll(static_cast<const Module&>(node).body); break;
    case NodeKind::FunctionDef: {
      const auto& fn = static_cast<const FunctionDef&>(node);
      c.addAll(fn.decorators);
      c.addAll(fn.typeParams);
      c.addAll(fn.params);
      c.add(fn.returns);
      c.addAll(fn.body);
      break;
    }
    case NodeKind::ClassDef: {
      const auto& cls = static_cast<const ClassDef&>(node);
      c.addAll(cls.decorators);
      c.addAll(cls.typeParams);
      c.addAll(cls.bases);
      c.addKeywords(cls.keywords);
      c.addAll(cls.body);
      break;
    }
    case NodeKind::ReturnStmt: c.add(static_cast<const ReturnStmt&>(node).value); break;
    case NodeKind::DelStmt: c.addAll(static_cast<const DelStmt&>(node).targets); break;
    case NodeKind::AssignStmt: {
      const auto& asg = static_cast<const AssignStmt&>(node);
      c.addAll(asg.targets);
      c.add(asg.value);
      break;
    }
    case NodeKind::AugAssignStmt: {
      const auto& asg = static_cast<const AugAssignStmt&>(node);
      c.add(asg.target);
      c.add(asg.value);
      break;
    }
    case NodeKind::AnnAssignStmt: {
      const auto& asg = static_cast<const AnnAssignStmt&>(node);
      c.add(asg.target);
      c.add(asg.annotation);
      c.add(asg.value);
      break;
    }
    case NodeKind::ForStmt: {
      const auto& loop = static_cast<const ForStmt&>(node);
      c.add(loop.target);
      c.add(loop.iterable);
      c.addAll(loop.body);
      c.addAll(loop.orelse);
      break;
    }
    case NodeKind::WhileStmt: {
      const auto& loop = static_cast<const WhileStmt&>(node);
      c.add(loop.cond);
      c.addAll(loop.body);
      c.addAll(loop.orelse);
      break;
    }
    case NodeKind::IfStmt: {
      const auto& stmt = static_cast<const IfStmt&>(node);
      c.add(stmt.cond);
      c.addAll(stmt.body);
      c.addAll(stmt.orelse);
      break;
    }
    case NodeKind::WithStmt: {
      const auto& with = static_cast<const WithStmt&>(node);
      for (const auto& item : with.items) {
        c.add(item.context);
        c.add(item.target);
      }
      c.addAll(with.body);
      break;
    }
    case NodeKind::MatchStmt: {
      const auto& match = static_cast<const MatchStmt&>(node);
      c.add(match.subject);
      c.addAll(match.cases);
      break;
    }
    case NodeKind::MatchCase: {
      const auto& mc = static_cast<const MatchCase&>(node);
      c.add(mc.pattern);
      c.add(mc.guard);
      c.addAll(mc.body);
      break;
    }
    case NodeKind::RaiseStmt: {
      const auto& raise = static_cast<const RaiseStmt&>(node);
      c.add(raise.exc);
      c.add(raise.cause);
      break;
    }
    case NodeKind::TryStmt: {
      const auto& stmt = static_cast<const TryStmt&>(node);
      c.addAll(stmt.body);
      c.addAll(stmt.handlers);
      c.addAll(stmt.orelse);
      c.addAll(stmt.finalbody);
      break;
    }
    case NodeKind::ExceptHandler: {
      const auto& handler = static_cast<const ExceptHandler&>(node);
      c.add(handler.type);
      c.addAll(handler.body);
      break;
    }
    case NodeKind::AssertStmt: {
      const auto& stmt = static_cast<const AssertStmt&>(node);
      c.add(stmt.test);
      c.add(stmt.msg);
      break;
    }
    case NodeKind::Import:
      for (const auto& alias : static_cast<const Import&>(node).names) { c.add(&alias); }
      break;
    case NodeKind::ImportFrom:
      for (const auto& alias : static_cast<const ImportFrom&>(node).names) { c.add(&alias); }
      break;
    case NodeKind::TypeAlias: {
      const auto& alias = static_cast<const TypeAlias&>(node);
      c.add(alias.name);
      c.addAll(alias.typeParams);
      c.add(alias.value);
      break;
    }
    case NodeKind::ExprStmt: c.add(static_cast<const ExprStmt&>(node).value); break;
    case NodeKind::BoolOp: c.addAll(static_cast<const BoolOp&>(node).values); break;
    case NodeKind::NamedExpr: {
      const auto& named = static_cast<const NamedExpr&>(node);
      c.add(named.target);
      c.add(named.value);
      break;
    }
    case NodeKind::BinaryExpr: {
      const auto& bin = static_cast<const BinaryExpr&>(node);
      c.add(bin.lhs);
      c.add(bin.rhs);
      break;
    }
    case NodeKind::UnaryExpr: c.add(static_cast<const UnaryExpr&>(node).operand); break;
    case NodeKind::LambdaExpr: {
      const auto& lambda = static_cast<const LambdaExpr&>(node);
      c.addAll(lambda.params);
      c.add(lambda.body);
      break;
    }
    case NodeKind::IfExpr: {
      const auto& ifExpr = static_cast<const IfExpr&>(node);
      c.add(ifExpr.body);
      c.add(ifExpr.test);
      c.add(ifExpr.orelse);
      break;
    }
    case NodeKind::DictLiteral:
      for (const auto& entry : static_cast<const DictLiteral&>(node).entries) {
        c.add(entry.key);
        c.add(entry.value);
      }
      break;
    case NodeKind::SetLiteral: c.addAll(static_cast<const SetLiteral&>(node).elements); break;
    case NodeKind::ListLiteral: c.addAll(static_cast<const ListLiteral&>(node).elements); break;
    case NodeKind::TupleLiteral: c.addAll(static_cast<const TupleLiteral&>(node).elements); break;
    case NodeKind::ListComp: {
      const auto& comp = static_cast<const ListComp&>(node);
      c.add(comp.elt);
      c.addFors(comp.fors);
      break;
    }
    case NodeKind::SetComp: {
      const auto& comp = static_cast<const SetComp&>(node);
      c.add(comp.elt);
      c.addFors(comp.fors);
      break;
    }
    case NodeKind::DictComp: {
      const auto& comp = static_cast<const DictComp&>(node);
      c.add(comp.key);
      c.add(comp.value);
      c.addFors(comp.fors);
      break;
    }
    case NodeKind::GeneratorExpr: {
      const auto& comp = static_cast<const GeneratorExpr&>(node);
      c.add(comp.elt);
      c.addFors(comp.fors);
      break;
    }
    case NodeKind::AwaitExpr: c.add(static_cast<const AwaitExpr&>(node).value); break;
    case NodeKind::YieldExpr: c.add(static_cast<const YieldExpr&>(node).value); break;
    case NodeKind::Compare: {
      const auto& cmp = static_cast<const Compare&>(node);
      c.add(cmp.left);
      c.addAll(cmp.comparators);
      break;
    }
    case NodeKind::Call: {
      const auto& call = static_cast<const Call&>(node);
      c.add(call.callee);
      c.addAll(call.args);
      c.addKeywords(call.keywords);
      break;
    }
    case NodeKind::FStringLiteral: c.addFString(static_cast<const FStringLiteral&>(node)); break;
    case NodeKind::Attribute: c.add(static_cast<const Attribute&>(node).value); break;
    case NodeKind::Subscript: {
      const auto& sub = static_cast<const Subscript&>(node);
      c.add(sub.value);
      c.add(sub.slice);
      break;
    }
    case NodeKind::Starred: c.add(static_cast<const Starred&>(node).value); break;
    case NodeKind::Slice: {
      const auto& slice = static_cast<const Slice&>(node);
      c.add(slice.lower);
      c.add(slice.upper);
      c.add(slice.step);
      break;
    }
    case NodeKind::Param: {
      const auto& param = static_cast<const Param&>(node);
      c.add(param.annotation);
      c.add(param.defaultValue);
      break;
    }
    case NodeKind::TypeParam: {
      const auto& param = static_cast<const TypeParam&>(node);
      c.add(param.bound);
      c.add(param.defaultValue);
      break;
    }
    case NodeKind::PatternValue: c.add(static_cast<const PatternValue&>(node).value); break;
    case NodeKind::PatternSequence: c.addAll(static_cast<const PatternSequence&>(node).elements); break;
    case NodeKind::PatternMapping:
      for (const auto& [key, pattern] : static_cast<const PatternMapping&>(node).items) {
        c.add(key);
        c.add(pattern);
      }
      break;
    case NodeKind::PatternClass: {
      const auto& pc = static_cast<const PatternClass&>(node);
      c.add(pc.cls);
      c.addAll(pc.args);
      for (const auto& kw : pc.kwargs) { c.add(kw.second); }
      break;
    }
    case NodeKind::PatternAs: c.add(static_cast<const PatternAs&>(node).pattern); break;
    case NodeKind::PatternOr: c.addAll(static_cast<const PatternOr&>(node).patterns); break;
    default:
      // Leaves: Name, Constant, Alias, Global/Nonlocal, Pass/Break/Continue,
      // PatternCapture, PatternStar.
      break;
  }
  return std::move(c.out);
}

void Walker::walk(const Node& root) {
  stopped_ = false;
  std::vector<const Node*> stack{&root};
  while (!stack.empty() && !stopped_) {
    const Node* node = stack.back();
    stack.pop_back();
    node->accept(*this);
    const auto children = childrenOf(*node);
    for (auto it = children.rbegin(); it != children.rend(); ++it) { stack.push_back(*it); }
  }
}

} // namespace agentrun::ast
