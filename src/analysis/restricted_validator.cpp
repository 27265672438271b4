/***
 * Name: agentrun::analysis::RestrictedValidator (impl)
 * Purpose: Collect restricted-compilation violations over a parsed module.
 * Theory of Operation:
 *   A Walker checks every binding or referenced name, every attribute, import
 *   aliases and a set of forbidden node kinds. Each finding is recorded as
 *   "Line N: <text>" and the walk always runs to the end.
 */
#include "agentrun/analysis/restricted_validator.h"

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "ast/Nodes.h"
#include "ast/Walker.h"

namespace agentrun {
namespace analysis {

namespace {

// Dunder names any function definition may use.
constexpr std::array<std::string_view, 8> kAllowedMagicNames{
    "__init__", "__contains__", "__lt__", "__le__", "__eq__", "__ne__", "__gt__", "__ge__"};

constexpr std::string_view kRolesSuffix = "__roles__";

bool startsPrivate(const std::string& name) { return !name.empty() && name[0] == '_' && name != "_"; }

bool endsWithRoles(const std::string& name) {
  return name.size() >= kRolesSuffix.size() &&
         std::string_view(name).substr(name.size() - kRolesSuffix.size()) == kRolesSuffix;
}

bool isAllowedMagic(const std::string& name) {
  for (const auto entry : kAllowedMagicNames) {
    if (entry == name) return true;
  }
  return false;
}

class RestrictedWalker : public ast::Walker {
 public:
  [[nodiscard]] const std::vector<std::string>& errors() const { return errors_; }

  void visit(const ast::Name& node) override { checkName(node.line, node.id); }
  void visit(const ast::Param& node) override { checkName(node.line, node.name); }
  void visit(const ast::ClassDef& node) override { checkName(node.line, node.name); }
  void visit(const ast::TypeParam& node) override { checkName(node.line, node.name); }
  void visit(const ast::ExceptHandler& node) override { checkName(node.line, node.name); }
  void visit(const ast::AwaitExpr& node) override { notAllowed(node.line, "Await"); }
  void visit(const ast::NonlocalStmt& node) override { notAllowed(node.line, "Nonlocal"); }

  void visit(const ast::FunctionDef& node) override {
    if (node.isAsync) {
      notAllowed(node.line, "AsyncFunctionDef");
      return;
    }
    checkName(node.line, node.name, true);
  }

  void visit(const ast::Attribute& node) override {
    if (startsPrivate(node.attr)) {
      error(node.line, "\"" + node.attr + "\" is an invalid attribute name because it starts with \"_\".");
    }
    if (endsWithRoles(node.attr)) {
      error(node.line, "\"" + node.attr + "\" is an invalid attribute name because it ends with \"__roles__\".");
    }
  }

  void visit(const ast::Import& node) override { checkAliases(node.line, node.names); }
  void visit(const ast::ImportFrom& node) override { checkAliases(node.line, node.names); }

  void visit(const ast::GlobalStmt& node) override {
    for (const auto& name : node.names) { checkName(node.line, name); }
  }

  void visit(const ast::ForStmt& node) override {
    if (node.isAsync) { notAllowed(node.line, "AsyncFor"); }
  }

  void visit(const ast::WithStmt& node) override {
    if (node.isAsync) { notAllowed(node.line, "AsyncWith"); }
  }

  void visit(const ast::BinaryExpr& node) override {
    if (node.op == ast::BinaryOperator::MatMul) { notAllowed(node.line, "MatMult"); }
  }

  void visit(const ast::AugAssignStmt& node) override {
    if (node.op == ast::BinaryOperator::MatMul) { notAllowed(node.line, "MatMult"); }
  }

  void visit(const ast::PatternCapture& node) override { checkName(node.line, node.name); }
  void visit(const ast::PatternStar& node) override { checkName(node.line, node.name); }
  void visit(const ast::PatternAs& node) override { checkName(node.line, node.name); }
  void visit(const ast::PatternMapping& node) override { checkName(node.line, node.restName); }

 private:
  void error(const int line, const std::string& info) {
    errors_.push_back("Line " + std::to_string(line) + ": " + info);
  }

  void notAllowed(const int line, const char* kind) { error(line, std::string(kind) + " statements are not allowed."); }

  void checkName(const int line, const std::string& name, const bool allowMagic = false) {
    if (name.empty()) return;
    if (startsPrivate(name) && !(allowMagic && isAllowedMagic(name))) {
      error(line, "\"" + name + "\" is an invalid variable name because it starts with \"_\"");
    } else if (endsWithRoles(name)) {
      error(line, "\"" + name + "\" is an invalid variable name because it ends with \"__roles__\".");
    } else if (name == "printed") {
      error(line, "\"printed\" is a reserved name.");
    }
  }

  void checkAliases(const int line, const std::vector<ast::Alias>& aliases) {
    for (const auto& alias : aliases) {
      if (alias.name == "*") {
        error(line, "\"*\" imports are not allowed.");
        continue;
      }
      checkName(line, alias.name);
      checkName(line, alias.asname);
    }
  }

  std::vector<std::string> errors_{};
};

}  // namespace

std::vector<std::string> RestrictedValidator::validate(const ast::Module& module) const {
  RestrictedWalker walker;
  walker.walk(module);
  return walker.errors();
}

}  // namespace analysis
}  // namespace agentrun
