/***
 * Name: agentrun::analysis::SafetyAnalyzer (impl)
 * Purpose: Deny-list walk plus restricted validation over a parsed submission.
 */
#include "agentrun/analysis/safety_analyzer.h"

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "agentrun/analysis/module_names.h"
#include "agentrun/analysis/restricted_validator.h"
#include "agentrun/exceptions/parse_error.h"
#include "agentrun/support/py_repr.h"
#include "ast/Nodes.h"
#include "ast/Walker.h"
#include "parser/Parser.h"

namespace agentrun {
namespace analysis {

namespace {

constexpr std::array<std::string_view, 7> kDangerousBuiltins{
    "globals", "locals", "vars", "dir", "eval", "exec", "compile"};

constexpr std::array<std::string_view, 4> kUnsafeModules{"os", "sys", "subprocess", "builtins"};

constexpr std::array<std::string_view, 10> kUnsafeFunctions{
    "exec", "eval", "compile", "open", "input", "__import__", "getattr", "setattr", "delattr", "hasattr"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& table, const std::string& name) {
  for (const auto entry : table) {
    if (entry == name) return true;
  }
  return false;
}

class DenyListWalker : public ast::Walker {
 public:
  [[nodiscard]] const std::optional<std::string>& violation() const { return violation_; }

  void visit(const ast::Call& call) override {
    if (call.callee == nullptr) return;
    if (call.callee->kind == ast::NodeKind::Name) {
      const auto& callee = static_cast<const ast::Name&>(*call.callee);
      if (contains(kDangerousBuiltins, callee.id)) {
        report("Use of dangerous built-in function: " + callee.id);
      } else if (contains(kUnsafeFunctions, callee.id)) {
        report("Unsafe function call: " + callee.id);
      }
    } else if (call.callee->kind == ast::NodeKind::Attribute) {
      const auto& callee = static_cast<const ast::Attribute&>(*call.callee);
      if (contains(kUnsafeFunctions, callee.attr)) { report("Unsafe function call: " + callee.attr); }
    }
  }

  void visit(const ast::Import& imp) override {
    for (const auto& alias : imp.names) {
      if (contains(kUnsafeModules, TopLevelSegment(alias.name))) {
        report("Unsafe module import: " + alias.name);
        return;
      }
    }
  }

  void visit(const ast::ImportFrom& imp) override {
    for (const auto& alias : imp.names) {
      if (!imp.module.empty() && contains(kUnsafeModules, TopLevelSegment(imp.module))) {
        report("Unsafe module import: " + imp.module);
        return;
      }
      if (contains(kUnsafeModules, TopLevelSegment(alias.name))) {
        report("Unsafe module import: " + alias.name);
        return;
      }
    }
  }

 private:
  void report(std::string message) {
    violation_ = std::move(message);
    stop();
  }

  std::optional<std::string> violation_{};
};

}  // namespace

SafetyReport SafetyAnalyzer::check(const std::string& source) const {
  std::unique_ptr<ast::Module> module;
  try {
    module = parse::ParseSource(source, "<unknown>");
  } catch (const exceptions::ParseError& err) {
    return SafetyReport{false, std::string("Syntax error: ") + err.what()};
  }
  return checkModule(*module);
}

SafetyReport SafetyAnalyzer::checkModule(const ast::Module& module) const {
  DenyListWalker denyList;
  denyList.walk(module);
  if (denyList.violation()) { return SafetyReport{false, *denyList.violation()}; }

  const RestrictedValidator validator;
  const std::vector<std::string> findings = validator.validate(module);
  if (!findings.empty()) {
    return SafetyReport{false, "RestrictedPython detected an unsafe pattern: " + support::PyTupleRepr(findings)};
  }
  return SafetyReport{true, "The code is safe to execute."};
}

}  // namespace analysis
}  // namespace agentrun
