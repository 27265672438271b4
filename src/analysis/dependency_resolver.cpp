/***
 * Name: agentrun::analysis::DependencyResolver (impl)
 * Purpose: Collect third-party top-level module names from import statements.
 */
#include "agentrun/analysis/dependency_resolver.h"

#include <set>
#include <string>

#include "agentrun/analysis/module_names.h"
#include "ast/Nodes.h"
#include "ast/Walker.h"
#include "parser/Parser.h"

namespace agentrun {
namespace analysis {

namespace {

class ImportCollector : public ast::Walker {
 public:
  explicit ImportCollector(std::set<std::string>& out) : out_(out) {}

  void visit(const ast::Import& node) override {
    for (const auto& alias : node.names) { add(alias.name); }
  }

  void visit(const ast::ImportFrom& node) override {
    // 'from . import x' and 'from .pkg import x' refer to local modules.
    if (node.level > 0 || node.module.empty()) return;
    add(node.module);
  }

 private:
  void add(const std::string& dotted) {
    const std::string top = TopLevelSegment(dotted);
    if (!top.empty() && !IsStdlibModule(top)) { out_.insert(top); }
  }

  std::set<std::string>& out_;
};

}  // namespace

std::set<std::string> DependencyResolver::parseDependencies(const std::string& source) const {
  const auto module = parse::ParseSource(source, "<unknown>");
  return collect(*module);
}

std::set<std::string> DependencyResolver::collect(const ast::Module& module) const {
  std::set<std::string> deps;
  ImportCollector collector(deps);
  collector.walk(module);
  return deps;
}

}  // namespace analysis
}  // namespace agentrun
