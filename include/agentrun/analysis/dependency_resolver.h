/***
 * Name: agentrun::analysis::DependencyResolver
 * Purpose: Extract the third-party top-level modules a submission imports.
 * Inputs: Python source text (already accepted by SafetyAnalyzer)
 * Outputs: Unique module names, standard library excluded
 * Theory of Operation: Walks Import/ImportFrom nodes, keeps the first dotted
 *   segment, drops relative imports and names known to IsStdlibModule.
 *   A parse failure propagates as ParseError.
 */
#pragma once

#include <set>
#include <string>

#include "ast/Module.h"

namespace agentrun {
namespace analysis {

class DependencyResolver {
 public:
  [[nodiscard]] std::set<std::string> parseDependencies(const std::string& source) const;
  [[nodiscard]] std::set<std::string> collect(const ast::Module& module) const;
};

}  // namespace analysis
}  // namespace agentrun
