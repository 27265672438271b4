/***
 * Name: agentrun::analysis::SafetyAnalyzer
 * Purpose: Static gate that rejects submissions matching a deny-list of
 *   dangerous constructs before anything runs.
 * Inputs: Python source text
 * Outputs: SafetyReport{safe, message}
 * Theory of Operation:
 *   1) Parse; a ParseError becomes "Syntax error: <what()>".
 *   2) One pre-order walk applies the builtin-call, import and unsafe-call
 *      rules; the first violation in traversal order wins.
 *   3) RestrictedValidator runs over the same tree; any findings become
 *      "RestrictedPython detected an unsafe pattern: <tuple repr>".
 *   This is a heuristic deny-list. It does not make code safe to run.
 */
#pragma once

#include <string>

#include "ast/Module.h"

namespace agentrun {
namespace analysis {

struct SafetyReport {
  bool safe{false};
  std::string message;
};

class SafetyAnalyzer {
 public:
  [[nodiscard]] SafetyReport check(const std::string& source) const;

  /*** checkModule: steps 2 and 3 over an already parsed tree. */
  [[nodiscard]] SafetyReport checkModule(const ast::Module& module) const;
};

}  // namespace analysis
}  // namespace agentrun
