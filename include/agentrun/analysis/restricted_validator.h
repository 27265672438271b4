/***
 * Name: agentrun::analysis::RestrictedValidator
 * Purpose: Second, stricter pass modelled on restricted compilation: rejects
 *   private and role names, star imports and a fixed set of node kinds.
 * Inputs: Parsed module
 * Outputs: Every violation found, each as "Line N: <text>", in traversal order
 * Theory of Operation: Independent Walker; unlike the deny-list pass it does
 *   not stop at the first finding.
 */
#pragma once

#include <string>
#include <vector>

#include "ast/Module.h"

namespace agentrun {
namespace analysis {

class RestrictedValidator {
 public:
  [[nodiscard]] std::vector<std::string> validate(const ast::Module& module) const;
};

}  // namespace analysis
}  // namespace agentrun
