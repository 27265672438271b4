/***
 * Name: agentrun::analysis (module_names)
 * Purpose: Helpers over dotted Python module paths.
 * Inputs: Module paths as written in import statements
 * Outputs: Top-level segments and standard-library membership
 * Theory of Operation: The standard-library table is CPython 3.12's
 *   sys.stdlib_module_names plus sys.builtin_module_names, compiled in.
 */
#pragma once

#include <string>

namespace agentrun {
namespace analysis {

/*** TopLevelSegment: "a.b.c" -> "a". */
std::string TopLevelSegment(const std::string& dotted);

/*** IsStdlibModule: true when name is a standard-library or built-in module. */
bool IsStdlibModule(const std::string& name);

}  // namespace analysis
}  // namespace agentrun
