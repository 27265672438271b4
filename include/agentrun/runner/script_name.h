/***
 * Name: agentrun::runner::GenerateScriptName
 * Purpose: Unique file name for one submission's staged script.
 * Outputs: "script_<32 lowercase hex digits>.py" from a random 128-bit value
 */
#pragma once

#include <string>

namespace agentrun {
namespace runner {

std::string GenerateScriptName();

}  // namespace runner
}  // namespace agentrun
