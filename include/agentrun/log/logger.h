/***
 * Name: agentrun::log
 * Purpose: Access to the library's named spdlog logger.
 * Inputs: Optional level changes from the driver
 * Outputs: Shared logger "agentrun" writing to a colored stderr sink
 * Theory of Operation: The logger is created on first use; later calls return
 *   the same instance. Callers log through the returned pointer with fmt-style
 *   format strings.
 */
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace agentrun {
namespace log {

/*** Logger: The process-wide "agentrun" logger. */
std::shared_ptr<spdlog::logger> Logger();

/*** SetLevel: Adjust the logger threshold (driver maps --verbose/--quiet). */
void SetLevel(spdlog::level::level_enum level);

}  // namespace log
}  // namespace agentrun
