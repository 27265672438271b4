/***
 * Name: agentrun::driver::ApplyLogLevel
 * Purpose: Map --verbose to debug and --quiet to error on the shared logger.
 */
#include "agentrun/driver/app.h"

#include <spdlog/spdlog.h>

#include "agentrun/log/logger.h"

namespace agentrun {
namespace driver {

auto ApplyLogLevel(const CliOptions& opts) -> void {
  if (opts.verbose) {
    log::SetLevel(spdlog::level::debug);
  } else if (opts.quiet) {
    log::SetLevel(spdlog::level::err);
  }
}

}  // namespace driver
}  // namespace agentrun
