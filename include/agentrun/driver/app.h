/***
 * Name: agentrun::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options, environment, submission source
 * Outputs: RunnerConfig, printed results, process status codes
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units. Exit status: 0 for a completed run, 1 when --check or
 *   --deps rejects the input, 2 for usage and configuration errors.
 */
#pragma once

#include <iosfwd>
#include <memory>
#include <string>

#include "agentrun/container/container_runtime.h"
#include "agentrun/driver/cli.h"
#include "agentrun/runner/runner_config.h"
#include "observability/Metrics.h"

namespace agentrun {
namespace driver {

inline constexpr int kExitOk = 0;
inline constexpr int kExitRejected = 1;
inline constexpr int kExitUsage = 2;

/***
 * Name: agentrun::driver::BuildConfig
 * Purpose: Defaults, then AGENTRUN_* environment, then command-line overrides.
 * Inputs: opts (CLI)
 * Outputs: config; false with a message on err for unparsable values
 */
bool BuildConfig(const CliOptions& opts, runner::RunnerConfig& config, std::ostream& err);

/***
 * Name: agentrun::driver::ReadSubmission
 * Purpose: Load the submission from a file path or standard input ("-").
 */
bool ReadSubmission(const std::string& input, std::string& source, std::string& err);

/***
 * Name: agentrun::driver::ApplyLogLevel
 * Purpose: Map --verbose/--quiet onto the library logger.
 */
void ApplyLogLevel(const CliOptions& opts);

/***
 * Name: agentrun::driver::ReportMetricsIfRequested
 * Purpose: Emit metrics in the requested format if enabled.
 */
void ReportMetricsIfRequested(const CliOptions& opts, const obs::Metrics& metrics, std::ostream& out);

/***
 * Name: agentrun::driver::RunCli
 * Purpose: The whole command: parse, configure, check or execute, report.
 * Inputs: argc/argv, output streams, optional runtime (defaults to the docker CLI)
 * Outputs: Process exit status
 * Theory of Operation: A full run waits for background cleanup before
 *   returning so the process never exits with cleanup in flight.
 */
int RunCli(int argc, const char* const* argv, std::ostream& out, std::ostream& err,
           std::shared_ptr<container::ContainerRuntime> runtime = nullptr);

}  // namespace driver
}  // namespace agentrun
