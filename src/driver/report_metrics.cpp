/***
 * Name: agentrun::driver::ReportMetricsIfRequested
 * Purpose: Print metrics summary in requested format if enabled.
 * Inputs:
 *   - opts: CLI options
 *   - metrics: collected stage timings and counters
 *   - out: destination stream
 * Outputs: None
 */
#include "agentrun/driver/app.h"

#include <ostream>

namespace agentrun {
namespace driver {

auto ReportMetricsIfRequested(const CliOptions& opts, const obs::Metrics& metrics, std::ostream& out) -> void {
  if (!opts.metrics) { return; }
  if (opts.metrics_format == CliOptions::MetricsFormat::Json) {
    out << metrics.summaryJson();
  } else {
    out << metrics.summaryText();
  }
}

}  // namespace driver
}  // namespace agentrun
