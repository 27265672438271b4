/***
 * Name: agentrun::driver::detail::HandleMetricsArg
 * Purpose: Recognize --metrics and --metrics=<format>.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Bare --metrics selects text; the '=' form looks the
 *   format up in a small name table.
 */
#include "agentrun/driver/cli.h"
#include "agentrun/driver/cli_parse.h"

#include <array>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace agentrun {
namespace driver {
namespace detail {

namespace {
using Format = CliOptions::MetricsFormat;
constexpr std::array<std::pair<std::string_view, Format>, 2> kFormats{{
    {"text", Format::Text},
    {"json", Format::Json},
}};
constexpr std::string_view kFlag{"--metrics"};
}  // namespace

auto HandleMetricsArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  const std::string_view view(arg);
  if (view.substr(0, kFlag.size()) != kFlag) return OptResult::NotMatched;
  const std::string_view rest = view.substr(kFlag.size());
  if (rest.empty()) {
    dst.metrics = true;
    dst.metrics_format = Format::Text;
    return OptResult::Handled;
  }
  if (rest.front() != '=') return OptResult::NotMatched;
  const std::string_view value = rest.substr(1);
  for (const auto& [name, format] : kFormats) {
    if (name == value) {
      dst.metrics = true;
      dst.metrics_format = format;
      return OptResult::Handled;
    }
  }
  err << "agentrun: error: unknown metrics format '" << value << "' (expected json or text)" << '\n';
  return OptResult::Error;
}

}  // namespace detail
}  // namespace driver
}  // namespace agentrun
