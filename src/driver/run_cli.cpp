/***
 * Name: agentrun::driver::RunCli
 * Purpose: Entire agentrun command behind main().
 * Inputs:
 *   - argc, argv: process arguments
 *   - out, err: result and diagnostic streams
 *   - runtime: container backend; nullptr selects DockerCliRuntime(opts.docker)
 * Outputs:
 *   - int: kExitOk, kExitRejected or kExitUsage
 * Theory of Operation:
 *   --check and --deps never touch a container. A full run constructs a
 *   Runner (ConfigError is a usage failure), prints the result text, then
 *   blocks on the cleanup future so nothing is left running in the
 *   background when the process exits.
 */
#include "agentrun/driver/app.h"

#include <memory>
#include <ostream>
#include <set>
#include <string>
#include <utility>

#include "agentrun/analysis/dependency_resolver.h"
#include "agentrun/analysis/safety_analyzer.h"
#include "agentrun/container/docker_cli_runtime.h"
#include "agentrun/exceptions/config_error.h"
#include "agentrun/exceptions/parse_error.h"
#include "agentrun/log/logger.h"
#include "agentrun/runner/runner.h"

namespace agentrun {
namespace driver {

static int RunCheck(const std::string& source, std::ostream& out) {
  const analysis::SafetyReport report = analysis::SafetyAnalyzer{}.check(source);
  out << report.message << '\n';
  return report.safe ? kExitOk : kExitRejected;
}

static int RunDeps(const std::string& source, std::ostream& out, std::ostream& err) {
  std::set<std::string> deps;
  try {
    deps = analysis::DependencyResolver{}.parseDependencies(source);
  } catch (const exceptions::ParseError& ex) {
    err << "agentrun: " << ex.what() << '\n';
    return kExitRejected;
  }
  for (const auto& name : deps) { out << name << '\n'; }
  return kExitOk;
}

auto RunCli(int argc, const char* const* argv, std::ostream& out, std::ostream& err,
            std::shared_ptr<container::ContainerRuntime> runtime) -> int {
  const char* argv0 = argc > 0 ? argv[0] : nullptr;  // NOLINT(*-pro-bounds-pointer-arithmetic)
  CliOptions opts;
  if (!ParseCli(argc, argv, opts, err)) {
    PrintUsage(err, argv0);
    return kExitUsage;
  }
  if (opts.show_help) {
    PrintUsage(out, argv0);
    return kExitOk;
  }
  ApplyLogLevel(opts);

  std::string source;
  std::string readErr;
  if (!ReadSubmission(opts.input, source, readErr)) {
    err << "agentrun: error: " << readErr << '\n';
    return kExitUsage;
  }
  if (opts.check_only) { return RunCheck(source, out); }
  if (opts.deps_only) { return RunDeps(source, out, err); }

  runner::RunnerConfig config;
  if (!BuildConfig(opts, config, err)) { return kExitUsage; }
  if (!runtime) { runtime = std::make_shared<container::DockerCliRuntime>(opts.docker); }

  obs::Metrics metrics;
  runner::Execution execution;
  try {
    const runner::Runner runner(std::move(config), std::move(runtime), &metrics);
    execution = runner.execute(source);
  } catch (const exceptions::ConfigError& ex) {
    err << "agentrun: error: " << ex.what() << '\n';
    return kExitUsage;
  }

  out << execution.result.text;
  if (execution.result.text.empty() || execution.result.text.back() != '\n') { out << '\n'; }
  out.flush();
  if (execution.cleanup.valid()) { execution.cleanup.wait(); }
  log::Logger()->debug("run finished: {}", runner::ToString(execution.result.kind));
  ReportMetricsIfRequested(opts, metrics, err);
  return kExitOk;
}

}  // namespace driver
}  // namespace agentrun
