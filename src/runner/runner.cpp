/***
 * Name: agentrun::runner::Runner (impl)
 * Purpose: Sequence safety, upload, dependencies, execution and cleanup.
 */
#include "agentrun/runner/runner.h"

#include <chrono>
#include <exception>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "agentrun/analysis/dependency_resolver.h"
#include "agentrun/container/script_archive.h"
#include "agentrun/exceptions/agentrun_exception.h"
#include "agentrun/exceptions/command_timeout.h"
#include "agentrun/exceptions/config_error.h"
#include "agentrun/exceptions/container_error.h"
#include "agentrun/exceptions/file_error.h"
#include "agentrun/log/logger.h"
#include "agentrun/runner/command_executor.h"
#include "agentrun/runner/dependency_manager.h"
#include "agentrun/runner/script_name.h"
#include "agentrun/support/fs.h"

namespace agentrun {
namespace runner {

namespace {
constexpr std::chrono::seconds kHousekeepingTimeout{30};

std::shared_future<void> readyFuture() {
  std::promise<void> done;
  done.set_value();
  return done.get_future().share();
}

[[noreturn]] void constructionFailed(const std::string& message) {
  log::Logger()->error("{}", message);
  throw exceptions::ConfigError(message);
}
}  // namespace

struct Runner::Shared {
  Shared(RunnerConfig cfg, std::shared_ptr<container::ContainerRuntime> rt, obs::Metrics* sink)
      : config(std::move(cfg)),
        runtime(std::move(rt)),
        metrics(sink),
        executor(runtime, config.code_dir),
        dependencies(config, executor, metrics) {}

  RunnerConfig config;
  std::shared_ptr<container::ContainerRuntime> runtime;
  obs::Metrics* metrics;
  CommandExecutor executor;
  DependencyManager dependencies;
  analysis::SafetyAnalyzer analyzer{};
  analysis::DependencyResolver resolver{};

  void count(const std::string& key) const {
    if (metrics != nullptr) metrics->incCounter(key);
  }
};

// Everything the background cleanup needs to undo one submission.
struct Runner::CleanupPlan {
  container::ContainerHandle handle;
  std::string script_name;
  std::string staged_path;   // empty when nothing was written locally
  bool uploaded{false};
  bool timed_out{false};
  std::set<std::string> dependencies;
};

Runner::Runner(RunnerConfig config, std::shared_ptr<container::ContainerRuntime> runtime, obs::Metrics* metrics) {
  ValidateConfig(config);
  if (!runtime) {
    constructionFailed("a container runtime is required");
  }
  if (config.staging_dir.empty()) {
    std::error_code ec;
    const auto tmp = std::filesystem::temp_directory_path(ec);
    config.staging_dir = ec ? std::string("/tmp") : tmp.string();
  }
  auto shared = std::make_shared<Shared>(std::move(config), std::move(runtime), metrics);
  const auto& cfg = shared->config;

  std::optional<container::ContainerHandle> handle;
  try {
    handle = shared->runtime->findByName(cfg.container_name);
  } catch (const exceptions::ContainerError& err) {
    constructionFailed(std::string("container runtime unavailable: ") + err.what());
  }
  if (!handle) {
    constructionFailed("Container with name " + cfg.container_name + " not found.");
  }
  if (handle->state != container::ContainerState::Running) {
    constructionFailed("Container " + cfg.container_name + " is not running (state: " +
                       container::ToString(handle->state) + ").");
  }

  if (!cfg.cached_dependencies.empty()) {
    const std::set<std::string> cached(cfg.cached_dependencies.begin(), cfg.cached_dependencies.end());
    log::Logger()->info("pre-installing {} cached dependencies", cached.size());
    ExecutionResult warmed;
    try {
      warmed = shared->dependencies.install(*handle, cached);
    } catch (const exceptions::AgentrunException& err) {
      warmed = ExecutionResult{ErrorKind::ExecutionFailed, err.what()};
    }
    if (!warmed.ok()) {
      constructionFailed("Failed to pre-install cached dependencies: " + warmed.text);
    }
  }
  shared_ = std::move(shared);
}

const RunnerConfig& Runner::config() const { return shared_->config; }

analysis::SafetyReport Runner::safetyCheck(const std::string& source) const {
  return shared_->analyzer.check(source);
}

std::set<std::string> Runner::parseDependencies(const std::string& source) const {
  return shared_->resolver.parseDependencies(source);
}

std::string Runner::executeCodeInContainer(const std::string& source,
                                           const std::optional<std::chrono::milliseconds> timeout) const {
  return execute(source, timeout).result.text;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity,readability-function-size)
Execution Runner::execute(const std::string& source, const std::optional<std::chrono::milliseconds> timeout) const {
  const Shared& shared = *shared_;
  const auto& cfg = shared.config;
  shared.count("executions");

  analysis::SafetyReport safety;
  {
    const obs::ScopedStage stage(shared.metrics, "safety_check");
    safety = shared.analyzer.check(source);
  }
  if (!safety.safe) {
    log::Logger()->debug("submission rejected: {}", safety.message);
    shared.count("rejected_unsafe");
    return Execution{ExecutionResult{ErrorKind::InputRejected, safety.message}, readyFuture()};
  }

  std::optional<CleanupPlan> plan;
  ExecutionResult result;
  bool failed = false;
  try {
    std::optional<container::ContainerHandle> handle;
    {
      const obs::ScopedStage stage(shared.metrics, "resolve_container");
      handle = shared.runtime->findByName(cfg.container_name);
    }
    if (!handle) {
      return Execution{
          ExecutionResult{ErrorKind::InfrastructureNotFound, "Container with name " + cfg.container_name + " not found."},
          readyFuture()};
    }
    plan.emplace();
    plan->handle = *handle;

    {
      log::Logger()->debug("applying limits to {}", handle->name);
      const obs::ScopedStage stage(shared.metrics, "apply_limits");
      shared.runtime->updateLimits(*handle, container::ResourceLimits{cfg.cpu_quota, cfg.memory_limit, cfg.memswap_limit});
    }

    {
      const obs::ScopedStage stage(shared.metrics, "upload_code");
      plan->script_name = GenerateScriptName();
      const std::string staged = (std::filesystem::path(cfg.staging_dir) / plan->script_name).string();
      std::string err;
      if (!support::WriteFile(staged, source, err)) {
        throw exceptions::FileError(err);
      }
      plan->staged_path = staged;
      log::Logger()->debug("uploading {} to {}", plan->script_name, cfg.code_dir);
      const std::string archive = container::BuildScriptArchive(plan->script_name, source);
      plan->uploaded = true;
      if (!shared.runtime->putArchive(*handle, cfg.code_dir, archive)) {
        result = ExecutionResult{ErrorKind::ExecutionFailed, "Failed to copy script to container."};
        failed = true;
      }
    }

    if (!failed) {
      const std::set<std::string> deps = shared.resolver.parseDependencies(source);
      const obs::ScopedStage stage(shared.metrics, "install_dependencies");
      // Recorded first so packages installed before a failure are still removed.
      plan->dependencies = deps;
      const ExecutionResult installed = shared.dependencies.install(*handle, deps);
      if (!installed.ok()) {
        if (installed.kind == ErrorKind::PolicyRejected) {
          shared.count("rejected_policy");
          plan->dependencies.clear();
        }
        result = installed;
        failed = true;
      }
    }

    if (!failed) {
      const auto limit = timeout.value_or(std::chrono::seconds(cfg.default_timeout));
      const std::string command = cfg.interpreter + " " + cfg.code_dir + "/" + plan->script_name;
      log::Logger()->debug("running {}", command);
      const obs::ScopedStage stage(shared.metrics, "run");
      try {
        auto ran = shared.executor.run(*handle, command, limit);
        result = ExecutionResult{ErrorKind::None, std::move(ran.output)};
      } catch (const exceptions::CommandTimeout&) {
        plan->timed_out = true;
        shared.count("timeouts");
        result = ExecutionResult{ErrorKind::ExecutionFailed, "Execution timed out."};
      }
    }
  } catch (const exceptions::AgentrunException& err) {
    result = ExecutionResult{ErrorKind::ExecutionFailed, err.what()};
  } catch (const std::exception& err) {
    result = ExecutionResult{ErrorKind::ExecutionFailed, err.what()};
  }

  if (!plan) {
    return Execution{std::move(result), readyFuture()};
  }
  return Execution{std::move(result), dispatchCleanup(std::move(*plan))};
}

std::shared_future<void> Runner::dispatchCleanup(CleanupPlan plan) const {
  std::promise<void> done;
  std::shared_future<void> signal = done.get_future().share();
  std::thread([shared = shared_, plan = std::move(plan), done = std::move(done)]() mutable {
    {
      const obs::ScopedStage stage(shared->metrics, "cleanup");
      cleanUp(*shared, plan);
    }
    done.set_value();
  }).detach();
  return signal;
}

// Each step is independent; a failure is logged and the next step still runs.
void Runner::cleanUp(const Shared& shared, const CleanupPlan& plan) {
  const auto& cfg = shared.config;
  const std::string remote = cfg.code_dir + "/" + plan.script_name;
  auto attempt = [&plan](const char* what, auto&& step) {
    try {
      step();
    } catch (const exceptions::AgentrunException& err) {
      log::Logger()->warn("cleanup of {}: {} failed: {}", plan.script_name, what, err.what());
    } catch (const std::exception& err) {
      log::Logger()->warn("cleanup of {}: {} failed: {}", plan.script_name, what, err.what());
    }
  };

  if (!plan.staged_path.empty()) {
    std::string err;
    if (!support::RemoveFile(plan.staged_path, err)) {
      log::Logger()->warn("cleanup of {}: {}", plan.script_name, err);
    }
  }
  if (plan.timed_out) {
    // "[/]code/..." matches the interpreter's command line but not this shell's.
    const std::string pattern = "[" + remote.substr(0, 1) + "]" + remote.substr(1);
    attempt("kill leftover interpreter", [&] {
      (void)shared.executor.run(plan.handle, "pkill -f '" + pattern + "'", kHousekeepingTimeout);
    });
  }
  if (plan.uploaded) {
    attempt("remove script", [&] {
      const auto removed = shared.executor.run(plan.handle, "rm -f " + remote, kHousekeepingTimeout);
      if (removed.exit_code != 0) {
        log::Logger()->warn("cleanup of {}: rm exited with {}", plan.script_name, removed.exit_code);
      }
    });
  }
  if (!plan.dependencies.empty()) {
    attempt("uninstall dependencies", [&] { (void)shared.dependencies.uninstall(plan.handle, plan.dependencies); });
  }
  log::Logger()->debug("cleanup of {} finished", plan.script_name);
}

}  // namespace runner
}  // namespace agentrun
