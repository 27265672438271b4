// Utility: in-memory ContainerRuntime that records calls and replays canned exec results
#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "agentrun/container/container_runtime.h"
#include "agentrun/exceptions/container_error.h"

namespace testutil {

class FakeRuntime : public agentrun::container::ContainerRuntime {
 public:
  struct Rule {
    std::string prefix;  // matched against the start of the exec command
    int exit_code{0};
    std::string output;
    std::chrono::milliseconds delay{0};
    std::string error{};  // when set, exec throws ContainerError with this text
  };

  struct Upload {
    std::string path;
    std::string tar_bytes;
  };

  explicit FakeRuntime(std::string name = "sandbox",
                       agentrun::container::ContainerState state = agentrun::container::ContainerState::Running)
      : name_(std::move(name)), state_(state) {}

  void addRule(Rule rule) {
    const std::lock_guard<std::mutex> lock(mu_);
    rules_.push_back(std::move(rule));
  }
  void setPresent(bool present) {
    const std::lock_guard<std::mutex> lock(mu_);
    present_ = present;
  }
  void setUploadResult(bool ok) {
    const std::lock_guard<std::mutex> lock(mu_);
    upload_ok_ = ok;
  }

  std::vector<std::string> commands() const {
    const std::lock_guard<std::mutex> lock(mu_);
    return commands_;
  }
  std::vector<Upload> uploads() const {
    const std::lock_guard<std::mutex> lock(mu_);
    return uploads_;
  }
  std::vector<agentrun::container::ResourceLimits> limits() const {
    const std::lock_guard<std::mutex> lock(mu_);
    return limits_;
  }
  std::string lastWorkdir() const {
    const std::lock_guard<std::mutex> lock(mu_);
    return workdir_;
  }
  bool ran(const std::string& prefix) const {
    for (const auto& cmd : commands()) {
      if (cmd.rfind(prefix, 0) == 0U) return true;
    }
    return false;
  }

  std::optional<agentrun::container::ContainerHandle> findByName(const std::string& name) override {
    const std::lock_guard<std::mutex> lock(mu_);
    if (!present_ || name != name_) return std::nullopt;
    return agentrun::container::ContainerHandle{"c0ffee", name_, state_};
  }

  agentrun::container::ContainerState status(const agentrun::container::ContainerHandle&) override {
    const std::lock_guard<std::mutex> lock(mu_);
    return present_ ? state_ : agentrun::container::ContainerState::Unknown;
  }

  void updateLimits(const agentrun::container::ContainerHandle&,
                    const agentrun::container::ResourceLimits& limits) override {
    const std::lock_guard<std::mutex> lock(mu_);
    limits_.push_back(limits);
  }

  agentrun::container::ExecOutput exec(const agentrun::container::ContainerHandle&, const std::string& command,
                                       const std::string& workdir) override {
    Rule match{};
    {
      const std::lock_guard<std::mutex> lock(mu_);
      commands_.push_back(command);
      workdir_ = workdir;
      for (const auto& rule : rules_) {
        if (command.rfind(rule.prefix, 0) == 0U) {
          match = rule;
          break;
        }
      }
    }
    if (match.delay.count() > 0) { std::this_thread::sleep_for(match.delay); }
    if (!match.error.empty()) { throw agentrun::exceptions::ContainerError(match.error); }
    return agentrun::container::ExecOutput{match.exit_code, match.output};
  }

  bool putArchive(const agentrun::container::ContainerHandle&, const std::string& path,
                  const std::string& tar_bytes) override {
    const std::lock_guard<std::mutex> lock(mu_);
    uploads_.push_back(Upload{path, tar_bytes});
    return upload_ok_;
  }

 private:
  mutable std::mutex mu_;
  std::string name_;
  agentrun::container::ContainerState state_;
  bool present_{true};
  bool upload_ok_{true};
  std::vector<Rule> rules_{};
  std::vector<std::string> commands_{};
  std::vector<Upload> uploads_{};
  std::vector<agentrun::container::ResourceLimits> limits_{};
  std::string workdir_{};
};

}  // namespace testutil
