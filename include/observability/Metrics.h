/***
 * Name: agentrun::obs::Metrics
 * Purpose: Collect per-stage timings and outcome counters for executions.
 * Inputs:
 *   - Calls to start/stop timers (or ScopedStage) for named stages.
 *   - Counter increments recorded by the runner.
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from
 *   stage names to accumulated microseconds and sample counts. A mutex guards
 *   all state because cleanup records from its own thread.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace agentrun::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);
  void record(const std::string& name, uint64_t microseconds);

  // Generic counters for observability
  void incCounter(const std::string& key, uint64_t delta = 1);
  [[nodiscard]] uint64_t counter(const std::string& key) const;
  [[nodiscard]] uint64_t durationUs(const std::string& name) const;
  [[nodiscard]] uint64_t samples(const std::string& name) const;

  [[nodiscard]] std::string summaryText() const;
  [[nodiscard]] std::string summaryJson() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::map<std::string, uint64_t> samples_{};
  std::map<std::string, uint64_t> counters_{};
};

/*** ScopedStage: time one stage into an optional Metrics sink. */
class ScopedStage {
 public:
  ScopedStage(Metrics* metrics, std::string name)
      : metrics_(metrics), name_(std::move(name)), start_(Metrics::Clock::now()) {}
  ~ScopedStage() noexcept;
  ScopedStage(const ScopedStage&) = delete;
  ScopedStage& operator=(const ScopedStage&) = delete;
  ScopedStage(ScopedStage&&) = delete;
  ScopedStage& operator=(ScopedStage&&) = delete;

 private:
  Metrics* metrics_;
  std::string name_;
  Metrics::Clock::time_point start_;
};

} // namespace agentrun::obs
