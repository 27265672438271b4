/***
 * Name: agentrun::obs::Metrics (impl)
 * Purpose: Implement stage timing, counters and formatting.
 */
#include "observability/Metrics.h"
#include <chrono>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <ios>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

namespace agentrun::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr int kIndent4 = 4;
} // namespace

static void appendDurations(std::ostringstream& oss,
                            const std::map<std::string, uint64_t>& durations,
                            const std::map<std::string, uint64_t>& samples) {
  oss << "  \"durations_ms\": {";
  bool first = true;
  for (const auto& [key, val] : durations) {
    if (!first) { oss << ","; }
    first = false;
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "\n    \"" << key << "\": " << std::fixed << std::setprecision(3) << millis;
  }
  oss << "\n  },\n  \"samples\": {";
  first = true;
  for (const auto& [key, val] : samples) {
    if (!first) { oss << ","; }
    first = false;
    oss << "\n    \"" << key << "\": " << val;
  }
  oss << "\n  }";
}

static void appendKeyValueObject(std::ostringstream& oss,
                                 const std::map<std::string, uint64_t>& values,
                                 int indent) {
  const std::string pad(indent, ' ');
  bool first = true;
  for (const auto& [key, val] : values) {
    if (!first) { oss << ","; }
    first = false;
    oss << "\n" << pad << "\"" << key << "\": " << val;
  }
}

void Metrics::start(const std::string& name) {
  const std::lock_guard<std::mutex> lock(mu_);
  active_[name] = Clock::now();
}

void Metrics::stop(const std::string& name) {
  const std::lock_guard<std::mutex> lock(mu_);
  auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second).count();
  durations_us_[name] += static_cast<uint64_t>(microseconds);
  samples_[name] += 1;
  active_.erase(iter);
}

void Metrics::record(const std::string& name, const uint64_t microseconds) {
  const std::lock_guard<std::mutex> lock(mu_);
  durations_us_[name] += microseconds;
  samples_[name] += 1;
}

void Metrics::incCounter(const std::string& key, const uint64_t delta) {
  const std::lock_guard<std::mutex> lock(mu_);
  counters_[key] += delta;
}

uint64_t Metrics::counter(const std::string& key) const {
  const std::lock_guard<std::mutex> lock(mu_);
  const auto iter = counters_.find(key);
  return iter == counters_.end() ? 0 : iter->second;
}

uint64_t Metrics::durationUs(const std::string& name) const {
  const std::lock_guard<std::mutex> lock(mu_);
  const auto iter = durations_us_.find(name);
  return iter == durations_us_.end() ? 0 : iter->second;
}

uint64_t Metrics::samples(const std::string& name) const {
  const std::lock_guard<std::mutex> lock(mu_);
  const auto iter = samples_.find(name);
  return iter == samples_.end() ? 0 : iter->second;
}

std::string Metrics::summaryText() const {
  const std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [key, val] : durations_us_) {
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "  " << key << ": " << std::fixed << std::setprecision(3) << millis << " ms";
    const auto count = samples_.find(key);
    if (count != samples_.end() && count->second > 1) { oss << " (" << count->second << " samples)"; }
    oss << "\n";
  }
  for (const auto& [key, val] : counters_) {
    oss << "  " << key << ": " << val << "\n";
  }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  const std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream oss;
  oss << "{\n";
  appendDurations(oss, durations_us_, samples_);
  if (!counters_.empty()) {
    oss << ",\n  \"counters\": {";
    appendKeyValueObject(oss, counters_, kIndent4);
    oss << "\n  }";
  }
  oss << "\n}\n";
  return oss.str();
}

ScopedStage::~ScopedStage() noexcept {
  if (metrics_ == nullptr) return;
  const auto end = Metrics::Clock::now();
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
  try {
    metrics_->record(name_, static_cast<uint64_t>(us));
  } catch (const std::exception&) {
    // sample dropped
  }
}

} // namespace agentrun::obs
