/***
 * Name: agentrun::log::Logger / SetLevel
 * Purpose: Create and configure the "agentrun" logger.
 * Theory of Operation: A function-local static makes creation thread-safe. If
 *   something else already registered the name, that logger is reused.
 */
#include "agentrun/log/logger.h"

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace agentrun {
namespace log {

namespace {
constexpr const char* kLoggerName = "agentrun";

std::shared_ptr<spdlog::logger> createLogger() {
  if (auto existing = spdlog::get(kLoggerName)) {
    return existing;
  }
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_level(spdlog::level::info);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  return logger;
}
}  // namespace

std::shared_ptr<spdlog::logger> Logger() {
  static const std::shared_ptr<spdlog::logger> logger = createLogger();
  return logger;
}

void SetLevel(const spdlog::level::level_enum level) { Logger()->set_level(level); }

}  // namespace log
}  // namespace agentrun
