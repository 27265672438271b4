/***
 * Name: agentrun::runner::GenerateScriptName
 * Purpose: Produce a collision-resistant script file name.
 * Theory of Operation: Each thread owns a 64-bit Mersenne Twister seeded from
 *   std::random_device; two draws give the 128 bits.
 */
#include "agentrun/runner/script_name.h"

#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

namespace agentrun {
namespace runner {

std::string GenerateScriptName() {
  thread_local std::mt19937_64 engine = [] {
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device()};
    return std::mt19937_64(seed);
  }();
  const std::uint64_t high = engine();
  const std::uint64_t low = engine();
  char hex[33];  // NOLINT(cppcoreguidelines-avoid-c-arrays)
  (void)std::snprintf(hex, sizeof(hex), "%016llx%016llx", static_cast<unsigned long long>(high),
                      static_cast<unsigned long long>(low));
  return std::string("script_") + hex + ".py";
}

}  // namespace runner
}  // namespace agentrun
