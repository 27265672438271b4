/***
 * Name: agentrun::driver::detail::NormalizeArgv
 * Purpose: Copy the process arguments into owned strings.
 * Inputs: argc, argv (entries may be null when a caller builds argv by hand)
 * Outputs: out, one string per argument; null entries become ""
 */
#include "agentrun/driver/cli_parse.h"

#include <string>
#include <vector>

namespace agentrun {
namespace driver {
namespace detail {

void NormalizeArgv(int argc, const char* const* argv, std::vector<std::string>& out) {
  out.assign(argc > 0 ? static_cast<std::vector<std::string>::size_type>(argc) : 0U, std::string{});
  if (argv == nullptr) return;
  for (std::vector<std::string>::size_type idx = 0; idx < out.size(); ++idx) {
    if (const char* arg = argv[idx]) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      out[idx] = arg;
    }
  }
}

}  // namespace detail
}  // namespace driver
}  // namespace agentrun
