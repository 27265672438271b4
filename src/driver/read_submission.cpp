/***
 * Name: agentrun::driver::ReadSubmission
 * Purpose: Load the submitted source from a file or from stdin when input is "-".
 * Inputs: input path, destination buffer
 * Outputs: bool success; err set on failure
 */
#include "agentrun/driver/app.h"

#include <iostream>
#include <string>

#include "agentrun/support/fs.h"

namespace agentrun {
namespace driver {

auto ReadSubmission(const std::string& input, std::string& source, std::string& err) -> bool {
  if (input == "-") {
    return support::ReadStream(std::cin, source, err);
  }
  return support::ReadFile(input, source, err);
}

}  // namespace driver
}  // namespace agentrun
