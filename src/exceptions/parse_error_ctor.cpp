/***
 * Name: agentrun::exceptions::ParseError::ParseError
 * Purpose: Build a syntax error carrying its source position.
 * Inputs:
 *   - msg: bare message (e.g. "invalid syntax")
 *   - file: display name of the source ("<unknown>" for in-memory code)
 *   - line, col: 1-based position of the offending token
 * Outputs: Exception whose what() is "<msg> (<file>, line <line>)"
 */
#include "agentrun/exceptions/parse_error.h"

#include <string>
#include <utility>

namespace agentrun::exceptions {

ParseError::ParseError(std::string msg, std::string file, const int line, const int col)
    : AgentrunException(msg + " (" + file + ", line " + std::to_string(line) + ")"),
      bare_(std::move(msg)),
      file_(std::move(file)),
      line_(line),
      col_(col) {}

}  // namespace agentrun::exceptions
