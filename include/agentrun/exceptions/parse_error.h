/***
 * Name: agentrun::exceptions::ParseError
 * Purpose: Exception for Python lexing/parsing failures.
 * Inputs: Bare message, source name and 1-based line/column
 * Outputs: Exception object whose what() reads "<message> (<file>, line <n>)"
 * Theory of Operation: Mirrors the text of a CPython SyntaxError so callers can
 *   surface it verbatim after a "Syntax error: " prefix.
 */
#pragma once

#include <string>

#include "agentrun/exceptions/agentrun_exception.h"

namespace agentrun {
namespace exceptions {

class ParseError : public AgentrunException {
 public:
  ParseError(std::string msg, std::string file, int line, int col);

  const std::string& message() const noexcept { return bare_; }
  const std::string& file() const noexcept { return file_; }
  int line() const noexcept { return line_; }
  int col() const noexcept { return col_; }

 private:
  std::string bare_;
  std::string file_;
  int line_{0};
  int col_{0};
};

}  // namespace exceptions
}  // namespace agentrun
