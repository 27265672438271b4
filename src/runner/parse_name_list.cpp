/***
 * Name: agentrun::runner::ParseNameList
 * Purpose: Read a list of package names from a flag or environment value.
 * Inputs:
 *   - text: '["requests", "numpy"]', "['a']", "a, b" or "" (empty list)
 * Outputs:
 *   - names in input order, surrounding whitespace removed
 * Theory of Operation: A leading '[' selects the bracketed form, where each
 *   element must be a single- or double-quoted string; otherwise the text is
 *   split on commas and empty pieces are dropped.
 */
#include "agentrun/runner/runner_config.h"

#include <string>
#include <string_view>
#include <vector>

#include "agentrun/exceptions/config_error.h"
#include "agentrun/support/parse.h"

namespace agentrun {
namespace runner {

namespace {

std::vector<std::string> splitCommas(std::string_view text) {
  std::vector<std::string> names;
  while (true) {
    const auto comma = text.find(',');
    std::string_view piece = text.substr(0, comma);
    support::TrimSpaces(piece);
    if (!piece.empty()) names.emplace_back(piece);
    if (comma == std::string_view::npos) break;
    text.remove_prefix(comma + 1);
  }
  return names;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::vector<std::string> parseBracketed(std::string_view text, const std::string& original) {
  auto malformed = [&original]() { return exceptions::ConfigError("malformed name list: " + original); };
  if (text.size() < 2 || text.back() != ']') throw malformed();
  text = text.substr(1, text.size() - 2);
  std::vector<std::string> names;
  bool expectItem = true;
  while (true) {
    support::TrimSpaces(text);
    if (text.empty()) break;
    if (!expectItem) {
      if (text.front() != ',') throw malformed();
      text.remove_prefix(1);
      expectItem = true;
      continue;
    }
    const char quote = text.front();
    if (quote != '"' && quote != '\'') throw malformed();
    const auto close = text.find(quote, 1);
    if (close == std::string_view::npos) throw malformed();
    names.emplace_back(text.substr(1, close - 1));
    text.remove_prefix(close + 1);
    expectItem = false;
  }
  return names;
}

}  // namespace

std::vector<std::string> ParseNameList(const std::string& text) {
  std::string_view view(text);
  support::TrimSpaces(view);
  if (!view.empty() && view.front() == '[') {
    return parseBracketed(view, text);
  }
  return splitCommas(view);
}

}  // namespace runner
}  // namespace agentrun
