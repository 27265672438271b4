/***
 * Name: agentrun::support (parse)
 * Purpose: Strict integer parsing for flags and environment values.
 * Inputs: Text containing optional surrounding spaces, an optional sign and digits
 * Outputs: Parsed integer via out_val; returns true on success
 * Theory of Operation: Validates characters and range without throwing;
 *   anything after the digits other than whitespace is an error.
 */
#pragma once

#include <string>
#include <string_view>

namespace agentrun {
namespace support {

bool ParseIntStrict(std::string_view text, long long& out_val, std::string* err = nullptr);

/*** TrimSpaces: Remove leading and trailing ASCII whitespace from view. */
void TrimSpaces(std::string_view& text);

/*** ConsumeSign: If + or -, consume and set is_negative accordingly. */
bool ConsumeSign(std::string_view& text, bool& is_negative);

/*** ParseDigitsStrict: Parse base-10 digits covering the whole view; set err on failure. */
bool ParseDigitsStrict(std::string_view text, long long& value, std::string* err);

}  // namespace support
}  // namespace agentrun
