/***
 * Name: agentrun::support (py_repr)
 * Purpose: Render strings and string tuples the way Python's repr() does.
 * Inputs: UTF-8 strings
 * Outputs: Quoted, escaped text
 * Theory of Operation: Quote selection follows CPython: single quotes unless the
 *   text contains a single quote and no double quote. Control bytes are
 *   escaped as \n, \r, \t or \xNN; other bytes pass through unchanged.
 */
#pragma once

#include <string>
#include <vector>

namespace agentrun {
namespace support {

/*** PyStrRepr: repr() of a str value. */
std::string PyStrRepr(const std::string& text);

/*** PyTupleRepr: repr() of a tuple of str values, e.g. ('a',) or ('a', 'b'). */
std::string PyTupleRepr(const std::vector<std::string>& items);

}  // namespace support
}  // namespace agentrun
