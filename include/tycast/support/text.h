/***
 * Name: tycast::support (text)
 * Purpose: Small string helpers shared by the type model and the builtin registry.
 * Inputs: Byte strings (type names, class names, union strings)
 * Outputs: Transformed copies or predicates
 * Theory of Operation: All helpers are ASCII-only; bytes >= 0x80 pass through
 *   unchanged so multi-byte identifiers survive lowercasing and validation.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tycast {
namespace support {

/***
 * Name: tycast::support::ToLowerAscii
 * Purpose: Lowercase A-Z only; used for class-name keys and keyword matching.
 */
std::string ToLowerAscii(std::string_view text);

/***
 * Name: tycast::support::TrimSpaces
 * Purpose: Drop leading and trailing ASCII whitespace.
 */
std::string_view TrimSpaces(std::string_view text);

/***
 * Name: tycast::support::SplitOn
 * Purpose: Split text on a delimiter, keeping empty pieces.
 * Inputs: text, delimiter
 * Outputs: Views into text; an empty input yields a single empty piece.
 */
std::vector<std::string_view> SplitOn(std::string_view text, char delim);

/***
 * Name: tycast::support::IsIdentifier
 * Purpose: True if text is a non-empty identifier: [A-Za-z_\x80-\xff][A-Za-z0-9_\x80-\xff]*
 */
bool IsIdentifier(std::string_view text);

/***
 * Name: tycast::support::NaturalLess
 * Purpose: Strict weak ordering that compares embedded digit runs by numeric value.
 * Inputs: lhs, rhs
 * Outputs: true if lhs orders before rhs
 * Theory of Operation:
 *   Walks both strings in lockstep. When both sides are at a digit, the two digit
 *   runs are compared as numbers (leading zeros skipped, then by length, then
 *   lexically); otherwise bytes are compared as unsigned values. Equal prefixes
 *   order the shorter string first. Case-sensitive, so "B" < "a".
 */
bool NaturalLess(std::string_view lhs, std::string_view rhs);

}  // namespace support
}  // namespace tycast
