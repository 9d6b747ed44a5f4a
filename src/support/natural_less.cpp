/***
 * Name: tycast::support::NaturalLess
 * Purpose: Natural ("human") string ordering used for canonical union strings.
 * Inputs:
 *   - lhs, rhs: strings to compare
 * Outputs: true if lhs sorts strictly before rhs
 * Theory of Operation: See header. Digit runs are compared without converting to
 *   an integer type so arbitrarily long runs cannot overflow.
 */
#include "tycast/support/text.h"

#include <cstddef>

namespace tycast::support {

namespace {
bool isDigit(char c) { return c >= '0' && c <= '9'; }

// Compare the digit runs starting at i/j; advances both past their runs.
int compareDigitRuns(std::string_view a, std::size_t& i, std::string_view b, std::size_t& j) {
  while (i < a.size() && a[i] == '0') { ++i; }
  while (j < b.size() && b[j] == '0') { ++j; }
  const std::size_t aStart = i;
  const std::size_t bStart = j;
  while (i < a.size() && isDigit(a[i])) { ++i; }
  while (j < b.size() && isDigit(b[j])) { ++j; }
  const std::size_t aLen = i - aStart;
  const std::size_t bLen = j - bStart;
  if (aLen != bLen) { return aLen < bLen ? -1 : 1; }
  const int cmp = a.substr(aStart, aLen).compare(b.substr(bStart, bLen));
  return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}
}  // namespace

bool NaturalLess(std::string_view lhs, std::string_view rhs) {
  std::size_t i = 0;
  std::size_t j = 0;
  while (i < lhs.size() && j < rhs.size()) {
    if (isDigit(lhs[i]) && isDigit(rhs[j])) {
      const int cmp = compareDigitRuns(lhs, i, rhs, j);
      if (cmp != 0) { return cmp < 0; }
      continue;
    }
    const auto a = static_cast<unsigned char>(lhs[i]);
    const auto b = static_cast<unsigned char>(rhs[j]);
    if (a != b) { return a < b; }
    ++i;
    ++j;
  }
  if ((lhs.size() - i) != (rhs.size() - j)) { return (lhs.size() - i) < (rhs.size() - j); }
  // Same natural value ("a01" vs "a1"): fall back to plain ordering for strictness.
  return lhs < rhs;
}

}  // namespace tycast::support
