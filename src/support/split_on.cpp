/***
 * Name: tycast::support::SplitOn
 * Purpose: Split a view on a single-character delimiter.
 */
#include "tycast/support/text.h"

#include <cstddef>

namespace tycast::support {

std::vector<std::string_view> SplitOn(std::string_view text, char delim) {
  std::vector<std::string_view> pieces;
  std::size_t start = 0;
  for (std::size_t pos = text.find(delim); pos != std::string_view::npos; pos = text.find(delim, start)) {
    pieces.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  pieces.push_back(text.substr(start));
  return pieces;
}

}  // namespace tycast::support
