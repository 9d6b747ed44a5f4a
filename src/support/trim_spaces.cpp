/***
 * Name: tycast::support::TrimSpaces
 * Purpose: Remove leading and trailing ASCII whitespace from a string_view.
 */
#include "tycast/support/text.h"

#include <cctype>
#include <cstddef>

namespace tycast::support {

std::string_view TrimSpaces(std::string_view text) {
  std::size_t index = 0;
  while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
    ++index;
  }
  text.remove_prefix(index);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace tycast::support
