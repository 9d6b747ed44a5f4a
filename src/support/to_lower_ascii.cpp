/***
 * Name: tycast::support::ToLowerAscii
 * Purpose: Lowercase ASCII letters in a copy of the input.
 */
#include "tycast/support/text.h"

namespace tycast::support {

std::string ToLowerAscii(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    if (c >= 'A' && c <= 'Z') { c = static_cast<char>(c - 'A' + 'a'); }
  }
  return out;
}

}  // namespace tycast::support
