/***
 * Name: tycast::support::IsIdentifier
 * Purpose: Validate one namespace segment or short class name.
 * Theory of Operation: Mirrors the source language's label rule; bytes >= 0x80
 *   count as letters.
 */
#include "tycast/support/text.h"

namespace tycast::support {

namespace {
bool isLabelStart(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c >= 0x80;
}
}  // namespace

bool IsIdentifier(std::string_view text) {
  if (text.empty() || !isLabelStart(static_cast<unsigned char>(text[0]))) { return false; }
  for (char ch : text.substr(1)) {
    const auto c = static_cast<unsigned char>(ch);
    if (!isLabelStart(c) && !(c >= '0' && c <= '9')) { return false; }
  }
  return true;
}

}  // namespace tycast::support
