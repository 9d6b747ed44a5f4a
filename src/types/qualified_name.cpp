/***
 * Name: tycast::types::QualifiedName (impl)
 * Purpose: Construction and segment accessors for qualified names.
 */
#include "tycast/types/QualifiedName.h"

#include <utility>

#include "tycast/support/text.h"

namespace tycast::types {

QualifiedName::QualifiedName(std::string fullyQualified) : text_(std::move(fullyQualified)) {}

QualifiedName QualifiedName::fromParts(std::string_view namespaceName, std::string_view name) {
  while (!namespaceName.empty() && namespaceName.front() == '\\') { namespaceName.remove_prefix(1); }
  while (!namespaceName.empty() && namespaceName.back() == '\\') { namespaceName.remove_suffix(1); }
  std::string text = "\\";
  if (!namespaceName.empty()) {
    text.append(namespaceName);
    text.push_back('\\');
  }
  text.append(name);
  return QualifiedName(std::move(text));
}

std::string QualifiedName::namespaceName() const {
  std::string_view view(text_);
  if (!view.empty() && view.front() == '\\') { view.remove_prefix(1); }
  const auto pos = view.rfind('\\');
  if (pos == std::string_view::npos) { return {}; }
  return std::string(view.substr(0, pos));
}

std::string QualifiedName::shortName() const {
  const auto pos = text_.rfind('\\');
  if (pos == std::string::npos) { return text_; }
  return text_.substr(pos + 1);
}

std::string QualifiedName::lowercased() const {
  std::string_view view(text_);
  if (!view.empty() && view.front() == '\\') { view.remove_prefix(1); }
  return support::ToLowerAscii(view);
}

}  // namespace tycast::types
