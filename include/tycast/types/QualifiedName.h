/***
 * Name: tycast::types::QualifiedName
 * Purpose: Immutable namespace-qualified identity of a class or function.
 * Inputs: A fully qualified name ("\Ns\Name") or a namespace plus a short name.
 * Outputs: Lookup key for the builtin registry and class references in AtomicType.
 * Theory of Operation:
 *   Stores the text verbatim; equality is exact string equality. Callers that need
 *   case-insensitive class identity use lowercased() explicitly, since function
 *   lookups are case-sensitive and class lookups are not.
 */
#pragma once

#include <string>
#include <string_view>

namespace tycast::types {

class QualifiedName {
 public:
  QualifiedName() = default;
  explicit QualifiedName(std::string fullyQualified);

  // fromParts("Foo\\Bar", "baz") -> "\Foo\Bar\baz"; an empty namespace yields "\baz".
  static QualifiedName fromParts(std::string_view namespaceName, std::string_view name);

  const std::string& toString() const { return text_; }
  bool empty() const { return text_.empty(); }

  // Namespace portion without leading or trailing separators ("" for the global namespace).
  std::string namespaceName() const;
  // Last segment.
  std::string shortName() const;
  // Leading '\' removed and ASCII lowercased; the case-insensitive class identity.
  std::string lowercased() const;

  bool operator==(const QualifiedName& other) const { return text_ == other.text_; }
  bool operator!=(const QualifiedName& other) const { return text_ != other.text_; }
  bool operator<(const QualifiedName& other) const { return text_ < other.text_; }

 private:
  std::string text_;
};

}  // namespace tycast::types
