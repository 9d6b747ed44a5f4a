/***
 * Name: tycast::types::AtomicType::parse
 * Purpose: Turn one type name into its interned AtomicType.
 * Inputs:
 *   - name: "?"? base ("[]")*, where base is a keyword, self/static/$this or a class name
 *   - err: optional message sink
 * Outputs: Interned type; `none` when the text is not valid type syntax
 * Theory of Operation:
 *   Strips the nullable prefix and every "[]" suffix, classifies the remaining base
 *   (keywords case-insensitively), interns it, then re-applies one GenericArray
 *   level per stripped suffix. Invalid text never throws: the caller gets the
 *   unknown type and a message, and decides whether that is fatal.
 */
#include "tycast/types/AtomicType.h"

#include <optional>
#include <string>

#include "tycast/support/text.h"
#include "tycast/types/TypeInterner.h"

namespace tycast::types {

namespace {

std::optional<NativeKind> keywordKind(const std::string& lowered) {
  if (lowered == "int" || lowered == "integer") { return NativeKind::Int; }
  if (lowered == "float" || lowered == "double") { return NativeKind::Float; }
  if (lowered == "string") { return NativeKind::String; }
  if (lowered == "bool" || lowered == "boolean") { return NativeKind::Bool; }
  if (lowered == "array") { return NativeKind::Array; }
  if (lowered == "null") { return NativeKind::Null; }
  if (lowered == "mixed") { return NativeKind::Mixed; }
  if (lowered == "none") { return NativeKind::None; }
  if (lowered == "callable") { return NativeKind::Callable; }
  if (lowered == "object") { return NativeKind::Object; }
  if (lowered == "resource") { return NativeKind::Resource; }
  if (lowered == "void") { return NativeKind::Void; }
  return std::nullopt;
}

std::optional<SelfKind> selfKeyword(const std::string& lowered) {
  if (lowered == "self") { return SelfKind::Self; }
  if (lowered == "static") { return SelfKind::Static; }
  if (lowered == "$this") { return SelfKind::This; }
  return std::nullopt;
}

bool isClassName(std::string_view text) {
  if (!text.empty() && text.front() == '\\') { text.remove_prefix(1); }
  if (text.empty()) { return false; }
  for (const auto segment : support::SplitOn(text, '\\')) {
    if (!support::IsIdentifier(segment)) { return false; }
  }
  return true;
}

}  // namespace

const AtomicType& AtomicType::parse(std::string_view name, std::string* err) {
  const std::string_view original = support::TrimSpaces(name);
  std::string_view text = original;
  auto fail = [&](const char* reason) -> const AtomicType& {
    if (err != nullptr) { *err = "invalid type name '" + std::string(original) + "': " + reason; }
    return native(NativeKind::None);
  };

  if (text.empty()) { return fail("empty type name"); }
  bool nullable = false;
  if (text.front() == '?') {
    nullable = true;
    text.remove_prefix(1);
  }
  int depth = 0;
  while (text.size() >= 2 && text.substr(text.size() - 2) == "[]") {
    ++depth;
    text.remove_suffix(2);
  }
  if (text.empty()) { return fail("missing base type"); }

  auto& interner = TypeInterner::Global();
  const std::string lowered = support::ToLowerAscii(text);
  const AtomicType* type = nullptr;
  if (const auto kind = keywordKind(lowered)) {
    type = &interner.native(*kind, nullable);
  } else if (const auto self = selfKeyword(lowered)) {
    type = &interner.selfLike(*self, nullable);
  } else if (isClassName(text)) {
    type = &interner.classRef(QualifiedName(std::string(text)), nullable);
  } else {
    return fail("not a type keyword or class name");
  }

  for (; depth > 0; --depth) { type = &interner.genericOf(*type); }
  return *type;
}

}  // namespace tycast::types
