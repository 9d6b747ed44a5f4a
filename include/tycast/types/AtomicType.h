/***
 * Name: tycast::types::AtomicType
 * Purpose: One concrete type alternative: a native keyword type, a class reference,
 *   a generic array of another atomic type, or a context-relative self/static/$this.
 * Inputs:
 *   - Canonical type names ("int", "?Foo", "string[][]", "$this")
 *   - Literal values
 * Outputs:
 *   - Interned, immutable instances; two instances are the same type iff they are
 *     the same object, which is iff their canonical strings are equal.
 * Theory of Operation:
 *   Instances are only created by TypeInterner and live until process exit, so
 *   references to them may be stored freely. A '?' prefix marks the base type
 *   nullable; '[]' suffixes wrap it in GenericArray levels, so "?int[]" is an
 *   array whose elements are nullable ints.
 */
#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "tycast/types/LiteralValue.h"
#include "tycast/types/QualifiedName.h"

namespace tycast::types {

class ClassHierarchy;
class TypeInterner;

enum class NativeKind { Int, Float, String, Bool, Array, Null, Mixed, None, Callable, Object, Resource, Void };

enum class SelfKind { Self, Static, This };

class AtomicType {
 public:
  enum class Variant { Native, ClassRef, GenericArray, SelfLike };

  AtomicType(const AtomicType&) = delete;
  AtomicType& operator=(const AtomicType&) = delete;

  /***
   * Name: tycast::types::AtomicType::parse
   * Purpose: Parse one type name (no '|') into its interned instance.
   * Inputs:
   *   - name: text such as "?int", "Foo\\Bar[]", "static"; surrounding spaces ignored
   *   - err: optional sink for a message when the name is not valid syntax
   * Outputs: The interned type. Invalid syntax yields the `none` type and sets *err.
   */
  static const AtomicType& parse(std::string_view name, std::string* err = nullptr);

  // null -> null, bool -> bool, integer -> int, floating -> float, string -> string,
  // array -> array, object -> class reference.
  static const AtomicType& fromLiteralValue(const LiteralValue& value);

  static const AtomicType& native(NativeKind kind);
  static const AtomicType& classRef(const QualifiedName& name);
  static const AtomicType& selfLike(SelfKind kind);

  /***
   * Name: tycast::types::AtomicType::canCastTo
   * Purpose: Pairwise compatibility of this type with an expected type.
   * Inputs:
   *   - target: expected type
   *   - hierarchy: optional class graph for class-to-class checks
   * Outputs: true if a value of this type may be used where `target` is expected
   * Theory of Operation:
   *   mixed and none match anything; null matches any nullable type and the
   *   nullable flag is otherwise ignored; class names compare case-insensitively;
   *   int widens to float but not the reverse; T[] and array match both ways and
   *   T[] -> U[] follows T -> U; classes and self-like types match object; Closure
   *   matches callable; self-like types match each other and any class; remaining
   *   class pairs consult `hierarchy`.
   */
  bool canCastTo(const AtomicType& target, const ClassHierarchy* hierarchy = nullptr) const;

  Variant variant() const { return variant_; }
  bool isNative() const { return variant_ == Variant::Native; }
  bool isNative(NativeKind kind) const { return variant_ == Variant::Native && native_ == kind; }
  bool isClass() const { return variant_ == Variant::ClassRef; }
  bool isGeneric() const { return variant_ == Variant::GenericArray; }
  bool isSelfLike() const { return variant_ == Variant::SelfLike; }
  bool isNullable() const { return nullable_; }

  // int, float, string, bool and null (nullable forms included).
  bool isScalar() const;

  NativeKind nativeKind() const { return native_; }
  SelfKind selfKind() const { return self_; }

  // Preconditions: isClass() / isGeneric(); violations throw PreconditionError.
  const QualifiedName& className() const;
  const AtomicType& elementType() const;

  // "T" -> "T[]"
  const AtomicType& asGenericType() const;
  // Same type with the nullable flag cleared; generic arrays are returned unchanged.
  const AtomicType& withoutNullable() const;

  const std::string& toString() const { return canonical_; }

 private:
  friend class TypeInterner;

  AtomicType(Variant variant, std::string canonical) : variant_(variant), canonical_(std::move(canonical)) {}

  Variant variant_;
  NativeKind native_{NativeKind::None};
  SelfKind self_{SelfKind::Self};
  bool nullable_{false};
  const AtomicType* element_{nullptr};
  // Non-nullable twin; points at this instance when the type is not nullable.
  const AtomicType* plain_{this};
  QualifiedName class_{};
  std::string canonical_;
};

// Keyword spelling of a native kind ("int", "float", ...).
std::string_view NativeKindName(NativeKind kind);

}  // namespace tycast::types
