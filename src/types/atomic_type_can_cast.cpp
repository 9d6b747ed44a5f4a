/***
 * Name: tycast::types::AtomicType::canCastTo
 * Purpose: Decide whether a value of this atomic type may be used where `target`
 *   is expected.
 * Inputs:
 *   - target: expected type
 *   - hierarchy: optional class graph (nullptr: class names must match)
 * Outputs: bool
 * Theory of Operation:
 *   Rules are checked in order; the first match wins. Among native keyword types
 *   the relation is symmetric except for int -> float.
 */
#include "tycast/types/AtomicType.h"

#include "tycast/types/ClassHierarchy.h"

namespace tycast::types {

namespace {

bool isUnknownOrMixed(const AtomicType& type) {
  return type.isNative(NativeKind::Mixed) || type.isNative(NativeKind::None);
}

bool isClassLike(const AtomicType& type) { return type.isClass() || type.isSelfLike(); }

bool isClosure(const AtomicType& type) { return type.isClass() && type.className().lowercased() == "closure"; }

// Both sides already have the nullable flag cleared.
bool castNonNullable(const AtomicType& src, const AtomicType& dst, const ClassHierarchy* hierarchy) {
  if (&src == &dst) { return true; }

  if (src.isClass() && dst.isClass()) {
    if (src.className().lowercased() == dst.className().lowercased()) { return true; }
    return hierarchy != nullptr && hierarchy->isSubclassOf(src.className(), dst.className());
  }

  // int -> float only
  if (src.isNative(NativeKind::Int) && dst.isNative(NativeKind::Float)) { return true; }

  if (src.isGeneric() && dst.isNative(NativeKind::Array)) { return true; }
  if (src.isNative(NativeKind::Array) && dst.isGeneric()) { return true; }
  if (src.isGeneric() && dst.isGeneric()) { return src.elementType().canCastTo(dst.elementType(), hierarchy); }

  if (isClassLike(src) && dst.isNative(NativeKind::Object)) { return true; }
  if (src.isNative(NativeKind::Object) && isClassLike(dst)) { return true; }

  if (isClosure(src) && dst.isNative(NativeKind::Callable)) { return true; }
  if (src.isNative(NativeKind::Callable) && isClosure(dst)) { return true; }

  // self/static/$this are resolved by the caller's class context.
  if (src.isSelfLike() && isClassLike(dst)) { return true; }
  if (isClassLike(src) && dst.isSelfLike()) { return true; }

  return false;
}

}  // namespace

bool AtomicType::canCastTo(const AtomicType& target, const ClassHierarchy* hierarchy) const {
  if (this == &target) { return true; }
  if (isUnknownOrMixed(*this) || isUnknownOrMixed(target)) { return true; }

  if (isNative(NativeKind::Null) && target.isNullable()) { return true; }
  if (target.isNative(NativeKind::Null) && isNullable()) { return true; }

  return castNonNullable(withoutNullable(), target.withoutNullable(), hierarchy);
}

}  // namespace tycast::types
