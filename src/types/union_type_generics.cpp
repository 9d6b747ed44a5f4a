/***
 * Name: tycast::types::UnionType (generic projection)
 * Purpose: Element types of array members, array-of-each-member, and the
 *   non-array remainder.
 */
#include "tycast/types/UnionType.h"

namespace tycast::types {

UnionType UnionType::genericTypes() const {
  // An untyped array (nullable or not) or mixed may hold anything.
  const AtomicType& mixedType = AtomicType::native(NativeKind::Mixed);
  for (const AtomicType* type : types_) {
    if (type->isNative(NativeKind::Array) || type == &mixedType) { return UnionType{&mixedType}; }
  }

  UnionType result;
  for (const AtomicType* type : types_) {
    if (type->isGeneric()) { result.addType(type->elementType()); }
  }
  return result;
}

UnionType UnionType::asGenericTypes() const {
  UnionType result;
  for (const AtomicType* type : types_) { result.addType(type->asGenericType()); }
  return result;
}

UnionType UnionType::nonGenericTypes() const {
  UnionType result;
  for (const AtomicType* type : types_) {
    if (!type->isGeneric()) { result.addType(*type); }
  }
  return result;
}

}  // namespace tycast::types
