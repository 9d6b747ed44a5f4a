/***
 * Name: tycast::types::UnionType::canCastTo
 * Purpose: Union-level cast compatibility.
 * Inputs:
 *   - target: expected union
 *   - hierarchy: optional class graph
 * Outputs: true if castable
 * Theory of Operation:
 *   Cheap whole-union rules run first in a fixed order; only then is the cross
 *   product of members checked pairwise. Unknown, null-only and mixed unions are
 *   accepted so unresolved inference never produces a diagnostic.
 */
#include "tycast/types/UnionType.h"

namespace tycast::types {

bool UnionType::canCastTo(const UnionType& target, const ClassHierarchy* hierarchy) const {
  if (isEqualTo(target)) { return true; }

  if (empty() || target.empty()) { return true; }

  const AtomicType& nullType = AtomicType::native(NativeKind::Null);
  if (isType(nullType) || target.isType(nullType)) { return true; }

  const AtomicType& mixedType = AtomicType::native(NativeKind::Mixed);
  if (hasType(mixedType) || target.hasType(mixedType)) { return true; }

  // int -> float
  if (isType(AtomicType::native(NativeKind::Int)) && target.isType(AtomicType::native(NativeKind::Float))) {
    return true;
  }

  for (const AtomicType* source : types_) {
    for (const AtomicType* expected : target.types_) {
      if (source->canCastTo(*expected, hierarchy)) { return true; }
    }
  }
  return false;
}

}  // namespace tycast::types
