/***
 * Name: tycast::types::TypeInterner
 * Purpose: Process-wide table from canonical type string to the single AtomicType
 *   instance with that string.
 * Inputs: Structural descriptions of a type (kind, nullability, element type)
 * Outputs: Stable references to interned instances
 * Theory of Operation:
 *   Each factory computes the canonical string, then performs insert-or-fetch under
 *   a mutex. Instances are owned by the table and never removed, so returned
 *   references stay valid for the life of the process and may be compared by
 *   address. Safe to call from concurrent analyses.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "tycast/types/AtomicType.h"

namespace tycast::types {

class TypeInterner {
 public:
  static TypeInterner& Global();

  const AtomicType& native(NativeKind kind, bool nullable);
  const AtomicType& classRef(const QualifiedName& name, bool nullable);
  const AtomicType& selfLike(SelfKind kind, bool nullable);
  const AtomicType& genericOf(const AtomicType& element);

  // Number of distinct types created so far.
  std::size_t size() const;

 private:
  TypeInterner() = default;

  const AtomicType* find(const std::string& canonical) const;
  const AtomicType& insert(std::unique_ptr<AtomicType> type);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<AtomicType>> types_;
};

}  // namespace tycast::types
