/***
 * Name: tycast::types::TypeInterner (impl)
 * Purpose: Insert-or-fetch of AtomicType instances keyed by canonical string.
 * Theory of Operation:
 *   Canonical strings are computed before taking the lock; lookup and creation
 *   happen under one lock so two threads interning the same name always observe
 *   the same instance. "?null" and "?mixed" collapse to their plain forms since
 *   both already admit null.
 *   A nullable type is created after its non-nullable twin, which it keeps a
 *   pointer to so withoutNullable() never touches the table.
 */
#include "tycast/types/TypeInterner.h"

#include <utility>

namespace tycast::types {

TypeInterner& TypeInterner::Global() {
  static TypeInterner interner;
  return interner;
}

// Callers hold mutex_.
const AtomicType* TypeInterner::find(const std::string& canonical) const {
  const auto it = types_.find(canonical);
  return it == types_.end() ? nullptr : it->second.get();
}

// Callers hold mutex_.
const AtomicType& TypeInterner::insert(std::unique_ptr<AtomicType> type) {
  const AtomicType& ref = *type;
  std::string key = type->canonical_;
  types_.emplace(std::move(key), std::move(type));
  return ref;
}

const AtomicType& TypeInterner::native(NativeKind kind, bool nullable) {
  if (kind == NativeKind::Null || kind == NativeKind::Mixed) { nullable = false; }
  std::string canonical = nullable ? "?" : "";
  canonical.append(NativeKindName(kind));
  const AtomicType* plain = nullable ? &native(kind, false) : nullptr;
  const std::lock_guard<std::mutex> lock(mutex_);
  if (const AtomicType* found = find(canonical)) { return *found; }
  std::unique_ptr<AtomicType> type(new AtomicType(AtomicType::Variant::Native, std::move(canonical)));
  type->native_ = kind;
  type->nullable_ = nullable;
  if (plain != nullptr) { type->plain_ = plain; }
  return insert(std::move(type));
}

const AtomicType& TypeInterner::classRef(const QualifiedName& name, bool nullable) {
  std::string canonical = nullable ? "?" : "";
  canonical.append(name.toString());
  const AtomicType* plain = nullable ? &classRef(name, false) : nullptr;
  const std::lock_guard<std::mutex> lock(mutex_);
  if (const AtomicType* found = find(canonical)) { return *found; }
  std::unique_ptr<AtomicType> type(new AtomicType(AtomicType::Variant::ClassRef, std::move(canonical)));
  type->class_ = name;
  type->nullable_ = nullable;
  if (plain != nullptr) { type->plain_ = plain; }
  return insert(std::move(type));
}

const AtomicType& TypeInterner::selfLike(SelfKind kind, bool nullable) {
  std::string canonical = nullable ? "?" : "";
  switch (kind) {
    case SelfKind::Self: canonical.append("self"); break;
    case SelfKind::Static: canonical.append("static"); break;
    case SelfKind::This: canonical.append("$this"); break;
  }
  const AtomicType* plain = nullable ? &selfLike(kind, false) : nullptr;
  const std::lock_guard<std::mutex> lock(mutex_);
  if (const AtomicType* found = find(canonical)) { return *found; }
  std::unique_ptr<AtomicType> type(new AtomicType(AtomicType::Variant::SelfLike, std::move(canonical)));
  type->self_ = kind;
  type->nullable_ = nullable;
  if (plain != nullptr) { type->plain_ = plain; }
  return insert(std::move(type));
}

const AtomicType& TypeInterner::genericOf(const AtomicType& element) {
  std::string canonical = element.toString() + "[]";
  const std::lock_guard<std::mutex> lock(mutex_);
  if (const AtomicType* found = find(canonical)) { return *found; }
  std::unique_ptr<AtomicType> type(new AtomicType(AtomicType::Variant::GenericArray, std::move(canonical)));
  type->element_ = &element;
  return insert(std::move(type));
}

std::size_t TypeInterner::size() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return types_.size();
}

}  // namespace tycast::types
