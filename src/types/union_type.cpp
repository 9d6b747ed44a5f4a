/***
 * Name: tycast::types::UnionType (set algebra)
 * Purpose: Insertion, membership queries and canonical string form.
 */
#include "tycast/types/UnionType.h"

#include <algorithm>

#include "tycast/exceptions/precondition_error.h"
#include "tycast/support/text.h"

namespace tycast::types {

UnionType::UnionType(std::initializer_list<const AtomicType*> types) {
  for (const AtomicType* type : types) {
    if (type != nullptr) { addType(*type); }
  }
}

UnionType::UnionType(const std::vector<const AtomicType*>& types) {
  for (const AtomicType* type : types) {
    if (type != nullptr) { addType(*type); }
  }
}

void UnionType::addType(const AtomicType& type) {
  if (!hasType(type)) { types_.push_back(&type); }
}

void UnionType::addUnionType(const UnionType& other) {
  for (const AtomicType* type : other.types_) { addType(*type); }
}

const AtomicType& UnionType::head() const {
  if (types_.empty()) { throw exceptions::PreconditionError("head() called on an empty union type"); }
  return *types_.front();
}

bool UnionType::hasType(const AtomicType& type) const {
  return std::find(types_.begin(), types_.end(), &type) != types_.end();
}

bool UnionType::hasAnyType(const std::vector<const AtomicType*>& types) const {
  return std::any_of(types.begin(), types.end(),
                     [this](const AtomicType* type) { return type != nullptr && hasType(*type); });
}

bool UnionType::isType(const AtomicType& type) const { return types_.size() == 1 && types_.front() == &type; }

bool UnionType::isEqualTo(const UnionType& other) const { return toString() == other.toString(); }

bool UnionType::hasSelfType() const {
  return std::any_of(types_.begin(), types_.end(), [](const AtomicType* type) { return type->isSelfLike(); });
}

bool UnionType::isScalar() const { return types_.size() == 1 && types_.front()->isScalar(); }

std::string UnionType::toString() const {
  std::vector<const std::string*> names;
  names.reserve(types_.size());
  for (const AtomicType* type : types_) { names.push_back(&type->toString()); }
  std::sort(names.begin(), names.end(),
            [](const std::string* lhs, const std::string* rhs) { return support::NaturalLess(*lhs, *rhs); });
  std::string out;
  for (const std::string* name : names) {
    if (!out.empty()) { out.push_back('|'); }
    out.append(*name);
  }
  return out;
}

}  // namespace tycast::types
