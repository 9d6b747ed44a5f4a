/***
 * Name: tycast::types::AtomicType (impl)
 * Purpose: Factories, predicates and derived-type accessors.
 */
#include "tycast/types/AtomicType.h"

#include <string>

#include "tycast/exceptions/precondition_error.h"
#include "tycast/types/TypeInterner.h"

namespace tycast::types {

std::string_view NativeKindName(NativeKind kind) {
  switch (kind) {
    case NativeKind::Int: return "int";
    case NativeKind::Float: return "float";
    case NativeKind::String: return "string";
    case NativeKind::Bool: return "bool";
    case NativeKind::Array: return "array";
    case NativeKind::Null: return "null";
    case NativeKind::Mixed: return "mixed";
    case NativeKind::None: return "none";
    case NativeKind::Callable: return "callable";
    case NativeKind::Object: return "object";
    case NativeKind::Resource: return "resource";
    case NativeKind::Void: return "void";
  }
  return "none";
}

const AtomicType& AtomicType::native(NativeKind kind) { return TypeInterner::Global().native(kind, false); }

const AtomicType& AtomicType::classRef(const QualifiedName& name) {
  return TypeInterner::Global().classRef(name, false);
}

const AtomicType& AtomicType::selfLike(SelfKind kind) { return TypeInterner::Global().selfLike(kind, false); }

namespace {
struct LiteralTyper {
  const AtomicType& operator()(std::nullptr_t /*unused*/) const { return AtomicType::native(NativeKind::Null); }
  const AtomicType& operator()(bool /*unused*/) const { return AtomicType::native(NativeKind::Bool); }
  const AtomicType& operator()(std::int64_t /*unused*/) const { return AtomicType::native(NativeKind::Int); }
  const AtomicType& operator()(double /*unused*/) const { return AtomicType::native(NativeKind::Float); }
  const AtomicType& operator()(const std::string& /*unused*/) const { return AtomicType::native(NativeKind::String); }
  const AtomicType& operator()(const ArrayLiteral& /*unused*/) const { return AtomicType::native(NativeKind::Array); }
  const AtomicType& operator()(const ObjectLiteral& obj) const { return AtomicType::classRef(obj.className); }
};
}  // namespace

const AtomicType& AtomicType::fromLiteralValue(const LiteralValue& value) { return std::visit(LiteralTyper{}, value); }

bool AtomicType::isScalar() const {
  if (variant_ != Variant::Native) { return false; }
  switch (native_) {
    case NativeKind::Int:
    case NativeKind::Float:
    case NativeKind::String:
    case NativeKind::Bool:
    case NativeKind::Null:
      return true;
    default:
      return false;
  }
}

const QualifiedName& AtomicType::className() const {
  if (!isClass()) {
    throw exceptions::PreconditionError("className() requires a class type, got '" + canonical_ + "'");
  }
  return class_;
}

const AtomicType& AtomicType::elementType() const {
  if (!isGeneric()) {
    throw exceptions::PreconditionError("elementType() requires a generic array type, got '" + canonical_ + "'");
  }
  return *element_;
}

const AtomicType& AtomicType::asGenericType() const { return TypeInterner::Global().genericOf(*this); }

const AtomicType& AtomicType::withoutNullable() const { return *plain_; }

}  // namespace tycast::types
