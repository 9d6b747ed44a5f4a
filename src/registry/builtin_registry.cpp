/***
 * Name: tycast::registry::BuiltinRegistry (lookups)
 * Purpose: Existence checks and typed lookups over the builtin tables.
 * Theory of Operation:
 *   Existence checks return bool and are the way callers learn a builtin is
 *   unknown. The typed lookups for properties and return types treat a missing
 *   key as a caller bug and throw PreconditionError.
 */
#include "tycast/registry/BuiltinRegistry.h"

#include "tycast/exceptions/precondition_error.h"
#include "tycast/support/text.h"

namespace tycast::registry {

bool BuiltinRegistry::hasClass(std::string_view className) const {
  return classes_.find(support::ToLowerAscii(className)) != classes_.end();
}

bool BuiltinRegistry::hasClassProperty(std::string_view className, const std::string& propertyName) const {
  const auto cls = classes_.find(support::ToLowerAscii(className));
  return cls != classes_.end() && cls->second.find(propertyName) != cls->second.end();
}

types::UnionType BuiltinRegistry::classPropertyType(std::string_view className,
                                                    const std::string& propertyName) const {
  const auto cls = classes_.find(support::ToLowerAscii(className));
  if (cls == classes_.end()) {
    throw exceptions::PreconditionError("precondition violated: builtin class '" + std::string(className) +
                                        "' is not registered; check hasClass() first");
  }
  const auto prop = cls->second.find(propertyName);
  if (prop == cls->second.end()) {
    throw exceptions::PreconditionError("precondition violated: builtin class '" + std::string(className) +
                                        "' has no property '" + propertyName +
                                        "'; check hasClassProperty() first");
  }
  return types::UnionType::fromString(prop->second);
}

ParameterTypeList BuiltinRegistry::functionParameterTypes(const types::QualifiedName& name) const {
  ParameterTypeList params;
  const auto fn = functions_.find(name.toString());
  if (fn == functions_.end() || fn->second.empty()) { return params; }
  for (std::size_t i = 1; i < fn->second.size(); ++i) {
    const SignatureSlot& slot = fn->second[i];
    params.emplace_back(slot.name, types::UnionType::fromString(slot.typeName));
  }
  return params;
}

bool BuiltinRegistry::signatureExists(const types::QualifiedName& name) const {
  const auto fn = functions_.find(name.toString());
  return fn != functions_.end() && !fn->second.empty();
}

types::UnionType BuiltinRegistry::functionReturnType(const types::QualifiedName& name) const {
  const auto fn = functions_.find(name.toString());
  if (fn == functions_.end() || fn->second.empty()) {
    throw exceptions::PreconditionError("precondition violated: builtin function '" + name.toString() +
                                        "' is not registered; check signatureExists() first");
  }
  return types::UnionType::fromString(fn->second.front().typeName);
}

}  // namespace tycast::registry
