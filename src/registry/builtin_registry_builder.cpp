/***
 * Name: tycast::registry::BuiltinRegistry::Builder
 * Purpose: Accumulate rows, then freeze them into an immutable registry.
 */
#include "tycast/registry/BuiltinRegistry.h"

#include "tycast/support/text.h"

namespace tycast::registry {

auto BuiltinRegistry::Builder::addClass(std::string_view className) -> Builder& {
  classes_[support::ToLowerAscii(className)];
  return *this;
}

auto BuiltinRegistry::Builder::addClassProperty(std::string_view className, std::string propertyName,
                                                std::string typeName) -> Builder& {
  classes_[support::ToLowerAscii(className)][std::move(propertyName)] = std::move(typeName);
  return *this;
}

auto BuiltinRegistry::Builder::addFunction(const types::QualifiedName& name, std::string returnType,
                                           std::vector<SignatureSlot> params) -> Builder& {
  std::vector<SignatureSlot> row;
  row.reserve(params.size() + 1);
  row.push_back(SignatureSlot{"", std::move(returnType)});
  for (auto& param : params) { row.push_back(std::move(param)); }
  functions_[name.toString()] = std::move(row);
  return *this;
}

auto BuiltinRegistry::Builder::build() -> BuiltinRegistry {
  return BuiltinRegistry(std::move(classes_), std::move(functions_));
}

}  // namespace tycast::registry
