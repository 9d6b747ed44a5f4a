/***
 * Name: tycast::registry::BuiltinRegistry
 * Purpose: Read-only tables of builtin class property types and builtin function
 *   signatures.
 * Inputs:
 *   - Rows added through Builder (or the compiled-in defaults)
 * Outputs:
 *   - UnionType answers for property and parameter lookups
 * Theory of Operation:
 *   Class names are stored lowercased, so class lookups are case-insensitive.
 *   Function signatures are keyed by the exact qualified name string, so function
 *   lookups are case-sensitive. Slot 0 of a signature is the return type; slots
 *   1..n are parameters in declaration order. A built registry never changes and
 *   may be read from any number of threads.
 *
 *   Global() is the process-wide instance. It is created exactly once: either by an
 *   explicit InitializeGlobal() before first use, or lazily from Defaults().
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tycast/types/QualifiedName.h"
#include "tycast/types/UnionType.h"

namespace tycast::registry {

struct SignatureSlot {
  std::string name;
  std::string typeName;
};

// Parameter name -> declared type, in declaration order.
using ParameterTypeList = std::vector<std::pair<std::string, types::UnionType>>;

class BuiltinRegistry {
 public:
  using PropertyTable = std::unordered_map<std::string, std::string>;
  using ClassTable = std::unordered_map<std::string, PropertyTable>;
  using FunctionTable = std::unordered_map<std::string, std::vector<SignatureSlot>>;

  class Builder {
   public:
    Builder& addClass(std::string_view className);
    Builder& addClassProperty(std::string_view className, std::string propertyName, std::string typeName);
    // Replaces any earlier row for the same name.
    Builder& addFunction(const types::QualifiedName& name, std::string returnType, std::vector<SignatureSlot> params);
    BuiltinRegistry build();

   private:
    ClassTable classes_;
    FunctionTable functions_;
  };

  BuiltinRegistry() = default;

  static const BuiltinRegistry& Global();
  // Installs `registry` as the process-wide instance. Throws PreconditionError if
  // Global() was already initialised (explicitly or lazily).
  static void InitializeGlobal(BuiltinRegistry registry);
  // The compiled-in standard library subset.
  static BuiltinRegistry Defaults();

  bool hasClass(std::string_view className) const;
  bool hasClassProperty(std::string_view className, const std::string& propertyName) const;

  /***
   * Name: tycast::registry::BuiltinRegistry::classPropertyType
   * Purpose: Declared type of a builtin class property.
   * Inputs: className (any case), propertyName (exact)
   * Outputs: Union parsed from the declared type name
   * Theory of Operation: The caller must have checked hasClassProperty(); an absent
   *   class or property throws PreconditionError rather than returning empty.
   */
  types::UnionType classPropertyType(std::string_view className, const std::string& propertyName) const;

  // Parameter types of a builtin function, return slot excluded. Empty when the
  // name is unknown.
  ParameterTypeList functionParameterTypes(const types::QualifiedName& name) const;

  bool signatureExists(const types::QualifiedName& name) const;

  // Precondition: signatureExists(name).
  types::UnionType functionReturnType(const types::QualifiedName& name) const;

  std::size_t classCount() const { return classes_.size(); }
  std::size_t functionCount() const { return functions_.size(); }

 private:
  BuiltinRegistry(ClassTable classes, FunctionTable functions)
      : classes_(std::move(classes)), functions_(std::move(functions)) {}

  ClassTable classes_;
  FunctionTable functions_;
};

}  // namespace tycast::registry
