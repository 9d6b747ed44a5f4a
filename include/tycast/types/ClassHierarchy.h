/***
 * Name: tycast::types::ClassHierarchy
 * Purpose: Injected view of the analyzed program's class graph.
 * Inputs: Two class names
 * Outputs: Whether the first class may stand in for the second
 * Theory of Operation:
 *   The class graph is built outside this library; cast checks accept an optional
 *   pointer to an implementation and fall back to name identity without one.
 */
#pragma once

#include "tycast/types/QualifiedName.h"

namespace tycast::types {

class ClassHierarchy {
 public:
  virtual ~ClassHierarchy() = default;

  // True if `derived` extends or implements `base` (directly or transitively).
  virtual bool isSubclassOf(const QualifiedName& derived, const QualifiedName& base) const = 0;
};

}  // namespace tycast::types
