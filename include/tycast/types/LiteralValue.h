/***
 * Name: tycast::types::LiteralValue
 * Purpose: Runtime value of a literal appearing in source, before it has a type.
 * Theory of Operation:
 *   A closed variant over the value shapes the source language can write
 *   literally. Arrays carry no elements here since only their presence matters
 *   for typing; objects carry their class name.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

#include "tycast/types/QualifiedName.h"

namespace tycast::infer {
class SyntaxNode;
}

namespace tycast::types {

struct ArrayLiteral {};

struct ObjectLiteral {
  QualifiedName className;
};

using LiteralValue =
    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, ArrayLiteral, ObjectLiteral>;

// Either a plain value or a syntax node whose type must be inferred.
using LiteralOrNode = std::variant<LiteralValue, const infer::SyntaxNode*>;

}  // namespace tycast::types
