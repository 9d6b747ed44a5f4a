/***
 * Name: tycast::infer (seam)
 * Purpose: Boundary between the type core and the AST-walking expression typer.
 * Inputs: Syntax nodes and the lexical context they appear in (owned elsewhere)
 * Outputs: The UnionType inferred for a node
 * Theory of Operation:
 *   The parser, scopes and visitor live outside this library. They derive their
 *   node and context types from the markers below and implement NodeTypeInferer;
 *   UnionType::fromNode and UnionType::fromTypeNameNode forward to it unchanged.
 */
#pragma once

#include "tycast/types/UnionType.h"

namespace tycast::infer {

class SyntaxNode {
 public:
  virtual ~SyntaxNode() = default;
};

class InferenceContext {
 public:
  virtual ~InferenceContext() = default;
};

class NodeTypeInferer {
 public:
  virtual ~NodeTypeInferer() = default;

  // Type of an expression node.
  virtual types::UnionType inferNodeType(const InferenceContext& context, const SyntaxNode& node) const = 0;

  // Type named by a node in a type position (parameter or return declaration,
  // `new X`, `instanceof X`), resolved against the context's namespace and uses.
  virtual types::UnionType inferTypeName(const InferenceContext& context, const SyntaxNode& node) const = 0;
};

}  // namespace tycast::infer
