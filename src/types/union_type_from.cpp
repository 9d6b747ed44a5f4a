/***
 * Name: tycast::types::UnionType (construction)
 * Purpose: Build unions from type strings, literal values and syntax nodes.
 * Theory of Operation:
 *   fromNode and fromTypeNameNode are the only places this library hands control
 *   to the external expression typer; everything else is local parsing.
 */
#include "tycast/types/UnionType.h"

#include <string>
#include <utility>
#include <variant>

#include "tycast/infer/NodeTypeInferer.h"
#include "tycast/support/text.h"

namespace tycast::types {

UnionType UnionType::fromString(std::string_view text, std::vector<std::string>* errs) {
  UnionType result;
  if (support::TrimSpaces(text).empty()) { return result; }
  for (const auto segment : support::SplitOn(text, '|')) {
    std::string err;
    const AtomicType& type = AtomicType::parse(segment, &err);
    if (!err.empty() && errs != nullptr) { errs->push_back(std::move(err)); }
    result.addType(type);
  }
  return result;
}

UnionType UnionType::fromLiteral(const LiteralValue& value) {
  if (std::holds_alternative<std::nullptr_t>(value)) { return UnionType(); }
  return UnionType{&AtomicType::fromLiteralValue(value)};
}

UnionType UnionType::fromNode(const infer::NodeTypeInferer& inferer, const infer::InferenceContext& context,
                              const infer::SyntaxNode* node) {
  if (node == nullptr) { return UnionType(); }
  return inferer.inferNodeType(context, *node);
}

UnionType UnionType::fromTypeNameNode(const infer::NodeTypeInferer& inferer, const infer::InferenceContext& context,
                                      const infer::SyntaxNode* node) {
  if (node == nullptr) { return UnionType(); }
  return inferer.inferTypeName(context, *node);
}

UnionType UnionType::fromLiteralOrNode(const infer::NodeTypeInferer& inferer, const infer::InferenceContext& context,
                                       const LiteralOrNode& input) {
  if (const auto* node = std::get_if<const infer::SyntaxNode*>(&input)) { return fromNode(inferer, context, *node); }
  return fromLiteral(std::get<LiteralValue>(input));
}

}  // namespace tycast::types
