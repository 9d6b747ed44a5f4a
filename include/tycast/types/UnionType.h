/***
 * Name: tycast::types::UnionType
 * Purpose: The set of atomic types an expression may hold at runtime.
 * Inputs:
 *   - '|' delimited type strings ("int|string|null|ClassName")
 *   - Literal values or syntax nodes (via an external inferer)
 *   - Incremental insertion while inference walks an expression
 * Outputs:
 *   - Set queries, cast-compatibility decisions and generic projections
 *   - A canonical, naturally sorted string form used for equality and serialization
 * Theory of Operation:
 *   Holds interned AtomicType pointers in first-insertion order without duplicates
 *   (interning makes pointer identity equal to canonical-string identity). The
 *   empty union means "unknown" and is accepted by every cast check. Unions are
 *   built by repeated insertion and then only queried; nothing enforces that split.
 */
#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "tycast/types/AtomicType.h"
#include "tycast/types/LiteralValue.h"

namespace tycast::infer {
class InferenceContext;
class NodeTypeInferer;
class SyntaxNode;
}  // namespace tycast::infer

namespace tycast::types {

class ClassHierarchy;

class UnionType {
 public:
  UnionType() = default;
  UnionType(std::initializer_list<const AtomicType*> types);
  explicit UnionType(const std::vector<const AtomicType*>& types);

  /***
   * Name: tycast::types::UnionType::fromString
   * Purpose: Parse a '|' delimited union string.
   * Inputs:
   *   - text: e.g. "int|string[]|?Foo"; "" yields the empty union
   *   - errs: optional sink; one message is appended per unparsable segment
   * Outputs: The union of every parsed segment (duplicates collapse)
   * Theory of Operation: Unparsable segments contribute `none` rather than aborting
   *   the whole union.
   */
  static UnionType fromString(std::string_view text, std::vector<std::string>* errs = nullptr);

  // A null literal yields the empty union; anything else its singleton literal type.
  static UnionType fromLiteral(const LiteralValue& value);

  // A null node yields the empty union; otherwise the inferer decides.
  static UnionType fromNode(const infer::NodeTypeInferer& inferer, const infer::InferenceContext& context,
                            const infer::SyntaxNode* node);

  // Same null handling as fromNode, for a node that names a type rather than
  // computing a value.
  static UnionType fromTypeNameNode(const infer::NodeTypeInferer& inferer, const infer::InferenceContext& context,
                                    const infer::SyntaxNode* node);

  static UnionType fromLiteralOrNode(const infer::NodeTypeInferer& inferer, const infer::InferenceContext& context,
                                     const LiteralOrNode& input);

  // Adding a type already present is a no-op.
  void addType(const AtomicType& type);
  void addUnionType(const UnionType& other);

  // First member in insertion order. Only meaningful when count() == 1; throws
  // PreconditionError on the empty union.
  const AtomicType& head() const;

  bool hasType(const AtomicType& type) const;
  bool hasAnyType(const std::vector<const AtomicType*>& types) const;
  // Exactly one member, and it is `type`.
  bool isType(const AtomicType& type) const;
  bool isEqualTo(const UnionType& other) const;
  bool hasSelfType() const;
  // Exactly one member, and that member is scalar.
  bool isScalar() const;

  std::size_t count() const { return types_.size(); }
  bool empty() const { return types_.empty(); }
  const std::vector<const AtomicType*>& types() const { return types_; }

  /***
   * Name: tycast::types::UnionType::canCastTo
   * Purpose: Decide whether a value of this union may be used where `target` is expected.
   * Inputs:
   *   - target: the expected union
   *   - hierarchy: optional class graph forwarded to atomic checks
   * Outputs: bool; never throws
   * Theory of Operation (first match wins):
   *   1. identical canonical strings
   *   2. either union empty (unknown)
   *   3. either union is exactly null
   *   4. either union contains mixed
   *   5. exactly int to exactly float (not the reverse)
   *   6. any source member casts to any target member
   *   otherwise not castable. Rules 2-5 deliberately favour accepting code whose
   *   types are uncertain.
   */
  bool canCastTo(const UnionType& target, const ClassHierarchy* hierarchy = nullptr) const;

  // "int[]|string|bool[]" -> "int|bool"; any bare array or mixed member -> "mixed".
  UnionType genericTypes() const;
  // "int|float" -> "int[]|float[]"
  UnionType asGenericTypes() const;
  // "int[]|string|bool[]" -> "string"
  UnionType nonGenericTypes() const;

  // Members sorted in natural order and joined with '|'.
  std::string toString() const;
  std::string serialize() const { return toString(); }
  static UnionType unserialize(std::string_view serialized) { return fromString(serialized); }

 private:
  std::vector<const AtomicType*> types_;
};

}  // namespace tycast::types
