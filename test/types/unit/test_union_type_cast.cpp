/***
 * Name: test_union_type_cast
 * Purpose: Union-level cast rules, applied in priority order.
 */
#include <gtest/gtest.h>

#include "tycast/types/ClassHierarchy.h"
#include "tycast/types/UnionType.h"

using namespace tycast::types;

namespace {
bool castable(const char* src, const char* dst, const ClassHierarchy* h = nullptr) {
  return UnionType::fromString(src).canCastTo(UnionType::fromString(dst), h);
}

class ShapeHierarchy : public ClassHierarchy {
 public:
  bool isSubclassOf(const QualifiedName& derived, const QualifiedName& base) const override {
    return derived.lowercased() == "circle" && base.lowercased() == "shape";
  }
};
}  // namespace

TEST(UnionTypeCast, IdenticalUnions) {
  EXPECT_TRUE(castable("int|string", "string|int"));
  EXPECT_TRUE(castable("Foo", "Foo"));
}

TEST(UnionTypeCast, EmptyIsAWildcardBothWays) {
  EXPECT_TRUE(castable("", "anything"));
  EXPECT_TRUE(castable("anything", ""));
  EXPECT_TRUE(castable("", ""));
}

TEST(UnionTypeCast, NullOnlyUnions) {
  EXPECT_TRUE(castable("null", "MyClass"));
  EXPECT_TRUE(castable("MyClass", "null"));
  EXPECT_TRUE(castable("null", "int"));
  // Only a union that is exactly null gets the shortcut.
  EXPECT_FALSE(castable("null|string", "int"));
}

TEST(UnionTypeCast, MixedOnEitherSide) {
  EXPECT_TRUE(castable("mixed", "int"));
  EXPECT_TRUE(castable("int", "mixed"));
  EXPECT_TRUE(castable("string|mixed", "Foo"));
}

TEST(UnionTypeCast, IntWidensToFloatOnly) {
  EXPECT_TRUE(castable("int", "float"));
  EXPECT_FALSE(castable("float", "int"));
}

TEST(UnionTypeCast, AnyMemberPairSuffices) {
  EXPECT_TRUE(castable("int|string", "bool|string"));
  EXPECT_TRUE(castable("Foo[]|int", "array"));
  EXPECT_FALSE(castable("int|bool", "string|Foo"));
  EXPECT_FALSE(castable("string", "int|float"));
}

TEST(UnionTypeCast, HierarchyIsForwarded) {
  const ShapeHierarchy h{};
  EXPECT_FALSE(castable("Circle|int", "Shape"));
  EXPECT_TRUE(castable("Circle|int", "Shape", &h));
  EXPECT_FALSE(castable("Shape", "Circle", &h));
}
