/***
 * Name: test_atomic_type_cast
 * Purpose: Pairwise compatibility rules between atomic types.
 */
#include <gtest/gtest.h>

#include "tycast/types/AtomicType.h"
#include "tycast/types/ClassHierarchy.h"

using namespace tycast::types;

namespace {
bool castable(const char* src, const char* dst, const ClassHierarchy* h = nullptr) {
  return AtomicType::parse(src).canCastTo(AtomicType::parse(dst), h);
}

class SingleParentHierarchy : public ClassHierarchy {
 public:
  bool isSubclassOf(const QualifiedName& derived, const QualifiedName& base) const override {
    return derived.lowercased() == "app\\admin" && base.lowercased() == "app\\user";
  }
};
}  // namespace

TEST(AtomicTypeCast, NumericWideningIsOneWay) {
  EXPECT_TRUE(castable("int", "float"));
  EXPECT_FALSE(castable("float", "int"));
  EXPECT_FALSE(castable("string", "int"));
  EXPECT_FALSE(castable("bool", "int"));
}

TEST(AtomicTypeCast, MixedAndNoneMatchEverything) {
  EXPECT_TRUE(castable("mixed", "Foo"));
  EXPECT_TRUE(castable("Foo[]", "mixed"));
  EXPECT_TRUE(castable("none", "int"));
  EXPECT_TRUE(castable("string", "none"));
}

TEST(AtomicTypeCast, NullabilityIsLenient) {
  EXPECT_TRUE(castable("?int", "int"));
  EXPECT_TRUE(castable("int", "?int"));
  EXPECT_TRUE(castable("null", "?Foo"));
  EXPECT_TRUE(castable("?Foo", "null"));
  EXPECT_FALSE(castable("null", "int"));
  EXPECT_TRUE(castable("?int", "?float"));
}

TEST(AtomicTypeCast, ClassNamesCompareCaseInsensitively) {
  EXPECT_TRUE(castable("\\App\\User", "app\\user"));
  EXPECT_FALSE(castable("App\\User", "App\\Order"));
}

TEST(AtomicTypeCast, HierarchyIsConsulted) {
  const SingleParentHierarchy h{};
  EXPECT_FALSE(castable("App\\Admin", "App\\User"));
  EXPECT_TRUE(castable("App\\Admin", "App\\User", &h));
  EXPECT_FALSE(castable("App\\User", "App\\Admin", &h));
  EXPECT_TRUE(castable("App\\Admin[]", "App\\User[]", &h));
}

TEST(AtomicTypeCast, ArraysAndGenerics) {
  EXPECT_TRUE(castable("int[]", "array"));
  EXPECT_TRUE(castable("array", "string[]"));
  EXPECT_TRUE(castable("int[]", "float[]"));
  EXPECT_FALSE(castable("float[]", "int[]"));
  EXPECT_FALSE(castable("int[]", "int"));
  EXPECT_FALSE(castable("string[]", "int[]"));
}

TEST(AtomicTypeCast, ObjectCallableAndSelf) {
  EXPECT_TRUE(castable("Foo", "object"));
  EXPECT_TRUE(castable("object", "Foo"));
  EXPECT_FALSE(castable("int", "object"));
  EXPECT_TRUE(castable("\\Closure", "callable"));
  EXPECT_TRUE(castable("callable", "closure"));
  EXPECT_FALSE(castable("string", "callable"));
  EXPECT_TRUE(castable("self", "Foo"));
  EXPECT_TRUE(castable("Foo", "static"));
  EXPECT_TRUE(castable("$this", "self"));
  EXPECT_TRUE(castable("static", "object"));
  EXPECT_FALSE(castable("self", "int"));
}
