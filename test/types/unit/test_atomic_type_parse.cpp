/***
 * Name: test_atomic_type_parse
 * Purpose: Parsing of single type names, interning and literal typing.
 */
#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "tycast/exceptions/precondition_error.h"
#include "tycast/types/AtomicType.h"

using namespace tycast::types;

TEST(AtomicTypeParse, NativeKeywords) {
  const AtomicType& t = AtomicType::parse("int");
  EXPECT_TRUE(t.isNative(NativeKind::Int));
  EXPECT_TRUE(t.isScalar());
  EXPECT_EQ(t.toString(), "int");
  EXPECT_EQ(AtomicType::parse("INT").toString(), "int");
  EXPECT_EQ(AtomicType::parse("integer").toString(), "int");
  EXPECT_EQ(AtomicType::parse("double").toString(), "float");
  EXPECT_EQ(AtomicType::parse(" bool ").toString(), "bool");
  EXPECT_FALSE(AtomicType::parse("array").isScalar());
  EXPECT_FALSE(AtomicType::parse("mixed").isScalar());
}

TEST(AtomicTypeParse, InternedByCanonicalString) {
  EXPECT_EQ(&AtomicType::parse("int"), &AtomicType::native(NativeKind::Int));
  EXPECT_EQ(&AtomicType::parse("Integer"), &AtomicType::parse("int"));
  EXPECT_EQ(&AtomicType::parse("Foo[]"), &AtomicType::parse("Foo").asGenericType());
  EXPECT_NE(&AtomicType::parse("Foo"), &AtomicType::parse("foo"));
}

TEST(AtomicTypeParse, NullablePrefix) {
  const AtomicType& t = AtomicType::parse("?int");
  EXPECT_TRUE(t.isNullable());
  EXPECT_TRUE(t.isScalar());
  EXPECT_EQ(t.toString(), "?int");
  EXPECT_EQ(&t.withoutNullable(), &AtomicType::parse("int"));
  EXPECT_EQ(AtomicType::parse("?null").toString(), "null");
}

TEST(AtomicTypeParse, GenericSuffixNests) {
  const AtomicType& t = AtomicType::parse("int[][]");
  ASSERT_TRUE(t.isGeneric());
  EXPECT_EQ(t.toString(), "int[][]");
  EXPECT_EQ(t.elementType().toString(), "int[]");
  EXPECT_EQ(&t.elementType().elementType(), &AtomicType::parse("int"));

  const AtomicType& n = AtomicType::parse("?Foo[]");
  ASSERT_TRUE(n.isGeneric());
  EXPECT_FALSE(n.isNullable());
  EXPECT_TRUE(n.elementType().isNullable());
}

TEST(AtomicTypeParse, ClassReferences) {
  const AtomicType& t = AtomicType::parse("\\Vendor\\Pkg\\Thing");
  ASSERT_TRUE(t.isClass());
  EXPECT_EQ(t.className().toString(), "\\Vendor\\Pkg\\Thing");
  EXPECT_EQ(t.className().shortName(), "Thing");
  EXPECT_EQ(t.className().namespaceName(), "Vendor\\Pkg");
  EXPECT_FALSE(t.isScalar());
}

TEST(AtomicTypeParse, SelfLikeKeywords) {
  EXPECT_TRUE(AtomicType::parse("self").isSelfLike());
  EXPECT_EQ(AtomicType::parse("Static").toString(), "static");
  const AtomicType& t = AtomicType::parse("$this");
  EXPECT_TRUE(t.isSelfLike());
  EXPECT_EQ(t.selfKind(), SelfKind::This);
}

TEST(AtomicTypeParse, InvalidNamesBecomeNone) {
  for (const char* bad : {"", "?", "[]", "1abc", "Foo\\\\Bar", "a-b", "??int", "$that"}) {
    std::string err;
    const AtomicType& t = AtomicType::parse(bad, &err);
    EXPECT_TRUE(t.isNative(NativeKind::None)) << bad;
    EXPECT_FALSE(err.empty()) << bad;
  }
  std::string err;
  AtomicType::parse("string", &err);
  EXPECT_TRUE(err.empty());
}

TEST(AtomicTypeParse, AccessorPreconditions) {
  EXPECT_THROW(AtomicType::parse("int").className(), tycast::exceptions::PreconditionError);
  EXPECT_THROW(AtomicType::parse("Foo").elementType(), tycast::exceptions::PreconditionError);
}

TEST(AtomicTypeLiteral, MapsValueShapes) {
  EXPECT_EQ(AtomicType::fromLiteralValue(LiteralValue{std::int64_t{42}}).toString(), "int");
  EXPECT_EQ(AtomicType::fromLiteralValue(LiteralValue{2.5}).toString(), "float");
  EXPECT_EQ(AtomicType::fromLiteralValue(LiteralValue{std::string("hi")}).toString(), "string");
  EXPECT_EQ(AtomicType::fromLiteralValue(LiteralValue{true}).toString(), "bool");
  EXPECT_EQ(AtomicType::fromLiteralValue(LiteralValue{nullptr}).toString(), "null");
  EXPECT_EQ(AtomicType::fromLiteralValue(LiteralValue{ArrayLiteral{}}).toString(), "array");
  EXPECT_EQ(AtomicType::fromLiteralValue(LiteralValue{ObjectLiteral{QualifiedName("\\App\\User")}}).toString(),
            "\\App\\User");
}
