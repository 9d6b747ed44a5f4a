/***
 * Name: test_cast_asymmetry
 * Purpose: Exhaustive check over native keyword pairs that int -> float is the
 *   only direction-dependent cast.
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tycast/types/UnionType.h"

using namespace tycast::types;

namespace {
const std::vector<std::string> kNativeNames{"int",   "float",    "string", "bool",     "array", "null",
                                            "mixed", "none",     "callable", "object", "resource", "void"};

bool isWidening(const std::string& a, const std::string& b) { return a == "int" && b == "float"; }
}  // namespace

TEST(CastAsymmetry, OnlyIntToFloatDependsOnDirection) {
  for (const auto& a : kNativeNames) {
    for (const auto& b : kNativeNames) {
      if (isWidening(a, b) || isWidening(b, a)) { continue; }
      const UnionType ua = UnionType::fromString(a);
      const UnionType ub = UnionType::fromString(b);
      EXPECT_EQ(ua.canCastTo(ub), ub.canCastTo(ua)) << a << " vs " << b;
    }
  }
}

TEST(CastAsymmetry, IntFloatPairIsAsymmetric) {
  const UnionType i = UnionType::fromString("int");
  const UnionType f = UnionType::fromString("float");
  EXPECT_TRUE(i.canCastTo(f));
  EXPECT_FALSE(f.canCastTo(i));
}

TEST(CastAsymmetry, AtomicPairsAgree) {
  for (const auto& a : kNativeNames) {
    for (const auto& b : kNativeNames) {
      if (isWidening(a, b) || isWidening(b, a)) { continue; }
      const AtomicType& ta = AtomicType::parse(a);
      const AtomicType& tb = AtomicType::parse(b);
      EXPECT_EQ(ta.canCastTo(tb), tb.canCastTo(ta)) << a << " vs " << b;
    }
  }
}
