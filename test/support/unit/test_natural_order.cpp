/***
 * Name: test_natural_order
 * Purpose: Natural ordering and small text helpers used by canonical type strings.
 */
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "tycast/support/text.h"

using namespace tycast::support;

TEST(NaturalOrder, DigitRunsCompareNumerically) {
  EXPECT_TRUE(NaturalLess("Foo9", "Foo10"));
  EXPECT_FALSE(NaturalLess("Foo10", "Foo9"));
  EXPECT_TRUE(NaturalLess("a2b", "a10a"));
}

TEST(NaturalOrder, PlainBytesOtherwise) {
  EXPECT_TRUE(NaturalLess("bool", "int"));
  EXPECT_TRUE(NaturalLess("?int", "int"));
  EXPECT_TRUE(NaturalLess("Zed", "alpha"));  // case-sensitive
  EXPECT_TRUE(NaturalLess("int", "int[]"));
  EXPECT_FALSE(NaturalLess("int", "int"));
}

TEST(NaturalOrder, SortsLikeNatsort) {
  std::vector<std::string> names{"img12", "img10", "img2", "img1"};
  std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) { return NaturalLess(a, b); });
  EXPECT_EQ(names, (std::vector<std::string>{"img1", "img2", "img10", "img12"}));
}

TEST(TextHelpers, LowerTrimSplit) {
  EXPECT_EQ(ToLowerAscii("DateTime\\Zone"), "datetime\\zone");
  EXPECT_EQ(TrimSpaces("  int \t"), "int");
  const auto pieces = SplitOn("int||string", '|');
  ASSERT_EQ(pieces.size(), 3u);
  EXPECT_EQ(pieces[1], "");
  EXPECT_EQ(SplitOn("", '|').size(), 1u);
}

TEST(TextHelpers, Identifiers) {
  EXPECT_TRUE(IsIdentifier("Foo_1"));
  EXPECT_TRUE(IsIdentifier("_x"));
  EXPECT_FALSE(IsIdentifier("1abc"));
  EXPECT_FALSE(IsIdentifier(""));
  EXPECT_FALSE(IsIdentifier("a-b"));
}
