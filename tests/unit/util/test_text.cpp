#include <gtest/gtest.h>

#include "nb/util/text.hpp"

using namespace nb::util;

TEST(TextTest, TrimStripsSurroundingWhitespace) {
  EXPECT_EQ(trim("  hello world \n\t"), "hello world");
  EXPECT_EQ(trim("\r\n"), "");
  EXPECT_EQ(trim(""), "");
  EXPECT_EQ(trim("x"), "x");
}

TEST(TextTest, SplitTrimmedDropsEmptyParts) {
  auto parts = splitTrimmed(",a,, b ,", ',');
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[1], "b");
}

TEST(TextTest, SplitTrimmedOfEmptyInputIsEmpty) {
  EXPECT_TRUE(splitTrimmed("", ',').empty());
  EXPECT_TRUE(splitTrimmed(" , ,", ',').empty());
}

TEST(TextTest, SplitTrimmedWithoutSeparatorIsOneItem) {
  auto parts = splitTrimmed(" Only Note ", ',');
  ASSERT_EQ(parts.size(), 1u);
  EXPECT_EQ(parts[0], "Only Note");
}
