#include "util/misc.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAreArray;
using ::testing::IsEmpty;

/*
 * Split
 */

// NOLINTNEXTLINE
TEST(Misc, Split) {
  std::string str = "this is some text";
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, ElementsAreArray({"this", "is", "some", "text"}));
}

// NOLINTNEXTLINE
TEST(Misc, SplitEmpty) {
  std::string str;
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, IsEmpty());
}

// NOLINTNEXTLINE
TEST(Misc, SplitSkipEmpty) {
  std::string str = "  wow  much lol  ";
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, ElementsAreArray({"wow", "much", "lol"}));
}

/*
 * Strings
 */

// NOLINTNEXTLINE
TEST(Misc, Trim) {
  EXPECT_EQ(util::trim("  a b \n\t"), "a b");
  EXPECT_EQ(util::trim(" \n "), "");
  EXPECT_EQ(util::trim(""), "");
}

// NOLINTNEXTLINE
TEST(Misc, Lower) { EXPECT_EQ(util::lower("HeLLo 42"), "hello 42"); }

/*
 * Setters
 */

// NOLINTNEXTLINE
TEST(Misc, SetBool) {
  bool x = false;
  util::setBool(x)();
  EXPECT_TRUE(x);
}

// NOLINTNEXTLINE
TEST(Misc, SetString) {
  std::string x;
  util::setString(x)("wow");
  EXPECT_EQ(x, "wow");
}

// NOLINTNEXTLINE
TEST(Misc, SetInt) {
  int x = 0;
  util::setInt(x)("42");
  EXPECT_EQ(x, 42);
}

}  // namespace
