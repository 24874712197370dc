#include "utils/string/convert.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {
TEST(ConvertTest, StopsAtTheFirstNul) {
  const char buffer[16] = {'Z', ' ', '8', '\0', 'x', 'x'};
  EXPECT_EQ(conv::FromFixedBuffer(buffer), "Z 8");
}

TEST(ConvertTest, UnterminatedBufferIsBoundedByCapacity) {
  const char buffer[4] = {'A', 'B', 'C', 'D'};
  EXPECT_EQ(conv::FromFixedBuffer(buffer), "ABCD");
  EXPECT_EQ(conv::FromFixedBuffer(buffer, 2), "AB");
  EXPECT_EQ(conv::FromFixedBuffer(nullptr, 8), "");
}

TEST(ConvertTest, InvalidSequencesAreReplaced) {
  EXPECT_EQ(conv::ToValidUtf8("ok"), "ok");
  EXPECT_EQ(conv::ToValidUtf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
  EXPECT_EQ(conv::ToValidUtf8("\xE6\x97\xA5"), "\xE6\x97\xA5");
}

TEST(ConvertTest, TrimAscii) {
  EXPECT_EQ(conv::TrimAscii("  OLYMPUS DIGITAL CAMERA\t\n"), "OLYMPUS DIGITAL CAMERA");
  EXPECT_EQ(conv::TrimAscii("   "), "");
  EXPECT_EQ(conv::TrimAscii(""), "");
}
}  // namespace
