#include "utf16.hpp"

#include <gtest/gtest.h>

TEST(Utf16Test, LineStarts) {
  EXPECT_EQ(computeLineStarts("ab\ncd\n"), (std::vector<size_t>{0, 3, 6}));
  EXPECT_EQ(computeLineStarts(""), (std::vector<size_t>{0}));
}

TEST(Utf16Test, ByteOffsetToPositionCountsUtf16Units) {
  // あ is 3 bytes / 1 unit, 😀 is 4 bytes / 2 units
  const std::string text = "a\nあ😀b";
  auto starts = computeLineStarts(text);

  Position p = byteOffsetToPosition(text, starts, 0);
  EXPECT_EQ(p.line, 0);
  EXPECT_EQ(p.character, 0);

  p = byteOffsetToPosition(text, starts, 5);
  EXPECT_EQ(p.line, 1);
  EXPECT_EQ(p.character, 1);

  p = byteOffsetToPosition(text, starts, 9);
  EXPECT_EQ(p.line, 1);
  EXPECT_EQ(p.character, 3);

  // 範囲外はテキスト末尾に丸める
  p = byteOffsetToPosition(text, starts, 100);
  EXPECT_EQ(p.line, 1);
  EXPECT_EQ(p.character, 4);
}

TEST(Utf16Test, ComputeByteOffset) {
  const std::string text = "a\nあ😀b\nlast";
  EXPECT_EQ(computeByteOffset(text, 0, 0), 0u);
  EXPECT_EQ(computeByteOffset(text, 1, 1), 5u);
  EXPECT_EQ(computeByteOffset(text, 1, 3), 9u);
  // 行末を超える文字位置は行末に丸める
  EXPECT_EQ(computeByteOffset(text, 1, 50), 10u);
  EXPECT_EQ(computeByteOffset(text, 2, 2), 13u);
  EXPECT_EQ(computeByteOffset(text, 9, 0), text.size());
}
