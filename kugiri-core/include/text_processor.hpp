#pragma once

#include <cstddef>
#include <string>

namespace Kugiri {
namespace text {

class TextProcessor {
public:
  // Decodes the code point starting at pos and stores its byte length in
  // seqLen. Invalid or truncated sequences decode as U+FFFD with seqLen 1 so
  // that the original bytes are still carried through by offset.
  static char32_t decodeCodePoint(const std::string &text, size_t pos,
                                  size_t &seqLen);

  static std::string encodeCodePoint(char32_t cp);

  static std::u32string toCodePoints(const std::string &utf8);

  static bool isWhitespace(char32_t cp);

  static bool isLineBreak(char32_t cp);

  static bool isLetter(char32_t cp);

  static bool isUppercase(char32_t cp);

  static bool isDigit(char32_t cp);

  // ! ? and their compound forms (‼ ⁇ ⁈ ⁉). The period is handled separately.
  static bool isTerminalMark(char32_t cp);

  // … and ‥
  static bool isEllipsisMark(char32_t cp);

  // 。．！？｡
  static bool isJapanesePunctuation(char32_t cp);

  static bool isClosingBracket(char32_t cp);

private:
  static bool isValidUtf8Sequence(const std::string &input, size_t pos,
                                  size_t seqLen);
};

} // namespace text
} // namespace Kugiri
