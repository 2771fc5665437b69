#include "text_processor.hpp"

namespace Kugiri {
namespace text {

char32_t TextProcessor::decodeCodePoint(const std::string &text, size_t pos,
                                        size_t &seqLen) {
  unsigned char c = static_cast<unsigned char>(text[pos]);

  // ASCII characters (0x00-0x7F) are always a single byte
  if (c < 0x80) {
    seqLen = 1;
    return c;
  }

  size_t len = 0;
  char32_t cp = 0;
  if ((c & 0xE0) == 0xC0) {
    len = 2; // 110xxxxx (2-byte)
    cp = c & 0x1F;
  } else if ((c & 0xF0) == 0xE0) {
    len = 3; // 1110xxxx (3-byte)
    cp = c & 0x0F;
  } else if ((c & 0xF8) == 0xF0) {
    len = 4; // 11110xxx (4-byte)
    cp = c & 0x07;
  }

  if (len == 0 || !isValidUtf8Sequence(text, pos, len)) {
    // Invalid start byte or broken continuation, consume one byte only
    seqLen = 1;
    return 0xFFFD;
  }

  for (size_t j = 1; j < len; ++j) {
    cp = (cp << 6) | (static_cast<unsigned char>(text[pos + j]) & 0x3F);
  }
  seqLen = len;
  return cp;
}

std::string TextProcessor::encodeCodePoint(char32_t cp) {
  std::string out;
  if (cp <= 0x7F) {
    out += static_cast<char>(cp);
  } else if (cp <= 0x7FF) {
    out += static_cast<char>(0xC0 | ((cp >> 6) & 0x1F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp <= 0xFFFF) {
    out += static_cast<char>(0xE0 | ((cp >> 12) & 0x0F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp <= 0x10FFFF) {
    out += static_cast<char>(0xF0 | ((cp >> 18) & 0x07));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  return out;
}

std::u32string TextProcessor::toCodePoints(const std::string &utf8) {
  std::u32string result;
  result.reserve(utf8.size());
  size_t pos = 0;
  while (pos < utf8.size()) {
    size_t len = 1;
    result.push_back(decodeCodePoint(utf8, pos, len));
    pos += len;
  }
  return result;
}

bool TextProcessor::isWhitespace(char32_t cp) {
  if (cp == 0x20 || (cp >= 0x09 && cp <= 0x0D))
    return true;
  switch (cp) {
  case 0x85:   // NEL
  case 0xA0:   // NO-BREAK SPACE
  case 0x1680: // OGHAM SPACE MARK
  case 0x2028: // LINE SEPARATOR
  case 0x2029: // PARAGRAPH SEPARATOR
  case 0x202F: // NARROW NO-BREAK SPACE
  case 0x205F: // MEDIUM MATHEMATICAL SPACE
  case 0x3000: // 全角スペース
  case 0xFEFF: // BOM
    return true;
  default:
    return cp >= 0x2000 && cp <= 0x200A;
  }
}

bool TextProcessor::isLineBreak(char32_t cp) {
  return cp == 0x0A || cp == 0x0D || cp == 0x85 || cp == 0x2028 ||
         cp == 0x2029;
}

bool TextProcessor::isLetter(char32_t cp) {
  if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z'))
    return true;
  if (cp < 0xC0)
    return false;

  // Latin-1 Supplement (× and ÷ excluded) and Latin Extended-A/B
  if (cp <= 0x24F)
    return cp != 0xD7 && cp != 0xF7;
  // Greek
  if (cp >= 0x386 && cp <= 0x3FF)
    return cp != 0x387;
  // Cyrillic
  if (cp >= 0x400 && cp <= 0x4FF)
    return true;
  // Latin Extended Additional
  if (cp >= 0x1E00 && cp <= 0x1EFF)
    return true;
  // 全角英字
  return (cp >= 0xFF21 && cp <= 0xFF3A) || (cp >= 0xFF41 && cp <= 0xFF5A);
}

bool TextProcessor::isUppercase(char32_t cp) {
  if (cp >= 'A' && cp <= 'Z')
    return true;
  if (cp < 0xC0)
    return false;

  if (cp <= 0xDE)
    return cp != 0xD7;

  // Latin Extended-A alternates case by code point parity
  if (cp >= 0x100 && cp <= 0x137)
    return cp % 2 == 0;
  if (cp >= 0x139 && cp <= 0x148)
    return cp % 2 == 1;
  if (cp >= 0x14A && cp <= 0x177)
    return cp % 2 == 0;
  if (cp == 0x178 || cp == 0x179 || cp == 0x17B || cp == 0x17D)
    return true;

  // Greek capitals
  if (cp == 0x386 || (cp >= 0x388 && cp <= 0x38F))
    return true;
  if (cp >= 0x391 && cp <= 0x3A9)
    return cp != 0x3A2;

  // Cyrillic capitals
  if (cp >= 0x400 && cp <= 0x42F)
    return true;

  // 全角英大文字
  return cp >= 0xFF21 && cp <= 0xFF3A;
}

bool TextProcessor::isDigit(char32_t cp) {
  return (cp >= '0' && cp <= '9') || (cp >= 0xFF10 && cp <= 0xFF19);
}

bool TextProcessor::isTerminalMark(char32_t cp) {
  switch (cp) {
  case '!':
  case '?':
  case 0x203C: // ‼
  case 0x2047: // ⁇
  case 0x2048: // ⁈
  case 0x2049: // ⁉
    return true;
  default:
    return false;
  }
}

bool TextProcessor::isEllipsisMark(char32_t cp) {
  return cp == 0x2026 || cp == 0x2025;
}

bool TextProcessor::isJapanesePunctuation(char32_t cp) {
  switch (cp) {
  case 0x3002: // 。
  case 0xFF0E: // ．
  case 0xFF01: // ！
  case 0xFF1F: // ？
  case 0xFF61: // ｡ (半角)
    return true;
  default:
    return false;
  }
}

bool TextProcessor::isClosingBracket(char32_t cp) {
  switch (cp) {
  case ')':
  case ']':
  case '}':
  case 0xFF09: // ）
  case 0xFF3D: // ］
  case 0xFF5D: // ｝
  case 0x3009: // 〉
  case 0x300B: // 》
  case 0x3011: // 】
  case 0x3015: // 〕
  case 0x3017: // 〗
  case 0x3019: // 〙
    return true;
  default:
    return false;
  }
}

bool TextProcessor::isValidUtf8Sequence(const std::string &input, size_t pos,
                                        size_t seqLen) {
  if (pos + seqLen > input.size())
    return false;

  for (size_t j = 1; j < seqLen; ++j) {
    if ((static_cast<unsigned char>(input[pos + j]) & 0xC0) != 0x80) {
      return false; // Invalid continuation byte
    }
  }
  return true;
}

} // namespace text
} // namespace Kugiri
