#include "utf16.hpp"
#include "text_processor.hpp"

using Kugiri::text::TextProcessor;

namespace {
// UTF-16 code units needed for the code point at i; advances i
static inline unsigned int consumeUtf16Units(const std::string &s, size_t &i) {
  size_t len = 1;
  char32_t cp = TextProcessor::decodeCodePoint(s, i, len);
  i += len;
  // BMP文字は1コードユニット、その他は2コードユニット (サロゲートペア)
  return cp <= 0xFFFF ? 1 : 2;
}
} // namespace

std::vector<size_t> computeLineStarts(const std::string &text) {
  std::vector<size_t> lineStarts;
  lineStarts.reserve(64);
  lineStarts.push_back(0);
  for (size_t i = 0; i < text.size(); ++i)
    if (text[i] == '\n')
      lineStarts.push_back(i + 1);
  return lineStarts;
}

Position byteOffsetToPosition(const std::string &text,
                              const std::vector<size_t> &lineStarts,
                              size_t offset) {
  // オフセットをテキストサイズに制限
  if (offset > text.size())
    offset = text.size();

  // オフセット以下の最後の開始位置を二分探索で検索
  size_t lo = 0, hi = lineStarts.size();
  while (lo + 1 < hi) {
    size_t mid = (lo + hi) / 2;
    if (lineStarts[mid] <= offset)
      lo = mid;
    else
      hi = mid;
  }

  // 行開始からオフセットまでのUTF-16コードユニット数をカウント
  size_t i = lineStarts[lo];
  unsigned int col16 = 0;
  while (i < offset && i < text.size() && text[i] != '\n') {
    col16 += consumeUtf16Units(text, i);
  }

  return Position{static_cast<int>(lo), static_cast<int>(col16)};
}

size_t computeByteOffset(const std::string &text, int line, int character) {
  // 対象行の先頭まで進める
  size_t pos = 0;
  int currentLine = 0;
  while (currentLine < line && pos < text.size()) {
    size_t nl = text.find('\n', pos);
    if (nl == std::string::npos)
      return text.size();
    pos = nl + 1;
    ++currentLine;
  }

  // UTF-16の文字位置をバイト位置に変換
  int col16 = 0;
  while (pos < text.size() && text[pos] != '\n' && col16 < character) {
    col16 += static_cast<int>(consumeUtf16Units(text, pos));
  }
  return pos;
}
