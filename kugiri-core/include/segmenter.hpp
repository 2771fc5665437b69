#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Kugiri {

enum class ParagraphMode {
  LineBreak, // 改行ごとに段落を区切る
  BlankLine  // 空行で段落を区切る (単独の改行は段落内)
};

struct QuotePair {
  char32_t open;
  char32_t close;
};

std::vector<std::string> defaultAbbreviations();

std::vector<QuotePair> defaultQuotePairs();

// Immutable once bound into a Segmenter
struct SegmenterConfig {
  ParagraphMode paragraphMode = ParagraphMode::LineBreak;
  std::vector<std::string> abbreviations = defaultAbbreviations();
  std::vector<QuotePair> quotePairs = defaultQuotePairs();
  bool singleLetterInitials = true; // "J. Smith"
  bool fullWidthTerminators = true; // 。！？ end a sentence without a space
  size_t maxLookback = 16;          // code points kept for the word before '.'
};

// Sentence unit
struct SentenceUnit {
  std::string text;     // 文の内容 (前後の空白を除去)
  int paragraphIndex{0}; // 段落番号
  int order{0};          // 出力順
  size_t start{0};       // 文の開始位置 (バイト単位)
  size_t end{0};         // 文の終了位置 (バイト単位)
};

class Segmenter {
public:
  Segmenter();
  explicit Segmenter(SegmenterConfig config);

  std::vector<SentenceUnit> segment(const std::string &text) const;

  const SegmenterConfig &config() const { return config_; }

  // token is the run of letters and internal periods before a '.'
  bool isAbbreviation(const std::u32string &token) const;

  // Closing mark for an opening quote, or 0 if cp does not open a quote
  char32_t closingQuoteFor(char32_t cp) const;

  bool isClosingQuote(char32_t cp) const;

private:
  SegmenterConfig config_;
  std::unordered_set<std::u32string> abbreviations_;
  std::unordered_map<char32_t, char32_t> closerFor_;
  std::unordered_set<char32_t> closers_;
};

// Segments text with the default configuration
std::vector<SentenceUnit> segment(const std::string &text);

std::vector<std::string> splitIntoSentences(const std::string &text);

// Rebuilds the source from its sentences by copying the separators between
// them back from source
std::string reassemble(const std::string &source,
                       const std::vector<SentenceUnit> &sentences);

} // namespace Kugiri
