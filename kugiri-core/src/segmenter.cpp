#include "segmenter.hpp"
#include "text_processor.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace Kugiri {

namespace {

using text::TextProcessor;

bool isDebugEnabled() {
  static const bool debug = (std::getenv("KUGIRI_DEBUG") != nullptr);
  return debug;
}

struct CodePoint {
  char32_t cp;
  size_t offset; // 原文中の位置 (バイト単位)
  size_t length;
};

std::vector<CodePoint> decodeAll(const std::string &text) {
  std::vector<CodePoint> chars;
  chars.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    size_t len = 1;
    char32_t cp = TextProcessor::decodeCodePoint(text, pos, len);
    chars.push_back(CodePoint{cp, pos, len});
    pos += len;
  }
  return chars;
}

enum class ScanState { InSentence, InQuote, InEllipsisCandidate };

// Scans one paragraph [begin, end) of the decoded text left to right and
// appends its sentences to out. Nothing already emitted is revisited.
class ParagraphScanner {
public:
  ParagraphScanner(const Segmenter &segmenter, const std::string &source,
                   const std::vector<CodePoint> &chars, size_t begin,
                   size_t end, int paragraphIndex, bool joinLines,
                   std::vector<SentenceUnit> &out)
      : segmenter_(segmenter), config_(segmenter.config()), source_(source),
        chars_(chars), begin_(begin), end_(end),
        paragraphIndex_(paragraphIndex), joinLines_(joinLines), out_(out) {}

  size_t scan() {
    size_t emittedBefore = out_.size();

    size_t i = begin_;
    while (i < end_) {
      i = step(i);
    }

    // 段落末: 閉じられていない引用も含めて残りを一文として確定する
    if (hasSentence_) {
      if (!quoteStack_.empty() && isDebugEnabled()) {
        std::cerr << "[DEBUG] Unterminated quote closed at paragraph "
                  << paragraphIndex_ << " end, depth=" << quoteStack_.size()
                  << std::endl;
      }
      if (endsOnTerminator())
        terminated_ = true;
      emitThrough(end_ - 1);
    }

    return out_.size() - emittedBefore;
  }

  // True once any sentence of the paragraph was ended by a terminator
  bool terminated() const { return terminated_; }

private:
  const Segmenter &segmenter_;
  const SegmenterConfig &config_;
  const std::string &source_;
  const std::vector<CodePoint> &chars_;
  size_t begin_;
  size_t end_;
  int paragraphIndex_;
  bool joinLines_; // 段落内の改行を空白として扱う
  std::vector<SentenceUnit> &out_;

  ScanState state_{ScanState::InSentence};
  bool hasSentence_{false};
  bool terminated_{false};
  bool lastPeriodIsAbbreviation_{false};
  size_t sentenceStart_{0};

  std::vector<char32_t> quoteStack_; // expected closing marks

  size_t runStart_{0};
  size_t runLength_{0};

  std::u32string lookback_;
  bool lookbackOverflow_{false};

  char32_t at(size_t i) const { return chars_[i].cp; }

  size_t step(size_t i) {
    char32_t c = at(i);

    if (state_ == ScanState::InEllipsisCandidate) {
      if (c == U'.') {
        ++runLength_;
        return i + 1;
      }
      if (TextProcessor::isEllipsisMark(c)) {
        runLength_ += 3;
        return i + 1;
      }
      size_t resume = i;
      if (resolvePeriodRun(i, resume))
        return resume;
    }

    if (!hasSentence_) {
      if (TextProcessor::isWhitespace(c))
        return i + 1;
      hasSentence_ = true;
      sentenceStart_ = i;
    }

    if (TextProcessor::isLineBreak(c))
      return onLineBreak(i);

    if (isQuoteMark(c) && !isApostrophe(i)) {
      size_t next = i + 1;
      if (onQuote(i, next))
        return next;
    }

    // 引用内では終端記号を一切扱わない。略語の判定だけは続ける
    if (state_ == ScanState::InQuote) {
      if (c == U'.') {
        lastPeriodIsAbbreviation_ = isAbbreviationBefore();
        appendLookback(c);
      } else if (TextProcessor::isLetter(c)) {
        appendLookback(c);
      } else {
        clearLookback();
      }
      return i + 1;
    }

    if (c == U'.' || TextProcessor::isEllipsisMark(c)) {
      state_ = ScanState::InEllipsisCandidate;
      runStart_ = i;
      runLength_ = (c == U'.') ? 1 : 3;
      return i + 1;
    }

    if (TextProcessor::isTerminalMark(c))
      return onTerminalMark(i);

    if (TextProcessor::isJapanesePunctuation(c))
      return onFullWidthTerminator(i);

    if (TextProcessor::isLetter(c)) {
      appendLookback(c);
    } else {
      clearLookback();
    }
    return i + 1;
  }

  // Decides what the period run [runStart_, i) was. Returns true when a
  // sentence was emitted and scanning resumes at resume.
  bool resolvePeriodRun(size_t i, size_t &resume) {
    state_ = ScanState::InSentence;

    lastPeriodIsAbbreviation_ = false;

    if (runLength_ >= 3) {
      clearLookback();
      size_t k = skipClosers(i);
      if (k < end_ && TextProcessor::isWhitespace(at(k)) &&
          startsNewSentence(k)) {
        emitTerminated(k - 1);
        resume = k;
        return true;
      }
      return false;
    }

    if (runLength_ == 1 && isAbbreviationBefore()) {
      lastPeriodIsAbbreviation_ = true;
      appendLookback(U'.');
      return false;
    }

    size_t k = skipClosers(i);
    if (k >= end_ || TextProcessor::isWhitespace(at(k))) {
      emitTerminated(k - 1);
      resume = k;
      return true;
    }

    // "file.txt" や "3.14" のように語の内部にあるピリオド
    if (runLength_ == 1) {
      appendLookback(U'.');
    } else {
      clearLookback();
    }
    return false;
  }

  size_t onTerminalMark(size_t i) {
    clearLookback();

    size_t j = i + 1;
    while (j < end_ && (TextProcessor::isTerminalMark(at(j)) ||
                        at(j) == U'.' || TextProcessor::isEllipsisMark(at(j)))) {
      ++j;
    }

    size_t k = skipClosers(j);
    if (k >= end_ || TextProcessor::isWhitespace(at(k))) {
      emitTerminated(k - 1);
      return k;
    }
    return j;
  }

  size_t onFullWidthTerminator(size_t i) {
    // 全角ピリオドは数字に挟まれている場合は小数点とみなす (３．１４)
    if (at(i) == 0xFF0E && i > begin_ && i + 1 < end_ &&
        TextProcessor::isDigit(at(i - 1)) && TextProcessor::isDigit(at(i + 1))) {
      clearLookback();
      return i + 1;
    }

    clearLookback();

    size_t j = i + 1;
    while (j < end_ && (TextProcessor::isJapanesePunctuation(at(j)) ||
                        TextProcessor::isTerminalMark(at(j)))) {
      ++j;
    }

    size_t k = skipClosers(j);
    if (config_.fullWidthTerminators || k >= end_ ||
        TextProcessor::isWhitespace(at(k))) {
      emitTerminated(k - 1);
      return k;
    }
    return j;
  }

  size_t onLineBreak(size_t i) {
    // 句読点のない段落では各行を一文とする (箇条書きなど)
    if (!joinLines_ && state_ != ScanState::InQuote) {
      emitThrough(i - 1);
      return i + 1;
    }
    clearLookback();
    return i + 1;
  }

  // Returns true if c was consumed as a quotation mark; next is set to the
  // index scanning continues from.
  bool onQuote(size_t i, size_t &next) {
    char32_t c = at(i);

    if (!quoteStack_.empty() && c == quoteStack_.back()) {
      quoteStack_.pop_back();
      next = quoteStack_.empty() ? afterOutermostClose(i) : i + 1;
      return true;
    }

    if (segmenter_.isClosingQuote(c)) {
      // Unbalanced nesting: close every inner quote up to the matching one
      for (size_t depth = quoteStack_.size(); depth > 0; --depth) {
        if (quoteStack_[depth - 1] == c) {
          quoteStack_.resize(depth - 1);
          next = quoteStack_.empty() ? afterOutermostClose(i) : i + 1;
          return true;
        }
      }
    }

    char32_t closer = segmenter_.closingQuoteFor(c);
    if (closer != 0) {
      quoteStack_.push_back(closer);
      state_ = ScanState::InQuote;
      clearLookback();
      next = i + 1;
      return true;
    }

    // Stray closing mark, treated as an ordinary character
    return false;
  }

  // Called once the quote at i brought the depth back to zero.
  size_t afterOutermostClose(size_t i) {
    state_ = ScanState::InSentence;
    clearLookback();

    size_t k = skipClosers(i + 1);

    char32_t lastMark = 0;
    for (size_t j = i; j > sentenceStart_; --j) {
      char32_t prev = at(j - 1);
      if (isQuoteMark(prev) || TextProcessor::isClosingBracket(prev))
        continue;
      lastMark = prev;
      break;
    }
    // 略語のピリオドで終わる引用 ("Ask Dr.") は文を終えない
    if (!isTerminatorChar(lastMark) ||
        (lastMark == U'.' && lastPeriodIsAbbreviation_))
      return k;

    if (k >= end_) {
      emitTerminated(k - 1);
      return k;
    }

    // 「はい。」「いいえ。」のように閉じ括弧の直後に次の発話が続く場合
    if (config_.fullWidthTerminators &&
        TextProcessor::isJapanesePunctuation(lastMark) &&
        segmenter_.closingQuoteFor(at(k)) != 0) {
      emitTerminated(k - 1);
      return k;
    }

    if (TextProcessor::isWhitespace(at(k)) && startsNewSentence(k)) {
      emitTerminated(k - 1);
    }
    return k;
  }

  // Closing brackets and unpaired closing quotes attach to the sentence they
  // follow.
  size_t skipClosers(size_t k) const {
    while (k < end_) {
      char32_t c = at(k);
      if (TextProcessor::isClosingBracket(c) ||
          (segmenter_.isClosingQuote(c) && segmenter_.closingQuoteFor(c) == 0)) {
        ++k;
        continue;
      }
      break;
    }
    return k;
  }

  // k points at whitespace following a candidate terminator
  bool startsNewSentence(size_t k) const {
    while (k < end_ && TextProcessor::isWhitespace(at(k)))
      ++k;
    if (k >= end_)
      return true;
    char32_t c = at(k);
    return TextProcessor::isUppercase(c) || segmenter_.closingQuoteFor(c) != 0;
  }

  bool isQuoteMark(char32_t c) const {
    return segmenter_.closingQuoteFor(c) != 0 || segmenter_.isClosingQuote(c);
  }

  // A quote mark between two letters is an apostrophe (don’t). Marks that
  // open and close alike, such as '"', are always quotes.
  bool isApostrophe(size_t i) const {
    char32_t c = at(i);
    if (segmenter_.closingQuoteFor(c) == c)
      return false;
    return i > begin_ && i + 1 < end_ && TextProcessor::isLetter(at(i - 1)) &&
           TextProcessor::isLetter(at(i + 1));
  }

  static bool isTerminatorChar(char32_t c) {
    return c == U'.' || TextProcessor::isTerminalMark(c) ||
           TextProcessor::isEllipsisMark(c) ||
           TextProcessor::isJapanesePunctuation(c);
  }

  // A period run still open at paragraph end
  bool endsOnTerminator() const {
    if (state_ != ScanState::InEllipsisCandidate)
      return false;
    return runLength_ != 1 || !isAbbreviationBefore();
  }

  bool isAbbreviationBefore() const {
    if (lookbackOverflow_ || lookback_.empty())
      return false;
    size_t first = lookback_.find_first_not_of(U'.');
    if (first == std::u32string::npos)
      return false;
    return segmenter_.isAbbreviation(lookback_.substr(first));
  }

  void appendLookback(char32_t c) {
    if (lookbackOverflow_)
      return;
    if (lookback_.size() >= config_.maxLookback) {
      lookbackOverflow_ = true;
      return;
    }
    lookback_.push_back(c);
  }

  void clearLookback() {
    lookback_.clear();
    lookbackOverflow_ = false;
  }

  void emitTerminated(size_t last) {
    terminated_ = true;
    emitThrough(last);
  }

  void emitThrough(size_t last) {
    while (last > sentenceStart_ && TextProcessor::isWhitespace(at(last)))
      --last;

    SentenceUnit unit;
    unit.start = chars_[sentenceStart_].offset;
    unit.end = chars_[last].offset + chars_[last].length;
    unit.text = source_.substr(unit.start, unit.end - unit.start);
    unit.paragraphIndex = paragraphIndex_;
    unit.order = static_cast<int>(out_.size());
    out_.push_back(std::move(unit));

    hasSentence_ = false;
    lastPeriodIsAbbreviation_ = false;
    quoteStack_.clear();
    state_ = ScanState::InSentence;
    runLength_ = 0;
    clearLookback();
  }
};

// Segments one paragraph and returns the number of sentences emitted.
// Internal line breaks join the lines unless no sentence of the paragraph can
// end on a terminator, in which case every line is a sentence of its own.
size_t scanParagraph(const Segmenter &segmenter, const std::string &source,
                     const std::vector<CodePoint> &chars, size_t begin,
                     size_t end, int paragraphIndex,
                     std::vector<SentenceUnit> &out) {
  size_t emittedBefore = out.size();
  ParagraphScanner joined(segmenter, source, chars, begin, end, paragraphIndex,
                          true, out);
  size_t count = joined.scan();
  if (!joined.terminated()) {
    bool multiLine = false;
    for (size_t i = begin; i < end && !multiLine; ++i)
      multiLine = TextProcessor::isLineBreak(chars[i].cp);
    if (multiLine) {
      out.resize(emittedBefore);
      ParagraphScanner byLine(segmenter, source, chars, begin, end,
                              paragraphIndex, false, out);
      count = byLine.scan();
    }
  }
  return count;
}

// Finds the paragraph break starting at i. breakEnd receives the index just
// past the break.
bool isParagraphBreak(ParagraphMode mode, const std::vector<CodePoint> &chars,
                      size_t i, size_t &breakEnd) {
  if (!TextProcessor::isLineBreak(chars[i].cp))
    return false;

  size_t j = i + 1;
  if (chars[i].cp == U'\r' && j < chars.size() && chars[j].cp == U'\n')
    ++j;

  if (mode == ParagraphMode::LineBreak) {
    breakEnd = j;
    return true;
  }

  while (j < chars.size() && TextProcessor::isWhitespace(chars[j].cp) &&
         !TextProcessor::isLineBreak(chars[j].cp)) {
    ++j;
  }
  if (j < chars.size() && TextProcessor::isLineBreak(chars[j].cp)) {
    breakEnd = j + 1;
    if (chars[j].cp == U'\r' && breakEnd < chars.size() &&
        chars[breakEnd].cp == U'\n')
      ++breakEnd;
    return true;
  }
  return false;
}

} // namespace

std::vector<std::string> defaultAbbreviations() {
  return {// 敬称
          "Mr", "Mrs", "Ms", "Dr", "Prof", "Sr", "Jr", "St", "Mt",
          // 一般的な略語
          "vs", "etc", "e.g", "i.e", "Fig", "fig", "No", "Dept", "dept",
          "Est", "Approx", "approx", "Appt", "appt", "Inc", "Ltd", "Co",
          "Corp",
          // 月
          "Jan", "Feb", "Mar", "Apr", "Jun", "Jul", "Aug", "Sep", "Sept",
          "Oct", "Nov", "Dec",
          // 曜日
          "Mon", "Tue", "Tues", "Wed", "Thu", "Thur", "Thurs", "Fri", "Sat",
          "Sun",
          // 頭字語
          "U.S", "U.K", "U.N"};
}

std::vector<QuotePair> defaultQuotePairs() {
  return {{U'"', U'"'},       {0x201C, 0x201D}, // “ ”
          {0x2018, 0x2019},                     // ‘ ’
          {0x00AB, 0x00BB},                     // « »
          {0x300C, 0x300D},                     // 「 」
          {0x300E, 0x300F}};                    // 『 』
}

Segmenter::Segmenter() : Segmenter(SegmenterConfig{}) {}

Segmenter::Segmenter(SegmenterConfig config) : config_(std::move(config)) {
  for (const auto &abbreviation : config_.abbreviations) {
    if (!abbreviation.empty()) {
      abbreviations_.insert(TextProcessor::toCodePoints(abbreviation));
    }
  }
  for (const auto &pair : config_.quotePairs) {
    closerFor_[pair.open] = pair.close;
    closers_.insert(pair.close);
  }
}

bool Segmenter::isAbbreviation(const std::u32string &token) const {
  if (token.empty())
    return false;

  if (abbreviations_.count(token) > 0)
    return true;

  // 一文字ずつピリオドで区切られた頭字語 (U.S, F.B.I)
  if (token.size() >= 3 && token.size() % 2 == 1) {
    bool acronym = true;
    for (size_t i = 0; i < token.size(); ++i) {
      bool letterSlot = (i % 2 == 0);
      if (letterSlot ? !TextProcessor::isLetter(token[i]) : token[i] != U'.') {
        acronym = false;
        break;
      }
    }
    if (acronym)
      return true;
  }

  return config_.singleLetterInitials && token.size() == 1 &&
         TextProcessor::isUppercase(token[0]) && token[0] != U'I';
}

char32_t Segmenter::closingQuoteFor(char32_t cp) const {
  auto it = closerFor_.find(cp);
  return it != closerFor_.end() ? it->second : 0;
}

bool Segmenter::isClosingQuote(char32_t cp) const {
  return closers_.count(cp) > 0;
}

std::vector<SentenceUnit> Segmenter::segment(const std::string &text) const {
  std::vector<SentenceUnit> sentences;
  if (text.empty())
    return sentences;

  std::vector<CodePoint> chars = decodeAll(text);

  int paragraphIndex = 0;
  size_t paragraphStart = 0;
  size_t i = 0;
  while (i <= chars.size()) {
    size_t breakEnd = i + 1;
    bool atEnd = (i == chars.size());
    if (atEnd ||
        isParagraphBreak(config_.paragraphMode, chars, i, breakEnd)) {
      // 空白だけの段落は番号を消費しない
      if (scanParagraph(*this, text, chars, paragraphStart, i,
                        paragraphIndex, sentences) > 0)
        ++paragraphIndex;
      if (atEnd)
        break;
      paragraphStart = breakEnd;
      i = breakEnd;
      continue;
    }
    ++i;
  }

  if (isDebugEnabled()) {
    std::cerr << "[DEBUG] segment: bytes=" << text.size()
              << ", paragraphs=" << paragraphIndex
              << ", sentences=" << sentences.size() << std::endl;
  }

  return sentences;
}

std::vector<SentenceUnit> segment(const std::string &text) {
  static const Segmenter segmenter;
  return segmenter.segment(text);
}

std::vector<std::string> splitIntoSentences(const std::string &text) {
  std::vector<std::string> result;
  for (auto &sentence : segment(text)) {
    result.push_back(std::move(sentence.text));
  }
  return result;
}

std::string reassemble(const std::string &source,
                       const std::vector<SentenceUnit> &sentences) {
  std::string result;
  result.reserve(source.size());
  size_t prev = 0;
  for (const auto &sentence : sentences) {
    result += source.substr(prev, sentence.start - prev);
    result += sentence.text;
    prev = sentence.end;
  }
  result += source.substr(prev);
  return result;
}

} // namespace Kugiri
