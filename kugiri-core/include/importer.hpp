#pragma once

#include "segmenter.hpp"
#include <string>
#include <vector>

namespace Kugiri {
namespace importer {

// One page of text as handed over by a PDF/OCR extractor
struct PageText {
  int pageNumber{0};
  std::string text;
};

struct PageSentence {
  int pageNumber{0};
  int index{0}; // ページ内での文番号
  int paragraphIndex{0};
  std::string text;
};

// Each page is segmented on its own; index restarts at 0 for every page.
std::vector<PageSentence> segmentPages(const Segmenter &segmenter,
                                       const std::vector<PageText> &pages);

} // namespace importer
} // namespace Kugiri
