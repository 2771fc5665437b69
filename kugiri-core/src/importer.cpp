#include "importer.hpp"

namespace Kugiri {
namespace importer {

std::vector<PageSentence> segmentPages(const Segmenter &segmenter,
                                       const std::vector<PageText> &pages) {
  std::vector<PageSentence> result;
  for (const auto &page : pages) {
    for (auto &sentence : segmenter.segment(page.text)) {
      PageSentence entry;
      entry.pageNumber = page.pageNumber;
      entry.index = sentence.order;
      entry.paragraphIndex = sentence.paragraphIndex;
      entry.text = std::move(sentence.text);
      result.push_back(std::move(entry));
    }
  }
  return result;
}

} // namespace importer
} // namespace Kugiri
