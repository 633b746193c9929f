#include "TitleDetector.hpp"

#include "TextNormalizer.hpp"

#include <algorithm>
#include <cmath>

namespace outline {

TitleDetector::TitleDetector(double titleRegion, double sizeTolerance)
    : m_titleRegion(titleRegion), m_sizeTolerance(sizeTolerance) {}

std::string TitleDetector::detect(const SpanSource &source) const {
  PageSize size = source.pageSize(0);
  return detect(source.blocks(0, nullptr, true), size.height);
}

std::string TitleDetector::detect(const std::vector<Block> &blocks,
                                  double pageHeight) const {
  double maxFontSize = 0.0;
  for (const auto &block : blocks) {
    for (const auto &line : block.lines) {
      for (const auto &span : line.spans) {
        maxFontSize = std::max(maxFontSize, span.size);
      }
    }
  }

  std::vector<std::string> candidates;
  double regionBottom = pageHeight * m_titleRegion;
  for (const auto &block : blocks) {
    if (block.lines.empty() || block.bottom() >= regionBottom) {
      continue;
    }
    for (const auto &line : block.lines) {
      for (const auto &span : line.spans) {
        if (std::abs(span.size - maxFontSize) >= m_sizeTolerance) {
          continue;
        }
        std::string text = trim(span.text);
        if (std::find(candidates.begin(), candidates.end(), text) ==
            candidates.end()) {
          candidates.push_back(text);
        }
      }
    }
  }

  if (candidates.empty()) {
    return kUntitled;
  }

  std::string title;
  for (size_t i = 0; i < candidates.size(); i++) {
    if (i > 0) {
      title += " ";
    }
    title += candidates[i];
  }
  return collapseWhitespace(title);
}

} // namespace outline
