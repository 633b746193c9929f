#include "SpanSource.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace outline {

std::string Line::text() const {
  std::string joined;
  for (size_t i = 0; i < spans.size(); i++) {
    if (i > 0) {
      joined += " ";
    }
    joined += spans[i].text;
  }
  return joined;
}

bool SpanSource::isBold(const Span &span) const {
  std::string fontLower = span.font;
  std::transform(fontLower.begin(), fontLower.end(), fontLower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return fontLower.find("bold") != std::string::npos;
}

void SpanSource::sortByPosition(std::vector<Block> &blocks) {
  // Top to bottom by bottom edge, left to right on ties
  std::stable_sort(blocks.begin(), blocks.end(),
                   [](const Block &a, const Block &b) {
                     if (a.bottom() != b.bottom()) {
                       return a.bottom() < b.bottom();
                     }
                     return a.bbox.x < b.bbox.x;
                   });
}

std::vector<Block> SpanSource::clipBlocks(const std::vector<Block> &blocks,
                                          const cv::Rect2d &clip) {
  std::vector<Block> clipped;
  for (const auto &block : blocks) {
    Block kept;
    for (const auto &line : block.lines) {
      Line keptLine;
      for (const auto &span : line.spans) {
        if ((span.bbox & clip).area() > 0) {
          keptLine.spans.push_back(span);
        }
      }
      if (!keptLine.spans.empty()) {
        kept.lines.push_back(std::move(keptLine));
      }
    }
    if (!kept.lines.empty()) {
      updateBounds(kept);
      clipped.push_back(std::move(kept));
    }
  }
  return clipped;
}

void SpanSource::updateBounds(Block &block) {
  bool firstLine = true;
  for (auto &line : block.lines) {
    if (line.spans.empty()) {
      continue;
    }
    line.bbox = line.spans.front().bbox;
    for (const auto &span : line.spans) {
      line.bbox |= span.bbox;
    }
    block.bbox = firstLine ? line.bbox : (block.bbox | line.bbox);
    firstLine = false;
  }
}

} // namespace outline
