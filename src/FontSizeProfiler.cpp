#include "FontSizeProfiler.hpp"

#include "TextNormalizer.hpp"

#include <algorithm>
#include <functional>

namespace outline {

bool FontProfile::levelForSize(int size, HeadingLevel &level) const {
  auto it = sizeToLevel.find(size);
  if (it == sizeToLevel.end()) {
    return false;
  }
  level = it->second;
  return true;
}

FontSizeProfiler::FontSizeProfiler(int maxHeadingSizes)
    : m_maxHeadingSizes(std::max(0, maxHeadingSizes)) {}

void FontSizeProfiler::addSpan(const Span &span) {
  int size = roundFontSize(span.size);
  m_spanCount++;

  auto it = std::find_if(
      m_counts.begin(), m_counts.end(),
      [size](const std::pair<int, size_t> &entry) { return entry.first == size; });
  if (it != m_counts.end()) {
    it->second++;
  } else {
    m_counts.emplace_back(size, 1);
  }
}

void FontSizeProfiler::addBlocks(const std::vector<Block> &blocks) {
  for (const auto &block : blocks) {
    for (const auto &line : block.lines) {
      for (const auto &span : line.spans) {
        addSpan(span);
      }
    }
  }
}

void FontSizeProfiler::addDocument(const SpanSource &source) {
  for (int pageIndex = 0; pageIndex < source.pageCount(); pageIndex++) {
    addBlocks(source.blocks(pageIndex, nullptr, false));
  }
}

FontProfile FontSizeProfiler::profile() const {
  FontProfile result;
  result.spanCount = m_spanCount;
  if (m_counts.empty()) {
    return result;
  }

  // First entry with the highest count wins ties
  auto body = m_counts.begin();
  for (auto it = m_counts.begin(); it != m_counts.end(); ++it) {
    if (it->second > body->second) {
      body = it;
    }
  }
  result.bodySize = body->first;

  for (const auto &entry : m_counts) {
    if (entry.first > result.bodySize) {
      result.headingSizes.push_back(entry.first);
    }
  }
  std::sort(result.headingSizes.begin(), result.headingSizes.end(),
            std::greater<int>());
  if (static_cast<int>(result.headingSizes.size()) > m_maxHeadingSizes) {
    result.headingSizes.resize(static_cast<size_t>(m_maxHeadingSizes));
  }

  for (size_t rank = 0; rank < result.headingSizes.size(); rank++) {
    result.sizeToLevel[result.headingSizes[rank]] =
        headingLevelFromDepth(static_cast<int>(rank) + 1);
  }
  return result;
}

size_t FontSizeProfiler::count(int roundedSize) const {
  for (const auto &entry : m_counts) {
    if (entry.first == roundedSize) {
      return entry.second;
    }
  }
  return 0;
}

} // namespace outline
