#ifndef OUTLINE_FONT_SIZE_PROFILER_HPP
#define OUTLINE_FONT_SIZE_PROFILER_HPP

#include "OutlineTypes.hpp"
#include "SpanSource.hpp"

#include <map>
#include <utility>
#include <vector>

namespace outline {

/**
 * @brief Font size statistics of a whole document
 */
struct FontProfile {
  int bodySize = 0;               ///< Most frequent rounded size
  std::vector<int> headingSizes;  ///< Ranked larger sizes, descending
  std::map<int, HeadingLevel> sizeToLevel; ///< Ranked size -> H1..H3
  size_t spanCount = 0;           ///< Spans seen while profiling

  bool empty() const { return spanCount == 0; }

  /**
   * @brief Level for a ranked heading size
   * @return true and sets level if size is one of the ranked sizes
   */
  bool levelForSize(int size, HeadingLevel &level) const;
};

/**
 * @brief Builds a frequency table of rounded font sizes
 *
 * Sizes are counted in the order they are first encountered so that ties for
 * the most frequent size resolve to the earliest one.
 */
class FontSizeProfiler {
public:
  explicit FontSizeProfiler(int maxHeadingSizes = 3);

  void addSpan(const Span &span);
  void addBlocks(const std::vector<Block> &blocks);

  /**
   * @brief Profile every span of every page (unclipped)
   */
  void addDocument(const SpanSource &source);

  /**
   * @brief Derive body size and ranked heading sizes
   */
  FontProfile profile() const;

  size_t count(int roundedSize) const;

private:
  int m_maxHeadingSizes;
  std::vector<std::pair<int, size_t>> m_counts; ///< size -> count, first-seen
  size_t m_spanCount = 0;
};

} // namespace outline

#endif // OUTLINE_FONT_SIZE_PROFILER_HPP
