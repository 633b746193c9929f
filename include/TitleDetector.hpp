#ifndef OUTLINE_TITLE_DETECTOR_HPP
#define OUTLINE_TITLE_DETECTOR_HPP

#include "SpanSource.hpp"

#include <string>
#include <vector>

namespace outline {

/**
 * @brief Finds the document title from the largest text on page one
 *
 * All spans within the size tolerance of the largest span, in blocks that
 * end above the title region, are joined in reading order. Repeated span
 * texts are kept once.
 */
class TitleDetector {
public:
  static constexpr const char *kUntitled = "Untitled Document";

  /**
   * @param titleRegion Fraction of the page height a block must end above
   * @param sizeTolerance Max difference from the largest size
   */
  TitleDetector(double titleRegion = 0.7, double sizeTolerance = 1.0);

  /**
   * @brief Detect the title of a document
   * @param source Document; must have at least one page
   * @return Title text, or kUntitled when no candidate is found
   */
  std::string detect(const SpanSource &source) const;

  /**
   * @brief Detect the title from the reading-ordered blocks of page one
   */
  std::string detect(const std::vector<Block> &blocks,
                     double pageHeight) const;

private:
  double m_titleRegion;
  double m_sizeTolerance;
};

} // namespace outline

#endif // OUTLINE_TITLE_DETECTOR_HPP
