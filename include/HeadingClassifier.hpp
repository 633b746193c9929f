#ifndef OUTLINE_HEADING_CLASSIFIER_HPP
#define OUTLINE_HEADING_CLASSIFIER_HPP

#include "FontSizeProfiler.hpp"
#include "OutlineAssembler.hpp"
#include "OutlineTypes.hpp"
#include "SpanSource.hpp"

#include <string>
#include <vector>

namespace outline {

/**
 * @brief Which check produced a heading decision
 */
enum class HeadingCue {
  NumberedHeading, ///< Numbering prefix on a bold line
  RankedSize,      ///< Bold line at one of the ranked heading sizes
  PlainBoldLine    ///< Short bold line larger than body text
};

/**
 * @brief Heading decision for one line
 */
struct HeadingDecision {
  bool isHeading = false;
  HeadingLevel level = HeadingLevel::H1;
  HeadingCue cue = HeadingCue::PlainBoldLine;
  size_t dotCount = 0; ///< Dots in the full text (numbered headings only)
  std::string text;    ///< Normalized heading text
};

/**
 * @brief Decides whether lines are headings and at which level
 *
 * Checks run in a fixed order and the first match wins:
 * - numbered and bold: H{clamp(dots + 2, 2, 4)}, where dots counts every '.'
 *   in the full line text
 * - bold at a ranked heading size: the size's level
 * - bold, larger than body text and fewer than maxFallbackWords words: H3
 */
class HeadingClassifier {
public:
  /**
   * @param profile Font profile of the document (copied)
   * @param config Extraction configuration (copied)
   */
  HeadingClassifier(const FontProfile &profile, const OutlineConfig &config);

  /**
   * @brief Classify one line without modifying any state
   *
   * @param lineText Raw line text (span texts joined with spaces)
   * @param fontSize Size of the line's first span (unrounded)
   * @param bold Whether the line's first span is bold
   * @param state Texts already emitted in this document
   */
  HeadingDecision classify(const std::string &lineText, double fontSize,
                           bool bold, const ClassifierState &state) const;

  /**
   * @brief Classify every line of a page's clipped blocks
   *
   * @param blocks Blocks of the heading band, in reading order
   * @param source Span source providing the boldness query
   * @param pageNumber 1-indexed page number
   * @param assembler Receives accepted headings; its state is consulted for
   * de-duplication
   * @return Number of headings added
   */
  size_t classifyPage(const std::vector<Block> &blocks,
                      const SpanSource &source, int pageNumber,
                      OutlineAssembler &assembler) const;

private:
  FontProfile m_profile;
  OutlineConfig m_config;
};

} // namespace outline

#endif // OUTLINE_HEADING_CLASSIFIER_HPP
