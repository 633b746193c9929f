#ifndef OUTLINE_OUTLINE_TYPES_HPP
#define OUTLINE_OUTLINE_TYPES_HPP

#include <string>
#include <vector>

namespace outline {

/**
 * @brief Heading nesting level
 */
enum class HeadingLevel { H1 = 1, H2 = 2, H3 = 3, H4 = 4 };

/**
 * @brief String form of a level ("H1" .. "H4")
 */
std::string headingLevelName(HeadingLevel level);

/**
 * @brief Level for a depth, clamped to H1..H4
 */
HeadingLevel headingLevelFromDepth(int depth);

/**
 * @brief One heading in the document outline
 */
struct OutlineEntry {
  HeadingLevel level; ///< Nesting level
  std::string text;   ///< Normalized heading text
  int page;           ///< 1-indexed page number

  bool operator==(const OutlineEntry &other) const {
    return level == other.level && text == other.text && page == other.page;
  }
};

/**
 * @brief Result of outline extraction for one document
 */
struct OutlineResult {
  std::string title;                 ///< Document title
  std::vector<OutlineEntry> outline; ///< Headings in document order
  int pageCount = 0;                 ///< Number of pages in the document
  double processingTimeMs = 0;       ///< Processing time in milliseconds
  bool success = false;              ///< Whether extraction succeeded
  std::string errorMessage;          ///< Error message if failed
};

/**
 * @brief Configuration options for outline extraction
 */
struct OutlineConfig {
  double marginTop = 0.1;    ///< Top of the heading band (fraction of height)
  double marginBottom = 0.9; ///< Bottom of the heading band
  double titleRegion = 0.7;  ///< Title blocks must end above this fraction
  double titleSizeTolerance = 1.0; ///< Max distance from the largest size
  int maxHeadingSizes = 3;   ///< Number of ranked heading sizes (H1..H3)
  size_t minHeadingLength = 3;     ///< Minimum heading length in characters
  size_t maxFallbackWords = 10;    ///< Fallback headings have fewer words
  bool verbose = false;      ///< Print DEBUG diagnostics to stderr
};

} // namespace outline

#endif // OUTLINE_OUTLINE_TYPES_HPP
