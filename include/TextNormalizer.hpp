#ifndef OUTLINE_TEXT_NORMALIZER_HPP
#define OUTLINE_TEXT_NORMALIZER_HPP

#include <cstddef>
#include <string>

namespace outline {

/**
 * @brief Kind of numbering prefix found at the start of a line
 */
enum class NumberingKind {
  None,    ///< No numbering prefix
  Numeric, ///< Dotted number sequence ("1", "1.2", "1.2.3")
  Chapter, ///< "Chapter" followed by a number
  Appendix ///< "Appendix" followed by a letter
};

/**
 * @brief Outcome of a numbering-prefix recognizer
 */
struct NumberingMatch {
  NumberingKind kind = NumberingKind::None; ///< What was recognized
  size_t prefixBegin = 0; ///< Offset of the prefix (after leading space)
  size_t prefixEnd = 0;   ///< Offset one past the prefix

  bool matched() const { return kind != NumberingKind::None; }
};

/**
 * @brief Recognize a numbering prefix that is followed by a separator
 *
 * "Appendix" takes one letter, digit or '_' in any script; punctuation such
 * as an en dash does not qualify. The prefix must be followed by '.',
 * whitespace or '-'. For dotted numbers a shorter prefix is accepted when
 * the longest one is not followed by a separator, so "1.2abc" is recognized
 * through "1" + ".".
 *
 * @param text Raw line text
 * @return Match describing the prefix, or NumberingKind::None
 */
NumberingMatch matchHeadingNumber(const std::string &text);

/**
 * @brief Recognize the longest numbering prefix, separator not required
 *
 * This is the prefix removed from heading text by normalizeHeadingText().
 */
NumberingMatch matchNumberingPrefix(const std::string &text);

/**
 * @brief Produce display text for a heading
 *
 * Removes a leading numbering prefix together with any '.', whitespace or
 * '-' characters that follow it, then collapses whitespace runs and trims.
 *
 * @param text Raw line text
 * @return Cleaned heading text
 */
std::string normalizeHeadingText(const std::string &text);

/**
 * @brief Remove leading and trailing whitespace
 *
 * Whitespace here and in the other helpers includes Unicode spaces such as
 * U+00A0 (no-break space), U+2000-U+200A and U+3000.
 */
std::string trim(const std::string &text);

/**
 * @brief Replace every whitespace run with one space and trim
 */
std::string collapseWhitespace(const std::string &text);

std::string toLowerAscii(const std::string &text);

/**
 * @brief Lowercase Latin, Greek and Cyrillic letters of a UTF-8 string
 *
 * Other code points are copied unchanged.
 */
std::string toLowerText(const std::string &text);

/**
 * @brief Number of Unicode code points in a UTF-8 string
 */
size_t codePointLength(const std::string &text);

/**
 * @brief Number of whitespace-separated words
 */
size_t countWords(const std::string &text);

size_t countDots(const std::string &text);

/**
 * @brief Round to the nearest integer, ties to even (12.5 -> 12, 13.5 -> 14)
 */
int roundFontSize(double size);

} // namespace outline

#endif // OUTLINE_TEXT_NORMALIZER_HPP
