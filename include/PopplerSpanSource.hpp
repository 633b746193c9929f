#ifndef OUTLINE_POPPLER_SPAN_SOURCE_HPP
#define OUTLINE_POPPLER_SPAN_SOURCE_HPP

#include "SpanSource.hpp"

#include <memory>
#include <string>
#include <vector>

namespace poppler {
class document;
}

namespace outline {

/**
 * @brief Span source reading a PDF file through poppler-cpp
 *
 * Poppler reports word boxes in reading order. Words are grouped into lines
 * (same baseline band, horizontally adjacent), lines into blocks (small
 * vertical gap, overlapping columns, same leading font size), and
 * consecutive words of a line sharing font name and size into spans.
 *
 * Example usage:
 * @code
 * outline::PopplerSpanSource source("report.pdf");
 * for (int i = 0; i < source.pageCount(); i++) {
 *     auto blocks = source.blocks(i, nullptr, true);
 * }
 * @endcode
 */
class PopplerSpanSource : public SpanSource {
public:
  /**
   * @brief Open a PDF file
   * @param pdfPath Path to the PDF file
   * @throws std::runtime_error if the file cannot be loaded or is locked
   */
  explicit PopplerSpanSource(const std::string &pdfPath);

  ~PopplerSpanSource() override;

  // Poppler documents are not copyable
  PopplerSpanSource(const PopplerSpanSource &) = delete;
  PopplerSpanSource &operator=(const PopplerSpanSource &) = delete;

  int pageCount() const override;
  PageSize pageSize(int pageIndex) const override;
  std::vector<Block> blocks(int pageIndex, const cv::Rect2d *clip,
                            bool sortReadingOrder) const override;

  const std::string &path() const { return m_path; }

  /**
   * @brief A single word box as reported by Poppler
   */
  struct Word {
    std::string text;
    std::string font;
    double size = 0.0;
    cv::Rect2d bbox;
    bool spaceAfter = true;
  };

  /**
   * @brief Group reading-ordered words into blocks, lines and spans
   */
  static std::vector<Block> groupWords(const std::vector<Word> &words);

private:
  std::vector<Word> readWords(int pageIndex) const;

  std::string m_path;
  std::unique_ptr<poppler::document> m_document;
};

} // namespace outline

#endif // OUTLINE_POPPLER_SPAN_SOURCE_HPP
