#ifndef OUTLINE_MEMORY_SPAN_SOURCE_HPP
#define OUTLINE_MEMORY_SPAN_SOURCE_HPP

#include "SpanSource.hpp"

#include <memory>
#include <string>
#include <vector>

namespace outline {

/**
 * @brief Span source holding pages in memory
 *
 * Pages are built with addPage()/addBlock()/addLine(), or loaded from a JSON
 * span dump:
 * @code
 * {"pages": [{"width": 612, "height": 792,
 *             "blocks": [{"lines": [{"spans": [
 *               {"text": "Intro", "size": 18.0, "font": "Arial-Bold",
 *                "bbox": [72, 100, 150, 118]}]}]}]}]}
 * @endcode
 * Span boxes are [x0, y0, x1, y1] in points with the origin at the top-left.
 */
class MemorySpanSource : public SpanSource {
public:
  MemorySpanSource() = default;

  /**
   * @brief Append an empty page
   * @return 0-based index of the new page
   */
  int addPage(double width, double height);

  /**
   * @brief Append a block to a page; boxes are computed from the spans
   */
  void addBlock(int pageIndex, std::vector<Line> lines);

  /**
   * @brief Append a block holding a single line
   */
  void addLine(int pageIndex, std::vector<Span> spans);

  int pageCount() const override;
  PageSize pageSize(int pageIndex) const override;
  std::vector<Block> blocks(int pageIndex, const cv::Rect2d *clip,
                            bool sortReadingOrder) const override;

  /**
   * @brief Parse a JSON span dump
   * @throws std::runtime_error on malformed input
   */
  static std::unique_ptr<MemorySpanSource> fromJson(const std::string &json);

  /**
   * @brief Load a JSON span dump from a file
   * @throws std::runtime_error if the file cannot be read or parsed
   */
  static std::unique_ptr<MemorySpanSource>
  fromJsonFile(const std::string &path);

private:
  struct StoredPage {
    PageSize size;
    std::vector<Block> blocks;
  };

  const StoredPage &page(int pageIndex) const;

  std::vector<StoredPage> m_pages;
};

/**
 * @brief Make a span from a top-left position and size
 */
Span makeSpan(const std::string &text, double size, const std::string &font,
              double x, double y, double width, double height);

} // namespace outline

#endif // OUTLINE_MEMORY_SPAN_SOURCE_HPP
