#ifndef OUTLINE_SPAN_SOURCE_HPP
#define OUTLINE_SPAN_SOURCE_HPP

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace outline {

/**
 * @brief A run of text sharing one font name and size within a line
 */
struct Span {
  std::string text;    ///< UTF-8 text content
  double size = 0.0;   ///< Font size in points
  std::string font;    ///< Font descriptor as reported by the backend
  cv::Rect2d bbox;     ///< Bounding box in points, origin top-left
};

/**
 * @brief One visual text line made of spans in left-to-right order
 */
struct Line {
  std::vector<Span> spans; ///< Spans in reading order
  cv::Rect2d bbox;         ///< Union of the span boxes

  /**
   * @brief Span texts joined with single spaces (not trimmed)
   */
  std::string text() const;
};

/**
 * @brief A group of lines forming a paragraph-like unit
 */
struct Block {
  std::vector<Line> lines; ///< Lines in reading order
  cv::Rect2d bbox;         ///< Union of the line boxes

  /**
   * @brief Bottom edge of the block (y grows downward)
   */
  double bottom() const { return bbox.y + bbox.height; }
};

/**
 * @brief Page dimensions in points
 */
struct PageSize {
  double width = 0.0;
  double height = 0.0;
};

/**
 * @brief Abstract provider of per-page text geometry
 *
 * A span source represents one open document. Page indices are 0-based.
 * Implementations throw std::runtime_error when a page cannot be read.
 */
class SpanSource {
public:
  virtual ~SpanSource() = default;

  /**
   * @brief Number of pages in the document
   */
  virtual int pageCount() const = 0;

  /**
   * @brief Dimensions of a page
   * @param pageIndex 0-based page index
   */
  virtual PageSize pageSize(int pageIndex) const = 0;

  /**
   * @brief Extract the blocks of a page
   *
   * @param pageIndex 0-based page index
   * @param clip Optional rectangle (points, origin top-left); when given,
   * only text whose box intersects it is returned
   * @param sortReadingOrder Order blocks top to bottom, then left to right
   * @return Blocks with their lines and spans
   */
  virtual std::vector<Block> blocks(int pageIndex, const cv::Rect2d *clip,
                                    bool sortReadingOrder) const = 0;

  /**
   * @brief Whether a span is rendered in a bold face
   *
   * The default looks for "bold" in the font descriptor, ignoring case.
   */
  virtual bool isBold(const Span &span) const;

  /**
   * @brief Sort blocks by bottom edge, then left edge (stable)
   */
  static void sortByPosition(std::vector<Block> &blocks);

  /**
   * @brief Keep only spans whose box intersects a clip rectangle
   *
   * Lines and blocks left without spans are dropped; the boxes of the
   * remaining ones are recomputed.
   */
  static std::vector<Block> clipBlocks(const std::vector<Block> &blocks,
                                       const cv::Rect2d &clip);

  /**
   * @brief Recompute line and block boxes from their spans
   */
  static void updateBounds(Block &block);
};

} // namespace outline

#endif // OUTLINE_SPAN_SOURCE_HPP
