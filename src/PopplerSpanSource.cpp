#include "PopplerSpanSource.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-page.h>

namespace outline {

namespace {

double centerY(const cv::Rect2d &box) { return box.y + box.height / 2.0; }

bool sameFont(const PopplerSpanSource::Word &a,
              const PopplerSpanSource::Word &b) {
  return a.font == b.font && std::abs(a.size - b.size) < 0.01;
}

// Words on the same line share a baseline band and sit close together
bool continuesLine(const PopplerSpanSource::Word &last,
                   const PopplerSpanSource::Word &word) {
  double height = std::max(last.bbox.height, word.bbox.height);
  double tolerance = std::max(2.0, height / 2.0);
  double yDiff = std::abs(centerY(last.bbox) - centerY(word.bbox));
  double gap = word.bbox.x - (last.bbox.x + last.bbox.width);
  return yDiff <= tolerance && gap > -tolerance && gap < height * 3.0;
}

// Lines in one block are stacked closely, overlap horizontally and start
// with the same font size
bool continuesBlock(const Line &previous, const Line &line) {
  double height = std::max(previous.bbox.height, line.bbox.height);
  double gap = line.bbox.y - (previous.bbox.y + previous.bbox.height);
  double overlap = std::min(previous.bbox.x + previous.bbox.width,
                            line.bbox.x + line.bbox.width) -
                   std::max(previous.bbox.x, line.bbox.x);
  double sizeDiff =
      std::abs(previous.spans.front().size - line.spans.front().size);
  return gap > -height && gap <= height * 0.5 && overlap > 0 &&
         sizeDiff < 1.0;
}

Line buildLine(const std::vector<PopplerSpanSource::Word> &words) {
  Line line;
  const PopplerSpanSource::Word *previous = nullptr;
  for (const auto &word : words) {
    if (previous && sameFont(*previous, word)) {
      Span &span = line.spans.back();
      if (previous->spaceAfter) {
        span.text += " ";
      }
      span.text += word.text;
      span.bbox |= word.bbox;
    } else {
      Span span;
      span.text = word.text;
      span.size = word.size;
      span.font = word.font;
      span.bbox = word.bbox;
      line.spans.push_back(std::move(span));
    }
    previous = &word;
  }
  return line;
}

} // namespace

PopplerSpanSource::PopplerSpanSource(const std::string &pdfPath)
    : m_path(pdfPath) {
  m_document.reset(poppler::document::load_from_file(pdfPath));
  if (!m_document) {
    throw std::runtime_error("Failed to load PDF file: " + pdfPath);
  }
  if (m_document->is_locked()) {
    throw std::runtime_error("PDF file is password protected: " + pdfPath);
  }
}

PopplerSpanSource::~PopplerSpanSource() = default;

int PopplerSpanSource::pageCount() const { return m_document->pages(); }

PageSize PopplerSpanSource::pageSize(int pageIndex) const {
  std::unique_ptr<poppler::page> page(m_document->create_page(pageIndex));
  if (!page) {
    throw std::runtime_error("Failed to create page " +
                             std::to_string(pageIndex + 1) + " of " + m_path);
  }
  poppler::rectf pageRect = page->page_rect();
  PageSize size;
  size.width = pageRect.width();
  size.height = pageRect.height();
  return size;
}

std::vector<PopplerSpanSource::Word>
PopplerSpanSource::readWords(int pageIndex) const {
  std::unique_ptr<poppler::page> page(m_document->create_page(pageIndex));
  if (!page) {
    throw std::runtime_error("Failed to create page " +
                             std::to_string(pageIndex + 1) + " of " + m_path);
  }

  std::vector<poppler::text_box> textBoxes =
      page->text_list(poppler::page::text_list_include_font);

  std::vector<Word> words;
  words.reserve(textBoxes.size());
  for (auto &textBox : textBoxes) {
    poppler::byte_array textBytes = textBox.text().to_utf8();
    std::string text(textBytes.begin(), textBytes.end());
    if (text.empty()) {
      continue;
    }

    // Text boxes are already in points with the origin at the top-left
    poppler::rectf bbox = textBox.bbox();

    Word word;
    word.text = text;
    word.bbox = cv::Rect2d(bbox.x(), bbox.y(), bbox.width(), bbox.height());
    word.spaceAfter = textBox.has_space_after();

    if (textBox.has_font_info()) {
      std::string fontName = textBox.get_font_name();
      if (fontName != "*ignored*") {
        word.font = fontName;
      }
      word.size = textBox.get_font_size();
    }
    // Fall back to the box height when no usable size is reported
    if (word.size <= 0.0) {
      word.size = bbox.height();
    }

    words.push_back(std::move(word));
  }
  return words;
}

std::vector<Block> PopplerSpanSource::blocks(int pageIndex,
                                             const cv::Rect2d *clip,
                                             bool sortReadingOrder) const {
  std::vector<Word> words = readWords(pageIndex);
  if (clip) {
    words.erase(std::remove_if(words.begin(), words.end(),
                               [clip](const Word &word) {
                                 return (word.bbox & *clip).area() <= 0;
                               }),
                words.end());
  }

  std::vector<Block> result = groupWords(words);
  if (sortReadingOrder) {
    sortByPosition(result);
  }
  return result;
}

std::vector<Block>
PopplerSpanSource::groupWords(const std::vector<Word> &words) {
  std::vector<Line> lines;
  std::vector<Word> lineWords;
  for (const auto &word : words) {
    if (!lineWords.empty() && !continuesLine(lineWords.back(), word)) {
      lines.push_back(buildLine(lineWords));
      lineWords.clear();
    }
    lineWords.push_back(word);
  }
  if (!lineWords.empty()) {
    lines.push_back(buildLine(lineWords));
  }

  std::vector<Block> blocks;
  for (auto &line : lines) {
    line.bbox = line.spans.front().bbox;
    for (const auto &span : line.spans) {
      line.bbox |= span.bbox;
    }

    if (blocks.empty() || !continuesBlock(blocks.back().lines.back(), line)) {
      blocks.emplace_back();
    }
    blocks.back().lines.push_back(std::move(line));
  }

  for (auto &block : blocks) {
    updateBounds(block);
  }
  return blocks;
}

} // namespace outline
