#include "MemorySpanSource.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace outline {

namespace {

Span spanFromJson(const nlohmann::json &node) {
  const nlohmann::json &box = node.at("bbox");
  if (!box.is_array() || box.size() != 4) {
    throw std::runtime_error("span \"bbox\" must be an array of 4 numbers");
  }
  double x0 = box[0].get<double>();
  double y0 = box[1].get<double>();
  double x1 = box[2].get<double>();
  double y1 = box[3].get<double>();

  Span span;
  span.text = node.at("text").get<std::string>();
  span.size = node.at("size").get<double>();
  span.font = node.value("font", std::string());
  span.bbox = cv::Rect2d(x0, y0, x1 - x0, y1 - y0);
  return span;
}

} // namespace

Span makeSpan(const std::string &text, double size, const std::string &font,
              double x, double y, double width, double height) {
  Span span;
  span.text = text;
  span.size = size;
  span.font = font;
  span.bbox = cv::Rect2d(x, y, width, height);
  return span;
}

int MemorySpanSource::addPage(double width, double height) {
  StoredPage stored;
  stored.size.width = width;
  stored.size.height = height;
  m_pages.push_back(std::move(stored));
  return static_cast<int>(m_pages.size()) - 1;
}

void MemorySpanSource::addBlock(int pageIndex, std::vector<Line> lines) {
  page(pageIndex); // range check
  Block block;
  block.lines = std::move(lines);
  updateBounds(block);
  m_pages[static_cast<size_t>(pageIndex)].blocks.push_back(std::move(block));
}

void MemorySpanSource::addLine(int pageIndex, std::vector<Span> spans) {
  Line line;
  line.spans = std::move(spans);
  std::vector<Line> lines;
  lines.push_back(std::move(line));
  addBlock(pageIndex, std::move(lines));
}

int MemorySpanSource::pageCount() const {
  return static_cast<int>(m_pages.size());
}

PageSize MemorySpanSource::pageSize(int pageIndex) const {
  return page(pageIndex).size;
}

std::vector<Block> MemorySpanSource::blocks(int pageIndex,
                                            const cv::Rect2d *clip,
                                            bool sortReadingOrder) const {
  std::vector<Block> result = clip ? clipBlocks(page(pageIndex).blocks, *clip)
                                   : page(pageIndex).blocks;
  if (sortReadingOrder) {
    sortByPosition(result);
  }
  return result;
}

const MemorySpanSource::StoredPage &
MemorySpanSource::page(int pageIndex) const {
  if (pageIndex < 0 || pageIndex >= pageCount()) {
    throw std::out_of_range("page index " + std::to_string(pageIndex) +
                            " out of range (" + std::to_string(pageCount()) +
                            " pages)");
  }
  return m_pages[static_cast<size_t>(pageIndex)];
}

std::unique_ptr<MemorySpanSource>
MemorySpanSource::fromJson(const std::string &json) {
  auto source = std::make_unique<MemorySpanSource>();
  try {
    nlohmann::json root = nlohmann::json::parse(json);
    for (const auto &pageNode : root.at("pages")) {
      int index = source->addPage(pageNode.at("width").get<double>(),
                                  pageNode.at("height").get<double>());
      if (!pageNode.contains("blocks")) {
        continue;
      }
      for (const auto &blockNode : pageNode.at("blocks")) {
        std::vector<Line> lines;
        if (blockNode.contains("lines")) {
          for (const auto &lineNode : blockNode.at("lines")) {
            Line line;
            for (const auto &spanNode : lineNode.at("spans")) {
              line.spans.push_back(spanFromJson(spanNode));
            }
            lines.push_back(std::move(line));
          }
        }
        // Image blocks carry no lines and contribute nothing
        if (!lines.empty()) {
          source->addBlock(index, std::move(lines));
        }
      }
    }
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("Invalid span dump: ") + e.what());
  }
  return source;
}

std::unique_ptr<MemorySpanSource>
MemorySpanSource::fromJsonFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open span dump: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  try {
    return fromJson(buffer.str());
  } catch (const std::runtime_error &e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

} // namespace outline
