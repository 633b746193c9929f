#include "OutlineJson.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace outline {

nlohmann::ordered_json resultToJson(const OutlineResult &result) {
  nlohmann::ordered_json outlineNode = nlohmann::ordered_json::array();
  for (const auto &entry : result.outline) {
    nlohmann::ordered_json entryNode;
    entryNode["level"] = headingLevelName(entry.level);
    entryNode["text"] = entry.text;
    entryNode["page"] = entry.page;
    outlineNode.push_back(entryNode);
  }

  nlohmann::ordered_json root;
  root["title"] = result.title;
  root["outline"] = outlineNode;
  return root;
}

std::string resultToJsonString(const OutlineResult &result) {
  return resultToJson(result).dump(
      4, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

void writeResultJson(const OutlineResult &result, const std::string &path) {
  std::filesystem::path outputPath(path);
  if (outputPath.has_parent_path()) {
    std::filesystem::create_directories(outputPath.parent_path());
  }

  std::ofstream out(outputPath, std::ios::binary);
  if (!out) {
    throw std::runtime_error("Failed to open output file: " + path);
  }
  out << resultToJsonString(result);
  if (!out) {
    throw std::runtime_error("Failed to write output file: " + path);
  }
}

nlohmann::json spansToJson(const SpanSource &source) {
  nlohmann::json pages = nlohmann::json::array();
  for (int pageIndex = 0; pageIndex < source.pageCount(); pageIndex++) {
    PageSize size = source.pageSize(pageIndex);
    nlohmann::json blocksNode = nlohmann::json::array();
    for (const auto &block : source.blocks(pageIndex, nullptr, false)) {
      nlohmann::json linesNode = nlohmann::json::array();
      for (const auto &line : block.lines) {
        nlohmann::json spansNode = nlohmann::json::array();
        for (const auto &span : line.spans) {
          spansNode.push_back(
              {{"text", span.text},
               {"size", span.size},
               {"font", span.font},
               {"bbox",
                {span.bbox.x, span.bbox.y, span.bbox.x + span.bbox.width,
                 span.bbox.y + span.bbox.height}}});
        }
        linesNode.push_back({{"spans", spansNode}});
      }
      blocksNode.push_back({{"lines", linesNode}});
    }
    pages.push_back({{"width", size.width},
                     {"height", size.height},
                     {"blocks", blocksNode}});
  }
  return {{"pages", pages}};
}

} // namespace outline
