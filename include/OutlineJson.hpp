#ifndef OUTLINE_OUTLINE_JSON_HPP
#define OUTLINE_OUTLINE_JSON_HPP

#include "OutlineTypes.hpp"
#include "SpanSource.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace outline {

/**
 * @brief {"title": ..., "outline": [{"level", "text", "page"}, ...]}
 */
nlohmann::ordered_json resultToJson(const OutlineResult &result);

/**
 * @brief Serialize a result with 4-space indentation, UTF-8 kept as is
 */
std::string resultToJsonString(const OutlineResult &result);

/**
 * @brief Write a result to a JSON file, creating parent directories
 * @throws std::runtime_error if the file cannot be written
 */
void writeResultJson(const OutlineResult &result, const std::string &path);

/**
 * @brief Dump the unclipped span structure of every page
 *
 * The output can be loaded back with MemorySpanSource::fromJson().
 */
nlohmann::json spansToJson(const SpanSource &source);

} // namespace outline

#endif // OUTLINE_OUTLINE_JSON_HPP
