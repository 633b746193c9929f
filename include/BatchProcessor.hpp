#ifndef OUTLINE_BATCH_PROCESSOR_HPP
#define OUTLINE_BATCH_PROCESSOR_HPP

#include "OutlineAnalysis.hpp"

#include <string>
#include <vector>

namespace outline {

/**
 * @brief Kind of files a batch run reads
 */
enum class InputKind {
  Pdf,     ///< PDF files (*.pdf), read with Poppler
  SpanDump ///< JSON span dumps (*.json), see MemorySpanSource
};

/**
 * @brief Outcome of a batch run
 */
struct BatchSummary {
  int processed = 0;                 ///< Files written successfully
  int failed = 0;                    ///< Files that could not be processed
  std::vector<std::string> outputs;  ///< Paths of the JSON files written
  std::vector<std::string> failures; ///< "<file>: <cause>" per failure
};

/**
 * @brief Writes one <stem>.json outline file per input document
 *
 * Each file is processed independently; a failure is logged and the run
 * continues with the next file.
 */
class BatchProcessor {
public:
  BatchProcessor(const OutlineAnalysis &analyzer, const std::string &outputDir,
                 InputKind kind = InputKind::Pdf);

  /**
   * @brief Process every matching file of a directory, sorted by name
   *
   * The extension match ignores case. Subdirectories are not scanned.
   */
  BatchSummary processDirectory(const std::string &inputDir) const;

  /**
   * @brief Process a single file into the output directory
   * @return true if the JSON file was written
   */
  bool processFile(const std::string &inputPath, BatchSummary &summary) const;

  /**
   * @brief Extract the outline of one input without writing anything
   */
  OutlineResult analyzeFile(const std::string &inputPath) const;

  /**
   * @brief Output path for an input file: <outputDir>/<stem>.json
   */
  std::string outputPathFor(const std::string &inputPath) const;

  /**
   * @brief Whether a file name has the extension for this input kind
   */
  bool matchesInput(const std::string &fileName) const;

private:
  const OutlineAnalysis &m_analyzer;
  std::string m_outputDir;
  InputKind m_kind;
};

} // namespace outline

#endif // OUTLINE_BATCH_PROCESSOR_HPP
