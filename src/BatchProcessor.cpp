#include "BatchProcessor.hpp"

#include "MemorySpanSource.hpp"
#include "OutlineJson.hpp"
#include "TextNormalizer.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace outline {

BatchProcessor::BatchProcessor(const OutlineAnalysis &analyzer,
                               const std::string &outputDir, InputKind kind)
    : m_analyzer(analyzer), m_outputDir(outputDir), m_kind(kind) {}

bool BatchProcessor::matchesInput(const std::string &fileName) const {
  std::string extension = toLowerAscii(fs::path(fileName).extension().string());
  return extension == (m_kind == InputKind::Pdf ? ".pdf" : ".json");
}

std::string BatchProcessor::outputPathFor(const std::string &inputPath) const {
  fs::path output = fs::path(m_outputDir) / fs::path(inputPath).stem();
  output += ".json";
  return output.string();
}

OutlineResult BatchProcessor::analyzeFile(const std::string &inputPath) const {
  if (m_kind == InputKind::Pdf) {
    return m_analyzer.extractOutline(inputPath);
  }

  OutlineResult result;
  try {
    auto source = MemorySpanSource::fromJsonFile(inputPath);
    result = m_analyzer.extractOutline(*source);
  } catch (const std::exception &e) {
    result.success = false;
    result.errorMessage = e.what();
  }
  return result;
}

bool BatchProcessor::processFile(const std::string &inputPath,
                                 BatchSummary &summary) const {
  std::string fileName = fs::path(inputPath).filename().string();
  std::cout << "Processing " << fileName << "..." << std::endl;

  OutlineResult result = analyzeFile(inputPath);
  if (!result.success) {
    std::cerr << "Failed to process " << fileName << ": "
              << result.errorMessage << std::endl;
    summary.failed++;
    summary.failures.push_back(fileName + ": " + result.errorMessage);
    return false;
  }

  std::string outputPath = outputPathFor(inputPath);
  try {
    writeResultJson(result, outputPath);
  } catch (const std::exception &e) {
    std::cerr << "Failed to process " << fileName << ": " << e.what()
              << std::endl;
    summary.failed++;
    summary.failures.push_back(fileName + ": " + e.what());
    return false;
  }

  std::cout << "Successfully created " << outputPath << " ("
            << result.outline.size() << " headings, "
            << result.processingTimeMs << " ms)" << std::endl;
  summary.processed++;
  summary.outputs.push_back(outputPath);
  return true;
}

BatchSummary BatchProcessor::processDirectory(const std::string &inputDir) const {
  BatchSummary summary;

  std::vector<std::string> inputs;
  for (const auto &entry : fs::directory_iterator(inputDir)) {
    if (entry.is_regular_file() &&
        matchesInput(entry.path().filename().string())) {
      inputs.push_back(entry.path().string());
    }
  }
  std::sort(inputs.begin(), inputs.end());

  if (inputs.empty()) {
    std::cout << "No input files found in " << inputDir << std::endl;
    return summary;
  }

  fs::create_directories(m_outputDir);
  for (const auto &input : inputs) {
    processFile(input, summary);
  }
  return summary;
}

} // namespace outline
