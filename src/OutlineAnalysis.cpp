#include "OutlineAnalysis.hpp"

#include "FontSizeProfiler.hpp"
#include "HeadingClassifier.hpp"
#include "OutlineAssembler.hpp"
#include "PopplerSpanSource.hpp"
#include "TitleDetector.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace outline {

OutlineAnalysis::OutlineAnalysis() : m_config() {}

OutlineAnalysis::OutlineAnalysis(const OutlineConfig &config)
    : m_config(config) {}

OutlineResult OutlineAnalysis::extractOutline(const std::string &pdfPath) const {
  OutlineResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    PopplerSpanSource source(pdfPath);
    if (m_config.verbose) {
      std::cerr << "DEBUG: " << pdfPath << " has " << source.pageCount()
                << " pages" << std::endl;
    }
    analyze(source, result);
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Outline extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

OutlineResult OutlineAnalysis::extractOutline(const SpanSource &source) const {
  OutlineResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    analyze(source, result);
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Outline extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

void OutlineAnalysis::analyze(const SpanSource &source,
                              OutlineResult &result) const {
  result.pageCount = source.pageCount();
  if (result.pageCount == 0) {
    result.title = kEmptyDocument;
    return;
  }

  TitleDetector titleDetector(m_config.titleRegion,
                              m_config.titleSizeTolerance);
  OutlineAssembler assembler(titleDetector.detect(source));
  if (m_config.verbose) {
    std::cerr << "DEBUG: Title: \"" << assembler.title() << "\"" << std::endl;
  }

  FontSizeProfiler profiler(m_config.maxHeadingSizes);
  profiler.addDocument(source);
  FontProfile profile = profiler.profile();
  if (profile.empty()) {
    if (m_config.verbose) {
      std::cerr << "DEBUG: No text spans found" << std::endl;
    }
    assembler.finish(result);
    return;
  }

  if (m_config.verbose) {
    std::cerr << "DEBUG: Body size " << profile.bodySize << ", heading sizes:";
    for (int size : profile.headingSizes) {
      std::cerr << " " << size;
    }
    std::cerr << std::endl;
  }

  HeadingClassifier classifier(profile, m_config);
  for (int pageIndex = 0; pageIndex < result.pageCount; pageIndex++) {
    PageSize size = source.pageSize(pageIndex);

    // Heading band excludes running headers and footers
    cv::Rect2d band(0.0, size.height * m_config.marginTop, size.width,
                    size.height * (m_config.marginBottom - m_config.marginTop));
    std::vector<Block> blocks = source.blocks(pageIndex, &band, true);

    classifier.classifyPage(blocks, source, pageIndex + 1, assembler);
  }

  assembler.finish(result);
}

const OutlineConfig &OutlineAnalysis::getConfig() const { return m_config; }

void OutlineAnalysis::setConfig(const OutlineConfig &config) {
  m_config = config;
}

} // namespace outline
