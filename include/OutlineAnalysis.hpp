#ifndef OUTLINE_OUTLINE_ANALYSIS_HPP
#define OUTLINE_OUTLINE_ANALYSIS_HPP

#include "OutlineTypes.hpp"
#include "SpanSource.hpp"

#include <string>

namespace outline {

/**
 * @brief Main class for extracting a title and heading outline from a PDF
 *
 * The title is taken from the largest text on page one. Headings are lines
 * between 10% and 90% of the page height that are bold and either numbered,
 * set in one of the three largest sizes above body text, or short and
 * larger than body text.
 *
 * Example usage:
 * @code
 * outline::OutlineAnalysis analyzer;
 * auto result = analyzer.extractOutline("report.pdf");
 * if (result.success) {
 *     std::cout << result.title << std::endl;
 * }
 * @endcode
 */
class OutlineAnalysis {
public:
  static constexpr const char *kEmptyDocument = "Empty Document";

  /**
   * @brief Default constructor
   */
  OutlineAnalysis();

  /**
   * @brief Constructor with custom configuration
   * @param config Extraction configuration options
   */
  explicit OutlineAnalysis(const OutlineConfig &config);

  /**
   * @brief Extract the outline of a PDF file using Poppler
   *
   * Failures to open or read the document are reported through
   * OutlineResult::success and OutlineResult::errorMessage.
   *
   * @param pdfPath Path to the PDF file
   * @return OutlineResult containing title, headings and metadata
   */
  OutlineResult extractOutline(const std::string &pdfPath) const;

  /**
   * @brief Extract the outline of an already opened document
   * @param source Span source for the document
   * @return OutlineResult containing title, headings and metadata
   */
  OutlineResult extractOutline(const SpanSource &source) const;

  /**
   * @brief Get the current configuration
   */
  const OutlineConfig &getConfig() const;

  /**
   * @brief Set a new configuration
   */
  void setConfig(const OutlineConfig &config);

private:
  /**
   * @brief Run the pipeline; exceptions propagate to the caller
   */
  void analyze(const SpanSource &source, OutlineResult &result) const;

  OutlineConfig m_config; ///< Current configuration
};

} // namespace outline

#endif // OUTLINE_OUTLINE_ANALYSIS_HPP
