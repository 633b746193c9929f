#include "HeadingClassifier.hpp"

#include "TextNormalizer.hpp"

#include <algorithm>
#include <iostream>

namespace outline {

HeadingClassifier::HeadingClassifier(const FontProfile &profile,
                                     const OutlineConfig &config)
    : m_profile(profile), m_config(config) {}

HeadingDecision HeadingClassifier::classify(const std::string &lineText,
                                            double fontSize, bool bold,
                                            const ClassifierState &state) const {
  HeadingDecision decision;

  std::string text = trim(lineText);
  if (text.empty() || codePointLength(text) < m_config.minHeadingLength ||
      state.contains(text)) {
    return decision;
  }

  // Nothing below can fire on a regular-weight line
  if (!bold) {
    return decision;
  }

  int roundedSize = roundFontSize(fontSize);

  if (matchHeadingNumber(text).matched()) {
    // Counts every '.' in the line, not just those in the numbering prefix
    decision.dotCount = countDots(text);
    int depth = std::min(std::max(2, static_cast<int>(decision.dotCount) + 2), 4);
    decision.isHeading = true;
    decision.cue = HeadingCue::NumberedHeading;
    decision.level = headingLevelFromDepth(depth);
  } else if (m_profile.levelForSize(roundedSize, decision.level)) {
    decision.isHeading = true;
    decision.cue = HeadingCue::RankedSize;
  } else if (roundedSize > m_profile.bodySize &&
             countWords(text) < m_config.maxFallbackWords) {
    decision.isHeading = true;
    decision.cue = HeadingCue::PlainBoldLine;
    decision.level = HeadingLevel::H3;
  }

  if (decision.isHeading) {
    decision.text = normalizeHeadingText(text);
  }
  return decision;
}

size_t HeadingClassifier::classifyPage(const std::vector<Block> &blocks,
                                       const SpanSource &source,
                                       int pageNumber,
                                       OutlineAssembler &assembler) const {
  size_t added = 0;
  for (const auto &block : blocks) {
    for (const auto &line : block.lines) {
      if (line.spans.empty()) {
        continue;
      }

      const Span &first = line.spans.front();
      std::string lineText = trim(line.text());
      HeadingDecision decision = classify(lineText, first.size,
                                          source.isBold(first),
                                          assembler.state());
      if (!decision.isHeading) {
        continue;
      }

      if (m_config.verbose) {
        std::cerr << "DEBUG: Page " << pageNumber << " heading "
                  << headingLevelName(decision.level) << " (size "
                  << roundFontSize(first.size) << "): \"" << decision.text
                  << "\"" << std::endl;
      }

      assembler.append(OutlineEntry{decision.level, decision.text, pageNumber},
                       lineText);
      added++;
    }
  }
  return added;
}

} // namespace outline
