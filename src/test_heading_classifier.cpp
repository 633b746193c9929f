#include "FontSizeProfiler.hpp"
#include "HeadingClassifier.hpp"
#include "MemorySpanSource.hpp"

#include <iostream>
#include <string>

using namespace outline;

namespace {

// Body 12 with ranked heading sizes 24, 18, 16 (14 is left over)
FontProfile sampleProfile() {
  FontSizeProfiler profiler;
  for (double size : {12.0, 12.0, 12.0, 12.0, 24.0, 18.0, 16.0, 14.0}) {
    profiler.addSpan(makeSpan("x", size, "Arial", 0, 0, 10, 10));
  }
  return profiler.profile();
}

} // namespace

int main() {
  std::cout << "=== Test HeadingClassifier ===" << std::endl << std::endl;

  int failures = 0;
  auto check = [&failures](bool condition, const std::string &description) {
    std::cout << (condition ? "  PASS  " : "  FAIL  ") << description
              << std::endl;
    if (!condition) {
      failures++;
    }
  };

  FontProfile profile = sampleProfile();
  OutlineConfig config;
  HeadingClassifier classifier(profile, config);
  ClassifierState empty;

  std::cout << "[ranked sizes]" << std::endl;
  HeadingDecision d = classifier.classify("Introduction", 24, true, empty);
  check(d.isHeading && d.level == HeadingLevel::H1 &&
            d.cue == HeadingCue::RankedSize,
        "bold 24pt -> H1");
  d = classifier.classify("Background", 18.3, true, empty);
  check(d.isHeading && d.level == HeadingLevel::H2, "bold 18.3pt -> H2");
  d = classifier.classify("Method", 15.7, true, empty);
  check(d.isHeading && d.level == HeadingLevel::H3, "bold 15.7pt -> H3");
  d = classifier.classify("Introduction", 24, false, empty);
  check(!d.isHeading, "regular-weight 24pt line is not a heading");

  std::cout << std::endl << "[numbered headings]" << std::endl;
  d = classifier.classify("1.2 See fig. 3.4 for details", 12, true, empty);
  check(d.isHeading && d.cue == HeadingCue::NumberedHeading &&
            d.dotCount == 4 && d.level == HeadingLevel::H4,
        "\"1.2 See fig. 3.4 for details\" counts 4 dots -> H4");
  check(d.text == "See fig. 3.4 for details", "numbering stripped from text");

  d = classifier.classify("1.1 Details", 16, true, empty);
  check(d.isHeading && d.level == HeadingLevel::H3 && d.text == "Details",
        "\"1.1 Details\" -> H3 \"Details\"");

  d = classifier.classify("2 Scope", 12, true, empty);
  check(d.isHeading && d.level == HeadingLevel::H2 && d.text == "Scope",
        "\"2 Scope\" has no dots -> H2");

  d = classifier.classify("1. Overview", 24, true, empty);
  check(d.isHeading && d.cue == HeadingCue::NumberedHeading &&
            d.level == HeadingLevel::H3,
        "numbering wins over the ranked size: \"1. Overview\" at 24pt -> H3");

  d = classifier.classify("Chapter 2 Results", 12, true, empty);
  check(d.isHeading && d.level == HeadingLevel::H2 && d.text == "Results",
        "\"Chapter 2 Results\" -> H2 \"Results\"");

  d = classifier.classify("Appendix A. Tables", 12, true, empty);
  check(d.isHeading && d.level == HeadingLevel::H3 && d.text == "Tables",
        "\"Appendix A. Tables\" -> H3 \"Tables\"");

  d = classifier.classify("Appendix \xE2\x80\x93 Data Sources", 18, true, empty);
  check(d.isHeading && d.cue == HeadingCue::RankedSize &&
            d.level == HeadingLevel::H2 &&
            d.text == "Appendix \xE2\x80\x93 Data Sources",
        "\"Appendix \xE2\x80\x93 Data Sources\" is ranked by size, text kept");

  d = classifier.classify("1\xC2\xA0Introduction", 24, true, empty);
  check(d.isHeading && d.cue == HeadingCue::NumberedHeading &&
            d.level == HeadingLevel::H2 && d.text == "Introduction",
        "no-break space after the number -> H2 \"Introduction\"");

  d = classifier.classify("1. Overview", 12, false, empty);
  check(!d.isHeading, "numbered regular-weight body line is not a heading");

  std::cout << std::endl << "[fallback]" << std::endl;
  d = classifier.classify("Key Findings", 14, true, empty);
  check(d.isHeading && d.cue == HeadingCue::PlainBoldLine &&
            d.level == HeadingLevel::H3,
        "bold 14pt short line -> H3");
  d = classifier.classify("one two three four five six seven eight nine", 14,
                          true, empty);
  check(d.isHeading, "nine words still qualify");
  d = classifier.classify("one two three four five six seven eight nine ten",
                          14, true, empty);
  check(!d.isHeading, "ten words do not qualify");
  d = classifier.classify("Bold body emphasis", 12, true, empty);
  check(!d.isHeading, "bold text at body size is not a heading");
  d = classifier.classify("Small print", 10, true, empty);
  check(!d.isHeading, "bold text below body size is not a heading");

  std::cout << std::endl << "[rejections]" << std::endl;
  check(!classifier.classify("AB", 24, true, empty).isHeading,
        "two characters are too short");
  check(!classifier.classify("   ", 24, true, empty).isHeading,
        "blank line rejected");
  check(classifier.classify("\xC3\x89t\xC3\xA9", 24, true, empty).isHeading,
        "three code points are long enough");
  check(!classifier.classify("\xC3\x89t", 24, true, empty).isHeading,
        "two code points are too short even with three bytes");

  ClassifierState state("Annual Report");
  check(!classifier.classify("ANNUAL REPORT", 24, true, state).isHeading,
        "title text rejected regardless of case");
  state.accept("Introduction");
  check(!classifier.classify("  introduction ", 24, true, state).isHeading,
        "already emitted heading rejected");
  check(classifier.classify("Introduction Part Two", 24, true, state).isHeading,
        "a different line is still accepted");
  check(state.size() == 2, "classify() leaves the state untouched");

  ClassifierState umlautTitle("\xC3\x9C" "BER UNS");
  check(!classifier.classify("\xC3\xBC" "ber uns", 24, true, umlautTitle).isHeading,
        "non-ASCII title text rejected regardless of case");
  check(!classifier.classify("\xC2\xA0Introduction", 24, true, state).isHeading,
        "leading no-break space trimmed before de-duplication");

  std::cout << std::endl << "[owned profile]" << std::endl;
  {
    FontSizeProfiler profiler;
    for (double size : {11.0, 11.0, 11.0, 20.0}) {
      profiler.addSpan(makeSpan("x", size, "Arial", 0, 0, 10, 10));
    }
    // Profile and config are temporaries that end with this statement
    HeadingClassifier owning(profiler.profile(), OutlineConfig());
    HeadingDecision owned = owning.classify("Findings", 20, true, empty);
    check(owned.isHeading && owned.level == HeadingLevel::H1,
          "classifier keeps its own copy of the profile");
  }

  std::cout << std::endl << "[classifyPage]" << std::endl;
  {
    MemorySpanSource source;
    int page = source.addPage(612, 792);
    source.addLine(page, {makeSpan("Results", 24, "Arial-BoldMT", 72, 100, 80, 29)});
    source.addLine(page, {makeSpan("Plain", 24, "ArialMT", 72, 150, 60, 29),
                          makeSpan("Bold tail", 24, "Arial-BoldMT", 140, 150, 90, 29)});
    source.addLine(page, {makeSpan("results", 24, "Arial-BoldMT", 72, 200, 80, 29)});
    source.addLine(page, {makeSpan("1.1", 16, "Arial-BoldMT", 72, 250, 20, 19),
                          makeSpan("Scope", 16, "Arial-BoldMT", 96, 250, 60, 19)});

    OutlineAssembler assembler("Report Title");
    size_t added = classifier.classifyPage(source.blocks(page, nullptr, true),
                                           source, 3, assembler);
    const auto &entries = assembler.entries();
    check(added == 2 && entries.size() == 2, "two headings added");
    check(entries.size() > 0 && entries[0] ==
                                    OutlineEntry{HeadingLevel::H1, "Results", 3},
          "first entry is H1 \"Results\" on page 3");
    check(entries.size() > 1 &&
              entries[1] == OutlineEntry{HeadingLevel::H3, "Scope", 3},
          "spans are joined before matching: \"1.1 Scope\" -> H3");
    check(assembler.state().contains("1.1 Scope"),
          "raw line text recorded for de-duplication");
  }

  std::cout << std::endl
            << (failures == 0 ? "All checks passed"
                              : std::to_string(failures) + " check(s) failed")
            << std::endl;
  return failures == 0 ? 0 : 1;
}
