#include "MemorySpanSource.hpp"
#include "TitleDetector.hpp"

#include <iostream>
#include <string>

using namespace outline;

int main() {
  std::cout << "=== Test TitleDetector ===" << std::endl << std::endl;

  int failures = 0;
  auto check = [&failures](bool condition, const std::string &description) {
    std::cout << (condition ? "  PASS  " : "  FAIL  ") << description
              << std::endl;
    if (!condition) {
      failures++;
    }
  };

  TitleDetector detector;

  // Largest spans on one line are joined
  {
    MemorySpanSource source;
    int page = source.addPage(612, 792);
    source.addLine(page, {makeSpan("Annual Report", 28, "Times-Bold", 72, 100, 200, 34),
                          makeSpan("2024", 28, "Times-Bold", 280, 100, 60, 34)});
    source.addLine(page, {makeSpan("Body text here", 12, "Times", 72, 200, 200, 14)});
    std::string title = detector.detect(source);
    check(title == "Annual Report 2024",
          "title joins the largest spans (got \"" + title + "\")");
  }

  // Spans within 1pt of the largest size count, others do not
  {
    MemorySpanSource source;
    int page = source.addPage(612, 792);
    source.addLine(page, {makeSpan("Main", 28, "Arial", 72, 100, 80, 34)});
    source.addLine(page, {makeSpan("Title", 27.2, "Arial", 72, 140, 80, 33)});
    source.addLine(page, {makeSpan("Subtitle", 26.9, "Arial", 72, 180, 120, 32)});
    std::string title = detector.detect(source);
    check(title == "Main Title",
          "size tolerance is strictly below 1.0 (got \"" + title + "\")");
  }

  // Blocks ending in the lower 30% are ignored
  {
    MemorySpanSource source;
    int page = source.addPage(612, 792);
    source.addLine(page, {makeSpan("Big Footer", 30, "Arial", 72, 600, 200, 36)});
    source.addLine(page, {makeSpan("Normal", 12, "Arial", 72, 100, 60, 14)});
    std::string title = detector.detect(source);
    check(title == TitleDetector::kUntitled,
          "largest text below 70% of the page yields no title (got \"" +
              title + "\")");
  }

  // Repeated candidates are kept once, first occurrence wins
  {
    MemorySpanSource source;
    int page = source.addPage(612, 792);
    source.addLine(page, {makeSpan("Report", 24, "Arial", 72, 100, 100, 29)});
    source.addLine(page, {makeSpan("Summary", 24, "Arial", 72, 150, 100, 29)});
    source.addLine(page, {makeSpan("Report", 24, "Arial", 72, 200, 100, 29)});
    std::string title = detector.detect(source);
    check(title == "Report Summary",
          "duplicate candidates removed (got \"" + title + "\")");
  }

  // Whitespace inside and around spans is collapsed
  {
    MemorySpanSource source;
    int page = source.addPage(612, 792);
    source.addLine(page, {makeSpan("  Annual   Report ", 24, "Arial", 72, 100, 200, 29),
                          makeSpan("\t2024", 24, "Arial", 280, 100, 60, 29)});
    std::string title = detector.detect(source);
    check(title == "Annual Report 2024",
          "whitespace collapsed (got \"" + title + "\")");
  }

  // Candidates follow reading order, not insertion order
  {
    MemorySpanSource source;
    int page = source.addPage(612, 792);
    source.addLine(page, {makeSpan("Second", 24, "Arial", 72, 200, 100, 29)});
    source.addLine(page, {makeSpan("First", 24, "Arial", 72, 100, 100, 29)});
    std::string title = detector.detect(source);
    check(title == "First Second",
          "blocks visited top to bottom (got \"" + title + "\")");
  }

  // Only page one is consulted
  {
    MemorySpanSource source;
    int first = source.addPage(612, 792);
    int second = source.addPage(612, 792);
    source.addLine(first, {makeSpan("Cover", 20, "Arial", 72, 100, 100, 24)});
    source.addLine(second, {makeSpan("Larger", 36, "Arial", 72, 100, 100, 43)});
    std::string title = detector.detect(source);
    check(title == "Cover", "later pages do not affect the title");
  }

  // No text at all
  {
    MemorySpanSource source;
    source.addPage(612, 792);
    check(detector.detect(source) == TitleDetector::kUntitled,
          "empty first page yields \"Untitled Document\"");
  }

  std::cout << std::endl
            << (failures == 0 ? "All checks passed"
                              : std::to_string(failures) + " check(s) failed")
            << std::endl;
  return failures == 0 ? 0 : 1;
}
