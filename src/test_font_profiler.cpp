#include "FontSizeProfiler.hpp"
#include "MemorySpanSource.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace outline;

namespace {

Span spanOfSize(double size) {
  return makeSpan("text", size, "Helvetica", 72, 100, 40, size * 1.2);
}

} // namespace

int main() {
  std::cout << "=== Test FontSizeProfiler ===" << std::endl << std::endl;

  int failures = 0;
  auto check = [&failures](bool condition, const std::string &description) {
    std::cout << (condition ? "  PASS  " : "  FAIL  ") << description
              << std::endl;
    if (!condition) {
      failures++;
    }
  };

  // Body 12 (six spans, one of them 12.4); larger sizes 24, 18, 16, 14
  {
    FontSizeProfiler profiler;
    for (double size : {12.0, 12.0, 18.0, 12.0, 24.0, 12.4, 16.0, 12.0, 14.0,
                        18.0, 10.0, 12.0}) {
      profiler.addSpan(spanOfSize(size));
    }
    FontProfile profile = profiler.profile();

    check(profile.bodySize == 12, "body size is the most frequent size");
    check(profiler.count(12) == 6, "12.4 is counted as 12");
    check(profile.headingSizes == std::vector<int>({24, 18, 16}),
          "heading sizes are the three largest above body, descending");

    HeadingLevel level = HeadingLevel::H4;
    check(profile.levelForSize(24, level) && level == HeadingLevel::H1,
          "24 -> H1");
    check(profile.levelForSize(18, level) && level == HeadingLevel::H2,
          "18 -> H2");
    check(profile.levelForSize(16, level) && level == HeadingLevel::H3,
          "16 -> H3");
    check(!profile.levelForSize(14, level), "14 did not make the cut");
    check(!profile.levelForSize(10, level), "10 is below body size");
    check(profile.spanCount == 12, "all spans counted");
  }

  // Ties resolve to the size seen first
  {
    FontSizeProfiler profiler;
    for (double size : {10.0, 12.0, 12.0, 10.0}) {
      profiler.addSpan(spanOfSize(size));
    }
    FontProfile profile = profiler.profile();
    check(profile.bodySize == 10, "tie resolves to the first size seen");
    check(profile.headingSizes == std::vector<int>({12}),
          "only 12 ranks above a body size of 10");
  }

  // Half sizes round to even
  {
    FontSizeProfiler profiler;
    for (double size : {12.5, 12.5, 13.5}) {
      profiler.addSpan(spanOfSize(size));
    }
    FontProfile profile = profiler.profile();
    check(profile.bodySize == 12, "12.5 rounds to 12");
    check(profile.headingSizes == std::vector<int>({14}), "13.5 rounds to 14");
  }

  // No spans
  {
    FontSizeProfiler profiler;
    FontProfile profile = profiler.profile();
    check(profile.empty(), "empty profiler reports no spans");
    check(profile.headingSizes.empty() && profile.sizeToLevel.empty(),
          "empty profile has no heading sizes");
  }

  // Whole document, every page, no clipping
  {
    MemorySpanSource source;
    int first = source.addPage(612, 792);
    int second = source.addPage(612, 792);
    source.addLine(first, {makeSpan("Header", 20, "Arial-Bold", 72, 10, 80, 24)});
    source.addLine(first, {makeSpan("Body", 11, "Arial", 72, 300, 40, 13),
                           makeSpan("more", 11, "Arial", 120, 300, 40, 13)});
    source.addLine(second, {makeSpan("Body", 11, "Arial", 72, 300, 40, 13)});
    source.addLine(second, {makeSpan("Footer", 9, "Arial", 72, 770, 40, 11)});

    FontSizeProfiler profiler;
    profiler.addDocument(source);
    FontProfile profile = profiler.profile();
    check(profile.spanCount == 5, "spans from every page are counted");
    check(profile.bodySize == 11, "body size across pages is 11");
    check(profile.headingSizes == std::vector<int>({20}),
          "spans in page margins still count toward the profile");
  }

  std::cout << std::endl
            << (failures == 0 ? "All checks passed"
                              : std::to_string(failures) + " check(s) failed")
            << std::endl;
  return failures == 0 ? 0 : 1;
}
