#include "OutlineJson.hpp"
#include "PopplerSpanSource.hpp"

#include <cstring>
#include <iomanip>
#include <iostream>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <pdf_file> [--json]" << std::endl;
    std::cerr << "  --json  Write a span dump readable by pdf_outline --spans"
              << std::endl;
    return 1;
  }

  std::string pdfPath = argv[1];
  bool asJson = false;
  for (int i = 2; i < argc; i++) {
    if (std::strcmp(argv[i], "--json") == 0) {
      asJson = true;
    }
  }

  try {
    outline::PopplerSpanSource source(pdfPath);

    if (asJson) {
      std::cout << outline::spansToJson(source).dump(2) << std::endl;
      return 0;
    }

    std::cout << "Loading PDF: " << pdfPath << std::endl;
    std::cout << "Number of pages: " << source.pageCount() << std::endl;

    for (int pageIndex = 0; pageIndex < source.pageCount(); pageIndex++) {
      outline::PageSize size = source.pageSize(pageIndex);
      auto blocks = source.blocks(pageIndex, nullptr, true);
      std::cout << std::endl
                << "=== Page " << (pageIndex + 1) << " (" << size.width << " x "
                << size.height << "), " << blocks.size() << " blocks ==="
                << std::endl;

      for (size_t b = 0; b < blocks.size(); b++) {
        const auto &block = blocks[b];
        std::cout << "Block " << b << " bottom=" << std::fixed
                  << std::setprecision(1) << block.bottom() << std::endl;
        for (const auto &line : block.lines) {
          for (const auto &span : line.spans) {
            std::cout << "  " << std::setw(6) << span.size << "  "
                      << (source.isBold(span) ? "B " : "  ") << std::setw(28)
                      << std::left << span.font << std::right << " \""
                      << span.text << "\"" << std::endl;
          }
        }
      }
    }
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << std::endl;
    return 1;
  }
}
