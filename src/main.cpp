#include "BatchProcessor.hpp"
#include "OutlineAnalysis.hpp"
#include "OutlineJson.hpp"

#include <poppler-global.h>

#include <exception>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " [options] [input]\n"
      << "\nExtracts the title and heading outline of PDF files as JSON.\n"
      << "<input> is a PDF file or a directory of PDF files (default: input)\n"
      << "\nOptions:\n"
      << "  -o, --output <dir>   Output directory for JSON files (default: "
         "output)\n"
      << "  -s, --spans          Read JSON span dumps instead of PDF files\n"
      << "  -p, --print          Print the JSON result instead of writing "
         "files\n"
      << "  -v, --verbose        Print debug information to stderr\n"
      << "  -h, --help           Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " report.pdf\n"
      << "  " << programName << " input -o output\n"
      << "  " << programName << " --spans --print report_spans.json\n";
}

int main(int argc, char *argv[]) {
  std::string inputPath;
  std::string outputDir = "output";
  outline::OutlineConfig config;
  outline::InputKind kind = outline::InputKind::Pdf;
  bool printResult = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        outputDir = argv[++i];
      } else {
        std::cerr << "Error: --output requires an argument\n";
        return 1;
      }
    } else if (arg == "-s" || arg == "--spans") {
      kind = outline::InputKind::SpanDump;
    } else if (arg == "-p" || arg == "--print") {
      printResult = true;
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg[0] != '-' && inputPath.empty()) {
      inputPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (config.verbose) {
    std::cerr << "=== PDF Outline ===\n"
              << "Poppler version: " << poppler::version_string() << "\n"
              << "===================\n";
  }

  if (inputPath.empty()) {
    inputPath = "input";
    if (!fs::exists(inputPath)) {
      fs::create_directories(inputPath);
      std::cout << "Created input directory at " << fs::absolute(inputPath)
                << ". Please add your PDF files there.\n";
      return 0;
    }
  }

  if (!fs::exists(inputPath)) {
    std::cerr << "Input not found: " << inputPath << "\n";
    printUsage(argv[0]);
    return 2;
  }

  outline::OutlineAnalysis analyzer(config);
  outline::BatchProcessor processor(analyzer, outputDir, kind);

  if (printResult) {
    if (fs::is_directory(inputPath)) {
      std::cerr << "Error: --print requires a single input file\n";
      return 1;
    }
    outline::OutlineResult result = processor.analyzeFile(inputPath);
    if (!result.success) {
      std::cerr << "Failed to process " << inputPath << ": "
                << result.errorMessage << "\n";
      return 1;
    }
    std::cout << outline::resultToJsonString(result) << "\n";
    return 0;
  }

  outline::BatchSummary summary;
  try {
    if (fs::is_directory(inputPath)) {
      summary = processor.processDirectory(inputPath);
    } else {
      processor.processFile(inputPath, summary);
    }
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }

  if (summary.failed > 0) {
    std::cerr << summary.failed << " file(s) failed\n";
    return 1;
  }
  return 0;
}
