#include "OutlineAnalysis.hpp"
#include "OutlineExport.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <pdf_file|input_dir> [options]\n"
      << "\nOptions:\n"
      << "  -o, --output <dir>        Output directory (default: output)\n"
      << "      --stdout              Print JSON for a single file instead\n"
      << "                            of writing it\n"
      << "      --title-margin <pt>   Minimum title size over body size\n"
      << "                            (default: 2)\n"
      << "      --heading-margin <pt> Size gap that makes a non-bold line a\n"
      << "                            heading (default: 4)\n"
      << "      --size-quantum <pt>   Font size rounding step (default: 0.5)\n"
      << "      --max-words <n>       Longer lines are never headings\n"
      << "                            (default: 0 = no limit)\n"
      << "      --centered-title      Only accept a horizontally centered\n"
      << "                            line of page 1 as the title\n"
      << "      --zero-based-pages    Number pages from 0 instead of 1\n"
      << "  -v, --verbose             Print diagnostics to stderr\n"
      << "  -h, --help                Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " report.pdf --stdout\n"
      << "  " << programName << " /app/input -o /app/output\n";
}

// Parses a count option value, returning false on malformed or out of range
// input
bool parseCount(const std::string &option, const std::string &value,
                int &out) {
  try {
    size_t consumed = 0;
    out = std::stoi(value, &consumed);
    if (consumed == value.size()) {
      return true;
    }
  } catch (const std::exception &) {
    // reported below
  }
  std::cerr << "Error: " << option << " expects a whole number, got '"
            << value << "'\n";
  return false;
}

// Parses a numeric option value, returning false on malformed input
bool parseNumber(const std::string &option, const std::string &value,
                 double &out) {
  try {
    size_t consumed = 0;
    out = std::stod(value, &consumed);
    if (consumed == value.size()) {
      return true;
    }
  } catch (const std::exception &) {
    // reported below
  }
  std::cerr << "Error: " << option << " expects a number, got '" << value
            << "'\n";
  return false;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string inputPath;
  std::string outputDir = "output";
  bool toStdout = false;
  outline::OutlineConfig config;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto requireValue = [&](std::string &value) {
      if (i + 1 < argc) {
        value = argv[++i];
        return true;
      }
      std::cerr << "Error: " << arg << " requires an argument\n";
      return false;
    };

    std::string value;
    double number = 0.0;
    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-o" || arg == "--output") {
      if (!requireValue(outputDir))
        return 1;
    } else if (arg == "--stdout") {
      toStdout = true;
    } else if (arg == "--title-margin") {
      if (!requireValue(value) || !parseNumber(arg, value, number))
        return 1;
      config.titleMinMargin = number;
    } else if (arg == "--heading-margin") {
      if (!requireValue(value) || !parseNumber(arg, value, number))
        return 1;
      config.headingMinMargin = number;
    } else if (arg == "--size-quantum") {
      if (!requireValue(value) || !parseNumber(arg, value, number))
        return 1;
      config.sizeQuantum = number;
    } else if (arg == "--max-words") {
      if (!requireValue(value) ||
          !parseCount(arg, value, config.maxHeadingWords))
        return 1;
    } else if (arg == "--centered-title") {
      config.requireCenteredTitle = true;
    } else if (arg == "--zero-based-pages") {
      config.firstPageNumber = 0;
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg[0] != '-') {
      inputPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (inputPath.empty()) {
    std::cerr << "Error: No input path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  if (config.sizeQuantum <= 0.0 || config.titleMinMargin < 0.0 ||
      config.headingMinMargin < 0.0 || config.maxHeadingWords < 0) {
    std::cerr << "Error: size quantum must be positive and margins and word "
                 "limits must not be negative\n";
    return 1;
  }

  if (!std::filesystem::exists(inputPath)) {
    std::cerr << "Input not found: " << inputPath << "\n";
    return 1;
  }

  outline::OutlineAnalysis analyzer(config);

  try {
    if (std::filesystem::is_directory(inputPath)) {
      outline::BatchSummary summary =
          outline::processDirectory(analyzer, inputPath, outputDir);

      std::cout << "\nProcessed " << summary.processed << " of "
                << summary.discovered << " document(s) in "
                << summary.processingTimeMs << " ms\n";
      for (const auto &error : summary.errors) {
        std::cerr << "Failed: " << error << "\n";
      }
      return summary.failed == 0 ? 0 : 1;
    }

    outline::PDFOutlineResult result = analyzer.analyzePDF(inputPath);
    if (!result.success) {
      std::cerr << "Outline extraction failed: " << result.errorMessage
                << "\n";
      return 1;
    }

    if (toStdout) {
      std::cout << outline::toJsonString(result.extraction) << "\n";
      return 0;
    }

    std::filesystem::create_directories(outputDir);
    std::string outputPath = outline::outputPathFor(inputPath, outputDir);
    outline::writeOutlineJson(result.extraction, outputPath);
    std::cout << "Wrote " << outputPath << " ("
              << result.extraction.outline.size() << " headings, "
              << result.processingTimeMs << " ms)\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
