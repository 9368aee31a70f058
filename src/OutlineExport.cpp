#include "OutlineExport.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

using json = nlohmann::ordered_json;

namespace outline {

namespace {

bool hasPdfExtension(const fs::path &path) {
  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return extension == ".pdf";
}

} // anonymous namespace

json toJson(const ExtractionResult &result) {
  json outline = json::array();
  for (const auto &heading : result.outline) {
    json entry;
    entry["level"] = headingLevelName(heading.level);
    entry["text"] = heading.text;
    entry["page"] = heading.page;
    outline.push_back(entry);
  }

  json obj;
  obj["title"] = result.title;
  obj["outline"] = outline;
  return obj;
}

std::string toJsonString(const ExtractionResult &result) {
  // Invalid UTF-8 from a broken font mapping is replaced rather than thrown
  return toJson(result).dump(2, ' ', false, json::error_handler_t::replace);
}

void writeOutlineJson(const ExtractionResult &result,
                      const std::string &outputPath) {
  std::ofstream out(outputPath, std::ios::binary);
  if (!out) {
    throw std::runtime_error("Failed to open output file: " + outputPath);
  }
  out << toJsonString(result) << "\n";
  if (!out) {
    throw std::runtime_error("Failed to write output file: " + outputPath);
  }
}

std::string outputPathFor(const std::string &pdfPath,
                          const std::string &outputDir) {
  fs::path name = fs::path(pdfPath).stem();
  name += ".json";
  return (fs::path(outputDir) / name).string();
}

BatchSummary processDirectory(const OutlineAnalysis &analyzer,
                              const std::string &inputDir,
                              const std::string &outputDir) {
  BatchSummary summary;

  auto startTime = std::chrono::high_resolution_clock::now();

  if (!fs::is_directory(inputDir)) {
    throw std::runtime_error("Input directory not found: " + inputDir);
  }

  std::error_code ec;
  fs::create_directories(outputDir, ec);
  if (ec) {
    throw std::runtime_error("Failed to create output directory " + outputDir +
                             ": " + ec.message());
  }

  std::vector<fs::path> pdfFiles;
  for (const auto &entry : fs::directory_iterator(inputDir)) {
    if (entry.is_regular_file() && hasPdfExtension(entry.path())) {
      pdfFiles.push_back(entry.path());
    }
  }
  std::sort(pdfFiles.begin(), pdfFiles.end());
  summary.discovered = static_cast<int>(pdfFiles.size());

  std::cout << "Found " << pdfFiles.size() << " PDF file(s) in " << inputDir
            << std::endl;

  for (const auto &pdfFile : pdfFiles) {
    std::string fileName = pdfFile.filename().string();
    std::cout << "Processing: " << fileName << std::endl;

    try {
      PDFOutlineResult result = analyzer.analyzePDF(pdfFile.string());
      if (!result.success) {
        std::cerr << "Error processing " << fileName << ": "
                  << result.errorMessage << std::endl;
        summary.failed++;
        summary.errors.push_back(fileName + ": " + result.errorMessage);
        continue;
      }

      std::string outputPath = outputPathFor(pdfFile.string(), outputDir);
      writeOutlineJson(result.extraction, outputPath);

      summary.processed++;
      summary.outputPaths.push_back(outputPath);
      std::cout << "Processed: " << fileName << " (" << result.pageCount
                << " pages, " << result.extraction.outline.size()
                << " headings, " << result.processingTimeMs << " ms)"
                << std::endl;
    } catch (const std::exception &e) {
      std::cerr << "Error processing " << fileName << ": " << e.what()
                << std::endl;
      summary.failed++;
      summary.errors.push_back(fileName + ": " + e.what());
    }
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  summary.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return summary;
}

} // namespace outline
