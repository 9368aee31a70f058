#ifndef OUTLINE_EXPORT_HPP
#define OUTLINE_EXPORT_HPP

#include "OutlineAnalysis.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace outline {

/**
 * @brief Outcome of processing a directory of PDF files
 */
struct BatchSummary {
  int discovered = 0;                   ///< PDF files found in the input dir
  int processed = 0;                    ///< Files with a JSON output written
  int failed = 0;                       ///< Files that could not be processed
  std::vector<std::string> outputPaths; ///< JSON files written, sorted
  std::vector<std::string> errors;      ///< "<file>: <message>" per failure
  double processingTimeMs = 0;          ///< Total time in milliseconds
};

/**
 * @brief Convert a result to the {"title", "outline"} JSON object
 *
 * Each outline entry has the keys "level" ("H1", "H2" or "H3"), "text" and
 * "page". Keys keep their insertion order.
 */
nlohmann::ordered_json toJson(const ExtractionResult &result);

/**
 * @brief Serialize a result as pretty-printed JSON (2-space indent)
 */
std::string toJsonString(const ExtractionResult &result);

/**
 * @brief Write a result to a JSON file
 * @throws std::runtime_error if the file cannot be written
 */
void writeOutlineJson(const ExtractionResult &result,
                      const std::string &outputPath);

/**
 * @brief Path of the JSON file written for an input PDF
 *
 * The input base name with a .json extension, inside outputDir.
 */
std::string outputPathFor(const std::string &pdfPath,
                          const std::string &outputDir);

/**
 * @brief Process every PDF file of a directory
 *
 * Files are handled in name order. A document that fails is logged and
 * recorded in the summary without stopping the run, and no JSON is written
 * for it. The output directory is created when missing.
 *
 * @param analyzer Configured analyzer
 * @param inputDir Directory searched (non-recursively) for *.pdf files
 * @param outputDir Directory receiving one JSON file per document
 * @throws std::runtime_error if inputDir is not a directory or outputDir
 * cannot be created
 */
BatchSummary processDirectory(const OutlineAnalysis &analyzer,
                              const std::string &inputDir,
                              const std::string &outputDir);

} // namespace outline

#endif // OUTLINE_EXPORT_HPP
