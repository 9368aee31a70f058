#ifndef OUTLINE_ANALYSIS_HPP
#define OUTLINE_ANALYSIS_HPP

#include <opencv2/core.hpp>

#include <cstddef>
#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace outline {

/**
 * @brief Result of classifying a single line
 */
enum class HeadingLevel {
  None, ///< Body text, not part of the outline
  H1,   ///< Top-level heading
  H2,   ///< Second-level heading
  H3    ///< Third-level heading
};

/**
 * @brief Convert a heading level to its outline label ("H1", "H2", "H3")
 * @return The label, or an empty string for HeadingLevel::None
 */
std::string headingLevelName(HeadingLevel level);

/**
 * @brief Smallest unit of text reported by the PDF parser (one text box)
 */
struct Span {
  std::string text;         ///< Text content (UTF-8)
  std::string fontName;     ///< Font name as reported by the PDF
  double fontSize = 0.0;    ///< Font size in points, must be positive
  bool isBold = false;      ///< Bold flag set by the producer
  cv::Rect2d boundingBox;   ///< Box in points, origin top-left
  int pageIndex = 0;        ///< 0-indexed page number
};

/**
 * @brief Spans of one page together with the page size
 */
struct PageSpans {
  int pageIndex = 0;        ///< 0-indexed page number
  double pageWidth = 0.0;   ///< Page width in points (0 if unknown)
  double pageHeight = 0.0;  ///< Page height in points (0 if unknown)
  std::vector<Span> spans;  ///< Spans in the order returned by the parser
};

/**
 * @brief Spans judged to be on the same visual line
 */
struct Line {
  std::vector<Span> spans;  ///< Merged spans, left to right
  std::string text;         ///< Span texts joined by single spaces
  double fontSize = 0.0;    ///< Largest span size
  bool isBold = false;      ///< True if a span of the line size is bold
  cv::Rect2d boundingBox;   ///< Union of the span boxes
  int pageIndex = 0;        ///< 0-indexed page number

  /// Vertical position of the line (top edge)
  double top() const { return boundingBox.y; }
};

/**
 * @brief Per-document font size statistics
 *
 * Built once per document and passed explicitly to the title detector and
 * the heading classifier. headingSizes holds at most three quantized sizes
 * strictly larger than the body size, in descending order: index 0 is H1,
 * index 1 is H2, index 2 is H3.
 */
struct StyleProfile {
  double bodySize = 0.0;
  std::vector<double> headingSizes;

  /// Threshold size for a level, or 0 if the document has none
  double thresholdFor(HeadingLevel level) const;
};

/**
 * @brief A classified heading
 */
struct HeadingRecord {
  HeadingLevel level = HeadingLevel::None;
  std::string text; ///< Cleaned heading text
  int page = 0;     ///< Page number (see OutlineConfig::firstPageNumber)
};

/**
 * @brief Heading record with its position inside the page
 */
struct HeadingCandidate {
  HeadingRecord record;
  std::size_t lineIndex = 0; ///< Index of the line in its page's reading order
};

/**
 * @brief Title and outline of one document
 */
struct ExtractionResult {
  std::string title;                  ///< Empty when no title was detected
  std::vector<HeadingRecord> outline; ///< Headings in reading order
};

/**
 * @brief Outcome of the title detector
 */
struct TitleSelection {
  std::string text;          ///< Cleaned title, may be empty
  bool found = false;        ///< Whether a title line was chosen
  std::size_t lineIndex = 0; ///< Index of the title line on page 1
};

/**
 * @brief Result of reading spans out of a PDF file
 */
struct PDFSpansResult {
  bool success = false;          ///< Whether the document could be read
  std::string errorMessage;      ///< Error message if failed
  std::vector<PageSpans> pages;  ///< One entry per page
  double processingTimeMs = 0;   ///< Processing time in milliseconds
};

/**
 * @brief Result of analyzing one PDF file
 *
 * When success is false the extraction is left empty: a document that cannot
 * be read never yields a partial outline.
 */
struct PDFOutlineResult {
  bool success = false;        ///< Whether analysis succeeded
  std::string errorMessage;    ///< Error message if failed
  std::string sourcePath;      ///< Path of the analyzed PDF
  ExtractionResult extraction; ///< Title and outline
  int pageCount = 0;           ///< Number of pages read
  int lineCount = 0;           ///< Number of aggregated lines
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/// Decides whether a span is set in a bold face
using BoldDetector = std::function<bool(const Span &)>;

/**
 * @brief Tunable thresholds of the outline heuristics
 */
struct OutlineConfig {
  /// Spans are on the same line when their vertical midpoints differ by at
  /// most this fraction of the smaller span height
  double lineMergeTolerance = 0.5;
  double sizeQuantum = 0.5;   ///< Font sizes are rounded to this step (pt)
  double sizeTolerance = 0.25; ///< Allowed distance from a level size (pt)
  double titleMinMargin = 2.0; ///< Title must exceed body size by this (pt)
  /// Only lines starting in the top fraction of page 1 may be the title
  double titleRegionFraction = 1.0;
  /// Only centered lines of page 1 may be the title (needs the page width)
  bool requireCenteredTitle = false;
  /// A line is centered when both ends keep this fraction of the page width
  /// free on their side...
  double titleSideMarginFraction = 0.15;
  /// ...or when it spans at least this fraction of the page width
  double titleFullWidthFraction = 0.6;
  int minTitleLength = 1; ///< Minimum title length in characters
  /// Drop the title size from the heading tiers when only the title uses it
  bool excludeTitleOnlySize = true;
  /// A non-bold line needs this gap over the body size to be a heading (pt)
  double headingMinMargin = 4.0;
  int maxHeadingWords = 0; ///< Longer lines are body text (0 = no limit)
  int firstPageNumber = 1; ///< Number given to the first page in records
  /// Lines matching any of these (case-insensitive) are never headings,
  /// in addition to lines made only of punctuation
  std::vector<std::string> ignorePatterns = {
      R"(^[0-9]{1,3}$)",      // page numbers
      R"(^(https?://|www\.))" // links
  };
  bool verbose = false; ///< Print DEBUG diagnostics to stderr
};

/**
 * @brief Case-insensitive check of a font name for a bold weight
 */
bool fontNameIndicatesBold(const std::string &fontName);

/**
 * @brief Default bold detector: the span flag or a bold font name
 */
bool defaultBoldDetector(const Span &span);

/**
 * @brief Normalize line text for titles and headings
 *
 * Trims, drops trailing dashes and underscores, collapses runs of whitespace
 * and removes whitespace in front of punctuation.
 */
std::string cleanText(const std::string &text);

/**
 * @brief Extracts a document title and heading outline from PDF files
 *
 * The class holds configuration only. Every call computes its own style
 * profile, so one instance may serve several documents, and separate
 * instances may run on separate threads.
 *
 * Example usage:
 * @code
 * outline::OutlineAnalysis analyzer;
 * auto result = analyzer.analyzePDF("report.pdf");
 * if (result.success) {
 *     std::cout << result.extraction.title << std::endl;
 * }
 * @endcode
 */
class OutlineAnalysis {
public:
  /**
   * @brief Default constructor
   */
  OutlineAnalysis();

  /**
   * @brief Constructor with custom configuration
   * @param config Outline configuration options
   * @param boldDetector Capability deciding span boldness (empty = default)
   * @throws std::regex_error if an ignore pattern is not a valid regex
   */
  explicit OutlineAnalysis(const OutlineConfig &config,
                           BoldDetector boldDetector = BoldDetector());

  /**
   * @brief Read all spans of a PDF file using Poppler
   *
   * Each Poppler text box becomes one span carrying its font name, font size
   * and bounding box. Locked or unreadable documents are reported with
   * success = false.
   *
   * @param pdfPath Path to the PDF file
   * @return PDFSpansResult with one PageSpans entry per page
   */
  PDFSpansResult extractSpansFromPDF(const std::string &pdfPath) const;

  /**
   * @brief Read a PDF file and extract its title and outline
   * @param pdfPath Path to the PDF file
   * @return PDFOutlineResult, success = false if the file cannot be read
   */
  PDFOutlineResult analyzePDF(const std::string &pdfPath) const;

  /**
   * @brief Run the full pipeline on pages of spans
   */
  ExtractionResult extractOutline(const std::vector<PageSpans> &pages) const;

  /**
   * @brief Run title detection and classification on aggregated lines
   * @param pageLines Lines of each page in reading order, page 1 first
   * @param firstPageHeight Height of page 1 in points (0 if unknown)
   * @param firstPageWidth Width of page 1 in points (0 if unknown)
   */
  ExtractionResult
  extractOutline(const std::vector<std::vector<Line>> &pageLines,
                 double firstPageHeight = 0.0,
                 double firstPageWidth = 0.0) const;

  /**
   * @brief Group the spans of one page into lines
   *
   * Spans with a non-positive size or without text are skipped. Lines are
   * returned top to bottom.
   */
  std::vector<Line> aggregateLines(const std::vector<Span> &spans) const;

  /**
   * @brief Compute body size and heading tiers over all lines of a document
   */
  StyleProfile buildStyleProfile(const std::vector<Line> &lines) const;

  /**
   * @brief Pick the title among the lines of page 1
   * @param firstPageLines Page 1 lines in reading order
   * @param profile Style profile of the document
   * @param pageHeight Height of page 1 in points (0 if unknown)
   * @param pageWidth Width of page 1 in points (0 if unknown, which disables
   *                  the centering check)
   */
  TitleSelection detectTitle(const std::vector<Line> &firstPageLines,
                             const StyleProfile &profile,
                             double pageHeight = 0.0,
                             double pageWidth = 0.0) const;

  /**
   * @brief Decide the heading level of one line
   *
   * Rules are applied in order and the first match wins: the title line,
   * empty or ignored text, then the H1, H2 and H3 sizes, each requiring a
   * bold face or a clear size gap over the body text.
   */
  HeadingLevel classifyLine(const Line &line, const StyleProfile &profile,
                            bool isTitle) const;

  /**
   * @brief Order heading candidates by page, then by line order
   */
  static std::vector<HeadingRecord>
  assembleOutline(std::vector<HeadingCandidate> candidates);

  /**
   * @brief Get the current configuration
   */
  const OutlineConfig &getConfig() const;

  /**
   * @brief Replace the configuration
   * @throws std::regex_error if an ignore pattern is not a valid regex
   */
  void setConfig(const OutlineConfig &config);

private:
  std::vector<std::vector<Line>>
  aggregatePages(const std::vector<PageSpans> &pages) const;
  bool isIgnoredText(const std::string &text) const;
  bool isCentered(const Line &line, double pageWidth) const;
  double quantize(double size) const;
  void compileIgnorePatterns();

  OutlineConfig m_config;                   ///< Current configuration
  BoldDetector m_boldDetector;              ///< Span boldness capability
  std::vector<std::regex> m_ignorePatterns; ///< Compiled ignorePatterns
};

} // namespace outline

#endif // OUTLINE_ANALYSIS_HPP
