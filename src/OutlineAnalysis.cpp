#include "OutlineAnalysis.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>
#include <utility>

namespace outline {

namespace {

// Sizes that differ by less than this are the same quantized size
const double SIZE_EPSILON = 1e-6;

bool isBlank(const std::string &text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
}

std::string trim(const std::string &s) {
  size_t start = 0;
  while (start < s.size() &&
         std::isspace(static_cast<unsigned char>(s[start])))
    start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    end--;
  return s.substr(start, end - start);
}

// Number of UTF-8 code points (continuation bytes are not counted)
std::size_t characterCount(const std::string &text) {
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(), [](unsigned char c) {
        return (c & 0xC0) != 0x80;
      }));
}

std::size_t wordCount(const std::string &text) {
  std::istringstream stream(text);
  std::string word;
  std::size_t count = 0;
  while (stream >> word)
    count++;
  return count;
}

// Decode the UTF-8 code point starting at text[pos] and advance pos past it.
// Malformed sequences yield the lead byte as-is.
char32_t nextCodePoint(const std::string &text, std::size_t &pos) {
  unsigned char lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 1;
  char32_t cp = lead;
  if (lead >= 0xF0 && lead < 0xF8) {
    length = 4;
    cp = lead & 0x07;
  } else if (lead >= 0xE0) {
    length = lead < 0xF0 ? 3 : 1;
    cp = lead & 0x0F;
  } else if (lead >= 0xC0) {
    length = 2;
    cp = lead & 0x1F;
  }
  if (length == 1 || pos + length > text.size()) {
    pos++;
    return lead;
  }
  for (std::size_t i = 1; i < length; i++) {
    unsigned char next = static_cast<unsigned char>(text[pos + i]);
    if ((next & 0xC0) != 0x80) {
      pos++;
      return lead;
    }
    cp = (cp << 6) | (next & 0x3F);
  }
  pos += length;
  return cp;
}

// Punctuation, symbol and space blocks outside ASCII: Latin-1 symbols,
// general punctuation through dingbats and arrows, CJK punctuation, and the
// fullwidth and small form variants of ASCII punctuation
bool isSymbolCodePoint(char32_t cp) {
  return (cp >= 0x00A0 && cp <= 0x00BF) || cp == 0x00D7 || cp == 0x00F7 ||
         (cp >= 0x2000 && cp <= 0x2BFF) || (cp >= 0x2E00 && cp <= 0x2E7F) ||
         (cp >= 0x3000 && cp <= 0x303F) || (cp >= 0xFE10 && cp <= 0xFE6F) ||
         (cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
         (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65) ||
         (cp >= 0x1F000 && cp <= 0x1FAFF);
}

// True for text without a single letter or digit (rules, bullets, leaders)
bool isPunctuationOnly(const std::string &text) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = nextCodePoint(text, pos);
    if (cp < 0x80) {
      if (std::isalnum(static_cast<unsigned char>(cp))) {
        return false;
      }
    } else if (!isSymbolCodePoint(cp)) {
      return false;
    }
  }
  return true;
}

char toLowerAscii(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

double verticalMidpoint(const Span &span) {
  return span.boundingBox.y + span.boundingBox.height / 2.0;
}

} // anonymous namespace

std::string headingLevelName(HeadingLevel level) {
  switch (level) {
  case HeadingLevel::H1:
    return "H1";
  case HeadingLevel::H2:
    return "H2";
  case HeadingLevel::H3:
    return "H3";
  case HeadingLevel::None:
    break;
  }
  return "";
}

double StyleProfile::thresholdFor(HeadingLevel level) const {
  size_t index = 0;
  switch (level) {
  case HeadingLevel::H1:
    index = 0;
    break;
  case HeadingLevel::H2:
    index = 1;
    break;
  case HeadingLevel::H3:
    index = 2;
    break;
  case HeadingLevel::None:
    return 0.0;
  }
  return index < headingSizes.size() ? headingSizes[index] : 0.0;
}

bool fontNameIndicatesBold(const std::string &fontName) {
  std::string fontNameLower = fontName;
  std::transform(fontNameLower.begin(), fontNameLower.end(),
                 fontNameLower.begin(), toLowerAscii);

  static const char *const boldMarkers[] = {"bold", "black", "heavy",
                                            "semibold", "demi"};
  for (const char *marker : boldMarkers) {
    if (fontNameLower.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool defaultBoldDetector(const Span &span) {
  return span.isBold || fontNameIndicatesBold(span.fontName);
}

std::string cleanText(const std::string &text) {
  std::string cleaned = trim(text);

  // Trailing separators left by leaders and underlines
  while (!cleaned.empty()) {
    unsigned char last = static_cast<unsigned char>(cleaned.back());
    if (std::isspace(last) || last == '-' || last == '_') {
      cleaned.pop_back();
    } else {
      break;
    }
  }

  std::istringstream stream(cleaned);
  std::string word;
  std::string collapsed;
  while (stream >> word) {
    if (!collapsed.empty())
      collapsed += ' ';
    collapsed += word;
  }

  static const std::regex spaceBeforePunctuation(R"((\w)\s+([.,;!?]))");
  return std::regex_replace(collapsed, spaceBeforePunctuation, "$1$2");
}

OutlineAnalysis::OutlineAnalysis()
    : m_config(), m_boldDetector(defaultBoldDetector) {
  compileIgnorePatterns();
}

OutlineAnalysis::OutlineAnalysis(const OutlineConfig &config,
                                 BoldDetector boldDetector)
    : m_config(config), m_boldDetector(std::move(boldDetector)) {
  if (!m_boldDetector) {
    m_boldDetector = defaultBoldDetector;
  }
  compileIgnorePatterns();
}

const OutlineConfig &OutlineAnalysis::getConfig() const { return m_config; }

void OutlineAnalysis::setConfig(const OutlineConfig &config) {
  m_config = config;
  compileIgnorePatterns();
}

void OutlineAnalysis::compileIgnorePatterns() {
  m_ignorePatterns.clear();
  for (const auto &pattern : m_config.ignorePatterns) {
    m_ignorePatterns.emplace_back(pattern, std::regex::ECMAScript |
                                               std::regex::icase);
  }
}

double OutlineAnalysis::quantize(double size) const {
  if (m_config.sizeQuantum <= 0.0) {
    return size;
  }
  return std::round(size / m_config.sizeQuantum) * m_config.sizeQuantum;
}

bool OutlineAnalysis::isIgnoredText(const std::string &text) const {
  if (isPunctuationOnly(text)) {
    return true;
  }
  for (const auto &pattern : m_ignorePatterns) {
    if (std::regex_search(text, pattern)) {
      return true;
    }
  }
  return false;
}

std::vector<Line>
OutlineAnalysis::aggregateLines(const std::vector<Span> &spans) const {
  std::vector<Span> usable;
  usable.reserve(spans.size());
  for (const auto &span : spans) {
    if (!std::isfinite(span.fontSize) || span.fontSize <= 0.0) {
      if (m_config.verbose) {
        std::cerr << "DEBUG: Skipping span \"" << span.text
                  << "\" with invalid font size " << span.fontSize
                  << std::endl;
      }
      continue;
    }
    if (isBlank(span.text)) {
      continue;
    }
    usable.push_back(span);
  }

  std::stable_sort(usable.begin(), usable.end(),
                   [](const Span &a, const Span &b) {
                     double midA = verticalMidpoint(a);
                     double midB = verticalMidpoint(b);
                     if (midA != midB) {
                       return midA < midB;
                     }
                     return a.boundingBox.x < b.boundingBox.x;
                   });

  // Group spans whose vertical midpoints are close to the first span of the
  // current line
  std::vector<std::vector<Span>> groups;
  double anchorMid = 0.0;
  double anchorHeight = 0.0;
  for (const auto &span : usable) {
    double mid = verticalMidpoint(span);
    double tolerance = m_config.lineMergeTolerance *
                       std::min(span.boundingBox.height, anchorHeight);
    if (groups.empty() || std::abs(mid - anchorMid) > tolerance) {
      groups.emplace_back();
      anchorMid = mid;
      anchorHeight = span.boundingBox.height;
    }
    groups.back().push_back(span);
  }

  std::vector<Line> lines;
  lines.reserve(groups.size());
  for (auto &group : groups) {
    std::stable_sort(group.begin(), group.end(),
                     [](const Span &a, const Span &b) {
                       return a.boundingBox.x < b.boundingBox.x;
                     });

    Line line;
    line.pageIndex = group.front().pageIndex;
    line.boundingBox = group.front().boundingBox;
    for (const auto &span : group) {
      if (!line.text.empty())
        line.text += ' ';
      line.text += trim(span.text);
      line.fontSize = std::max(line.fontSize, span.fontSize);
      line.boundingBox |= span.boundingBox;
    }

    // Only spans set at the line size decide its weight
    double lineSize = quantize(line.fontSize);
    for (const auto &span : group) {
      if (std::abs(quantize(span.fontSize) - lineSize) < SIZE_EPSILON &&
          m_boldDetector(span)) {
        line.isBold = true;
        break;
      }
    }

    line.spans = std::move(group);
    lines.push_back(std::move(line));
  }

  std::stable_sort(lines.begin(), lines.end(),
                   [](const Line &a, const Line &b) {
                     if (a.top() != b.top()) {
                       return a.top() < b.top();
                     }
                     return a.boundingBox.x < b.boundingBox.x;
                   });

  return lines;
}

StyleProfile
OutlineAnalysis::buildStyleProfile(const std::vector<Line> &lines) const {
  StyleProfile profile;

  // Quantized size -> number of characters set in that size
  std::map<double, std::size_t> weights;
  for (const auto &line : lines) {
    if (!std::isfinite(line.fontSize) || line.fontSize <= 0.0 ||
        line.text.empty()) {
      continue;
    }
    weights[quantize(line.fontSize)] += characterCount(line.text);
  }

  if (weights.empty()) {
    return profile;
  }

  // Ascending iteration with a strict comparison keeps the smaller size on
  // ties
  profile.bodySize = weights.begin()->first;
  std::size_t bodyWeight = weights.begin()->second;
  for (const auto &entry : weights) {
    if (entry.second > bodyWeight) {
      profile.bodySize = entry.first;
      bodyWeight = entry.second;
    }
  }

  for (auto it = weights.rbegin();
       it != weights.rend() && profile.headingSizes.size() < 3; ++it) {
    if (it->first > profile.bodySize + SIZE_EPSILON) {
      profile.headingSizes.push_back(it->first);
    }
  }

  return profile;
}

bool OutlineAnalysis::isCentered(const Line &line, double pageWidth) const {
  double sideMargin = pageWidth * m_config.titleSideMarginFraction;
  bool insideMargins = line.boundingBox.x > sideMargin &&
                       line.boundingBox.br().x < pageWidth - sideMargin;
  return insideMargins ||
         line.boundingBox.width >= pageWidth * m_config.titleFullWidthFraction;
}

TitleSelection
OutlineAnalysis::detectTitle(const std::vector<Line> &firstPageLines,
                             const StyleProfile &profile, double pageHeight,
                             double pageWidth) const {
  TitleSelection selection;

  bool haveCandidate = false;
  std::size_t bestIndex = 0;
  double bestSize = 0.0;
  for (std::size_t i = 0; i < firstPageLines.size(); i++) {
    const Line &line = firstPageLines[i];
    std::string text = cleanText(line.text);
    if (text.empty() || isIgnoredText(text)) {
      continue;
    }
    if (characterCount(text) <
        static_cast<std::size_t>(std::max(0, m_config.minTitleLength))) {
      continue;
    }
    if (pageHeight > 0.0 && m_config.titleRegionFraction < 1.0 &&
        line.top() > pageHeight * m_config.titleRegionFraction) {
      continue;
    }
    if (m_config.requireCenteredTitle && pageWidth > 0.0 &&
        !isCentered(line, pageWidth)) {
      continue;
    }

    double size = quantize(line.fontSize);
    if (!haveCandidate || size > bestSize + SIZE_EPSILON ||
        (std::abs(size - bestSize) < SIZE_EPSILON &&
         line.top() < firstPageLines[bestIndex].top())) {
      haveCandidate = true;
      bestIndex = i;
      bestSize = size;
    }
  }

  if (!haveCandidate) {
    if (m_config.verbose) {
      std::cerr << "DEBUG: No title candidate on page 1" << std::endl;
    }
    return selection;
  }

  double margin = bestSize - profile.bodySize;
  if (margin <= 0.0 || margin < m_config.titleMinMargin) {
    if (m_config.verbose) {
      std::cerr << "DEBUG: Largest page 1 line (" << bestSize
                << "pt) is too close to body size " << profile.bodySize
                << "pt, no title" << std::endl;
    }
    return selection;
  }

  selection.text = cleanText(firstPageLines[bestIndex].text);
  selection.found = true;
  selection.lineIndex = bestIndex;
  return selection;
}

HeadingLevel OutlineAnalysis::classifyLine(const Line &line,
                                           const StyleProfile &profile,
                                           bool isTitle) const {
  if (isTitle) {
    return HeadingLevel::None;
  }

  std::string text = cleanText(line.text);
  if (text.empty() || isIgnoredText(text)) {
    return HeadingLevel::None;
  }
  if (m_config.maxHeadingWords > 0 &&
      wordCount(text) > static_cast<std::size_t>(m_config.maxHeadingWords)) {
    return HeadingLevel::None;
  }

  double size = quantize(line.fontSize);
  bool emphasized =
      line.isBold || size - profile.bodySize >= m_config.headingMinMargin;
  if (!emphasized) {
    return HeadingLevel::None;
  }

  static const HeadingLevel levels[] = {HeadingLevel::H1, HeadingLevel::H2,
                                        HeadingLevel::H3};
  for (HeadingLevel level : levels) {
    double threshold = profile.thresholdFor(level);
    if (threshold > 0.0 &&
        std::abs(size - threshold) <= m_config.sizeTolerance + SIZE_EPSILON) {
      return level;
    }
  }
  return HeadingLevel::None;
}

std::vector<HeadingRecord>
OutlineAnalysis::assembleOutline(std::vector<HeadingCandidate> candidates) {
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const HeadingCandidate &a, const HeadingCandidate &b) {
                     if (a.record.page != b.record.page) {
                       return a.record.page < b.record.page;
                     }
                     return a.lineIndex < b.lineIndex;
                   });

  std::vector<HeadingRecord> outline;
  outline.reserve(candidates.size());
  for (auto &candidate : candidates) {
    outline.push_back(std::move(candidate.record));
  }
  return outline;
}

std::vector<std::vector<Line>>
OutlineAnalysis::aggregatePages(const std::vector<PageSpans> &pages) const {
  std::vector<std::vector<Line>> pageLines;
  pageLines.reserve(pages.size());
  for (std::size_t p = 0; p < pages.size(); p++) {
    const PageSpans &page = pages[p];
    // Page numbers follow the position of the page in the document
    std::vector<Line> lines = aggregateLines(page.spans);
    for (auto &line : lines) {
      line.pageIndex = static_cast<int>(p);
    }
    if (m_config.verbose) {
      std::cerr << "DEBUG: Page " << (p + 1) << ": "
                << page.spans.size() << " spans grouped into " << lines.size()
                << " lines" << std::endl;
    }
    pageLines.push_back(std::move(lines));
  }
  return pageLines;
}

ExtractionResult
OutlineAnalysis::extractOutline(const std::vector<PageSpans> &pages) const {
  double firstPageHeight = pages.empty() ? 0.0 : pages.front().pageHeight;
  double firstPageWidth = pages.empty() ? 0.0 : pages.front().pageWidth;
  return extractOutline(aggregatePages(pages), firstPageHeight,
                        firstPageWidth);
}

ExtractionResult
OutlineAnalysis::extractOutline(const std::vector<std::vector<Line>> &pageLines,
                                double firstPageHeight,
                                double firstPageWidth) const {
  ExtractionResult result;

  std::vector<Line> allLines;
  for (const auto &lines : pageLines) {
    allLines.insert(allLines.end(), lines.begin(), lines.end());
  }
  if (allLines.empty()) {
    return result;
  }

  StyleProfile profile = buildStyleProfile(allLines);
  TitleSelection title =
      detectTitle(pageLines.front(), profile, firstPageHeight, firstPageWidth);
  result.title = title.text;

  if (title.found && m_config.excludeTitleOnlySize) {
    // Page 1 lines come first in allLines, so the title keeps its index
    double titleSize = quantize(allLines[title.lineIndex].fontSize);
    bool shared = false;
    for (std::size_t i = 0; i < allLines.size() && !shared; i++) {
      shared = i != title.lineIndex &&
               std::abs(quantize(allLines[i].fontSize) - titleSize) <
                   SIZE_EPSILON;
    }
    if (!shared) {
      allLines.erase(allLines.begin() +
                     static_cast<std::ptrdiff_t>(title.lineIndex));
      profile = buildStyleProfile(allLines);
    }
  }

  if (m_config.verbose) {
    std::cerr << "DEBUG: Body size " << profile.bodySize << "pt, heading sizes:";
    for (double size : profile.headingSizes) {
      std::cerr << " " << size;
    }
    std::cerr << std::endl;
    std::cerr << "DEBUG: Title: \"" << result.title << "\"" << std::endl;
  }

  std::vector<HeadingCandidate> candidates;
  for (std::size_t p = 0; p < pageLines.size(); p++) {
    const std::vector<Line> &lines = pageLines[p];
    for (std::size_t i = 0; i < lines.size(); i++) {
      bool isTitle = p == 0 && title.found && i == title.lineIndex;
      HeadingLevel level = classifyLine(lines[i], profile, isTitle);
      if (level == HeadingLevel::None) {
        continue;
      }

      HeadingCandidate candidate;
      candidate.record.level = level;
      candidate.record.text = cleanText(lines[i].text);
      candidate.record.page = static_cast<int>(p) + m_config.firstPageNumber;
      candidate.lineIndex = i;

      if (m_config.verbose) {
        std::cerr << "DEBUG: " << headingLevelName(level) << " on page "
                  << candidate.record.page << ": \"" << candidate.record.text
                  << "\" (" << lines[i].fontSize << "pt"
                  << (lines[i].isBold ? " bold" : "") << ")" << std::endl;
      }
      candidates.push_back(std::move(candidate));
    }
  }

  result.outline = assembleOutline(std::move(candidates));
  return result;
}

} // namespace outline
