#include "OutlineAnalysis.hpp"

#include <chrono>
#include <iostream>
#include <memory>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-page.h>

namespace outline {

PDFSpansResult
OutlineAnalysis::extractSpansFromPDF(const std::string &pdfPath) const {
  PDFSpansResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(pdfPath));

    if (!doc) {
      result.errorMessage = "Failed to load PDF file: " + pdfPath;
      return result;
    }

    if (doc->is_locked()) {
      result.errorMessage = "PDF file is password protected: " + pdfPath;
      return result;
    }

    int pageCount = doc->pages();
    if (m_config.verbose) {
      std::cerr << "DEBUG: PDF has " << pageCount << " pages" << std::endl;
    }

    for (int pageIndex = 0; pageIndex < pageCount; pageIndex++) {
      std::unique_ptr<poppler::page> page(doc->create_page(pageIndex));

      PageSpans pageSpans;
      pageSpans.pageIndex = pageIndex;

      if (!page) {
        // Keep the page so later page numbers stay aligned
        std::cerr << "Warning: Failed to create page " << (pageIndex + 1)
                  << " of " << pdfPath << ", treating it as empty"
                  << std::endl;
        result.pages.push_back(std::move(pageSpans));
        continue;
      }

      poppler::rectf pageRect = page->page_rect();
      pageSpans.pageWidth = pageRect.width();
      pageSpans.pageHeight = pageRect.height();

      std::vector<poppler::text_box> textBoxes =
          page->text_list(poppler::page::text_list_include_font);

      pageSpans.spans.reserve(textBoxes.size());
      for (auto &textBox : textBoxes) {
        poppler::byte_array textBytes = textBox.text().to_utf8();
        std::string text(textBytes.begin(), textBytes.end());

        if (text.empty()) {
          continue;
        }

        // Poppler reports text boxes with the origin at the top-left corner
        // of the page, which is the reading order the line grouping expects
        poppler::rectf bbox = textBox.bbox();

        Span span;
        span.text = text;
        span.boundingBox =
            cv::Rect2d(bbox.x(), bbox.y(), bbox.width(), bbox.height());
        span.pageIndex = pageIndex;

        if (textBox.has_font_info()) {
          std::string fontName = textBox.get_font_name();
          if (fontName != "*ignored*") {
            span.fontName = fontName;
          }
          span.fontSize = textBox.get_font_size();
        }
        span.isBold = fontNameIndicatesBold(span.fontName);

        pageSpans.spans.push_back(std::move(span));
      }

      if (m_config.verbose) {
        std::cerr << "DEBUG: Found " << pageSpans.spans.size()
                  << " text boxes on page " << (pageIndex + 1) << std::endl;
      }

      result.pages.push_back(std::move(pageSpans));
    }

    result.success = true;
  } catch (const std::exception &e) {
    result.pages.clear();
    result.errorMessage = std::string("PDF extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

PDFOutlineResult OutlineAnalysis::analyzePDF(const std::string &pdfPath) const {
  PDFOutlineResult result;
  result.success = false;
  result.sourcePath = pdfPath;

  auto startTime = std::chrono::high_resolution_clock::now();

  PDFSpansResult spans = extractSpansFromPDF(pdfPath);
  if (!spans.success) {
    result.errorMessage = spans.errorMessage;
  } else {
    std::vector<std::vector<Line>> pageLines = aggregatePages(spans.pages);
    for (const auto &lines : pageLines) {
      result.lineCount += static_cast<int>(lines.size());
    }
    result.pageCount = static_cast<int>(spans.pages.size());

    double firstPageHeight =
        spans.pages.empty() ? 0.0 : spans.pages.front().pageHeight;
    double firstPageWidth =
        spans.pages.empty() ? 0.0 : spans.pages.front().pageWidth;
    result.extraction =
        extractOutline(pageLines, firstPageHeight, firstPageWidth);
    result.success = true;
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace outline
