#include <catch2/catch.hpp>

#include "OutlineAnalysis.hpp"
#include "TestHelpers.hpp"

#include <algorithm>

using namespace outline;
using outline::testing::bodySpan;
using outline::testing::makeLine;
using outline::testing::makeSpan;

namespace {

PageSpans makePage(int index, std::vector<Span> spans) {
  PageSpans page;
  page.pageIndex = index;
  page.pageWidth = 612;
  page.pageHeight = 792;
  page.spans = std::move(spans);
  return page;
}

// Title on page 1, an 18pt and a 15pt bold heading on page 2
std::vector<PageSpans> reportDocument() {
  return {makePage(0, {makeSpan("Overview", 24, 72, 50, true, 0),
                       bodySpan(100, 0), bodySpan(120, 0), bodySpan(140, 0)}),
          makePage(1, {makeSpan("Introduction", 18, 72, 50, true, 1),
                       bodySpan(100, 1), bodySpan(120, 1),
                       makeSpan("Revision History", 15, 72, 300, true, 1),
                       bodySpan(340, 1)})};
}

} // namespace

TEST_CASE("extractOutline finds the title and ranks the remaining sizes",
          "[pipeline]") {
  OutlineAnalysis analyzer;

  ExtractionResult result = analyzer.extractOutline(reportDocument());

  REQUIRE(result.title == "Overview");
  REQUIRE(result.outline.size() == 2);
  REQUIRE(result.outline[0].level == HeadingLevel::H1);
  REQUIRE(result.outline[0].text == "Introduction");
  REQUIRE(result.outline[0].page == 2);
  REQUIRE(result.outline[1].level == HeadingLevel::H2);
  REQUIRE(result.outline[1].text == "Revision History");
  REQUIRE(result.outline[1].page == 2);
}

TEST_CASE("extractOutline can keep the title size as a heading tier",
          "[pipeline]") {
  OutlineConfig config;
  config.excludeTitleOnlySize = false;
  OutlineAnalysis analyzer(config);

  ExtractionResult result = analyzer.extractOutline(reportDocument());

  REQUIRE(result.title == "Overview");
  REQUIRE(result.outline.size() == 2);
  REQUIRE(result.outline[0].level == HeadingLevel::H2);
  REQUIRE(result.outline[1].level == HeadingLevel::H3);
  REQUIRE(result.outline[1].text == "Revision History");
}

TEST_CASE("extractOutline never repeats the title in the outline",
          "[pipeline]") {
  OutlineAnalysis analyzer;

  std::vector<PageSpans> pages = {
      makePage(0, {makeSpan("Overview", 24, 72, 50, true, 0),
                   bodySpan(100, 0), bodySpan(120, 0)}),
      makePage(1, {makeSpan("Chapter Two", 24, 72, 50, true, 1),
                   bodySpan(100, 1), bodySpan(120, 1)})};

  ExtractionResult result = analyzer.extractOutline(pages);

  REQUIRE(result.title == "Overview");
  REQUIRE(result.outline.size() == 1);
  REQUIRE(result.outline[0].text == "Chapter Two");
  REQUIRE(result.outline[0].level == HeadingLevel::H1);
  for (const auto &heading : result.outline) {
    REQUIRE(heading.text != result.title);
  }
}

TEST_CASE("extractOutline keeps reading order for shuffled spans",
          "[pipeline]") {
  OutlineAnalysis analyzer;

  std::vector<PageSpans> pages = reportDocument();
  std::reverse(pages[1].spans.begin(), pages[1].spans.end());

  ExtractionResult result = analyzer.extractOutline(pages);

  REQUIRE(result.outline.size() == 2);
  REQUIRE(result.outline[0].text == "Introduction");
  REQUIRE(result.outline[1].text == "Revision History");
  for (size_t i = 1; i < result.outline.size(); i++) {
    REQUIRE(result.outline[i].page >= result.outline[i - 1].page);
  }
}

TEST_CASE("extractOutline handles documents without content", "[pipeline]") {
  OutlineAnalysis analyzer;

  SECTION("no pages") {
    ExtractionResult result = analyzer.extractOutline(
        std::vector<PageSpans>());
    REQUIRE(result.title.empty());
    REQUIRE(result.outline.empty());
  }

  SECTION("pages without spans") {
    ExtractionResult result =
        analyzer.extractOutline({makePage(0, {}), makePage(1, {})});
    REQUIRE(result.title.empty());
    REQUIRE(result.outline.empty());
  }

  SECTION("only malformed spans") {
    ExtractionResult result = analyzer.extractOutline(
        {makePage(0, {makeSpan("broken", 0, 72, 50, true, 0)})});
    REQUIRE(result.title.empty());
    REQUIRE(result.outline.empty());
  }
}

TEST_CASE("extractOutline finds a bold heading larger than body text",
          "[pipeline]") {
  OutlineAnalysis analyzer;

  std::vector<PageSpans> pages = {
      makePage(0, {bodySpan(100, 0), bodySpan(120, 0)}),
      makePage(1, {makeSpan("Appendix", 14, 72, 50, true, 1),
                   bodySpan(100, 1)})};

  ExtractionResult result = analyzer.extractOutline(pages);

  REQUIRE(result.title.empty());
  REQUIRE(result.outline.size() == 1);
  REQUIRE(result.outline[0].text == "Appendix");
  REQUIRE(result.outline[0].level == HeadingLevel::H1);
}

TEST_CASE("extractOutline separates bold and regular lines of one size",
          "[pipeline]") {
  OutlineAnalysis analyzer;

  std::vector<PageSpans> pages = {
      makePage(0, {bodySpan(100, 0), bodySpan(120, 0)}),
      makePage(1, {makeSpan("Methods", 14, 72, 50, true, 1),
                   makeSpan("Highlighted quote", 14, 72, 80, false, 1),
                   bodySpan(120, 1)})};

  ExtractionResult result = analyzer.extractOutline(pages);

  REQUIRE(result.outline.size() == 1);
  REQUIRE(result.outline[0].text == "Methods");
}

TEST_CASE("extractOutline numbers pages from the configured base",
          "[pipeline]") {
  OutlineConfig config;
  config.firstPageNumber = 0;
  OutlineAnalysis analyzer(config);

  ExtractionResult result = analyzer.extractOutline(reportDocument());

  REQUIRE(result.outline.size() == 2);
  REQUIRE(result.outline[0].page == 1);
}

TEST_CASE("extractOutline is deterministic", "[pipeline]") {
  OutlineAnalysis analyzer;
  std::vector<PageSpans> pages = reportDocument();

  ExtractionResult first = analyzer.extractOutline(pages);
  ExtractionResult second = analyzer.extractOutline(pages);

  REQUIRE(first.title == second.title);
  REQUIRE(first.outline.size() == second.outline.size());
  for (size_t i = 0; i < first.outline.size(); i++) {
    REQUIRE(first.outline[i].level == second.outline[i].level);
    REQUIRE(first.outline[i].text == second.outline[i].text);
    REQUIRE(first.outline[i].page == second.outline[i].page);
  }
}

TEST_CASE("extractOutline accepts pre-aggregated lines", "[pipeline]") {
  OutlineAnalysis analyzer;
  const std::string body = "Plain paragraph text of the document body.";

  std::vector<std::vector<Line>> pageLines = {
      {makeLine("Design Notes", 22, true, 40, 0),
       makeLine(body, 11, false, 80, 0), makeLine(body, 11, false, 96, 0)},
      {makeLine("Scope", 16, true, 40, 1), makeLine(body, 11, false, 80, 1),
       makeLine("Limits", 13, true, 120, 1)}};

  ExtractionResult result = analyzer.extractOutline(pageLines);

  REQUIRE(result.title == "Design Notes");
  REQUIRE(result.outline.size() == 2);
  REQUIRE(result.outline[0].text == "Scope");
  REQUIRE(result.outline[0].level == HeadingLevel::H1);
  REQUIRE(result.outline[1].text == "Limits");
  REQUIRE(result.outline[1].level == HeadingLevel::H2);
}

TEST_CASE("extractOutline numbers pages by their position", "[pipeline]") {
  OutlineAnalysis analyzer;

  // Page indexes are left at their defaults
  PageSpans first;
  first.spans = {makeSpan("Overview", 24, 72, 50, true), bodySpan(100, 0),
                 bodySpan(120, 0), makeSpan("Next Chapter", 16, 72, 300, true)};
  PageSpans second;
  second.spans = {makeSpan("Late Section", 16, 72, 50, true), bodySpan(100, 0)};

  ExtractionResult result = analyzer.extractOutline({first, second});

  REQUIRE(result.title == "Overview");
  REQUIRE(result.outline.size() == 2);
  REQUIRE(result.outline[0].text == "Next Chapter");
  REQUIRE(result.outline[0].page == 1);
  REQUIRE(result.outline[1].text == "Late Section");
  REQUIRE(result.outline[1].page == 2);
}

TEST_CASE("extractOutline passes the page width to title detection",
          "[pipeline]") {
  OutlineConfig config;
  config.requireCenteredTitle = true;
  OutlineAnalysis analyzer(config);

  std::vector<PageSpans> pages = {
      makePage(0, {makeSpan("Left Banner", 28, 72, 20, true, 0),
                   makeSpan("Annual Review", 24, 250, 60, true, 0),
                   bodySpan(100, 0), bodySpan(120, 0)})};

  ExtractionResult result = analyzer.extractOutline(pages);

  REQUIRE(result.title == "Annual Review");
}
