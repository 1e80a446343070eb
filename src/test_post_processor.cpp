#include "OCRPostProcessor.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <map>
#include <vector>

using namespace ocrblocks;
using ocrblocks_test::check;
using ocrblocks_test::makeLine;

namespace {

std::vector<RawLine> novelPage(int page) {
  return {
      makeLine(page, 100, 40, 400, 20, "THE ADVENTURES OF SHERLOCK HOLMES",
               20),
      makeLine(page, 50, 200, 500, 12,
               "To Sherlock Holmes she is always the woman."),
      makeLine(page, 50, 214, 500, 12, "I have seldom heard him mention her"),
      makeLine(page, 50, 228, 200, 12, "under any other name."),
      makeLine(page, 300, 242, 150, 12, "\xE2\x80\x94 Dr. Watson"),
      makeLine(page, 290, 780, 20, 12, "12"),
  };
}

LayoutRegion makeRegion(LayoutLabel label, double x, double y, double width,
                        double height) {
  LayoutRegion region;
  region.label = label;
  region.boundingBox = cv::Rect2d(x, y, width, height);
  region.confidence = 0.95;
  return region;
}

bool sameBlock(const TextBlock &a, const TextBlock &b) {
  return a.id == b.id && a.page == b.page && a.boundingBox == b.boundingBox &&
         a.text == b.text && a.fontSize == b.fontSize &&
         a.fontName == b.fontName && a.charCount == b.charCount &&
         a.lineCount == b.lineCount && a.category == b.category &&
         a.region == b.region && a.isOcr == b.isOcr;
}

bool sameResult(const ProcessedResult &a, const ProcessedResult &b) {
  if (a.blocks.size() != b.blocks.size() ||
      a.categories.size() != b.categories.size()) {
    return false;
  }
  for (size_t i = 0; i < a.blocks.size(); i++) {
    if (!sameBlock(a.blocks[i], b.blocks[i])) {
      return false;
    }
  }
  for (const auto &entry : a.categories) {
    auto other = b.categories.find(entry.first);
    if (other == b.categories.end() ||
        other->second.blockCount != entry.second.blockCount ||
        other->second.charCount != entry.second.charCount ||
        other->second.sampleText != entry.second.sampleText) {
      return false;
    }
  }
  return true;
}

} // namespace

int main() {
  std::cout << "=== Test OCR post-processing ===" << std::endl;

  OCRPostProcessor processor;
  const std::vector<PageDimension> onePage = {{600, 800}};

  ocrblocks_test::section("Empty input");
  {
    ProcessedResult result = processor.process({}, onePage);
    check(result.blocks.empty(), "no blocks");
    check(result.categories.empty(), "no categories");
  }

  ocrblocks_test::section("Paragraph merge");
  {
    ProcessedResult result = processor.process(
        {makeLine(0, 50, 100, 300, 12, "The cat sat on the"),
         makeLine(0, 50, 114, 100, 12, "the mat.")},
        onePage);
    check(result.blocks.size() == 1, "two lines form one block");
    check(!result.blocks.empty() &&
              result.blocks[0].text == "The cat sat on the the mat." &&
              result.blocks[0].lineCount == 2,
          "merged text and line count");
    check(!result.blocks.empty() && result.blocks[0].id == "ocr_p0_0" &&
              result.blocks[0].fontName == "OCR" && result.blocks[0].isOcr,
          "block id and OCR markers");
  }

  ocrblocks_test::section("Heuristic page");
  {
    std::vector<RawLine> lines = novelPage(0);
    ProcessedResult result = processor.process(lines, onePage);
    const auto &blocks = result.blocks;

    check(blocks.size() == 4, "title, paragraph, attribution, page number");
    if (blocks.size() == 4) {
      check(blocks[0].category == CategoryId::Title, "caps line is a title");
      check(blocks[1].category == CategoryId::Body && blocks[1].lineCount == 3,
            "three-line paragraph is body text");
      check(blocks[2].category == CategoryId::Attribution &&
                blocks[2].text == "\xE2\x80\x94 Dr. Watson",
            "dash line stays separate as attribution");
      check(blocks[3].category == CategoryId::Footer &&
                blocks[3].region == RegionClass::Footer,
            "page number is a footer");
      check(blocks[0].id == "ocr_p0_0" && blocks[3].id == "ocr_p0_3",
            "ids follow block order");
      check(blocks[2].charCount == 12, "char count in code points");
    }

    int lineTotal = 0;
    for (const auto &block : blocks) {
      lineTotal += block.lineCount;
    }
    check(lineTotal == static_cast<int>(lines.size()),
          "every line lands in exactly one block");

    check(result.categories.size() == 4, "four categories in use");
    check(result.categories.count(CategoryId::Body) &&
              result.categories.at(CategoryId::Body).blockCount == 1,
          "body statistics");

    std::vector<RawLine> reversed(lines.rbegin(), lines.rend());
    check(sameResult(processor.process(reversed, onePage), result),
          "input line order does not matter");
    check(sameResult(processor.process(lines, onePage), result),
          "identical input gives identical output");
  }

  ocrblocks_test::section("Page dimensions");
  {
    ProcessedResult reference = processor.process(novelPage(0), onePage);
    check(sameResult(processor.process(novelPage(0), {}), reference),
          "missing dimensions fall back to 600x800");
    check(sameResult(processor.process(novelPage(0), {{0, 0}}), reference),
          "zero dimensions fall back to 600x800");

    PageDimension dims = processor.pageDimensionFor({{0, -5}}, 0);
    check(dims.width == 600 && dims.height == 800, "fallback size");
    dims = processor.pageDimensionFor({{1200, 1600}}, 0);
    check(dims.width == 1200 && dims.height == 1600, "explicit size kept");

    PostProcessorConfig config;
    config.fallbackPageHeight = 1600;
    OCRPostProcessor tall(config);
    ProcessedResult result =
        tall.process({makeLine(0, 290, 780, 20, 12, "12")}, {});
    check(result.blocks.size() == 1 &&
              result.blocks[0].category == CategoryId::Body,
          "configured fallback height moves the footer band");
  }

  ocrblocks_test::section("Multiple pages");
  {
    std::vector<RawLine> lines = novelPage(2);
    std::vector<RawLine> first = novelPage(0);
    lines.insert(lines.end(), first.begin(), first.end());

    ProcessedResult result = processor.process(lines, {});
    check(result.blocks.size() == 8, "four blocks per page");
    check(std::is_sorted(result.blocks.begin(), result.blocks.end(),
                         [](const TextBlock &a, const TextBlock &b) {
                           return a.page < b.page;
                         }),
          "pages in ascending order");
    check(result.blocks.size() == 8 && result.blocks[0].id == "ocr_p0_0" &&
              result.blocks[4].id == "ocr_p2_0",
          "ids restart per page");
    check(result.categories.at(CategoryId::Title).blockCount == 2,
          "statistics span pages");

    std::map<int, int> linesPerPage;
    for (const auto &block : result.blocks) {
      linesPerPage[block.page] += block.lineCount;
    }
    check(linesPerPage[0] == 6 && linesPerPage[2] == 6,
          "line count conserved per page");
  }

  ocrblocks_test::section("Layout regions");
  {
    std::vector<RawLine> lines = {
        makeLine(0, 100, 500, 200, 12, "Figure 1. A cat on a mat."),
        makeLine(0, 290, 780, 20, 12, "12"),
        makeLine(1, 290, 780, 20, 12, "13"),
    };
    LayoutRegionsByPage regions;
    regions[0] = {makeRegion(LayoutLabel::Caption, 90, 490, 250, 40)};

    ProcessedResult result = processor.process(lines, {}, regions);
    check(result.blocks.size() == 3, "three blocks");
    if (result.blocks.size() == 3) {
      check(result.blocks[0].category == CategoryId::Caption,
            "caption from the layout region");
      check(result.blocks[1].category == CategoryId::Body,
            "uncovered block on a layout page is body text");
      check(result.blocks[2].category == CategoryId::Footer,
            "page without regions uses heuristics");
    }

    LayoutRegionsByPage emptyRegions;
    emptyRegions[0] = {};
    result = processor.process({makeLine(0, 290, 780, 20, 12, "12")}, {},
                               emptyRegions);
    check(result.blocks.size() == 1 &&
              result.blocks[0].category == CategoryId::Footer,
          "empty region list uses heuristics");

    regions[0] = {makeRegion(LayoutLabel::PageHeader, 0, 0, 600, 60)};
    result = processor.process({makeLine(0, 100, 20, 200, 12, "Running Head")},
                               {}, regions);
    check(result.blocks.size() == 1 &&
              result.blocks[0].category == CategoryId::Header &&
              result.blocks[0].region == RegionClass::Header,
          "PageHeader region gives a header block");
  }

  return ocrblocks_test::finish();
}
