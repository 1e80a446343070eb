#include "HeuristicCategorizer.hpp"

#include "TextShape.hpp"

#include <cmath>

namespace ocrblocks {

namespace {

const double EDGE_ZONE = 0.06;           // header/footer band height
const double CHAPTER_NUMBER_ZONE = 0.20; // chapter numbers sit near the top
const double CAPS_TITLE_ZONE = 0.35;     // all-caps above this is a title
const double LARGE_TITLE_ZONE = 0.40;
const double LARGE_FONT_FACTOR = 1.15;
const double CENTER_TOLERANCE = 0.15;

bool isHeader(const BlockContext &ctx) {
  return ctx.yPercent < EDGE_ZONE && ctx.lineCount == 1 && ctx.textLength < 30;
}

bool isFooter(const BlockContext &ctx) {
  return ctx.yPercent > 1.0 - EDGE_ZONE && ctx.lineCount == 1 &&
         looksLikePageNumber(ctx.text);
}

bool isAttribution(const BlockContext &ctx) {
  return startsWithDashMarker(ctx.text) && ctx.textLength < 80 &&
         ctx.lineCount == 1;
}

bool isChapterNumber(const BlockContext &ctx) {
  return ctx.textLength < 30 && ctx.yPercent < CHAPTER_NUMBER_ZONE &&
         ctx.lineCount == 1 && looksLikeChapterNumber(ctx.text);
}

bool isTitle(const BlockContext &ctx) {
  const bool capsTitle = ctx.isAllCaps && ctx.yPercent < CAPS_TITLE_ZONE &&
                         ctx.textLength < 80;
  const bool largeTitle = ctx.fontSize > ctx.avgFontSize * LARGE_FONT_FACTOR &&
                          ctx.textLength < 80 &&
                          ctx.yPercent < LARGE_TITLE_ZONE &&
                          ctx.lineCount == 1;
  return capsTitle || largeTitle;
}

bool isHeading(const BlockContext &ctx) {
  return ctx.isAllCaps && ctx.textLength < 80 && ctx.lineCount == 1 &&
         ctx.yPercent >= CAPS_TITLE_ZONE;
}

} // namespace

BlockContext makeBlockContext(const MergedBlock &block,
                              const PageDimension &dims, double pageCenterX,
                              double avgFontSize) {
  BlockContext ctx;
  ctx.text = trim(block.text);
  ctx.textLength = utf8Length(ctx.text);
  ctx.yPercent = block.boundingBox.y / dims.height;
  ctx.lineCount = block.lineCount;
  ctx.fontSize = block.fontSize;
  ctx.avgFontSize = avgFontSize;
  ctx.isAllCaps = isAllCaps(ctx.text);

  // Not consulted by any rule yet
  const double blockCenterX = block.boundingBox.x + block.boundingBox.width / 2;
  ctx.isCentered =
      std::abs(blockCenterX - pageCenterX) < dims.width * CENTER_TOLERANCE;

  return ctx;
}

const std::vector<HeuristicRule> &heuristicRules() {
  static const std::vector<HeuristicRule> rules = {
      {"header", CategoryId::Header, &isHeader},
      {"footer", CategoryId::Footer, &isFooter},
      {"attribution", CategoryId::Attribution, &isAttribution},
      {"chapter-number", CategoryId::Title, &isChapterNumber},
      {"title", CategoryId::Title, &isTitle},
      {"heading", CategoryId::Heading, &isHeading},
  };
  return rules;
}

CategoryId categorizeHeuristically(const MergedBlock &block,
                                   const PageDimension &dims,
                                   double pageCenterX, double avgFontSize) {
  const BlockContext ctx =
      makeBlockContext(block, dims, pageCenterX, avgFontSize);

  for (const auto &rule : heuristicRules()) {
    if (rule.matches(ctx)) {
      return rule.category;
    }
  }
  return CategoryId::Body;
}

} // namespace ocrblocks
