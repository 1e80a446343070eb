#include "OCRPostProcessor.hpp"

#include "HeuristicCategorizer.hpp"
#include "LayoutCategorizer.hpp"
#include "PageMetrics.hpp"
#include "ParagraphMerger.hpp"
#include "TextShape.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>

namespace ocrblocks {

OCRPostProcessor::OCRPostProcessor() : m_config() {}

OCRPostProcessor::OCRPostProcessor(const PostProcessorConfig &config)
    : m_config(config) {}

ProcessedResult
OCRPostProcessor::process(const std::vector<RawLine> &rawLines,
                          const std::vector<PageDimension> &pageDimensions,
                          const LayoutRegionsByPage &layoutRegions) const {
  ProcessedResult result;

  if (m_config.verbose) {
    std::cerr << "DEBUG: Processing " << rawLines.size()
              << " raw lines (layout detection: "
              << (layoutRegions.empty() ? "disabled" : "enabled") << ")"
              << std::endl;
  }

  if (rawLines.empty()) {
    return result;
  }

  // Group lines by page, keeping their input order within each page
  std::map<int, std::vector<RawLine>> linesByPage;
  for (const auto &line : rawLines) {
    linesByPage[line.page].push_back(line);
  }

  for (const auto &entry : linesByPage) {
    const int pageNumber = entry.first;
    PageDimension dims = pageDimensionFor(pageDimensions, pageNumber);

    const std::vector<LayoutRegion> *pageRegions = nullptr;
    auto regions = layoutRegions.find(pageNumber);
    if (regions != layoutRegions.end() && !regions->second.empty()) {
      pageRegions = &regions->second;
    }

    std::vector<TextBlock> pageBlocks =
        processPage(entry.second, dims, pageNumber, pageRegions);
    result.blocks.insert(result.blocks.end(), pageBlocks.begin(),
                         pageBlocks.end());
  }

  result.categories = aggregateCategories(result.blocks, categoryTaxonomy());

  if (m_config.verbose) {
    std::cerr << "DEBUG: Produced " << result.blocks.size() << " blocks in "
              << result.categories.size() << " categories" << std::endl;
  }

  return result;
}

std::vector<TextBlock>
OCRPostProcessor::processPage(const std::vector<RawLine> &lines,
                              const PageDimension &dims, int pageNumber,
                              const std::vector<LayoutRegion> *layoutRegions)
    const {
  std::vector<TextBlock> blocks;
  if (lines.empty()) {
    return blocks;
  }

  // Top to bottom; lines at the same height keep their input order
  std::vector<RawLine> sorted = lines;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const RawLine &a, const RawLine &b) {
                     return a.boundingBox.y < b.boundingBox.y;
                   });

  PageMetrics metrics = estimatePageMetrics(sorted);

  if (m_config.verbose) {
    std::cerr << "DEBUG: Page " << pageNumber << ": " << sorted.size()
              << " lines, avgFontSize=" << std::fixed << std::setprecision(1)
              << metrics.avgFontSize
              << ", medianLineHeight=" << metrics.medianLineHeight
              << std::endl;
  }

  std::vector<MergedBlock> merged =
      mergeLines(sorted, metrics.medianLineHeight, dims.width);

  if (m_config.verbose) {
    std::cerr << "DEBUG: Page " << pageNumber << ": merged " << sorted.size()
              << " lines into " << merged.size() << " blocks ("
              << (layoutRegions ? "layout" : "heuristic")
              << " categorization)" << std::endl;
  }

  const double pageCenterX = dims.width / 2;

  for (size_t i = 0; i < merged.size(); i++) {
    const MergedBlock &block = merged[i];

    CategoryId category;
    if (layoutRegions) {
      category = categorizeWithLayout(block, *layoutRegions);

      if (m_config.verbose) {
        LayoutMatch match = findBestLayoutMatch(block.boundingBox,
                                                *layoutRegions);
        std::cerr << "DEBUG:   Block at (" << block.boundingBox.x << ", "
                  << block.boundingBox.y << ") " << block.boundingBox.width
                  << "x" << block.boundingBox.height << " best match: "
                  << (match.region ? layoutLabelString(match.region->label)
                                   : std::string("none"))
                  << " (" << match.overlap * 100 << "% overlap) -> "
                  << categoryIdString(category) << std::endl;
      }
    } else {
      category = categorizeHeuristically(block, dims, pageCenterX,
                                         metrics.avgFontSize);
    }

    TextBlock textBlock;
    textBlock.id =
        "ocr_p" + std::to_string(pageNumber) + "_" + std::to_string(i);
    textBlock.page = pageNumber;
    textBlock.boundingBox = block.boundingBox;
    textBlock.text = block.text;
    textBlock.fontSize = block.fontSize;
    textBlock.charCount = static_cast<int>(utf8Length(block.text));
    textBlock.lineCount = block.lineCount;
    textBlock.category = category;
    textBlock.region = regionClassFor(category);
    textBlock.isOcr = true;
    blocks.push_back(textBlock);
  }

  return blocks;
}

PageDimension
OCRPostProcessor::pageDimensionFor(const std::vector<PageDimension> &dims,
                                   int pageNumber) const {
  if (pageNumber >= 0 && pageNumber < static_cast<int>(dims.size())) {
    const PageDimension &entry = dims[pageNumber];
    if (entry.width > 0 && entry.height > 0) {
      return entry;
    }
  }

  PageDimension fallback;
  fallback.width = m_config.fallbackPageWidth;
  fallback.height = m_config.fallbackPageHeight;
  return fallback;
}

const PostProcessorConfig &OCRPostProcessor::getConfig() const {
  return m_config;
}

} // namespace ocrblocks
