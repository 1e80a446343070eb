#ifndef OCRBLOCKS_OCR_POST_PROCESSOR_HPP
#define OCRBLOCKS_OCR_POST_PROCESSOR_HPP

#include "CategoryRegistry.hpp"
#include "OCRTypes.hpp"

#include <vector>

namespace ocrblocks {

/**
 * @brief Configuration options for post-processing
 */
struct PostProcessorConfig {
  double fallbackPageWidth = 600.0;  ///< Width for pages without dimensions
  double fallbackPageHeight = 800.0; ///< Height for pages without dimensions
  bool verbose = false; ///< Write per-page diagnostics to stderr
};

/**
 * @brief Turns line-level OCR output into categorized paragraph blocks
 *
 * Lines are grouped by page and processed in ascending page order. On each
 * page the lines are sorted top to bottom, merged into paragraphs and every
 * paragraph is categorized. A page with layout regions is categorized by
 * region overlap; a page without uses the position and text-shape
 * heuristics. The method is chosen once per page.
 *
 * The transform holds no state between calls and yields identical output
 * for identical input.
 *
 * Example usage:
 * @code
 * ocrblocks::OCRPostProcessor processor;
 * auto result = processor.process(lines, pageDimensions);
 * for (const auto &block : result.blocks) {
 *     std::cout << ocrblocks::categoryIdString(block.category) << ": "
 *               << block.text << std::endl;
 * }
 * @endcode
 */
class OCRPostProcessor {
public:
  /**
   * @brief Default constructor
   */
  OCRPostProcessor();

  /**
   * @brief Constructor with custom configuration
   * @param config Post-processing configuration options
   */
  explicit OCRPostProcessor(const PostProcessorConfig &config);

  /**
   * @brief Process the OCR lines of a document
   *
   * @param rawLines OCR lines of all pages, in any page order
   * @param pageDimensions Page sizes indexed by page number; missing or
   * non-positive entries use the fallback size
   * @param layoutRegions Optional layout regions per page
   * @return Categorized blocks in document order plus category statistics
   */
  ProcessedResult
  process(const std::vector<RawLine> &rawLines,
          const std::vector<PageDimension> &pageDimensions,
          const LayoutRegionsByPage &layoutRegions = LayoutRegionsByPage()) const;

  /**
   * @brief Process the lines of a single page
   *
   * @param lines Lines of one page
   * @param dims Page size (positive)
   * @param pageNumber 0-indexed page number, used for block ids
   * @param layoutRegions Regions for this page, or null for heuristics
   * @return Categorized blocks of the page, top to bottom
   */
  std::vector<TextBlock>
  processPage(const std::vector<RawLine> &lines, const PageDimension &dims,
              int pageNumber,
              const std::vector<LayoutRegion> *layoutRegions) const;

  /**
   * @brief Size used for a page, falling back when the entry is unusable
   */
  PageDimension pageDimensionFor(const std::vector<PageDimension> &dims,
                                 int pageNumber) const;

  /**
   * @brief Get the current configuration
   */
  const PostProcessorConfig &getConfig() const;

private:
  PostProcessorConfig m_config; ///< Current configuration
};

} // namespace ocrblocks

#endif // OCRBLOCKS_OCR_POST_PROCESSOR_HPP
