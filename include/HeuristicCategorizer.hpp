#ifndef OCRBLOCKS_HEURISTIC_CATEGORIZER_HPP
#define OCRBLOCKS_HEURISTIC_CATEGORIZER_HPP

#include "OCRTypes.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ocrblocks {

/**
 * @brief Block features the heuristic rules look at
 *
 * Built once per block so every rule sees the same derived values.
 */
struct BlockContext {
  std::string text;           ///< Trimmed block text
  std::size_t textLength = 0; ///< Code points in text
  double yPercent = 0.0;      ///< Block top as a fraction of page height
  int lineCount = 1;          ///< Source line count
  double fontSize = 0.0;      ///< Block font size
  double avgFontSize = 12.0;  ///< Page average font size
  bool isCentered = false;    ///< Block centre within 15% of page centre
  bool isAllCaps = false;     ///< All letters uppercase, more than 3 letters
};

/**
 * @brief Derive the rule inputs for one block
 * @param block Merged block to categorize
 * @param dims Page size (must be positive)
 * @param pageCenterX Horizontal centre of the page
 * @param avgFontSize Page average font size
 */
BlockContext makeBlockContext(const MergedBlock &block,
                              const PageDimension &dims, double pageCenterX,
                              double avgFontSize);

/**
 * @brief One entry of the ordered heuristic rule chain
 */
struct HeuristicRule {
  const char *name;                         ///< Rule name, e.g. "footer"
  CategoryId category;                      ///< Category assigned on match
  bool (*matches)(const BlockContext &ctx); ///< Rule predicate
};

/**
 * @brief The heuristic rules in evaluation order
 *
 * header, footer, attribution, chapter-number, title, heading. There is no
 * caption rule; captions only come from layout regions.
 */
const std::vector<HeuristicRule> &heuristicRules();

/**
 * @brief Categorize a block from its position, size and text shape
 *
 * The first matching rule wins; blocks no rule claims are body text.
 */
CategoryId categorizeHeuristically(const MergedBlock &block,
                                   const PageDimension &dims,
                                   double pageCenterX, double avgFontSize);

} // namespace ocrblocks

#endif // OCRBLOCKS_HEURISTIC_CATEGORIZER_HPP
