#ifndef OCRBLOCKS_LAYOUT_CATEGORIZER_HPP
#define OCRBLOCKS_LAYOUT_CATEGORIZER_HPP

#include "OCRTypes.hpp"

#include <vector>

namespace ocrblocks {

/**
 * @brief Minimum block overlap (exclusive) for a layout region to decide
 */
const double LAYOUT_OVERLAP_THRESHOLD = 0.30;

/**
 * @brief Category for a layout detector label
 *
 * Every label maps to exactly one category.
 */
CategoryId categoryForLayoutLabel(LayoutLabel label);

/**
 * @brief Fraction of the block's area covered by the region
 *
 * Relative to the block, not the region, so a page-sized region does not
 * win by size alone. Zero for an empty block.
 */
double overlapRatio(const cv::Rect2d &block, const cv::Rect2d &region);

/**
 * @brief Best-overlapping region for a block
 */
struct LayoutMatch {
  const LayoutRegion *region = nullptr; ///< Best region, null if none overlaps
  double overlap = 0.0;                 ///< Its overlap ratio
};

/**
 * @brief Find the region covering the largest share of the block
 *
 * Ties keep the earlier region.
 */
LayoutMatch findBestLayoutMatch(const cv::Rect2d &block,
                                const std::vector<LayoutRegion> &regions);

/**
 * @brief Categorize a block from the page's layout regions
 *
 * The best region decides when it covers more than 30% of the block;
 * otherwise, or with no regions, the block is body text.
 */
CategoryId categorizeWithLayout(const MergedBlock &block,
                                const std::vector<LayoutRegion> &regions);

} // namespace ocrblocks

#endif // OCRBLOCKS_LAYOUT_CATEGORIZER_HPP
