#ifndef OCRBLOCKS_PAGE_METRICS_HPP
#define OCRBLOCKS_PAGE_METRICS_HPP

#include "OCRTypes.hpp"

#include <vector>

namespace ocrblocks {

/**
 * @brief Per-page typography baselines
 */
struct PageMetrics {
  double avgFontSize = 12.0;      ///< Mean of the positive font sizes
  double medianLineHeight = 18.0; ///< Median line-to-line vertical distance
};

/// Font size assumed when no line on the page reports one
const double DEFAULT_FONT_SIZE = 12.0;

/**
 * @brief Estimate the font size and line spacing baselines of one page
 *
 * Line spacing is the median of the consecutive vertical deltas after
 * sorting by y. Deltas that are not positive or exceed 4x the average font
 * size (column breaks, images) are discarded. Without any valid delta the
 * spacing is 1.5x the average font size.
 *
 * @param lines All lines of a single page, in any order
 * @return Estimated metrics
 */
PageMetrics estimatePageMetrics(const std::vector<RawLine> &lines);

} // namespace ocrblocks

#endif // OCRBLOCKS_PAGE_METRICS_HPP
