#ifndef OCRBLOCKS_LAYOUT_REGION_READER_HPP
#define OCRBLOCKS_LAYOUT_REGION_READER_HPP

#include "OCRTypes.hpp"

#include <istream>
#include <string>

namespace ocrblocks {

/**
 * @brief Result of reading layout regions
 */
struct LayoutRegionsResult {
  bool success = false;        ///< Whether every line was read
  std::string errorMessage;    ///< Error message if failed
  LayoutRegionsByPage regions; ///< Regions by page, in input order
  int regionCount = 0;         ///< Number of regions read
};

/**
 * @brief Read layout regions from tab-separated text
 *
 * One region per line:
 * @code
 * page  label  x1  y1  x2  y2  confidence  position
 * @endcode
 * Blank lines and lines starting with '#' are skipped. The polygon of each
 * region is its four box corners. An unknown label or a malformed line
 * fails the whole read.
 *
 * @param input Stream to read from
 * @return LayoutRegionsResult with the regions or an error message
 */
LayoutRegionsResult readLayoutRegions(std::istream &input);

/**
 * @brief Read layout regions from a file
 * @param path Path to the tab-separated region file
 */
LayoutRegionsResult readLayoutRegionsFile(const std::string &path);

} // namespace ocrblocks

#endif // OCRBLOCKS_LAYOUT_REGION_READER_HPP
