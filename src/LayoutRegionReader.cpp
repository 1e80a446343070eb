#include "LayoutRegionReader.hpp"

#include "TextShape.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace ocrblocks {

LayoutRegionsResult readLayoutRegions(std::istream &input) {
  LayoutRegionsResult result;
  LayoutRegionsByPage regions;
  int regionCount = 0;

  std::string line;
  int lineNumber = 0;
  while (std::getline(input, line)) {
    lineNumber++;

    const std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }

    std::istringstream fields(trimmed);
    int page = 0;
    std::string labelName;
    double x1 = 0, y1 = 0, x2 = 0, y2 = 0;
    double confidence = 0;
    int position = 0;

    if (!(fields >> page >> labelName >> x1 >> y1 >> x2 >> y2 >> confidence >>
          position)) {
      result.errorMessage =
          "Malformed layout region at line " + std::to_string(lineNumber);
      return result;
    }

    LayoutRegion region;
    if (!parseLayoutLabel(labelName, region.label)) {
      result.errorMessage = "Unknown layout label \"" + labelName +
                            "\" at line " + std::to_string(lineNumber);
      return result;
    }

    if (page < 0 || x2 < x1 || y2 < y1) {
      result.errorMessage =
          "Invalid layout region box at line " + std::to_string(lineNumber);
      return result;
    }

    region.boundingBox = cv::Rect2d(x1, y1, x2 - x1, y2 - y1);
    region.confidence = confidence;
    region.position = position;
    region.polygon = {cv::Point2d(x1, y1), cv::Point2d(x2, y1),
                      cv::Point2d(x2, y2), cv::Point2d(x1, y2)};

    regions[page].push_back(region);
    regionCount++;
  }

  result.regions = std::move(regions);
  result.regionCount = regionCount;
  result.success = true;
  return result;
}

LayoutRegionsResult readLayoutRegionsFile(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    LayoutRegionsResult result;
    result.errorMessage = "Failed to open layout region file: " + path;
    return result;
  }
  return readLayoutRegions(file);
}

} // namespace ocrblocks
