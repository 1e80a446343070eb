#include "PageMetrics.hpp"

#include <algorithm>

namespace ocrblocks {

PageMetrics estimatePageMetrics(const std::vector<RawLine> &lines) {
  PageMetrics metrics;

  double fontSizeSum = 0.0;
  int fontSizeCount = 0;
  for (const auto &line : lines) {
    if (line.fontSize > 0) {
      fontSizeSum += line.fontSize;
      fontSizeCount++;
    }
  }
  metrics.avgFontSize =
      fontSizeCount > 0 ? fontSizeSum / fontSizeCount : DEFAULT_FONT_SIZE;

  std::vector<double> tops;
  tops.reserve(lines.size());
  for (const auto &line : lines) {
    tops.push_back(line.boundingBox.y);
  }
  std::sort(tops.begin(), tops.end());

  const double maxDistance = metrics.avgFontSize * 4;
  std::vector<double> distances;
  for (size_t i = 1; i < tops.size(); i++) {
    double distance = tops[i] - tops[i - 1];
    if (distance > 0 && distance < maxDistance) {
      distances.push_back(distance);
    }
  }

  if (distances.empty()) {
    metrics.medianLineHeight = metrics.avgFontSize * 1.5;
  } else {
    std::sort(distances.begin(), distances.end());
    metrics.medianLineHeight = distances[distances.size() / 2];
  }

  return metrics;
}

} // namespace ocrblocks
