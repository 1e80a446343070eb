#include "LayoutCategorizer.hpp"

namespace ocrblocks {

CategoryId categoryForLayoutLabel(LayoutLabel label) {
  // No default: a new label must be mapped here explicitly
  switch (label) {
  case LayoutLabel::Title:
    return CategoryId::Title;
  case LayoutLabel::SectionHeader:
    return CategoryId::Heading;
  case LayoutLabel::Text:
  case LayoutLabel::Handwriting:
  case LayoutLabel::TextInlineMath:
  case LayoutLabel::ListItem:
  case LayoutLabel::Form:
  case LayoutLabel::Table:
  case LayoutLabel::Figure:
  case LayoutLabel::Picture:
  case LayoutLabel::TableOfContents:
    return CategoryId::Body;
  case LayoutLabel::Caption:
    return CategoryId::Caption;
  case LayoutLabel::Footnote:
  case LayoutLabel::PageFooter:
    return CategoryId::Footer;
  case LayoutLabel::PageHeader:
    return CategoryId::Header;
  case LayoutLabel::Formula:
    return CategoryId::Epigraph;
  }
  return CategoryId::Body;
}

double overlapRatio(const cv::Rect2d &block, const cv::Rect2d &region) {
  const double blockArea = block.area();
  if (blockArea <= 0) {
    return 0.0;
  }
  return (block & region).area() / blockArea;
}

LayoutMatch findBestLayoutMatch(const cv::Rect2d &block,
                                const std::vector<LayoutRegion> &regions) {
  LayoutMatch best;
  for (const auto &region : regions) {
    double overlap = overlapRatio(block, region.boundingBox);
    if (overlap > best.overlap) {
      best.overlap = overlap;
      best.region = &region;
    }
  }
  return best;
}

CategoryId categorizeWithLayout(const MergedBlock &block,
                                const std::vector<LayoutRegion> &regions) {
  LayoutMatch match = findBestLayoutMatch(block.boundingBox, regions);
  if (match.region != nullptr && match.overlap > LAYOUT_OVERLAP_THRESHOLD) {
    return categoryForLayoutLabel(match.region->label);
  }
  return CategoryId::Body;
}

} // namespace ocrblocks
