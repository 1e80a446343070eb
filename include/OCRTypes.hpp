#ifndef OCRBLOCKS_OCR_TYPES_HPP
#define OCRBLOCKS_OCR_TYPES_HPP

#include <opencv2/core.hpp>

#include <map>
#include <string>
#include <vector>

namespace ocrblocks {

/**
 * @brief One OCR-recognized line of text
 */
struct RawLine {
  int page = 0;           ///< 0-indexed page number
  cv::Rect2d boundingBox; ///< Line box, origin top-left
  std::string text;       ///< Recognized text (UTF-8)
  double fontSize = 0.0;  ///< Estimated font size (0 = unknown)
};

/**
 * @brief Paragraph-level group of consecutive lines on one page
 */
struct MergedBlock {
  int page = 0;           ///< 0-indexed page number
  cv::Rect2d boundingBox; ///< Union of the member line boxes
  std::string text;       ///< Member line texts joined in line order
  int lineCount = 0;      ///< Number of member lines
  double fontSize = 0.0;  ///< Rounded mean of member font sizes
};

/**
 * @brief Page size used by the position-based heuristics
 */
struct PageDimension {
  double width = 0.0;  ///< Page width
  double height = 0.0; ///< Page height
};

/**
 * @brief Semantic category of a block
 */
enum class CategoryId {
  Title,
  Heading,
  Epigraph,
  Attribution,
  Body,
  Caption,
  Header,
  Footer
};

/**
 * @brief Page region a category belongs to
 */
enum class RegionClass { Body, Header, Footer };

/**
 * @brief Labels emitted by the layout-detection collaborator
 */
enum class LayoutLabel {
  Title,
  SectionHeader,
  Text,
  Handwriting,
  TextInlineMath,
  ListItem,
  Form,
  Table,
  Figure,
  Picture,
  TableOfContents,
  Caption,
  Footnote,
  PageFooter,
  PageHeader,
  Formula
};

/**
 * @brief Externally detected labeled region on a page
 */
struct LayoutRegion {
  LayoutLabel label = LayoutLabel::Text; ///< Detected region type
  cv::Rect2d boundingBox;                ///< Region box, origin top-left
  double confidence = 0.0;               ///< Detector confidence (0-1)
  std::vector<cv::Point2d> polygon;      ///< Region outline
  int position = 0;                      ///< Reading-order position
};

/// Layout regions keyed by 0-indexed page number
using LayoutRegionsByPage = std::map<int, std::vector<LayoutRegion>>;

/**
 * @brief Category metadata plus run-scoped statistics
 */
struct Category {
  CategoryId id = CategoryId::Body;
  std::string name;        ///< Display name
  std::string description; ///< Display description
  std::string color;       ///< Display color (#rrggbb)
  double fontSize = 0.0;   ///< Nominal font size
  RegionClass region = RegionClass::Body;
  bool enabled = true; ///< Enabled by default in the editor

  int blockCount = 0;     ///< Blocks assigned in this run
  int charCount = 0;      ///< Characters assigned in this run
  std::string sampleText; ///< Leading text of the first assigned block
};

/**
 * @brief Categorized output block
 */
struct TextBlock {
  std::string id;         ///< Stable id: ocr_p<page>_<index>
  int page = 0;           ///< 0-indexed page number
  cv::Rect2d boundingBox; ///< Block box, origin top-left
  std::string text;       ///< Block text
  double fontSize = 0.0;  ///< Rounded mean font size
  std::string fontName = "OCR";
  int charCount = 0; ///< Text length in code points
  int lineCount = 0; ///< Number of source lines
  CategoryId category = CategoryId::Body;
  RegionClass region = RegionClass::Body;
  bool isOcr = true; ///< Always true for blocks built from OCR lines
};

/**
 * @brief Result of post-processing a document
 */
struct ProcessedResult {
  std::vector<TextBlock> blocks;             ///< Blocks in document order
  std::map<CategoryId, Category> categories; ///< Only categories in use
};

/**
 * @brief Stable string id of a category ("title", "heading", ...)
 */
std::string categoryIdString(CategoryId id);

/**
 * @brief Display string of a region class ("body", "header", "footer")
 */
std::string regionClassString(RegionClass region);

/**
 * @brief Label name as emitted by the layout detector ("SectionHeader", ...)
 */
std::string layoutLabelString(LayoutLabel label);

/**
 * @brief Parse a layout detector label
 * @param name Label name, e.g. "PageHeader"
 * @param label Receives the parsed label on success
 * @return false if the name is not one of the known labels
 */
bool parseLayoutLabel(const std::string &name, LayoutLabel &label);

} // namespace ocrblocks

#endif // OCRBLOCKS_OCR_TYPES_HPP
