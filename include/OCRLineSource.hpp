#ifndef OCRBLOCKS_OCR_LINE_SOURCE_HPP
#define OCRBLOCKS_OCR_LINE_SOURCE_HPP

#include "OCRTypes.hpp"

#include <opencv2/opencv.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace ocrblocks {

/**
 * @brief Lines and page sizes produced by an OCR source
 */
struct LineSourceResult {
  bool success = false;       ///< Whether extraction succeeded
  std::string errorMessage;   ///< Error message if failed
  std::vector<RawLine> lines; ///< Recognized lines
  std::vector<PageDimension>
      pageDimensions;          ///< Page sizes indexed by page number
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Configuration options for the OCR line sources
 */
struct LineSourceConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "deu+eng")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_AUTO;     ///< Page segmentation mode
  bool preprocessImage = true; ///< Apply preprocessing (grayscale, threshold)
  int minConfidence = 0;       ///< Minimum line confidence (0-100)
  std::string tessDataPath =
      ""; ///< Path to tessdata directory (empty = TESSDATA_PREFIX)
};

/**
 * @brief Produces line-level OCR input for the post-processor
 *
 * Scanned pages go through Tesseract, one image per page. PDFs with a text
 * layer are read with Poppler and their words grouped into lines. Either
 * way each line's font size is estimated from its box height.
 *
 * Example usage:
 * @code
 * ocrblocks::OCRLineSource source;
 * if (source.initialize()) {
 *     auto lines = source.recognizeImage("page1.png", 0);
 *     if (lines.success) {
 *         auto result = ocrblocks::OCRPostProcessor().process(
 *             lines.lines, lines.pageDimensions);
 *     }
 * }
 * @endcode
 */
class OCRLineSource {
public:
  /**
   * @brief Default constructor
   */
  OCRLineSource();

  /**
   * @brief Constructor with custom configuration
   * @param config Line source configuration options
   */
  explicit OCRLineSource(const LineSourceConfig &config);

  /**
   * @brief Destructor
   */
  ~OCRLineSource();

  // Disable copy operations (Tesseract API is not copyable)
  OCRLineSource(const OCRLineSource &) = delete;
  OCRLineSource &operator=(const OCRLineSource &) = delete;

  // Enable move operations
  OCRLineSource(OCRLineSource &&other) noexcept;
  OCRLineSource &operator=(OCRLineSource &&other) noexcept;

  /**
   * @brief Initialize the Tesseract engine
   *
   * Only needed for recognizeImage(); PDF text layers are read without it.
   *
   * @return true if initialization was successful, false otherwise
   */
  bool initialize();

  /**
   * @brief Check if the Tesseract engine is initialized
   */
  bool isInitialized() const;

  /**
   * @brief Recognize the text lines of a page image file
   * @param imagePath Path to the image file
   * @param pageNumber 0-indexed page number assigned to the lines
   * @return Lines of the page; pageDimensions has the image size at
   * pageNumber
   */
  LineSourceResult recognizeImage(const std::string &imagePath,
                                  int pageNumber);

  /**
   * @brief Recognize the text lines of a page image
   * @param image OpenCV Mat image
   * @param pageNumber 0-indexed page number assigned to the lines
   */
  LineSourceResult recognizeImage(const cv::Mat &image, int pageNumber);

  /**
   * @brief Read the text layer of every page of a PDF
   *
   * Words are grouped into lines by vertical centre and horizontal
   * proximity. Fails for unreadable or password protected documents.
   *
   * @param pdfPath Path to the PDF file
   * @return Lines of all pages and the size of each page
   */
  LineSourceResult extractPDFTextLayer(const std::string &pdfPath);

  /**
   * @brief Get the current configuration
   */
  const LineSourceConfig &getConfig() const;

  /**
   * @brief Get the Tesseract version string
   */
  static std::string getTesseractVersion();

private:
  /**
   * @brief Grayscale, blur and adaptive threshold for better OCR results
   */
  cv::Mat preprocessImage(const cv::Mat &image);

  /**
   * @brief Hand an OpenCV image to Tesseract as RGB
   */
  void setImage(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI>
      m_tesseract;           ///< Tesseract API instance
  LineSourceConfig m_config; ///< Current configuration
  bool m_initialized;        ///< Initialization state
};

/**
 * @brief Group word boxes of one page into horizontal text lines
 *
 * A word joins a line when its vertical centre is within half the line
 * height (at least 5) and it is within three line widths horizontally.
 *
 * @param words Word-level lines of one page in reading order
 * @return Line-level lines; font size is the line box height
 */
std::vector<RawLine> groupWordsIntoLines(const std::vector<RawLine> &words);

} // namespace ocrblocks

#endif // OCRBLOCKS_OCR_LINE_SOURCE_HPP
