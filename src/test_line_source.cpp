#include "OCRLineSource.hpp"
#include "test_support.hpp"

#include <vector>

using namespace ocrblocks;
using ocrblocks_test::check;
using ocrblocks_test::makeLine;

int main() {
  std::cout << "=== Test OCR line sources ===" << std::endl;
  std::cout << "Tesseract version: " << OCRLineSource::getTesseractVersion()
            << std::endl;

  ocrblocks_test::section("Word grouping");
  {
    std::vector<RawLine> words = {
        makeLine(0, 50, 100, 40, 12, "Hello"),
        makeLine(0, 95, 101, 45, 12, "world"),
        makeLine(0, 50, 120, 30, 12, "Next"),
        makeLine(0, 5000, 100, 30, 12, "Far"),
    };
    std::vector<RawLine> lines = groupWordsIntoLines(words);

    check(lines.size() == 3, "four words form three lines");
    if (lines.size() == 3) {
      check(lines[0].text == "Hello world", "words joined with a space");
      check(lines[0].boundingBox == cv::Rect2d(50, 100, 90, 13),
            "line box is the union of its words");
      check(lines[0].fontSize == 13, "font size is the line height");
      check(lines[1].text == "Next", "lower word starts a new line");
      check(lines[2].text == "Far", "distant word starts a new line");
      check(lines[2].page == 0, "page kept from the word");
    }
    check(groupWordsIntoLines({}).empty(), "no words, no lines");
  }

  ocrblocks_test::section("Error handling");
  {
    OCRLineSource source;
    check(!source.isInitialized(), "not initialized by construction");
    check(source.getConfig().language == "eng", "default language");

    cv::Mat image(100, 100, CV_8UC3, cv::Scalar(255, 255, 255));
    LineSourceResult result = source.recognizeImage(image, 0);
    check(!result.success && !result.errorMessage.empty(),
          "recognition before initialize fails");

    result = source.recognizeImage("/nonexistent/page.png", 0);
    check(!result.success && !result.errorMessage.empty(),
          "missing image fails");

    result = source.extractPDFTextLayer("/nonexistent/book.pdf");
    check(!result.success && !result.errorMessage.empty(),
          "missing PDF fails");
    check(result.lines.empty(), "failed extraction yields no lines");
  }

  return ocrblocks_test::finish();
}
