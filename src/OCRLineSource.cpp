#include "OCRLineSource.hpp"

#include "TextShape.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <utility>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-page.h>

namespace ocrblocks {

OCRLineSource::OCRLineSource()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_initialized(false) {}

OCRLineSource::OCRLineSource(const LineSourceConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

OCRLineSource::~OCRLineSource() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

OCRLineSource::OCRLineSource(OCRLineSource &&other) noexcept
    : m_tesseract(std::move(other.m_tesseract)),
      m_config(std::move(other.m_config)), m_initialized(other.m_initialized) {
  other.m_initialized = false;
}

OCRLineSource &OCRLineSource::operator=(OCRLineSource &&other) noexcept {
  if (this != &other) {
    if (m_tesseract) {
      m_tesseract->End();
    }
    m_tesseract = std::move(other.m_tesseract);
    m_config = std::move(other.m_config);
    m_initialized = other.m_initialized;
    other.m_initialized = false;
  }
  return *this;
}

bool OCRLineSource::initialize() {
  if (m_initialized) {
    return true;
  }

  // Config path first, then TESSDATA_PREFIX, then Tesseract's built-in path
  const char *tessDataPath = nullptr;
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  } else {
    tessDataPath = std::getenv("TESSDATA_PREFIX");
  }

  int result = m_tesseract->Init(tessDataPath, m_config.language.c_str());
  if (result != 0) {
    std::cerr << "Failed to initialize Tesseract with language: "
              << m_config.language << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_initialized = true;
  return true;
}

bool OCRLineSource::isInitialized() const { return m_initialized; }

LineSourceResult OCRLineSource::recognizeImage(const std::string &imagePath,
                                               int pageNumber) {
  cv::Mat image = cv::imread(imagePath);
  if (image.empty()) {
    LineSourceResult result;
    result.errorMessage = "Failed to load image: " + imagePath;
    return result;
  }

  return recognizeImage(image, pageNumber);
}

LineSourceResult OCRLineSource::recognizeImage(const cv::Mat &image,
                                               int pageNumber) {
  LineSourceResult result;

  if (!m_initialized) {
    result.errorMessage =
        "OCR engine not initialized. Call initialize() first.";
    return result;
  }

  if (image.empty()) {
    result.errorMessage = "Input image is empty";
    return result;
  }

  if (pageNumber < 0) {
    result.errorMessage = "Page number must not be negative";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    cv::Mat processedImage =
        m_config.preprocessImage ? preprocessImage(image) : image;

    setImage(processedImage);

    // Must call Recognize before GetIterator
    if (m_tesseract->Recognize(nullptr) != 0) {
      result.errorMessage = "Tesseract recognition failed";
      return result;
    }

    std::unique_ptr<tesseract::ResultIterator> ri(m_tesseract->GetIterator());
    const tesseract::PageIteratorLevel level = tesseract::RIL_TEXTLINE;

    if (ri) {
      do {
        std::unique_ptr<char[]> lineText(ri->GetUTF8Text(level));
        float conf = ri->Confidence(level);

        if (!lineText || conf < m_config.minConfidence) {
          continue;
        }

        std::string text = trim(lineText.get());
        if (text.empty()) {
          continue;
        }

        int x1, y1, x2, y2;
        if (!ri->BoundingBox(level, &x1, &y1, &x2, &y2)) {
          continue;
        }

        RawLine line;
        line.page = pageNumber;
        line.boundingBox = cv::Rect2d(x1, y1, x2 - x1, y2 - y1);
        line.text = text;
        // Box height stands in for the font size
        line.fontSize = y2 - y1;
        result.lines.push_back(line);
      } while (ri->Next(level));
    }

    result.pageDimensions.resize(pageNumber + 1);
    result.pageDimensions[pageNumber].width = image.cols;
    result.pageDimensions[pageNumber].height = image.rows;
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("OCR recognition failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

LineSourceResult
OCRLineSource::extractPDFTextLayer(const std::string &pdfPath) {
  LineSourceResult result;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(pdfPath));

    if (!doc) {
      result.errorMessage = "Failed to load PDF file: " + pdfPath;
      return result;
    }

    if (doc->is_locked()) {
      result.errorMessage = "PDF file is password protected: " + pdfPath;
      return result;
    }

    const int pageCount = doc->pages();
    result.pageDimensions.resize(pageCount);

    for (int pageIndex = 0; pageIndex < pageCount; pageIndex++) {
      std::unique_ptr<poppler::page> page(doc->create_page(pageIndex));
      if (!page) {
        std::cerr << "Failed to create page " << (pageIndex + 1)
                  << ", skipping" << std::endl;
        continue;
      }

      poppler::rectf pageRect = page->page_rect();
      result.pageDimensions[pageIndex].width = pageRect.width();
      result.pageDimensions[pageIndex].height = pageRect.height();

      // Text boxes come back in reading order with top-left origin
      std::vector<RawLine> words;
      for (auto &textBox : page->text_list()) {
        poppler::byte_array textBytes = textBox.text().to_utf8();
        std::string text(textBytes.begin(), textBytes.end());
        if (trim(text).empty()) {
          continue;
        }

        poppler::rectf bbox = textBox.bbox();

        RawLine word;
        word.page = pageIndex;
        word.boundingBox =
            cv::Rect2d(bbox.x(), bbox.y(), bbox.width(), bbox.height());
        word.text = trim(text);
        word.fontSize = bbox.height();
        words.push_back(word);
      }

      std::vector<RawLine> lines = groupWordsIntoLines(words);
      result.lines.insert(result.lines.end(), lines.begin(), lines.end());
    }

    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

const LineSourceConfig &OCRLineSource::getConfig() const { return m_config; }

std::string OCRLineSource::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

cv::Mat OCRLineSource::preprocessImage(const cv::Mat &image) {
  cv::Mat processed;

  // Convert to grayscale if color
  if (image.channels() == 3) {
    cv::cvtColor(image, processed, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, processed, cv::COLOR_BGRA2GRAY);
  } else {
    processed = image.clone();
  }

  cv::GaussianBlur(processed, processed, cv::Size(3, 3), 0);
  cv::adaptiveThreshold(processed, processed, 255,
                        cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 11,
                        2);

  return processed;
}

void OCRLineSource::setImage(const cv::Mat &image) {
  cv::Mat rgbImage;

  // Tesseract expects RGB
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

std::vector<RawLine> groupWordsIntoLines(const std::vector<RawLine> &words) {
  std::vector<RawLine> lines;
  std::vector<bool> used(words.size(), false);

  for (size_t i = 0; i < words.size(); i++) {
    if (used[i])
      continue;

    RawLine line = words[i];
    used[i] = true;

    // Words whose vertical centres are this close share a line
    const double tolerance = std::max(5.0, line.boundingBox.height / 2);

    for (size_t j = i + 1; j < words.size(); j++) {
      if (used[j])
        continue;

      const cv::Rect2d &lineBox = line.boundingBox;
      const cv::Rect2d &wordBox = words[j].boundingBox;

      double yCenter1 = lineBox.y + lineBox.height / 2;
      double yCenter2 = wordBox.y + wordBox.height / 2;
      double yDiff = std::abs(yCenter1 - yCenter2);

      double horizontalGap =
          std::min(std::abs(wordBox.x - (lineBox.x + lineBox.width)),
                   std::abs(lineBox.x - (wordBox.x + wordBox.width)));

      if (yDiff <= tolerance && horizontalGap < lineBox.width * 3) {
        used[j] = true;

        double newX = std::min(lineBox.x, wordBox.x);
        double newY = std::min(lineBox.y, wordBox.y);
        double newRight =
            std::max(lineBox.x + lineBox.width, wordBox.x + wordBox.width);
        double newBottom =
            std::max(lineBox.y + lineBox.height, wordBox.y + wordBox.height);

        line.boundingBox =
            cv::Rect2d(newX, newY, newRight - newX, newBottom - newY);
        line.text += " " + words[j].text;
      }
    }

    line.fontSize = line.boundingBox.height;
    lines.push_back(line);
  }

  return lines;
}

} // namespace ocrblocks
