#include "LayoutRegionReader.hpp"
#include "OCRLineSource.hpp"
#include "OCRPostProcessor.hpp"
#include "TextShape.hpp"

#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <input>... [options]\n"
      << "\nInputs are page images (one page each, in order) or a single PDF\n"
      << "with a text layer.\n"
      << "\nOptions:\n"
      << "  -l, --language <lang>   Set OCR language (default: eng)\n"
      << "  -c, --confidence <val>  Minimum line confidence (0-100)\n"
      << "  -L, --layout <file>     Layout regions (tab-separated)\n"
      << "  -v, --verbose           Print post-processing diagnostics\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " page1.png page2.png\n"
      << "  " << programName << " book.pdf --layout book_layout.tsv\n"
      << "  " << programName << " scan.png -l eng+deu -c 60\n";
}

bool isPDF(const std::string &path) {
  if (path.size() < 4) {
    return false;
  }
  std::string extension = path.substr(path.size() - 4);
  for (char &c : extension) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return extension == ".pdf";
}

std::string shorten(const std::string &text, size_t maxLength) {
  std::string shortened = ocrblocks::utf8Prefix(text, maxLength);
  if (shortened.size() < text.size()) {
    shortened += "...";
  }
  return shortened;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::vector<std::string> inputs;
  std::string layoutPath;
  ocrblocks::LineSourceConfig sourceConfig;
  ocrblocks::PostProcessorConfig processorConfig;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-l" || arg == "--language") {
      if (i + 1 < argc) {
        sourceConfig.language = argv[++i];
      } else {
        std::cerr << "Error: --language requires an argument\n";
        return 1;
      }
    } else if (arg == "-c" || arg == "--confidence") {
      if (i + 1 < argc) {
        try {
          sourceConfig.minConfidence = std::stoi(argv[++i]);
        } catch (const std::exception &) {
          std::cerr << "Error: --confidence expects a number\n";
          return 1;
        }
      } else {
        std::cerr << "Error: --confidence requires an argument\n";
        return 1;
      }
    } else if (arg == "-L" || arg == "--layout") {
      if (i + 1 < argc) {
        layoutPath = argv[++i];
      } else {
        std::cerr << "Error: --layout requires an argument\n";
        return 1;
      }
    } else if (arg == "-v" || arg == "--verbose") {
      processorConfig.verbose = true;
    } else if (arg[0] != '-') {
      inputs.push_back(arg);
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (inputs.empty()) {
    std::cerr << "Error: No input provided\n";
    printUsage(argv[0]);
    return 1;
  }

  const bool pdfInput = inputs.size() == 1 && isPDF(inputs[0]);
  for (const auto &input : inputs) {
    if (isPDF(input) && !pdfInput) {
      std::cerr << "Error: a PDF must be the only input\n";
      return 1;
    }
  }

  std::cout << "=== OCR Block Reconstruction ===\n"
            << "Tesseract version: "
            << ocrblocks::OCRLineSource::getTesseractVersion() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Language: " << sourceConfig.language << "\n"
            << "================================\n\n";

  ocrblocks::OCRLineSource source(sourceConfig);
  std::vector<ocrblocks::RawLine> lines;
  std::vector<ocrblocks::PageDimension> pageDimensions;

  if (pdfInput) {
    auto extracted = source.extractPDFTextLayer(inputs[0]);
    if (!extracted.success) {
      std::cerr << "PDF extraction failed: " << extracted.errorMessage << "\n";
      return 1;
    }
    lines = extracted.lines;
    pageDimensions = extracted.pageDimensions;
  } else {
    if (!source.initialize()) {
      std::cerr
          << "Failed to initialize OCR engine.\n"
          << "Make sure Tesseract is installed and tessdata is available.\n";
      return 1;
    }

    pageDimensions.resize(inputs.size());
    for (size_t page = 0; page < inputs.size(); ++page) {
      std::cout << "Recognizing page " << (page + 1) << ": " << inputs[page]
                << "\n";
      auto recognized =
          source.recognizeImage(inputs[page], static_cast<int>(page));
      if (!recognized.success) {
        std::cerr << "OCR failed: " << recognized.errorMessage << "\n";
        return 1;
      }
      lines.insert(lines.end(), recognized.lines.begin(),
                   recognized.lines.end());
      pageDimensions[page] = recognized.pageDimensions[page];
    }
  }

  ocrblocks::LayoutRegionsByPage layoutRegions;
  if (!layoutPath.empty()) {
    auto layout = ocrblocks::readLayoutRegionsFile(layoutPath);
    if (!layout.success) {
      std::cerr << "Layout regions rejected: " << layout.errorMessage << "\n";
      return 1;
    }
    layoutRegions = layout.regions;
    std::cout << "Layout regions: " << layout.regionCount << " on "
              << layoutRegions.size() << " pages\n";
  }

  ocrblocks::OCRPostProcessor processor(processorConfig);
  auto result = processor.process(lines, pageDimensions, layoutRegions);

  // Display blocks
  std::cout << "\n[Blocks]\n";
  std::cout << std::setw(12) << std::left << "Id" << std::setw(13) << "Category"
            << std::setw(28) << "Bounding Box" << std::setw(7) << "Lines"
            << "Text\n";
  std::cout << std::string(90, '-') << "\n";

  for (const auto &block : result.blocks) {
    std::ostringstream bbox;
    bbox << std::fixed << std::setprecision(0) << "(" << block.boundingBox.x
         << "," << block.boundingBox.y << "," << block.boundingBox.width << ","
         << block.boundingBox.height << ")";

    std::cout << std::setw(12) << std::left << block.id << std::setw(13)
              << ocrblocks::categoryIdString(block.category) << std::setw(28)
              << bbox.str() << std::setw(7) << block.lineCount
              << shorten(block.text, 60) << "\n";
  }

  // Display category statistics
  std::cout << "\n[Categories]\n";
  std::cout << std::setw(20) << std::left << "Name" << std::setw(8) << "Blocks"
            << std::setw(8) << "Chars" << std::setw(9) << "Enabled"
            << "Sample\n";
  std::cout << std::string(90, '-') << "\n";

  for (const auto &entry : result.categories) {
    const auto &category = entry.second;
    std::cout << std::setw(20) << std::left << category.name << std::setw(8)
              << category.blockCount << std::setw(8) << category.charCount
              << std::setw(9) << (category.enabled ? "yes" : "no")
              << shorten(category.sampleText, 40) << "\n";
  }

  std::cout << "\nTotal lines: " << lines.size()
            << ", blocks: " << result.blocks.size()
            << ", categories: " << result.categories.size() << "\n";

  return 0;
}
