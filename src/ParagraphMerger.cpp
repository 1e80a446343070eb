#include "ParagraphMerger.hpp"

#include "TextShape.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace ocrblocks {

namespace {

const double MAX_GAP_FACTOR = 2.5;        // beyond this: separate blocks
const double INDENT_FACTOR = 2.0;         // indent that opens a paragraph
const double EXTRA_SPACE_FACTOR = 1.3;    // gap that ends a short line
const double SHORT_LINE_PAGE_RATIO = 0.5; // "short" relative to page width
const double MERGE_GAP_FACTOR = 1.8;      // default merge distance

MergeDecision decide(bool merge, MergeRule rule) {
  MergeDecision decision;
  decision.merge = merge;
  decision.rule = rule;
  return decision;
}

} // namespace

MergeDecision evaluateMerge(const RawLine &previous, const RawLine &candidate,
                            const RawLine &groupFirst, double medianLineHeight,
                            double pageWidth) {
  const std::string prevText = trim(previous.text);
  const std::string currText = trim(candidate.text);

  // Content checks first; these override spacing
  if (startsWithDashMarker(currText)) {
    return decide(false, MergeRule::AttributionMarker);
  }

  if (endsWithWordHyphen(prevText)) {
    return decide(true, MergeRule::HyphenatedWord);
  }

  const bool endsSentence = endsWithSentencePunctuation(prevText);
  if (!endsSentence && startsWithLowercase(currText)) {
    return decide(true, MergeRule::LowercaseContinuation);
  }

  // Spatial checks
  const double gap = candidate.boundingBox.y - previous.boundingBox.y;

  if (gap > medianLineHeight * MAX_GAP_FACTOR) {
    return decide(false, MergeRule::TooFarApart);
  }
  if (gap <= 0) {
    return decide(false, MergeRule::NotBelow);
  }

  const bool indented = candidate.boundingBox.x >
                        groupFirst.boundingBox.x +
                            medianLineHeight * INDENT_FACTOR;
  if (indented && endsSentence) {
    return decide(false, MergeRule::IndentedParagraph);
  }

  const bool prevIsShort =
      previous.boundingBox.width < pageWidth * SHORT_LINE_PAGE_RATIO;
  const bool extraSpace = gap > medianLineHeight * EXTRA_SPACE_FACTOR;
  if (prevIsShort && endsSentence && extraSpace) {
    return decide(false, MergeRule::ShortLineBreak);
  }

  return decide(gap <= medianLineHeight * MERGE_GAP_FACTOR,
                MergeRule::LineSpacing);
}

std::vector<std::vector<RawLine>>
groupLines(const std::vector<RawLine> &sortedLines, double medianLineHeight,
           double pageWidth) {
  std::vector<std::vector<RawLine>> groups;
  if (sortedLines.empty()) {
    return groups;
  }

  std::vector<RawLine> current;
  current.push_back(sortedLines[0]);

  for (size_t i = 1; i < sortedLines.size(); i++) {
    MergeDecision decision =
        evaluateMerge(sortedLines[i - 1], sortedLines[i], current.front(),
                      medianLineHeight, pageWidth);
    if (decision.merge) {
      current.push_back(sortedLines[i]);
    } else {
      groups.push_back(std::move(current));
      current.clear();
      current.push_back(sortedLines[i]);
    }
  }
  groups.push_back(std::move(current));

  return groups;
}

MergedBlock finalizeGroup(const std::vector<RawLine> &group) {
  MergedBlock block;
  if (group.empty()) {
    return block;
  }

  block.page = group.front().page;
  block.lineCount = static_cast<int>(group.size());

  double minX = group.front().boundingBox.x;
  double minY = group.front().boundingBox.y;
  double maxX = group.front().boundingBox.x + group.front().boundingBox.width;
  double maxY = group.front().boundingBox.y + group.front().boundingBox.height;
  double fontSizeSum = 0.0;

  for (size_t i = 0; i < group.size(); i++) {
    const cv::Rect2d &box = group[i].boundingBox;
    minX = std::min(minX, box.x);
    minY = std::min(minY, box.y);
    maxX = std::max(maxX, box.x + box.width);
    maxY = std::max(maxY, box.y + box.height);
    fontSizeSum += group[i].fontSize;

    const std::string lineText = trim(group[i].text);
    if (i == 0) {
      block.text = lineText;
    } else if (endsWithWordHyphen(block.text)) {
      // Word broken across lines: "exam-" + "ple" -> "example"
      block.text.pop_back();
      block.text += lineText;
    } else {
      block.text += " " + lineText;
    }
  }

  block.boundingBox = cv::Rect2d(minX, minY, maxX - minX, maxY - minY);
  block.fontSize = std::round(fontSizeSum / group.size());

  return block;
}

std::vector<MergedBlock> mergeLines(const std::vector<RawLine> &sortedLines,
                                    double medianLineHeight, double pageWidth) {
  std::vector<MergedBlock> blocks;
  for (const auto &group : groupLines(sortedLines, medianLineHeight, pageWidth)) {
    blocks.push_back(finalizeGroup(group));
  }
  return blocks;
}

} // namespace ocrblocks
