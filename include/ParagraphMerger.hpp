#ifndef OCRBLOCKS_PARAGRAPH_MERGER_HPP
#define OCRBLOCKS_PARAGRAPH_MERGER_HPP

#include "OCRTypes.hpp"

#include <vector>

namespace ocrblocks {

/**
 * @brief Rule of the merge chain that decided whether two lines join
 *
 * Rules are evaluated in declaration order; the first one that applies
 * decides.
 */
enum class MergeRule {
  AttributionMarker,     ///< Candidate starts with a dash marker: split
  HyphenatedWord,        ///< Previous ends "letter-": merge
  LowercaseContinuation, ///< No sentence end + lowercase start: merge
  TooFarApart,           ///< Gap above 2.5x median line height: split
  NotBelow,              ///< Gap not positive (overlap/duplicate): split
  IndentedParagraph,     ///< Indent over 2x median after sentence end: split
  ShortLineBreak,        ///< Short previous line + sentence end + space: split
  LineSpacing            ///< Default: merge if gap within 1.8x median
};

/**
 * @brief Outcome of the merge rule chain for one candidate line
 */
struct MergeDecision {
  bool merge = false; ///< Whether the candidate joins the current group
  MergeRule rule = MergeRule::LineSpacing; ///< Rule that decided
};

/**
 * @brief Decide whether a candidate line continues the current group
 *
 * @param previous Last line of the current group
 * @param candidate Next line in vertical order
 * @param groupFirst First line of the current group (indent reference)
 * @param medianLineHeight Page line spacing baseline
 * @param pageWidth Page width
 * @return Decision and the rule that produced it
 */
MergeDecision evaluateMerge(const RawLine &previous, const RawLine &candidate,
                            const RawLine &groupFirst, double medianLineHeight,
                            double pageWidth);

/**
 * @brief Split lines of one page into paragraph groups
 * @param sortedLines Lines of one page sorted by vertical position
 * @return Groups in line order; every input line is in exactly one group
 */
std::vector<std::vector<RawLine>>
groupLines(const std::vector<RawLine> &sortedLines, double medianLineHeight,
           double pageWidth);

/**
 * @brief Build a block from a non-empty group of lines
 *
 * The box is the union of the line boxes, the font size the rounded mean,
 * and the text the trimmed line texts joined by spaces. A line ending in
 * "letter-" is joined to the next without the hyphen or a space.
 */
MergedBlock finalizeGroup(const std::vector<RawLine> &group);

/**
 * @brief Group and finalize the lines of one page
 */
std::vector<MergedBlock> mergeLines(const std::vector<RawLine> &sortedLines,
                                    double medianLineHeight, double pageWidth);

} // namespace ocrblocks

#endif // OCRBLOCKS_PARAGRAPH_MERGER_HPP
