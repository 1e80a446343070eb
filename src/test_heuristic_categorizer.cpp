#include "HeuristicCategorizer.hpp"
#include "test_support.hpp"

#include <string>

using namespace ocrblocks;
using ocrblocks_test::check;

namespace {

const PageDimension PAGE = {600.0, 800.0};
const double CENTER_X = 300.0;
const double AVG_FONT = 12.0;

MergedBlock makeBlock(double y, const std::string &text, int lineCount = 1,
                      double fontSize = 12.0) {
  MergedBlock block;
  block.page = 0;
  block.boundingBox = cv::Rect2d(50, y, 300, 14.0 * lineCount);
  block.text = text;
  block.lineCount = lineCount;
  block.fontSize = fontSize;
  return block;
}

CategoryId categorize(const MergedBlock &block) {
  return categorizeHeuristically(block, PAGE, CENTER_X, AVG_FONT);
}

const HeuristicRule *findRule(const std::string &name) {
  for (const auto &rule : heuristicRules()) {
    if (name == rule.name) {
      return &rule;
    }
  }
  return nullptr;
}

bool ruleMatches(const std::string &name, const MergedBlock &block) {
  const HeuristicRule *rule = findRule(name);
  return rule != nullptr &&
         rule->matches(makeBlockContext(block, PAGE, CENTER_X, AVG_FONT));
}

} // namespace

int main() {
  std::cout << "=== Test heuristic categorization ===" << std::endl;

  ocrblocks_test::section("Rule order");
  {
    const char *expected[] = {"header",         "footer", "attribution",
                              "chapter-number", "title",  "heading"};
    const auto &rules = heuristicRules();
    bool inOrder = rules.size() == 6;
    for (size_t i = 0; inOrder && i < rules.size(); i++) {
      inOrder = std::string(rules[i].name) == expected[i];
    }
    check(inOrder, "rules evaluated header -> heading");

    bool hasCaption = false;
    for (const auto &rule : rules) {
      hasCaption = hasCaption || rule.category == CategoryId::Caption;
    }
    check(!hasCaption, "no heuristic produces captions");
  }

  ocrblocks_test::section("Header and footer");
  check(categorize(makeBlock(20, "Running Head")) == CategoryId::Header,
        "short line in the top 6% is a header");
  check(categorize(makeBlock(20, "This running head is rather long for one")) ==
            CategoryId::Body,
        "long line in the top band is not a header");
  check(categorize(makeBlock(780, "142")) == CategoryId::Footer,
        "page number in the bottom 6% is a footer");
  check(categorize(makeBlock(780, "Page 12")) == CategoryId::Footer,
        "\"Page N\" is a footer");
  check(!ruleMatches("footer",
                     makeBlock(780, "The closing sentence of the chapter.")),
        "long sentence at the bottom is not a footer");
  check(categorize(makeBlock(780, "142", 2)) == CategoryId::Body,
        "multi-line block is not a footer");

  ocrblocks_test::section("Attribution and chapter numbers");
  check(categorize(makeBlock(400, "\xE2\x80\x94 Mark Twain")) ==
            CategoryId::Attribution,
        "dash-led short line is an attribution");
  check(categorize(makeBlock(400, "- " + std::string(85, 'x'))) ==
            CategoryId::Body,
        "dash-led long line is body text");
  check(ruleMatches("chapter-number", makeBlock(100, "XII")),
        "Roman numeral near the top matches chapter-number");
  check(categorize(makeBlock(100, "7.")) == CategoryId::Title,
        "chapter number is categorized as title");
  check(!ruleMatches("chapter-number", makeBlock(300, "XII")),
        "numeral lower on the page is not a chapter number");

  ocrblocks_test::section("Title and heading");
  check(categorize(makeBlock(200, "THE BEGINNING OF THE END")) ==
            CategoryId::Title,
        "all caps in the top 35% is a title");
  check(categorize(makeBlock(200, "THE BEGINNING OF THE END", 2)) ==
            CategoryId::Title,
        "all-caps title may span lines");
  check(categorize(makeBlock(250, "A Quiet Morning", 1, 16)) ==
            CategoryId::Title,
        "large font near the top is a title");
  check(categorize(makeBlock(250, "A Quiet Morning", 2, 16)) ==
            CategoryId::Body,
        "large font title must be a single line");
  check(categorize(makeBlock(400, "A Quiet Morning", 1, 16)) ==
            CategoryId::Body,
        "large font below 40% is body text");
  check(categorize(makeBlock(400, "PART TWO SUMMER")) == CategoryId::Heading,
        "all caps lower on the page is a heading");
  check(categorize(makeBlock(400, "PART TWO SUMMER", 2)) == CategoryId::Body,
        "multi-line caps lower on the page is body text");
  check(categorize(makeBlock(400, "It was a bright cold day in April.")) ==
            CategoryId::Body,
        "ordinary sentence is body text");

  ocrblocks_test::section("Block context");
  {
    MergedBlock block = makeBlock(400, "Centered");
    block.boundingBox = cv::Rect2d(200, 400, 200, 14);
    BlockContext ctx = makeBlockContext(block, PAGE, CENTER_X, AVG_FONT);
    check(ctx.isCentered, "block around the page centre is centered");
    check(ctx.yPercent == 0.5, "vertical position relative to page height");
    check(ctx.textLength == 8, "text length in characters");

    block.boundingBox = cv::Rect2d(20, 400, 100, 14);
    check(!makeBlockContext(block, PAGE, CENTER_X, AVG_FONT).isCentered,
          "left-aligned block is not centered");
  }

  return ocrblocks_test::finish();
}
