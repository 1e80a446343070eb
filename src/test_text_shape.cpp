#include "TextShape.hpp"
#include "test_support.hpp"

using namespace ocrblocks;
using ocrblocks_test::check;

int main() {
  std::cout << "=== Test text shape predicates ===" << std::endl;

  ocrblocks_test::section("Trimming and UTF-8 length");
  check(trim("  hello world \n") == "hello world", "trim strips both ends");
  check(trim(" \t ").empty(), "trim of whitespace is empty");
  check(utf8Length("abc") == 3, "ASCII length");
  check(utf8Length("\xE2\x80\x94 Twain") == 7, "em dash counts as one");
  check(utf8Length("caf\xC3\xA9") == 4, "two-byte letter counts as one");
  check(utf8Prefix("caf\xC3\xA9s", 4) == "caf\xC3\xA9",
        "prefix keeps whole code points");
  check(utf8Prefix("short", 100) == "short", "prefix longer than text");

  ocrblocks_test::section("Dash markers");
  check(startsWithDashMarker("\xE2\x80\x94 Mark Twain"), "em dash");
  check(startsWithDashMarker("\xE2\x80\x93 Mark Twain"), "en dash");
  check(startsWithDashMarker("\xE2\x80\x92 Mark Twain"), "figure dash");
  check(startsWithDashMarker("- Mark Twain"), "hyphen");
  check(!startsWithDashMarker("Mark Twain"), "plain text");

  ocrblocks_test::section("Sentence punctuation");
  check(endsWithSentencePunctuation("The end."), "period");
  check(endsWithSentencePunctuation("Really?"), "question mark");
  check(endsWithSentencePunctuation("as follows:"), "colon");
  check(endsWithSentencePunctuation("first; "), "semicolon + space");
  check(endsWithSentencePunctuation("he said.\""), "period + quote");
  check(endsWithSentencePunctuation("he said.\xE2\x80\x9D"),
        "period + right double quote");
  check(endsWithSentencePunctuation("it's done.\xE2\x80\x99 "),
        "period + right single quote + space");
  check(!endsWithSentencePunctuation("The cat sat on the"), "no punctuation");
  check(!endsWithSentencePunctuation("\""), "quote only");
  check(!endsWithSentencePunctuation(""), "empty");

  ocrblocks_test::section("Hyphens and case");
  check(endsWithWordHyphen("exam-"), "letter + hyphen");
  check(!endsWithWordHyphen("1990-"), "digit + hyphen");
  check(!endsWithWordHyphen("-"), "lone hyphen");
  check(!endsWithWordHyphen("example"), "no hyphen");
  check(startsWithLowercase("the mat."), "lowercase start");
  check(!startsWithLowercase("The mat."), "uppercase start");
  check(!startsWithLowercase(""), "empty");
  check(isAllCaps("CHAPTER ONE"), "all caps");
  check(isAllCaps("PART 2: THE END"), "caps with digits and punctuation");
  check(!isAllCaps("ABC"), "three letters is too few");
  check(!isAllCaps("Chapter One"), "mixed case");
  check(asciiLetterCount("A1 b-C") == 3, "letter count");

  ocrblocks_test::section("Page and chapter numbers");
  check(looksLikePageNumber("42"), "digits");
  check(looksLikePageNumber("- 17 -"), "short dashed number");
  check(looksLikePageNumber("12345 - 67890 - 1"), "long digits and dashes");
  check(looksLikePageNumber("Page 123456789012"), "long page N");
  check(looksLikePageNumber("page 12"), "page N");
  check(!looksLikePageNumber("A long closing sentence of text."),
        "long sentence");
  check(looksLikeChapterNumber("XII."), "Roman numeral + period");
  check(looksLikeChapterNumber("IV"), "Roman numeral");
  check(looksLikeChapterNumber("7"), "digit");
  check(!looksLikeChapterNumber("Chapter 7"), "word + number");
  check(!looksLikeChapterNumber("."), "period only");
  check(!looksLikeChapterNumber("iv"), "lowercase numeral");

  return ocrblocks_test::finish();
}
