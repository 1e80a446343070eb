#ifndef OCRBLOCKS_TEXT_SHAPE_HPP
#define OCRBLOCKS_TEXT_SHAPE_HPP

#include <cstddef>
#include <string>

namespace ocrblocks {

/**
 * @brief Strip leading and trailing ASCII whitespace
 */
std::string trim(const std::string &text);

/**
 * @brief Number of code points in a UTF-8 string
 *
 * Continuation bytes (10xxxxxx) are not counted, so malformed input still
 * yields a finite, stable count.
 */
std::size_t utf8Length(const std::string &text);

/**
 * @brief First @p count code points of a UTF-8 string
 */
std::string utf8Prefix(const std::string &text, std::size_t count);

/**
 * @brief True if the text starts with an em, en or figure dash, or a hyphen
 */
bool startsWithDashMarker(const std::string &text);

/**
 * @brief True if the text ends with . ! ? : or ; optionally followed by
 * whitespace and closing quotes
 */
bool endsWithSentencePunctuation(const std::string &text);

/**
 * @brief True if the text ends with a letter followed by a hyphen ("exam-")
 */
bool endsWithWordHyphen(const std::string &text);

/// True if the first character is an ASCII lowercase letter
bool startsWithLowercase(const std::string &text);

/// Number of ASCII letters in the text
std::size_t asciiLetterCount(const std::string &text);

/**
 * @brief True if the text has more than 3 letters and none is lowercase
 */
bool isAllCaps(const std::string &text);

/**
 * @brief Page-number-like shape: digits, dashes and whitespace only, or
 * "page N", or fewer than 15 characters
 */
bool looksLikePageNumber(const std::string &text);

/**
 * @brief Chapter-number shape: digits or Roman numeral capitals with an
 * optional trailing period ("7", "XII.")
 */
bool looksLikeChapterNumber(const std::string &text);

} // namespace ocrblocks

#endif // OCRBLOCKS_TEXT_SHAPE_HPP
