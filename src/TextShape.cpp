#include "TextShape.hpp"

#include <cctype>

namespace ocrblocks {

namespace {

// UTF-8 encodings of the punctuation the shape tests care about
const std::string EM_DASH = "\xE2\x80\x94";
const std::string EN_DASH = "\xE2\x80\x93";
const std::string FIGURE_DASH = "\xE2\x80\x92";
const std::string RIGHT_DOUBLE_QUOTE = "\xE2\x80\x9D";
const std::string RIGHT_SINGLE_QUOTE = "\xE2\x80\x99";

bool isAsciiSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

bool isAsciiDigit(char c) { return c >= '0' && c <= '9'; }

bool isAsciiLetter(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool startsWith(const std::string &text, const std::string &prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string &text, const std::string &suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string trim(const std::string &text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && isAsciiSpace(text[begin])) {
    begin++;
  }
  while (end > begin && isAsciiSpace(text[end - 1])) {
    end--;
  }
  return text.substr(begin, end - begin);
}

std::size_t utf8Length(const std::string &text) {
  std::size_t count = 0;
  for (char c : text) {
    if (!isContinuationByte(c)) {
      count++;
    }
  }
  return count;
}

std::string utf8Prefix(const std::string &text, std::size_t count) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < text.size(); i++) {
    if (!isContinuationByte(text[i])) {
      if (seen == count) {
        return text.substr(0, i);
      }
      seen++;
    }
  }
  return text;
}

bool startsWithDashMarker(const std::string &text) {
  return startsWith(text, "-") || startsWith(text, EM_DASH) ||
         startsWith(text, EN_DASH) || startsWith(text, FIGURE_DASH);
}

bool endsWithSentencePunctuation(const std::string &text) {
  std::string rest = text;

  // Peel off trailing whitespace and closing quotes
  for (;;) {
    if (!rest.empty() &&
        (isAsciiSpace(rest.back()) || rest.back() == '"' ||
         rest.back() == '\'')) {
      rest.pop_back();
    } else if (endsWith(rest, RIGHT_DOUBLE_QUOTE) ||
               endsWith(rest, RIGHT_SINGLE_QUOTE)) {
      rest.resize(rest.size() - 3);
    } else {
      break;
    }
  }

  if (rest.empty()) {
    return false;
  }

  const char last = rest.back();
  return last == '.' || last == '!' || last == '?' || last == ':' ||
         last == ';';
}

bool endsWithWordHyphen(const std::string &text) {
  return text.size() >= 2 && text.back() == '-' &&
         isAsciiLetter(text[text.size() - 2]);
}

bool startsWithLowercase(const std::string &text) {
  return !text.empty() && text[0] >= 'a' && text[0] <= 'z';
}

std::size_t asciiLetterCount(const std::string &text) {
  std::size_t count = 0;
  for (char c : text) {
    if (isAsciiLetter(c)) {
      count++;
    }
  }
  return count;
}

bool isAllCaps(const std::string &text) {
  if (asciiLetterCount(text) <= 3) {
    return false;
  }
  for (char c : text) {
    if (c >= 'a' && c <= 'z') {
      return false;
    }
  }
  return true;
}

bool looksLikePageNumber(const std::string &text) {
  if (utf8Length(text) < 15) {
    return true;
  }

  // Digits, dashes and whitespace only ("- 12 -", "12")
  bool dashesAndDigits = !text.empty();
  for (std::size_t i = 0; i < text.size() && dashesAndDigits;) {
    if (isAsciiDigit(text[i]) || isAsciiSpace(text[i]) || text[i] == '-') {
      i++;
    } else if (text.compare(i, EM_DASH.size(), EM_DASH) == 0 ||
               text.compare(i, EN_DASH.size(), EN_DASH) == 0) {
      i += EM_DASH.size();
    } else {
      dashesAndDigits = false;
    }
  }
  if (dashesAndDigits) {
    return true;
  }

  // "page N", case-insensitive
  if (text.size() < 5) {
    return false;
  }
  std::string lowered = text.substr(0, 4);
  for (char &c : lowered) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lowered != "page") {
    return false;
  }
  std::size_t i = 4;
  while (i < text.size() && isAsciiSpace(text[i])) {
    i++;
  }
  if (i == text.size()) {
    return false;
  }
  for (; i < text.size(); i++) {
    if (!isAsciiDigit(text[i])) {
      return false;
    }
  }
  return true;
}

bool looksLikeChapterNumber(const std::string &text) {
  std::size_t end = text.size();
  if (end > 0 && text[end - 1] == '.') {
    end--;
  }
  if (end == 0) {
    return false;
  }
  for (std::size_t i = 0; i < end; i++) {
    const char c = text[i];
    if (!isAsciiDigit(c) && c != 'I' && c != 'V' && c != 'X' && c != 'L' &&
        c != 'C' && c != 'D' && c != 'M') {
      return false;
    }
  }
  return true;
}

} // namespace ocrblocks
