#include "TextNormalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <vector>

namespace outline {

namespace {

// Decode the UTF-8 sequence at pos; returns its length in bytes. Malformed
// bytes decode as themselves with length 1.
size_t decodeAt(const std::string &text, size_t pos, char32_t &cp) {
  unsigned char lead = static_cast<unsigned char>(text[pos]);
  size_t length = 1;
  if (lead >= 0xF0 && lead < 0xF8) {
    length = 4;
    cp = lead & 0x07;
  } else if (lead >= 0xE0) {
    length = 3;
    cp = lead & 0x0F;
  } else if (lead >= 0xC0) {
    length = 2;
    cp = lead & 0x1F;
  } else {
    cp = lead;
    return 1;
  }
  if (lead >= 0xF8 || pos + length > text.size()) {
    cp = lead;
    return 1;
  }
  for (size_t i = 1; i < length; i++) {
    unsigned char next = static_cast<unsigned char>(text[pos + i]);
    if ((next & 0xC0) != 0x80) {
      cp = lead;
      return 1;
    }
    cp = (cp << 6) | (next & 0x3F);
  }
  return length;
}

void appendUtf8(std::string &out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool isSpaceCodePoint(char32_t cp) {
  return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20) ||
         cp == 0x85 || cp == 0xA0 || cp == 0x1680 ||
         (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 || cp == 0x2029 ||
         cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

// Letters, digits and '_' in any script. Non-ASCII code points count unless
// they fall in a punctuation, symbol, control or private-use range.
bool isWordCodePoint(char32_t cp) {
  if (cp < 0x80) {
    return std::isalnum(static_cast<int>(cp)) || cp == '_';
  }
  if (cp < 0xC0) {
    // Latin-1: only ª ² ³ µ ¹ º ¼ ½ ¾ are letters or numbers
    return cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 ||
           cp == 0xB9 || cp == 0xBA || (cp >= 0xBC && cp <= 0xBE);
  }
  if (cp == 0xD7 || cp == 0xF7) {
    return false;
  }
  if (isSpaceCodePoint(cp)) {
    return false;
  }
  struct Range {
    char32_t first;
    char32_t last;
  };
  static const Range kNonWord[] = {
      {0x2000, 0x206F}, // General Punctuation
      {0x20A0, 0x20CF}, // Currency Symbols
      {0x2190, 0x245F}, // Arrows, math operators, technical, control pictures
      {0x2500, 0x2775}, // Box drawing, shapes, dingbats
      {0x2794, 0x2BFF}, // Dingbats, arrows, math symbols
      {0x2E00, 0x2E7F}, // Supplemental Punctuation
      {0x3001, 0x3004}, // CJK punctuation
      {0x3008, 0x3020}, // CJK brackets and marks
      {0x3030, 0x3030},
      {0x303D, 0x303F},
      {0xE000, 0xF8FF}, // Private Use Area
      {0xFE10, 0xFE1F}, // Vertical forms
      {0xFE30, 0xFE4F}, // CJK compatibility forms
      {0xFE50, 0xFE6F}, // Small form variants
      {0xFF01, 0xFF0F}, // Fullwidth punctuation
      {0xFF1A, 0xFF20},
      {0xFF3B, 0xFF40},
      {0xFF5B, 0xFF65},
      {0xFFF0, 0xFFFF}, // Specials
      {0x1F000, 0x1FAFF}, // Emoji and pictographs
  };
  for (const auto &range : kNonWord) {
    if (cp >= range.first && cp <= range.last) {
      return false;
    }
  }
  return true;
}

// Simple lowercase mapping for Latin, Greek and Cyrillic
char32_t toLowerCodePoint(char32_t cp) {
  if (cp < 0x80) {
    return static_cast<char32_t>(std::tolower(static_cast<int>(cp)));
  }
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) {
    return cp + 0x20;
  }
  if (cp == 0x130) {
    return 'i';
  }
  if (cp == 0x178) {
    return 0xFF;
  }
  if ((cp >= 0x100 && cp <= 0x137) || (cp >= 0x14A && cp <= 0x177)) {
    return cp | 1;
  }
  if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
    return (cp & 1) ? cp + 1 : cp;
  }
  if (cp >= 0x391 && cp <= 0x3AB && cp != 0x3A2) {
    return cp + 0x20;
  }
  if (cp == 0x386) {
    return 0x3AC;
  }
  if (cp >= 0x388 && cp <= 0x38A) {
    return cp + 0x25;
  }
  if (cp == 0x38C) {
    return 0x3CC;
  }
  if (cp == 0x38E || cp == 0x38F) {
    return cp + 0x3F;
  }
  if (cp >= 0x400 && cp <= 0x40F) {
    return cp + 0x50;
  }
  if (cp >= 0x410 && cp <= 0x42F) {
    return cp + 0x20;
  }
  if ((cp >= 0x460 && cp <= 0x481) || (cp >= 0x48A && cp <= 0x4BF)) {
    return cp | 1;
  }
  return cp;
}

// Length in bytes of the whitespace character at pos, or 0
size_t spaceAt(const std::string &text, size_t pos) {
  if (pos >= text.size()) {
    return 0;
  }
  char32_t cp = 0;
  size_t length = decodeAt(text, pos, cp);
  return isSpaceCodePoint(cp) ? length : 0;
}

bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)); }

size_t skipSpace(const std::string &text, size_t pos) {
  while (size_t length = spaceAt(text, pos)) {
    pos += length;
  }
  return pos;
}

size_t skipDigits(const std::string &text, size_t pos) {
  while (pos < text.size() && isDigit(text[pos])) {
    pos++;
  }
  return pos;
}

bool startsWithAt(const std::string &text, size_t pos, const char *word) {
  return text.compare(pos, std::char_traits<char>::length(word), word) == 0;
}

// One word character at pos; returns the offset after it, or pos if none
size_t skipWordChar(const std::string &text, size_t pos) {
  if (pos >= text.size()) {
    return pos;
  }
  char32_t cp = 0;
  size_t length = decodeAt(text, pos, cp);
  return isWordCodePoint(cp) ? pos + length : pos;
}

// Length in bytes of a '.', '-' or whitespace separator at pos, or 0
size_t separatorAt(const std::string &text, size_t pos) {
  if (pos < text.size() && (text[pos] == '.' || text[pos] == '-')) {
    return 1;
  }
  return spaceAt(text, pos);
}

// Every candidate end of a dotted number starting at pos, shortest first
std::vector<size_t> dottedNumberEnds(const std::string &text, size_t pos) {
  std::vector<size_t> ends;
  size_t end = skipDigits(text, pos);
  if (end == pos) {
    return ends;
  }
  ends.push_back(end);
  while (end + 1 < text.size() && text[end] == '.' && isDigit(text[end + 1])) {
    end = skipDigits(text, end + 1);
    ends.push_back(end);
  }
  return ends;
}

// "Chapter" <space> <digits>; returns the offset after the digits or npos
size_t chapterEnd(const std::string &text, size_t pos) {
  if (!startsWithAt(text, pos, "Chapter")) {
    return std::string::npos;
  }
  size_t p = pos + 7;
  size_t space = spaceAt(text, p);
  if (space == 0) {
    return std::string::npos;
  }
  size_t end = skipDigits(text, p + space);
  return end == p + space ? std::string::npos : end;
}

// "Appendix" <space> <word char>; returns the offset after it or npos
size_t appendixEnd(const std::string &text, size_t pos) {
  if (!startsWithAt(text, pos, "Appendix")) {
    return std::string::npos;
  }
  size_t p = pos + 8;
  size_t space = spaceAt(text, p);
  if (space == 0) {
    return std::string::npos;
  }
  size_t end = skipWordChar(text, p + space);
  return end == p + space ? std::string::npos : end;
}

NumberingMatch makeMatch(NumberingKind kind, size_t begin, size_t end) {
  NumberingMatch match;
  match.kind = kind;
  match.prefixBegin = begin;
  match.prefixEnd = end;
  return match;
}

} // namespace

NumberingMatch matchHeadingNumber(const std::string &text) {
  size_t begin = skipSpace(text, 0);

  std::vector<size_t> ends = dottedNumberEnds(text, begin);
  for (auto it = ends.rbegin(); it != ends.rend(); ++it) {
    if (separatorAt(text, *it)) {
      return makeMatch(NumberingKind::Numeric, begin, *it);
    }
  }

  size_t end = chapterEnd(text, begin);
  if (end != std::string::npos && separatorAt(text, end)) {
    return makeMatch(NumberingKind::Chapter, begin, end);
  }

  end = appendixEnd(text, begin);
  if (end != std::string::npos && separatorAt(text, end)) {
    return makeMatch(NumberingKind::Appendix, begin, end);
  }

  return NumberingMatch();
}

NumberingMatch matchNumberingPrefix(const std::string &text) {
  size_t begin = skipSpace(text, 0);

  std::vector<size_t> ends = dottedNumberEnds(text, begin);
  if (!ends.empty()) {
    return makeMatch(NumberingKind::Numeric, begin, ends.back());
  }

  size_t end = chapterEnd(text, begin);
  if (end != std::string::npos) {
    return makeMatch(NumberingKind::Chapter, begin, end);
  }

  end = appendixEnd(text, begin);
  if (end != std::string::npos) {
    return makeMatch(NumberingKind::Appendix, begin, end);
  }

  return NumberingMatch();
}

std::string normalizeHeadingText(const std::string &text) {
  NumberingMatch prefix = matchNumberingPrefix(text);
  if (!prefix.matched()) {
    return collapseWhitespace(text);
  }

  size_t rest = prefix.prefixEnd;
  while (size_t length = separatorAt(text, rest)) {
    rest += length;
  }
  return collapseWhitespace(text.substr(rest));
}

std::string trim(const std::string &text) {
  size_t start = skipSpace(text, 0);
  size_t end = start;
  size_t pos = start;
  while (pos < text.size()) {
    char32_t cp = 0;
    pos += decodeAt(text, pos, cp);
    if (!isSpaceCodePoint(cp)) {
      end = pos;
    }
  }
  return text.substr(start, end - start);
}

std::string collapseWhitespace(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool pendingSpace = false;
  size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    size_t length = decodeAt(text, pos, cp);
    if (isSpaceCodePoint(cp)) {
      pendingSpace = true;
    } else {
      if (pendingSpace && !out.empty()) {
        out.push_back(' ');
      }
      pendingSpace = false;
      out.append(text, pos, length);
    }
    pos += length;
  }
  return out;
}

std::string toLowerAscii(const std::string &text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) {
                   return c < 0x80 ? static_cast<char>(std::tolower(c))
                                   : static_cast<char>(c);
                 });
  return lower;
}

std::string toLowerText(const std::string &text) {
  std::string lower;
  lower.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    size_t length = decodeAt(text, pos, cp);
    if (length == 1 && cp >= 0x80) {
      lower.push_back(text[pos]); // malformed byte, kept as is
    } else {
      appendUtf8(lower, toLowerCodePoint(cp));
    }
    pos += length;
  }
  return lower;
}

size_t codePointLength(const std::string &text) {
  return static_cast<size_t>(
      std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
      }));
}

size_t countWords(const std::string &text) {
  size_t words = 0;
  bool inWord = false;
  size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    pos += decodeAt(text, pos, cp);
    if (isSpaceCodePoint(cp)) {
      inWord = false;
    } else if (!inWord) {
      inWord = true;
      words++;
    }
  }
  return words;
}

size_t countDots(const std::string &text) {
  return static_cast<size_t>(std::count(text.begin(), text.end(), '.'));
}

int roundFontSize(double size) {
  // nearbyint follows the current rounding mode, which defaults to
  // round-half-to-even
  return static_cast<int>(std::nearbyint(size));
}

} // namespace outline
