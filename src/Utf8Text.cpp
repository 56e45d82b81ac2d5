#include "Utf8Text.hpp"

#include <cstdint>

namespace hanzi {
namespace text {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

bool isContinuation(unsigned char byte) { return (byte & 0xC0) == 0x80; }

} // anonymous namespace

std::u32string decodeUtf8(const std::string &utf8) {
  std::u32string out;
  out.reserve(utf8.size());

  const auto *p = reinterpret_cast<const unsigned char *>(utf8.data());
  const unsigned char *end = p + utf8.size();

  while (p < end) {
    unsigned char c = *p;
    uint32_t ch = 0;
    int extra = 0;

    if (c < 0x80) {
      ch = c;
    } else if ((c >> 5) == 0x6) {
      // 110xxxxx
      ch = c & 0x1F;
      extra = 1;
    } else if ((c >> 4) == 0xE) {
      // 1110xxxx
      ch = c & 0x0F;
      extra = 2;
    } else if ((c >> 3) == 0x1E) {
      // 11110xxx
      ch = c & 0x07;
      extra = 3;
    } else {
      out.push_back(kReplacement);
      ++p;
      continue;
    }

    // Truncated sequence at the end of input
    if (extra > 0 && end - p <= extra) {
      out.push_back(kReplacement);
      ++p;
      continue;
    }

    bool valid = true;
    for (int i = 1; i <= extra; ++i) {
      if (!isContinuation(p[i])) {
        valid = false;
        break;
      }
      ch = (ch << 6) | (p[i] & 0x3F);
    }

    if (!valid) {
      out.push_back(kReplacement);
      ++p;
      continue;
    }

    out.push_back(static_cast<char32_t>(ch));
    p += extra + 1;
  }

  return out;
}

void appendUtf8(std::string &out, char32_t ch) {
  const auto c = static_cast<uint32_t>(ch);
  if (c < 0x80) {
    out.push_back(static_cast<char>(c));
  } else if (c < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (c >> 12)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (c >> 18)));
    out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
}

std::string encodeUtf8(const std::u32string &text) {
  std::string out;
  out.reserve(text.size() * 3);
  for (char32_t ch : text) {
    appendUtf8(out, ch);
  }
  return out;
}

size_t codePointCount(const std::string &utf8) {
  return decodeUtf8(utf8).size();
}

bool isCjk(char32_t ch) {
  const auto c = static_cast<uint32_t>(ch);
  return (c >= 0x3400 && c <= 0x4DBF) ||   // Extension A
         (c >= 0x4E00 && c <= 0x9FFF) ||   // Unified ideographs
         (c >= 0xF900 && c <= 0xFAFF) ||   // Compatibility ideographs
         (c >= 0x20000 && c <= 0x2FA1F) || // Extensions B-F, supplement
         (c >= 0x3040 && c <= 0x30FF) ||   // Hiragana, katakana
         (c >= 0xAC00 && c <= 0xD7AF) ||   // Hangul syllables
         c == 0x3005 || c == 0x3007;       // 々 〇
}

bool isCjkPunctuation(char32_t ch) {
  const auto c = static_cast<uint32_t>(ch);
  if (c > 0x3000 && c <= 0x303F) {
    return c != 0x3005 && c != 0x3007;
  }
  switch (c) {
  case 0xFF01: // ！
  case 0xFF08: // （
  case 0xFF09: // ）
  case 0xFF0C: // ，
  case 0xFF0E: // ．
  case 0xFF1A: // ：
  case 0xFF1B: // ；
  case 0xFF1F: // ？
  case 0xFF3B: // ［
  case 0xFF3D: // ］
  case 0xFF5B: // ｛
  case 0xFF5D: // ｝
  case 0xFF5E: // ～
  case 0xFF0F: // ／
  case 0x2018: // ‘
  case 0x2019: // ’
  case 0x201C: // “
  case 0x201D: // ”
  case 0x2026: // …
  case 0x2014: // —
  case 0x00B7: // ·
    return true;
  default:
    return false;
  }
}

bool isDigit(char32_t ch) {
  return (ch >= U'0' && ch <= U'9') || (ch >= 0xFF10 && ch <= 0xFF19);
}

bool isLatinOrDigit(char32_t ch) {
  const auto c = static_cast<uint32_t>(ch);
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         isDigit(ch) ||
         (c >= 0x00C0 && c <= 0x024F && c != 0x00D7 && c != 0x00F7) ||
         (c >= 0xFF21 && c <= 0xFF3A) || (c >= 0xFF41 && c <= 0xFF5A);
}

bool isLanguageChar(char32_t ch) { return isCjk(ch) || isLatinOrDigit(ch); }

bool isHorizontalSpace(char32_t ch) {
  return ch == U' ' || ch == U'\t' || ch == 0x00A0 || ch == 0x3000 ||
         ch == U'\f' || ch == U'\v';
}

bool isWhitespace(char32_t ch) {
  return isHorizontalSpace(ch) || ch == U'\n' || ch == U'\r';
}

bool isCjkContext(char32_t ch) { return isCjk(ch) || isCjkPunctuation(ch); }

std::u32string trim(const std::u32string &text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && isWhitespace(text[begin])) {
    ++begin;
  }
  while (end > begin && isWhitespace(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

} // namespace text
} // namespace hanzi
