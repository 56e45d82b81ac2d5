#ifndef HANZI_UTF8_TEXT_HPP
#define HANZI_UTF8_TEXT_HPP

#include <cstddef>
#include <string>

namespace hanzi {
namespace text {

/**
 * @brief Decode UTF-8 into code points
 *
 * Malformed sequences decode to U+FFFD, one per offending byte.
 */
std::u32string decodeUtf8(const std::string &utf8);

/**
 * @brief Encode code points as UTF-8
 */
std::string encodeUtf8(const std::u32string &text);

/**
 * @brief Append one code point to a UTF-8 string
 */
void appendUtf8(std::string &out, char32_t ch);

/**
 * @brief Number of code points in a UTF-8 string
 */
size_t codePointCount(const std::string &utf8);

/// CJK ideographs, kana and hangul syllables
bool isCjk(char32_t ch);

/// Ideographic punctuation and the full-width forms used in Chinese prose
bool isCjkPunctuation(char32_t ch);

/// ASCII, Latin-1/Extended and full-width letters and digits
bool isLatinOrDigit(char32_t ch);

/// ASCII or full-width decimal digit
bool isDigit(char32_t ch);

/// CJK or Latin/digit: characters that carry language content
bool isLanguageChar(char32_t ch);

/// Space, tab, no-break space and ideographic space (not line breaks)
bool isHorizontalSpace(char32_t ch);

/// Horizontal space or a line break
bool isWhitespace(char32_t ch);

/// Character that puts neighbouring punctuation in a CJK context
bool isCjkContext(char32_t ch);

/**
 * @brief Remove leading and trailing whitespace
 */
std::u32string trim(const std::u32string &text);

} // namespace text
} // namespace hanzi

#endif // HANZI_UTF8_TEXT_HPP
