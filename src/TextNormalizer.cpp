#include "TextNormalizer.hpp"
#include "Utf8Text.hpp"

#include <algorithm>

namespace hanzi {

namespace {

enum class SegmenterState { InSentence, AfterTerminalPunct };

std::vector<std::u32string> splitLines(const std::u32string &text) {
  std::vector<std::u32string> lines;
  std::u32string current;
  for (size_t i = 0; i < text.size(); ++i) {
    char32_t ch = text[i];
    if (ch == U'\r') {
      if (i + 1 < text.size() && text[i + 1] == U'\n') {
        ++i;
      }
      lines.push_back(current);
      current.clear();
    } else if (ch == U'\n') {
      lines.push_back(current);
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  lines.push_back(current);
  return lines;
}

std::u32string joinLines(const std::vector<std::u32string> &lines) {
  std::u32string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out.push_back(U'\n');
    }
    out += lines[i];
  }
  return out;
}

// ASCII punctuation with a full-width counterpart
bool isConvertible(char32_t ch) {
  switch (ch) {
  case U',':
  case U'.':
  case U'?':
  case U'!':
  case U':':
  case U';':
  case U'(':
  case U')':
  case U'"':
  case U'\'':
    return true;
  default:
    return false;
  }
}

// Nearest character carrying language content, skipping spaces and
// punctuation, so the decision does not depend on neighbouring conversions
char32_t languageNeighbour(const std::u32string &line, size_t pos, int step) {
  long i = static_cast<long>(pos) + step;
  while (i >= 0 && i < static_cast<long>(line.size())) {
    char32_t ch = line[static_cast<size_t>(i)];
    if (text::isLanguageChar(ch)) {
      return ch;
    }
    i += step;
  }
  return 0;
}

void trimTrailingSpace(std::u32string &s) {
  while (!s.empty() && text::isHorizontalSpace(s.back())) {
    s.pop_back();
  }
}

bool endsWithTerminal(const std::u32string &s) {
  size_t k = s.size();
  while (k > 0 && TextNormalizer::isClosingMark(s[k - 1])) {
    --k;
  }
  if (k == 0) {
    return false;
  }
  char32_t next = (k < s.size()) ? s[k] : U'\n';
  return TextNormalizer::isTerminalPunctuation(s[k - 1], next);
}

} // anonymous namespace

TextNormalizer::TextNormalizer(const PipelineConfig &config)
    : m_maxParagraphChars(
          static_cast<size_t>(std::max(1, config.maxParagraphChars))) {}

bool TextNormalizer::isTerminalPunctuation(char32_t ch, char32_t next) {
  switch (ch) {
  case 0x3002: // 。
  case 0xFF01: // ！
  case 0xFF1F: // ？
  case 0xFF1B: // ；
  case 0xFF0E: // ．
  case U'!':
  case U'?':
    return true;
  case 0x2026: // …
    return next != 0x2026;
  case U'.':
    return !text::isLatinOrDigit(next) && next != U'.';
  default:
    return false;
  }
}

bool TextNormalizer::isClosingMark(char32_t ch) {
  switch (ch) {
  case 0x201D: // ”
  case 0x2019: // ’
  case 0x300D: // 」
  case 0x300F: // 』
  case 0xFF09: // ）
  case 0x3011: // 】
  case 0x300B: // 》
  case U')':
  case U']':
  case U'"':
    return true;
  default:
    return false;
  }
}

std::u32string TextNormalizer::sentenceSeparator(const std::u32string &previous,
                                                 const std::u32string &next) {
  if (previous.empty() || next.empty()) {
    return U"";
  }
  // Latin sentences keep the space between them
  if (previous.back() < 0x80 && text::isLatinOrDigit(next.front())) {
    return U" ";
  }
  return U"";
}

std::string TextNormalizer::collapseWhitespace(const std::string &input) const {
  std::vector<std::u32string> lines = splitLines(text::decodeUtf8(input));

  for (auto &line : lines) {
    std::u32string out;
    out.reserve(line.size());

    size_t i = 0;
    while (i < line.size()) {
      if (!text::isHorizontalSpace(line[i])) {
        out.push_back(line[i]);
        ++i;
        continue;
      }

      size_t end = i;
      while (end < line.size() && text::isHorizontalSpace(line[end])) {
        ++end;
      }

      // Leading and trailing runs are dropped
      if (!out.empty() && end < line.size()) {
        char32_t before = out.back();
        char32_t after = line[end];
        if (text::isLatinOrDigit(before) || text::isLatinOrDigit(after)) {
          out.push_back(U' ');
        }
      }
      i = end;
    }

    line = std::move(out);
  }

  return text::encodeUtf8(joinLines(lines));
}

std::string TextNormalizer::unifyPunctuation(const std::string &input) const {
  // Quotes and brackets may span a line break, so the whole text is one
  // stream and neighbours are looked up across lines
  std::u32string in = joinLines(splitLines(text::decodeUtf8(input)));
  std::u32string out;
  out.reserve(in.size());
  bool doubleQuoteOpen = false;
  bool singleQuoteOpen = false;
  int openParens = 0;

  size_t i = 0;
  while (i < in.size()) {
    char32_t ch = in[i];
    if (!isConvertible(ch)) {
      out.push_back(ch);
      ++i;
      continue;
    }

    char32_t before = languageNeighbour(in, i, -1);
    char32_t after = languageNeighbour(in, i, +1);
    bool cjkContext = text::isCjk(before) || text::isCjk(after);

    // A line break between the digits may be joined away later
    size_t p = i;
    while (p > 0 && in[p - 1] == U'\n') {
      --p;
    }
    size_t n = i + 1;
    while (n < in.size() && in[n] == U'\n') {
      ++n;
    }
    char32_t prevRaw = (p > 0) ? in[p - 1] : 0;
    char32_t nextRaw = (n < in.size()) ? in[n] : 0;
    bool betweenDigits = text::isDigit(prevRaw) && text::isDigit(nextRaw);

    // Closers follow an opener converted earlier in the text
    if (ch == U')' && openParens > 0) {
      out.push_back(0xFF09);
      --openParens;
      ++i;
      continue;
    }
    if (ch == U'"' && doubleQuoteOpen) {
      out.push_back(0x201D);
      doubleQuoteOpen = false;
      ++i;
      continue;
    }
    if (ch == U'\'' && singleQuoteOpen) {
      out.push_back(0x2019);
      singleQuoteOpen = false;
      ++i;
      continue;
    }

    if (!cjkContext) {
      out.push_back(ch);
      ++i;
      continue;
    }

    if (ch == U'.') {
      size_t run = 1;
      while (i + run < in.size() && in[i + run] == U'.') {
        ++run;
      }
      if (run >= 2) {
        out += U"……";
        i += run;
        continue;
      }
    }

    switch (ch) {
    case U',':
      out.push_back(betweenDigits ? ch : char32_t(0xFF0C));
      break;
    case U'.':
      out.push_back(betweenDigits ? ch : char32_t(0x3002));
      break;
    case U':':
      out.push_back(betweenDigits ? ch : char32_t(0xFF1A));
      break;
    case U';':
      out.push_back(0xFF1B);
      break;
    case U'?':
      out.push_back(0xFF1F);
      break;
    case U'!':
      out.push_back(0xFF01);
      break;
    case U'(':
      out.push_back(0xFF08);
      ++openParens;
      break;
    case U')':
      out.push_back(0xFF09);
      break;
    case U'"':
      out.push_back(0x201C);
      doubleQuoteOpen = true;
      break;
    case U'\'':
      out.push_back(0x2018);
      singleQuoteOpen = true;
      break;
    default:
      out.push_back(ch);
      break;
    }
    ++i;
  }

  return text::encodeUtf8(out);
}

std::string TextNormalizer::resolveLineBreaks(const std::string &input) const {
  std::u32string in = joinLines(splitLines(text::decodeUtf8(input)));
  std::u32string out;
  out.reserve(in.size());

  size_t i = 0;
  while (i < in.size()) {
    if (in[i] != U'\n') {
      out.push_back(in[i]);
      ++i;
      continue;
    }

    // Swallow the whole break, blank lines and indentation included
    size_t end = i;
    while (end < in.size() && text::isWhitespace(in[end])) {
      ++end;
    }
    trimTrailingSpace(out);

    if (!out.empty() && end < in.size()) {
      if (endsWithTerminal(out)) {
        out.push_back(U'\n');
      } else if (text::isLatinOrDigit(out.back()) &&
                 text::isLatinOrDigit(in[end])) {
        out.push_back(U' ');
      }
    }
    i = end;
  }

  return text::encodeUtf8(text::trim(out));
}

std::vector<TextNormalizer::SentenceBlock>
TextNormalizer::segmentSentences(const std::string &input) const {
  std::u32string in = text::decodeUtf8(input);
  std::vector<SentenceBlock> blocks;
  SentenceBlock block;
  std::u32string sentence;
  SegmenterState state = SegmenterState::InSentence;

  auto flushSentence = [&]() {
    std::u32string trimmed = text::trim(sentence);
    if (!trimmed.empty()) {
      block.push_back(std::move(trimmed));
    }
    sentence.clear();
  };
  auto flushBlock = [&]() {
    if (!block.empty()) {
      blocks.push_back(std::move(block));
    }
    block.clear();
  };

  for (size_t i = 0; i < in.size(); ++i) {
    char32_t ch = in[i];
    char32_t next = (i + 1 < in.size()) ? in[i + 1] : U'\n';

    if (ch == U'\n' || ch == U'\r') {
      flushSentence();
      flushBlock();
      state = SegmenterState::InSentence;
      continue;
    }

    if (state == SegmenterState::AfterTerminalPunct) {
      if (isTerminalPunctuation(ch, next) || isClosingMark(ch)) {
        sentence.push_back(ch);
        continue;
      }
      flushSentence();
      state = SegmenterState::InSentence;
    }

    if (sentence.empty() && text::isHorizontalSpace(ch)) {
      continue;
    }
    sentence.push_back(ch);
    if (isTerminalPunctuation(ch, next)) {
      state = SegmenterState::AfterTerminalPunct;
    }
  }

  flushSentence();
  flushBlock();
  return blocks;
}

CleanedText
TextNormalizer::assembleParagraphs(const std::vector<SentenceBlock> &blocks) const {
  std::vector<std::u32string> paragraphs;
  std::vector<size_t> sentencesPerParagraph;

  for (const auto &block : blocks) {
    std::u32string current;
    size_t count = 0;
    const std::u32string *last = nullptr;

    for (const auto &sentence : block) {
      std::u32string separator =
          last != nullptr ? sentenceSeparator(*last, sentence) : U"";

      if (count > 0 && current.size() + separator.size() + sentence.size() >
                           m_maxParagraphChars) {
        paragraphs.push_back(std::move(current));
        sentencesPerParagraph.push_back(count);
        current.clear();
        count = 0;
        separator.clear();
      }

      current += separator;
      current += sentence;
      ++count;
      last = &sentence;
    }

    if (count > 0) {
      paragraphs.push_back(std::move(current));
      sentencesPerParagraph.push_back(count);
    }
  }

  verifyParagraphs(blocks, paragraphs, sentencesPerParagraph);

  CleanedText cleaned;
  for (const auto &paragraph : paragraphs) {
    cleaned.paragraphs.push_back(text::encodeUtf8(paragraph));
  }
  for (const auto &block : blocks) {
    for (const auto &sentence : block) {
      cleaned.sentences.push_back(text::encodeUtf8(sentence));
    }
  }
  return cleaned;
}

void TextNormalizer::verifyParagraphs(
    const std::vector<SentenceBlock> &blocks,
    const std::vector<std::u32string> &paragraphs,
    const std::vector<size_t> &sentencesPerParagraph) const {
  std::vector<const std::u32string *> sentences;
  for (const auto &block : blocks) {
    for (const auto &sentence : block) {
      sentences.push_back(&sentence);
    }
  }

  size_t next = 0;
  for (size_t p = 0; p < paragraphs.size(); ++p) {
    size_t count = sentencesPerParagraph[p];
    if (count == 0 || next + count > sentences.size()) {
      throw NormalizationError("paragraph " + std::to_string(p) +
                               " does not map onto the sentence stream");
    }

    std::u32string rebuilt;
    for (size_t s = 0; s < count; ++s) {
      if (s > 0) {
        rebuilt += sentenceSeparator(*sentences[next + s - 1],
                                     *sentences[next + s]);
      }
      rebuilt += *sentences[next + s];
    }
    if (rebuilt != paragraphs[p]) {
      throw NormalizationError("paragraph " + std::to_string(p) +
                               " lost or reordered sentence text");
    }
    if (count > 1 && paragraphs[p].size() > m_maxParagraphChars) {
      throw NormalizationError("paragraph " + std::to_string(p) +
                               " exceeds the length bound at a legal split");
    }
    next += count;
  }

  if (next != sentences.size()) {
    throw NormalizationError("paragraphs dropped " +
                             std::to_string(sentences.size() - next) +
                             " sentences");
  }
}

CleanedText TextNormalizer::normalize(const std::string &input) const {
  std::string collapsed = collapseWhitespace(input);
  std::string unified = unifyPunctuation(collapsed);
  std::string joined = resolveLineBreaks(unified);
  return assembleParagraphs(segmentSentences(joined));
}

} // namespace hanzi
