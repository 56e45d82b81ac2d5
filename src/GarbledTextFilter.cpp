#include "GarbledTextFilter.hpp"
#include "Utf8Text.hpp"

#include <algorithm>
#include <vector>

namespace hanzi {

namespace {

// ASCII punctuation accepted as ordinary text
const std::u32string kPlainPunctuation = U"\\/:.,!?;\"'()[]{}-+=<>";

} // anonymous namespace

GarbledTextFilter::GarbledTextFilter(const PipelineConfig &config)
    : m_ratioThreshold(config.garbledRatioThreshold),
      m_symbolRunLength(static_cast<size_t>(std::max(2, config.symbolRunLength))) {
}

bool GarbledTextFilter::isNormalChar(char32_t ch) {
  if (text::isLanguageChar(ch) || text::isWhitespace(ch) || ch == U'_') {
    return true;
  }
  if ((ch >= 0x3000 && ch <= 0x303F) || (ch >= 0xFF00 && ch <= 0xFFEF)) {
    return true;
  }
  if (text::isCjkPunctuation(ch)) {
    return true;
  }
  return kPlainPunctuation.find(ch) != std::u32string::npos;
}

bool GarbledTextFilter::isSymbolChar(char32_t ch) {
  return !text::isLanguageChar(ch) && !text::isWhitespace(ch) &&
         !text::isCjkPunctuation(ch);
}

SpanAssessment GarbledTextFilter::assess(const std::string &span) const {
  SpanAssessment assessment;
  std::u32string chars = text::decodeUtf8(span);

  size_t run = 0;
  for (char32_t ch : chars) {
    assessment.totalChars++;
    if (isNormalChar(ch)) {
      assessment.normalChars++;
    }
    if (!text::isWhitespace(ch)) {
      assessment.nonSpaceChars++;
    }
    if (text::isLanguageChar(ch)) {
      assessment.languageChars++;
    }

    run = isSymbolChar(ch) ? run + 1 : 0;
    assessment.longestSymbolRun = std::max(assessment.longestSymbolRun, run);
  }

  if (assessment.totalChars > 0) {
    assessment.normalRatio =
        static_cast<double>(assessment.normalChars) / assessment.totalChars;
  }
  if (assessment.nonSpaceChars > 0) {
    assessment.languageShare =
        static_cast<double>(assessment.languageChars) /
        assessment.nonSpaceChars;
  }

  // A majority of language characters always protects the span
  bool mostlyLanguage = assessment.languageShare > 0.5;
  assessment.isNoise = assessment.nonSpaceChars > 0 && !mostlyLanguage &&
                       assessment.normalRatio < m_ratioThreshold;

  return assessment;
}

std::string GarbledTextFilter::stripSymbolRuns(const std::string &span,
                                               int *removedRuns) const {
  std::u32string chars = text::decodeUtf8(span);
  std::u32string out;
  out.reserve(chars.size());
  int removed = 0;

  size_t i = 0;
  while (i < chars.size()) {
    if (!isSymbolChar(chars[i])) {
      out.push_back(chars[i]);
      ++i;
      continue;
    }

    size_t end = i;
    while (end < chars.size() && isSymbolChar(chars[end])) {
      ++end;
    }

    if (end - i >= m_symbolRunLength) {
      removed++;
    } else {
      out.append(chars, i, end - i);
    }
    i = end;
  }

  if (removedRuns != nullptr) {
    *removedRuns = removed;
  }
  return text::encodeUtf8(out);
}

FilterOutcome GarbledTextFilter::filter(const std::string &text) const {
  FilterOutcome outcome;

  std::vector<std::string> kept;

  // A trailing line break leaves an empty last line, kept like any other
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string line = text.substr(start, end - start);
    start = end + 1;

    SpanAssessment assessment = assess(line);

    if (assessment.nonSpaceChars == 0) {
      kept.push_back(line);
      continue;
    }

    // Artifact runs go first so they cannot sink the rest of the line
    if (assessment.longestSymbolRun >= m_symbolRunLength) {
      int removed = 0;
      line = stripSymbolRuns(line, &removed);
      outcome.removedSymbolRuns += removed;
      assessment = assess(line);

      if (assessment.languageChars == 0) {
        outcome.droppedSpans++;
        continue;
      }
    }

    if (assessment.isNoise) {
      outcome.droppedSpans++;
      continue;
    }

    kept.push_back(line);
  }

  for (size_t i = 0; i < kept.size(); ++i) {
    if (i > 0) {
      outcome.text += '\n';
    }
    outcome.text += kept[i];
  }

  return outcome;
}

} // namespace hanzi
