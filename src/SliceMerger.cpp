#include "SliceMerger.hpp"
#include "Utf8Text.hpp"

#include <algorithm>
#include <cmath>

namespace hanzi {

namespace {

size_t significantLength(const std::u32string &s) {
  return static_cast<size_t>(std::count_if(
      s.begin(), s.end(), [](char32_t ch) { return !text::isWhitespace(ch); }));
}

// Only horizontal space separates pos from the start of its line
bool startsLine(const std::u32string &s, size_t pos) {
  while (pos > 0 && text::isHorizontalSpace(s[pos - 1])) {
    --pos;
  }
  return pos == 0 || s[pos - 1] == U'\n';
}

// A line break follows pos, past any horizontal space
bool endsAtLineBreak(const std::u32string &s, size_t pos) {
  size_t i = pos + 1;
  while (i < s.size() && text::isHorizontalSpace(s[i])) {
    ++i;
  }
  return i < s.size() && s[i] == U'\n';
}

} // anonymous namespace

SliceMerger::SliceMerger(const PipelineConfig &config)
    : m_overlapRatio(config.sliceHeightPx > 0
                         ? static_cast<double>(config.overlapPx) /
                               config.sliceHeightPx
                         : 0.0),
      m_minWindow(static_cast<size_t>(std::max(2, config.mergeWindowChars))) {}

size_t SliceMerger::searchWindow(size_t previousLength,
                                 size_t nextLength) const {
  // Text density is roughly uniform down a slice, so the overlap band holds
  // about overlapRatio of each slice's text. Twice that absorbs uneven
  // layout.
  double expected = 2.0 * m_overlapRatio *
                    static_cast<double>(std::max(previousLength, nextLength));
  return std::max(m_minWindow, static_cast<size_t>(std::ceil(expected)));
}

size_t SliceMerger::minimumAlignment(size_t window) {
  // The window is twice the expected duplicate, so a real band fills about
  // half of it
  return std::max(kMinAlignmentChars, window / kWindowShare);
}

size_t SliceMerger::findOverlap(const std::u32string &tail,
                                const std::u32string &head, size_t window,
                                size_t minMatch) {
  // Positions of the last `window` significant characters of tail (in
  // reading order) and the first `window` significant characters of head
  std::vector<size_t> tailPos;
  for (size_t i = tail.size(); i > 0 && tailPos.size() < window; --i) {
    if (!text::isWhitespace(tail[i - 1])) {
      tailPos.push_back(i - 1);
    }
  }
  std::reverse(tailPos.begin(), tailPos.end());

  std::vector<size_t> headPos;
  for (size_t i = 0; i < head.size() && headPos.size() < window; ++i) {
    if (!text::isWhitespace(head[i])) {
      headPos.push_back(i);
    }
  }

  size_t longest = std::min(tailPos.size(), headPos.size());
  for (size_t k = longest; k >= kMinAlignmentChars; --k) {
    size_t tailStart = tailPos.size() - k;
    bool matches = true;
    bool hasLanguage = false;
    for (size_t j = 0; j < k; ++j) {
      char32_t ch = tail[tailPos[tailStart + j]];
      if (ch != head[headPos[j]]) {
        matches = false;
        break;
      }
      hasLanguage = hasLanguage || text::isLanguageChar(ch);
    }
    // Punctuation-only coincidences are not evidence of a shared band
    if (!matches || !hasLanguage) {
      continue;
    }
    if (k >= minMatch || (startsLine(tail, tailPos[tailStart]) &&
                          endsAtLineBreak(head, headPos[k - 1]))) {
      return headPos[k - 1] + 1;
    }
  }

  return 0;
}

size_t SliceMerger::appendSlice(std::u32string &merged,
                                const std::u32string &previous,
                                const std::u32string &next) const {
  if (next.empty()) {
    return 0;
  }
  if (merged.empty()) {
    merged = next;
    return 0;
  }

  size_t covered = 0;
  if (!previous.empty()) {
    size_t window =
        searchWindow(significantLength(previous), significantLength(next));
    covered = findOverlap(previous, next, window, minimumAlignment(window));
  }

  if (covered == 0) {
    merged += U'\n';
    merged += next;
    return 0;
  }

  // Keep a line break that follows the duplicate, it may end a paragraph
  size_t restStart = covered;
  while (restStart < next.size() && text::isHorizontalSpace(next[restStart])) {
    ++restStart;
  }
  merged.append(next, restStart, std::u32string::npos);
  return significantLength(next.substr(0, covered));
}

MergeOutcome SliceMerger::mergePage(std::vector<RecognitionResult> results) const {
  std::stable_sort(results.begin(), results.end(),
                   [](const RecognitionResult &a, const RecognitionResult &b) {
                     return a.sliceIndex < b.sliceIndex;
                   });

  MergeOutcome outcome;
  std::u32string merged;
  std::u32string previous;
  int previousIndex = -1;

  for (const auto &result : results) {
    std::u32string current = text::trim(text::decodeUtf8(result.text));

    // A failed or missing slice breaks the overlap chain
    if (current.empty() || result.sliceIndex != previousIndex + 1) {
      previous.clear();
    }
    previousIndex = result.sliceIndex;
    if (current.empty()) {
      continue;
    }

    size_t removed = appendSlice(merged, previous, current);
    if (removed > 0) {
      outcome.collapsedOverlaps++;
      outcome.removedChars += removed;
    }
    previous = std::move(current);
  }

  outcome.text = text::encodeUtf8(merged);
  return outcome;
}

MergeOutcome
SliceMerger::mergeDocument(const std::vector<std::string> &pageTexts) const {
  MergeOutcome outcome;
  for (const auto &page : pageTexts) {
    if (page.empty()) {
      continue;
    }
    if (!outcome.text.empty()) {
      outcome.text += '\n';
    }
    outcome.text += page;
  }
  return outcome;
}

} // namespace hanzi
