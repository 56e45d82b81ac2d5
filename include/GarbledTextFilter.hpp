#ifndef HANZI_GARBLED_TEXT_FILTER_HPP
#define HANZI_GARBLED_TEXT_FILTER_HPP

#include "PipelineConfig.hpp"

#include <string>

namespace hanzi {

/**
 * @brief Character statistics of one text span
 */
struct SpanAssessment {
  size_t totalChars = 0;       ///< All code points, whitespace included
  size_t normalChars = 0;      ///< Language, whitespace and punctuation
  size_t nonSpaceChars = 0;    ///< Code points that are not whitespace
  size_t languageChars = 0;    ///< CJK, Latin letters and digits
  size_t longestSymbolRun = 0; ///< Longest run of symbol characters
  double normalRatio = 1.0;    ///< normalChars / totalChars
  double languageShare = 0.0;  ///< languageChars / nonSpaceChars
  bool isNoise = false;        ///< Classified as garbled
};

/**
 * @brief Result of filtering a text
 */
struct FilterOutcome {
  std::string text;          ///< Text with noise removed
  int droppedSpans = 0;      ///< Lines removed entirely
  int removedSymbolRuns = 0; ///< Symbol runs cut out of kept lines
};

/**
 * @brief Detects and removes OCR noise line by line
 *
 * A line is noise when the share of recognizable characters (CJK, letters,
 * digits, whitespace and common punctuation) falls below the configured
 * threshold. Runs of consecutive symbol characters at least
 * @c symbolRunLength long are cut out of any line. The filter never drops
 * a line in which most non-whitespace characters are language characters.
 *
 * Diagrams and charts inside scanned pages can still leave small amounts of
 * garbled text behind.
 */
class GarbledTextFilter {
public:
  explicit GarbledTextFilter(const PipelineConfig &config);

  /**
   * @brief Compute the statistics of one span and classify it
   */
  SpanAssessment assess(const std::string &span) const;

  bool isNoise(const std::string &span) const { return assess(span).isNoise; }

  /**
   * @brief Cut symbol runs of the configured length out of a span
   * @param span UTF-8 span
   * @param removedRuns Receives the number of runs cut (may be null)
   */
  std::string stripSymbolRuns(const std::string &span,
                              int *removedRuns = nullptr) const;

  /**
   * @brief Filter a multi-line text
   */
  FilterOutcome filter(const std::string &text) const;

  /// Character counted as recognized content in the noise ratio
  static bool isNormalChar(char32_t ch);

  /// Non-linguistic symbol that can form an artifact run
  static bool isSymbolChar(char32_t ch);

private:
  double m_ratioThreshold;
  size_t m_symbolRunLength;
};

} // namespace hanzi

#endif // HANZI_GARBLED_TEXT_FILTER_HPP
