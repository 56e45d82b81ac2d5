#ifndef HANZI_SLICE_MERGER_HPP
#define HANZI_SLICE_MERGER_HPP

#include "PipelineConfig.hpp"
#include "PipelineTypes.hpp"

#include <string>
#include <vector>

namespace hanzi {

/**
 * @brief Result of stitching slice or page texts together
 */
struct MergeOutcome {
  std::string text;          ///< Merged UTF-8 text
  int collapsedOverlaps = 0; ///< Boundaries where a duplicate was removed
  size_t removedChars = 0;   ///< Characters dropped as duplicates
};

/**
 * @brief Stitches per-slice OCR text into page and document text
 *
 * Adjacent slices share an overlap band, so the end of one slice's text is
 * usually repeated at the start of the next. The merger looks for the
 * longest suffix of the previous slice that equals a prefix of the next one
 * (ignoring whitespace) within a window proportional to the overlap ratio,
 * and keeps a single copy. A match must cover a quarter of the window, or
 * else consist of whole lines in both slices; anything shorter is taken for
 * a coincidence. When no reliable alignment exists the slices are simply
 * concatenated: a possible duplicate is preferred to lost text.
 */
class SliceMerger {
public:
  /// Shortest alignment accepted, and only when it spans whole lines
  static constexpr size_t kMinAlignmentChars = 2;
  /// An alignment must cover 1/kWindowShare of the search window
  static constexpr size_t kWindowShare = 4;

  explicit SliceMerger(const PipelineConfig &config);

  /**
   * @brief Merge the recognition results of one page
   *
   * Results are ordered by slice index first, so they may arrive in
   * completion order.
   */
  MergeOutcome mergePage(std::vector<RecognitionResult> results) const;

  /**
   * @brief Concatenate page texts in page order, skipping empty pages
   */
  MergeOutcome mergeDocument(const std::vector<std::string> &pageTexts) const;

  /**
   * @brief Append @p next to @p merged, collapsing a duplicated overlap
   * @param merged Text accumulated so far (modified)
   * @param previous Text of the slice directly above @p next, empty when
   * that slice produced nothing
   * @param next Text of the following slice
   * @return Number of characters of @p next dropped as duplicate
   */
  size_t appendSlice(std::u32string &merged, const std::u32string &previous,
                     const std::u32string &next) const;

  /**
   * @brief Alignment search window in characters for two slice texts
   */
  size_t searchWindow(size_t previousLength, size_t nextLength) const;

  /**
   * @brief Shortest alignment accepted within @p window, whole lines aside
   */
  static size_t minimumAlignment(size_t window);

  /**
   * @brief Find the duplicated region between two texts
   *
   * Compares the last significant (non-whitespace) characters of @p tail
   * with the first significant characters of @p head. An alignment must
   * contain a language character and be at least @p minMatch long, or at
   * least kMinAlignmentChars long when it starts a line of @p tail and is
   * followed by a line break in @p head.
   *
   * @return Number of code points at the start of @p head covered by the
   * longest alignment, or 0 when there is none
   */
  static size_t findOverlap(const std::u32string &tail,
                            const std::u32string &head, size_t window,
                            size_t minMatch);

private:
  double m_overlapRatio;
  size_t m_minWindow;
};

} // namespace hanzi

#endif // HANZI_SLICE_MERGER_HPP
