#ifndef HANZI_TEXT_NORMALIZER_HPP
#define HANZI_TEXT_NORMALIZER_HPP

#include "PipelineConfig.hpp"
#include "PipelineTypes.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace hanzi {

/**
 * @brief Raised when the normalizer breaks one of its own invariants
 *
 * Well-formed input never triggers it; an occurrence is a bug and is
 * reported to the caller instead of being swallowed.
 */
class NormalizationError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

/**
 * @brief Turns filtered OCR text into readable paragraphs
 *
 * The steps run in this order and can each be called on their own:
 * - collapseWhitespace(): drop the spaces OCR inserts between CJK
 *   characters, keep spaces next to Latin letters and digits
 * - unifyPunctuation(): map ASCII punctuation in CJK context to the
 *   full-width forms, pairing quotes and brackets across lines
 * - resolveLineBreaks(): join lines broken mid-sentence, keep a break after
 *   terminal punctuation as a paragraph boundary
 * - segmentSentences() / assembleParagraphs(): split into sentences and pack
 *   them greedily into paragraphs of at most @c maxParagraphChars
 *
 * Running normalize() on the serialized output of normalize() returns the
 * same paragraphs.
 */
class TextNormalizer {
public:
  /**
   * @brief Sentences of one paragraph delimited by a genuine line break
   */
  using SentenceBlock = std::vector<std::u32string>;

  explicit TextNormalizer(const PipelineConfig &config);

  /**
   * @brief Remove spurious whitespace line by line
   *
   * Whitespace between two CJK characters (or around CJK punctuation) is
   * removed; a run next to a Latin letter or digit collapses to one space.
   * Line ends are trimmed and CR/CRLF become LF.
   */
  std::string collapseWhitespace(const std::string &text) const;

  /**
   * @brief Map ASCII punctuation to full-width CJK punctuation
   *
   * Only punctuation whose nearest language character on either side is
   * CJK is mapped, looking across line breaks. Quote and parenthesis state
   * carries over from one line to the next. Decimal points, thousands
   * separators and times between digits are left alone, and two or more
   * dots become an ellipsis.
   */
  std::string unifyPunctuation(const std::string &text) const;

  /**
   * @brief Resolve line breaks into continuations or paragraph boundaries
   *
   * A break after terminal punctuation (optionally followed by closing
   * quotes or brackets) stays as a single newline. Any other break is
   * removed, or replaced with a space when it separates two Latin words.
   */
  std::string resolveLineBreaks(const std::string &text) const;

  /**
   * @brief Split text into sentences, grouped by paragraph boundary
   */
  std::vector<SentenceBlock> segmentSentences(const std::string &text) const;

  /**
   * @brief Pack sentences into paragraphs
   * @throws NormalizationError if the packing violates its invariants
   */
  CleanedText assembleParagraphs(const std::vector<SentenceBlock> &blocks) const;

  /**
   * @brief Run every step
   * @throws NormalizationError on an internal invariant violation
   */
  CleanedText normalize(const std::string &text) const;

  /**
   * @brief Whether @p ch ends a sentence when followed by @p next
   */
  static bool isTerminalPunctuation(char32_t ch, char32_t next);

  /**
   * @brief Closing quote or bracket that stays with the preceding sentence
   */
  static bool isClosingMark(char32_t ch);

  /**
   * @brief Separator placed between two sentences of one paragraph
   */
  static std::u32string sentenceSeparator(const std::u32string &previous,
                                          const std::u32string &next);

  size_t maxParagraphChars() const { return m_maxParagraphChars; }

private:
  void verifyParagraphs(const std::vector<SentenceBlock> &blocks,
                        const std::vector<std::u32string> &paragraphs,
                        const std::vector<size_t> &sentencesPerParagraph) const;

  size_t m_maxParagraphChars;
};

} // namespace hanzi

#endif // HANZI_TEXT_NORMALIZER_HPP
