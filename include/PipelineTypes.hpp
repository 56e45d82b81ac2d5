#ifndef HANZI_PIPELINE_TYPES_HPP
#define HANZI_PIPELINE_TYPES_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace hanzi {

/**
 * @brief Classes of failure the pipeline distinguishes
 */
enum class ErrorKind {
  None,          ///< No error
  Rasterization, ///< A page could not be rendered (page is skipped)
  Engine,        ///< An OCR call failed (unit yields empty text)
  Configuration, ///< Unusable configuration or language data (run aborts)
  Normalization, ///< Text normalizer invariant was violated
  Document,      ///< Document could not be opened or has no content
  Cancelled      ///< Processing was aborted on request
};

/**
 * @brief Human-readable name of an error kind
 */
const char *errorKindName(ErrorKind kind);

/**
 * @brief A vertical band of a page submitted to OCR on its own
 */
struct Slice {
  int index = 0;     ///< 0-indexed position within the page
  int top = 0;       ///< Top edge in page units
  int height = 0;    ///< Height in page units
  int overlapPx = 0; ///< Overlap with the previous slice (0 for the first)
};

/**
 * @brief Text recognized for one slice or one standalone image
 */
struct RecognitionResult {
  std::string text;          ///< Recognized UTF-8 text
  int pageIndex = 0;         ///< 0-indexed page
  int sliceIndex = 0;        ///< 0-indexed slice within the page
  int verticalOffset = 0;    ///< Slice top in page units
  float meanConfidence = 0;  ///< Engine confidence (0-100), 0 if unknown
};

/**
 * @brief An isolated failure of one page or slice
 */
struct UnitError {
  int pageIndex = -1;  ///< 0-indexed page, -1 for a standalone image
  int sliceIndex = -1; ///< 0-indexed slice, -1 when the whole page failed
  ErrorKind kind = ErrorKind::None;
  std::string stage;   ///< Pipeline stage that failed
  std::string message; ///< Diagnostic message
};

/**
 * @brief Final normalized text as paragraphs
 */
struct CleanedText {
  std::vector<std::string> paragraphs; ///< Paragraphs in reading order
  std::vector<std::string> sentences;  ///< Sentences the paragraphs hold

  /**
   * @brief Paragraphs joined with newlines
   */
  std::string toString() const;
};

/**
 * @brief Sidecar metadata derived from the source file name
 */
struct DocumentMetadata {
  std::string title;    ///< Candidate title, empty if none
  std::string date;     ///< Date as YYYY-MM-DD, empty if none
  std::string pageInfo; ///< Trailing file-name fields, empty if none
};

/**
 * @brief Character counts collected while cleaning a document
 */
struct ProcessingStats {
  size_t rawChars = 0;       ///< Merged text before filtering
  size_t filteredChars = 0;  ///< After the garbled-text filter
  size_t cleanedChars = 0;   ///< Serialized cleaned text
  int droppedSpans = 0;      ///< Spans removed as noise
  int removedSymbolRuns = 0; ///< Symbol runs cut out of kept spans
  int collapsedOverlaps = 0; ///< Slice boundaries de-duplicated
  size_t sentenceCount = 0;
  size_t paragraphCount = 0;
  double compressionRatio = 0; ///< cleanedChars / rawChars
};

} // namespace hanzi

#endif // HANZI_PIPELINE_TYPES_HPP
