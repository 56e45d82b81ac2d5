#ifndef HANZI_TEXT_CLEANING_HPP
#define HANZI_TEXT_CLEANING_HPP

#include "PipelineConfig.hpp"
#include "PipelineTypes.hpp"

#include <string>

namespace hanzi {

/**
 * @brief Result of cleaning one merged text
 */
struct CleaningResult {
  bool success = false;
  ErrorKind error = ErrorKind::None;
  std::string errorMessage;
  std::string filteredText; ///< Text after the garbled-text filter
  CleanedText cleaned;      ///< Normalized paragraphs
  DocumentMetadata metadata;
  ProcessingStats stats;
};

/**
 * @brief Filter, normalize and measure a merged OCR text
 *
 * @param mergedText Text produced by the slice merger (or read from a file)
 * @param sourcePath Path the metadata is derived from
 * @param config Pipeline configuration
 * @param applyFilter Run the garbled-text filter before normalizing
 */
CleaningResult cleanRecognizedText(const std::string &mergedText,
                                   const std::string &sourcePath,
                                   const PipelineConfig &config,
                                   bool applyFilter = true);

} // namespace hanzi

#endif // HANZI_TEXT_CLEANING_HPP
