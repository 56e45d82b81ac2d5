#include "TextCleaning.hpp"
#include "FileNameMetadata.hpp"
#include "GarbledTextFilter.hpp"
#include "TextNormalizer.hpp"
#include "Utf8Text.hpp"

namespace hanzi {

CleaningResult cleanRecognizedText(const std::string &mergedText,
                                   const std::string &sourcePath,
                                   const PipelineConfig &config,
                                   bool applyFilter) {
  CleaningResult result;
  result.metadata = extractFileNameMetadata(sourcePath);
  result.stats.rawChars = text::codePointCount(mergedText);

  if (applyFilter) {
    GarbledTextFilter filter(config);
    FilterOutcome filtered = filter.filter(mergedText);
    result.filteredText = std::move(filtered.text);
    result.stats.droppedSpans = filtered.droppedSpans;
    result.stats.removedSymbolRuns = filtered.removedSymbolRuns;
  } else {
    result.filteredText = mergedText;
  }
  result.stats.filteredChars = text::codePointCount(result.filteredText);

  try {
    TextNormalizer normalizer(config);
    result.cleaned = normalizer.normalize(result.filteredText);
  } catch (const NormalizationError &e) {
    result.error = ErrorKind::Normalization;
    result.errorMessage = std::string("Text normalization failed: ") + e.what();
    return result;
  }

  result.stats.cleanedChars = text::codePointCount(result.cleaned.toString());
  result.stats.sentenceCount = result.cleaned.sentences.size();
  result.stats.paragraphCount = result.cleaned.paragraphs.size();
  if (result.stats.rawChars > 0) {
    result.stats.compressionRatio =
        static_cast<double>(result.stats.cleanedChars) / result.stats.rawChars;
  }

  result.success = true;
  return result;
}

} // namespace hanzi
