#include "PipelineConfig.hpp"

#include <sstream>
#include <thread>

namespace hanzi {

std::string PipelineConfig::validate() const {
  std::ostringstream problem;

  if (sliceHeightPx <= 0) {
    problem << "slice height must be positive (got " << sliceHeightPx << ")";
  } else if (overlapPx < 0) {
    problem << "overlap must not be negative (got " << overlapPx << ")";
  } else if (overlapPx >= sliceHeightPx) {
    problem << "overlap (" << overlapPx
            << ") must be smaller than the slice height (" << sliceHeightPx
            << ")";
  } else if (mergeWindowChars < 2) {
    problem << "merge window must be at least 2 characters (got "
            << mergeWindowChars << ")";
  } else if (!(scale > 0.0)) {
    problem << "scale must be positive (got " << scale << ")";
  } else if (garbledRatioThreshold < 0.0 || garbledRatioThreshold > 1.0) {
    problem << "garbled ratio threshold must be within [0, 1] (got "
            << garbledRatioThreshold << ")";
  } else if (symbolRunLength < 2) {
    problem << "symbol run length must be at least 2 (got "
            << symbolRunLength << ")";
  } else if (maxParagraphChars < 1) {
    problem << "maximum paragraph length must be positive (got "
            << maxParagraphChars << ")";
  } else if (languageHint.empty()) {
    problem << "language hint must not be empty";
  } else if (ocrTimeoutMs < 0) {
    problem << "OCR timeout must not be negative (got " << ocrTimeoutMs
            << ")";
  } else if (workerCount < 1) {
    problem << "worker count must be at least 1 (got " << workerCount << ")";
  }

  return problem.str();
}

int PipelineConfig::defaultWorkerCount() {
  unsigned int hardware = std::thread::hardware_concurrency();
  return hardware > 0 ? static_cast<int>(hardware) : 1;
}

} // namespace hanzi
