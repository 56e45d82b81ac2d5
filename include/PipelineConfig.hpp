#ifndef HANZI_PIPELINE_CONFIG_HPP
#define HANZI_PIPELINE_CONFIG_HPP

#include <tesseract/publictypes.h>

#include <string>

namespace hanzi {

/**
 * @brief Configuration shared by every stage of the extraction pipeline
 *
 * A single immutable value of this type is handed to the rasterizer, the
 * merger, the filter and the normalizer. Slice geometry is expressed in page
 * units (one unit = one pixel of the page rendered at 72 dpi); the rendered
 * slice images are @c scale times larger.
 */
struct PipelineConfig {
  int sliceHeightPx = 1500;   ///< Nominal slice height in page units
  int overlapPx = 100;        ///< Overlap between adjacent slices
  int mergeWindowChars = 16;  ///< Smallest overlap search window, characters
  double scale = 3.0;         ///< Render zoom factor (dpi = 72 * scale)
  double garbledRatioThreshold = 0.4; ///< Minimum normal-character ratio
  int symbolRunLength = 10;   ///< Symbol runs this long are always removed
  int maxParagraphChars = 500; ///< Paragraph size bound in characters
  std::string languageHint = "chi_sim+eng"; ///< Tesseract language string
  std::string fallbackLanguage =
      ""; ///< Used when the hint's data is missing (empty = fatal)
  std::string tessDataPath =
      ""; ///< Path to tessdata directory (empty = TESSDATA_PREFIX/default)
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_SINGLE_BLOCK; ///< Page segmentation mode
  bool preprocessImage = false;   ///< Grayscale + threshold before OCR
  int ocrTimeoutMs = 0;           ///< Per-call OCR deadline (0 = none)
  int workerCount = defaultWorkerCount(); ///< Concurrent OCR calls
  bool verbose = true;                    ///< Print progress to stdout

  /**
   * @brief Check the configuration for values no stage can work with
   * @return Empty string if valid, otherwise a description of the problem
   */
  std::string validate() const;

  /**
   * @brief Hardware concurrency, never less than one
   */
  static int defaultWorkerCount();
};

} // namespace hanzi

#endif // HANZI_PIPELINE_CONFIG_HPP
