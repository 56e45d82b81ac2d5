#ifndef HANZI_OCR_ENGINE_HPP
#define HANZI_OCR_ENGINE_HPP

#include <opencv2/core.hpp>

#include <string>

namespace hanzi {

/**
 * @brief Failures an OCR engine can report
 */
enum class EngineErrorKind {
  None,                ///< No error
  EngineUnavailable,   ///< The engine could not be started or crashed
  LanguageDataMissing, ///< Trained data for a requested language is missing
  Timeout              ///< Recognition exceeded its deadline
};

/**
 * @brief Human-readable name of an engine error
 */
const char *engineErrorName(EngineErrorKind kind);

/**
 * @brief Result of a single recognition call
 */
struct EngineOutcome {
  bool success = false;       ///< Whether recognition completed
  std::string text;           ///< Recognized UTF-8 text
  float meanConfidence = 0;   ///< Mean word confidence (0-100)
  EngineErrorKind error = EngineErrorKind::None;
  std::string errorMessage;   ///< Error message if failed
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Recognition capability consumed by the pipeline
 *
 * One instance is used by one thread at a time. Concurrent use goes through
 * an EnginePool holding several instances.
 */
class OCREngine {
public:
  virtual ~OCREngine() = default;

  /**
   * @brief Prepare the engine for a language hint
   * @param languageHint Language string such as "chi_sim+eng"
   * @param errorMessage Receives a description when initialization fails
   * @return EngineErrorKind::None on success
   */
  virtual EngineErrorKind initialize(const std::string &languageHint,
                                     std::string &errorMessage) = 0;

  /**
   * @brief Recognize the text of an image
   * @param image BGR, BGRA or grayscale image
   * @param languageHint Language string; the engine re-initializes if it
   * differs from the current one
   */
  virtual EngineOutcome recognize(const cv::Mat &image,
                                  const std::string &languageHint) = 0;
};

} // namespace hanzi

#endif // HANZI_OCR_ENGINE_HPP
