#ifndef HANZI_TESSERACT_ENGINE_HPP
#define HANZI_TESSERACT_ENGINE_HPP

#include "OCREngine.hpp"
#include "PipelineConfig.hpp"

#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace hanzi {

/**
 * @brief OCREngine backed by Tesseract's TessBaseAPI
 *
 * The tessdata directory is taken from the configuration, then from the
 * TESSDATA_PREFIX environment variable, and finally left to Tesseract's
 * compiled-in default. Every '+'-separated language of the hint must have a
 * @c .traineddata file there.
 *
 * Example usage:
 * @code
 * hanzi::TesseractEngine engine(config);
 * std::string error;
 * if (engine.initialize("chi_sim+eng", error) == hanzi::EngineErrorKind::None) {
 *     auto outcome = engine.recognize(image, "chi_sim+eng");
 * }
 * @endcode
 */
class TesseractEngine : public OCREngine {
public:
  explicit TesseractEngine(const PipelineConfig &config);
  ~TesseractEngine() override;

  // Tesseract API is not copyable
  TesseractEngine(const TesseractEngine &) = delete;
  TesseractEngine &operator=(const TesseractEngine &) = delete;

  EngineErrorKind initialize(const std::string &languageHint,
                             std::string &errorMessage) override;

  EngineOutcome recognize(const cv::Mat &image,
                          const std::string &languageHint) override;

  bool isInitialized() const { return m_initialized; }

  /**
   * @brief Languages the initialized engine can load
   */
  std::vector<std::string> getAvailableLanguages() const;

  /**
   * @brief Tesseract library version string
   */
  static std::string getTesseractVersion();

  /**
   * @brief Directory searched for trained data, empty for the built-in default
   */
  static std::string resolveTessDataPath(const PipelineConfig &config);

  /**
   * @brief Split a hint such as "chi_sim+eng" into its languages
   */
  static std::vector<std::string> splitLanguages(const std::string &languageHint);

  /**
   * @brief Languages of @p languageHint without a .traineddata file
   *
   * Looks in @p tessDataPath and its @c tessdata subdirectory.
   */
  static std::vector<std::string>
  missingLanguages(const std::string &tessDataPath,
                   const std::string &languageHint);

  /**
   * @brief Grayscale, blur and adaptive threshold for noisy scans
   */
  static cv::Mat preprocessImage(const cv::Mat &image);

private:
  void setImage(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
  PipelineConfig m_config;
  std::string m_language;
  bool m_initialized;
};

} // namespace hanzi

#endif // HANZI_TESSERACT_ENGINE_HPP
