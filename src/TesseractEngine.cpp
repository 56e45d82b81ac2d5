#include "TesseractEngine.hpp"

#include <opencv2/imgproc.hpp>
#include <tesseract/ocrclass.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace hanzi {

TesseractEngine::TesseractEngine(const PipelineConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

TesseractEngine::~TesseractEngine() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

std::string TesseractEngine::resolveTessDataPath(const PipelineConfig &config) {
  // Priority 1: Use config path if provided
  if (!config.tessDataPath.empty()) {
    return config.tessDataPath;
  }

  // Priority 2: Check TESSDATA_PREFIX environment variable
  const char *envPath = std::getenv("TESSDATA_PREFIX");
  if (envPath != nullptr) {
    return envPath;
  }

  // Priority 3: Tesseract's compiled-in default
  return "";
}

std::vector<std::string>
TesseractEngine::splitLanguages(const std::string &languageHint) {
  std::vector<std::string> languages;
  size_t start = 0;
  while (start <= languageHint.size()) {
    size_t pos = languageHint.find('+', start);
    if (pos == std::string::npos) {
      pos = languageHint.size();
    }
    if (pos > start) {
      languages.push_back(languageHint.substr(start, pos - start));
    }
    start = pos + 1;
  }
  return languages;
}

std::vector<std::string>
TesseractEngine::missingLanguages(const std::string &tessDataPath,
                                  const std::string &languageHint) {
  std::vector<std::string> missing;
  for (const auto &language : splitLanguages(languageHint)) {
    std::string fileName = language + ".traineddata";
    std::error_code ec;
    bool found = fs::exists(fs::path(tessDataPath) / fileName, ec) ||
                 fs::exists(fs::path(tessDataPath) / "tessdata" / fileName, ec);
    if (!found) {
      missing.push_back(language);
    }
  }
  return missing;
}

EngineErrorKind TesseractEngine::initialize(const std::string &languageHint,
                                            std::string &errorMessage) {
  if (m_initialized && languageHint == m_language) {
    return EngineErrorKind::None;
  }
  if (m_initialized) {
    m_tesseract->End();
    m_initialized = false;
  }

  std::string tessDataPath = resolveTessDataPath(m_config);

  if (!tessDataPath.empty()) {
    std::vector<std::string> missing =
        missingLanguages(tessDataPath, languageHint);
    if (!missing.empty()) {
      errorMessage = "No trained data for language";
      for (size_t i = 0; i < missing.size(); ++i) {
        errorMessage += (i == 0 ? " '" : ", '") + missing[i] + "'";
      }
      errorMessage += " in " + tessDataPath;
      return EngineErrorKind::LanguageDataMissing;
    }
  }

  int result = m_tesseract->Init(
      tessDataPath.empty() ? nullptr : tessDataPath.c_str(),
      languageHint.c_str());

  if (result != 0) {
    // Without a directory to inspect, a failed Init usually means the
    // default tessdata lacks the language
    if (tessDataPath.empty()) {
      errorMessage = "Failed to initialize Tesseract with language '" +
                     languageHint +
                     "' (is its trained data installed? set TESSDATA_PREFIX)";
      return EngineErrorKind::LanguageDataMissing;
    }
    errorMessage = "Failed to initialize Tesseract with language '" +
                   languageHint + "' from " + tessDataPath;
    return EngineErrorKind::EngineUnavailable;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_language = languageHint;
  m_initialized = true;
  return EngineErrorKind::None;
}

EngineOutcome TesseractEngine::recognize(const cv::Mat &image,
                                         const std::string &languageHint) {
  EngineOutcome outcome;

  std::string initError;
  EngineErrorKind initKind = initialize(languageHint, initError);
  if (initKind != EngineErrorKind::None) {
    outcome.error = initKind;
    outcome.errorMessage = initError;
    return outcome;
  }

  if (image.empty()) {
    outcome.error = EngineErrorKind::EngineUnavailable;
    outcome.errorMessage = "Input image is empty";
    return outcome;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    cv::Mat processedImage =
        m_config.preprocessImage ? preprocessImage(image) : image;
    setImage(processedImage);

    tesseract::ETEXT_DESC monitor;
    if (m_config.ocrTimeoutMs > 0) {
      monitor.set_deadline_msecs(m_config.ocrTimeoutMs);
    }

    int rc = m_tesseract->Recognize(&monitor);
    if (rc != 0) {
      if (m_config.ocrTimeoutMs > 0 && monitor.deadline_exceeded()) {
        outcome.error = EngineErrorKind::Timeout;
        outcome.errorMessage = "Recognition exceeded " +
                               std::to_string(m_config.ocrTimeoutMs) + " ms";
      } else {
        outcome.error = EngineErrorKind::EngineUnavailable;
        outcome.errorMessage = "Tesseract recognition failed";
      }
    } else {
      char *outText = m_tesseract->GetUTF8Text();
      if (outText) {
        outcome.text = outText;
        delete[] outText;
      }
      outcome.meanConfidence = static_cast<float>(m_tesseract->MeanTextConf());
      outcome.success = true;
    }
    m_tesseract->Clear();
  } catch (const std::exception &e) {
    outcome.error = EngineErrorKind::EngineUnavailable;
    outcome.errorMessage = std::string("OCR analysis failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  outcome.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return outcome;
}

std::string TesseractEngine::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

std::vector<std::string> TesseractEngine::getAvailableLanguages() const {
  std::vector<std::string> languages;

  if (m_initialized) {
    m_tesseract->GetAvailableLanguagesAsVector(&languages);
  }

  return languages;
}

cv::Mat TesseractEngine::preprocessImage(const cv::Mat &image) {
  cv::Mat processed;

  if (image.channels() == 3) {
    cv::cvtColor(image, processed, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, processed, cv::COLOR_BGRA2GRAY);
  } else {
    processed = image.clone();
  }

  // Reduce scanner noise before thresholding
  cv::GaussianBlur(processed, processed, cv::Size(3, 3), 0);

  cv::adaptiveThreshold(processed, processed, 255,
                        cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 11,
                        2);

  return processed;
}

void TesseractEngine::setImage(const cv::Mat &image) {
  cv::Mat rgbImage;

  // Tesseract expects RGB
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

} // namespace hanzi
