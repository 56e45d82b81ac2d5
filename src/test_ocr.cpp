#include "TesseractEngine.hpp"

#include <iostream>
#include <opencv2/imgproc.hpp>

// Exit code ctest treats as a skipped test
static const int kSkipped = 77;

int main() {
  // Create a simple test image with text
  cv::Mat testImage(200, 600, CV_8UC3, cv::Scalar(255, 255, 255));

  cv::putText(testImage, "Hanzi OCR Test", cv::Point(50, 50),
              cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 0, 0), 2);
  cv::putText(testImage, "Hello World!", cv::Point(50, 100),
              cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 0, 0), 2);
  cv::putText(testImage, "Testing 123", cv::Point(50, 150),
              cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 0, 0), 2);

  // Clean digital images read better without thresholding
  hanzi::PipelineConfig config;
  config.languageHint = "eng";
  config.preprocessImage = false;

  hanzi::TesseractEngine engine(config);

  std::string errorMessage;
  hanzi::EngineErrorKind kind = engine.initialize("eng", errorMessage);
  if (kind == hanzi::EngineErrorKind::LanguageDataMissing ||
      kind == hanzi::EngineErrorKind::EngineUnavailable) {
    std::cerr << "Skipping: " << hanzi::engineErrorName(kind) << ": "
              << errorMessage << "\n";
    return kSkipped;
  }
  if (kind != hanzi::EngineErrorKind::None) {
    std::cerr << "Failed to initialize OCR engine: " << errorMessage << "\n";
    return 1;
  }

  std::cout << "Tesseract version: "
            << hanzi::TesseractEngine::getTesseractVersion() << "\n";
  std::cout << "Available languages:";
  for (const auto &language : engine.getAvailableLanguages()) {
    std::cout << " " << language;
  }
  std::cout << "\nRunning OCR on generated image...\n\n";

  hanzi::EngineOutcome outcome = engine.recognize(testImage, "eng");

  if (!outcome.success) {
    std::cerr << "OCR failed: " << outcome.errorMessage << "\n";
    return 1;
  }

  std::cout << "=== Extracted Text ===\n";
  std::cout << outcome.text << "\n";
  std::cout << "======================\n\n";
  std::cout << "Mean confidence: " << outcome.meanConfidence << "%\n";
  std::cout << "Processing time: " << outcome.processingTimeMs << " ms\n";

  if (outcome.text.empty()) {
    std::cerr << "No text recognized\n";
    return 1;
  }

  // Preprocessed input goes through the same call
  config.preprocessImage = true;
  hanzi::TesseractEngine preprocessing(config);
  hanzi::EngineOutcome preprocessed = preprocessing.recognize(testImage, "eng");
  if (!preprocessed.success) {
    std::cerr << "OCR with preprocessing failed: " << preprocessed.errorMessage
              << "\n";
    return 1;
  }

  std::cout << "All tests passed\n";
  return 0;
}
