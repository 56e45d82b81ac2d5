#include "PageRasterizer.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace hanzi {

namespace {

std::string lowerExtension(const std::string &path) {
  std::string ext = fs::u8path(path).extension().u8string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext;
}

} // anonymous namespace

const std::vector<std::string> &supportedImageExtensions() {
  static const std::vector<std::string> extensions = {
      ".png", ".jpg", ".jpeg", ".bmp", ".tiff", ".tif", ".webp"};
  return extensions;
}

bool isSupportedImage(const std::string &path) {
  const auto &extensions = supportedImageExtensions();
  return std::find(extensions.begin(), extensions.end(),
                   lowerExtension(path)) != extensions.end();
}

bool isPdfFile(const std::string &path) { return lowerExtension(path) == ".pdf"; }

RasterOutcome loadImageFile(const std::string &path) {
  RasterOutcome outcome;

  try {
    outcome.image = cv::imread(path, cv::IMREAD_COLOR);
  } catch (const cv::Exception &e) {
    outcome.error = RasterErrorKind::UnsupportedDocument;
    outcome.errorMessage = "Failed to load image: " + path + " (" + e.what() + ")";
    return outcome;
  }

  if (outcome.image.empty()) {
    outcome.error = RasterErrorKind::UnsupportedDocument;
    outcome.errorMessage = "Failed to load image: " + path;
    return outcome;
  }

  outcome.success = true;
  return outcome;
}

} // namespace hanzi
