#include "PipelineConfig.hpp"
#include "PipelineTypes.hpp"

#include <iostream>
#include <string>

static int g_failures = 0;

static void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << description
            << std::endl;
  if (!condition) {
    g_failures++;
  }
}

int main() {
  std::cout << "=== Test PipelineConfig ===" << std::endl << std::endl;

  {
    std::cout << "Defaults:" << std::endl;
    hanzi::PipelineConfig config;
    check(config.sliceHeightPx == 1500 && config.overlapPx == 100 &&
              config.scale == 3.0,
          "slice geometry defaults");
    check(config.maxParagraphChars == 500, "paragraph bound default");
    check(config.mergeWindowChars == 16, "merge window default");
    check(config.languageHint == "chi_sim+eng", "language default");
    check(config.pageSegMode == tesseract::PSM_SINGLE_BLOCK,
          "single block segmentation");
    check(config.workerCount >= 1, "at least one worker");
    check(config.validate().empty(), "defaults are valid");
  }

  {
    std::cout << "Rejected values:" << std::endl;
    hanzi::PipelineConfig config;

    config.overlapPx = config.sliceHeightPx;
    check(!config.validate().empty(), "overlap equal to slice height");

    config = hanzi::PipelineConfig();
    config.overlapPx = -1;
    check(!config.validate().empty(), "negative overlap");

    config = hanzi::PipelineConfig();
    config.sliceHeightPx = 0;
    check(!config.validate().empty(), "zero slice height");

    config = hanzi::PipelineConfig();
    config.mergeWindowChars = 1;
    check(!config.validate().empty(), "merge window of 1");

    config = hanzi::PipelineConfig();
    config.scale = 0.0;
    check(!config.validate().empty(), "zero scale");

    config = hanzi::PipelineConfig();
    config.garbledRatioThreshold = 1.5;
    check(!config.validate().empty(), "threshold above 1");

    config = hanzi::PipelineConfig();
    config.symbolRunLength = 1;
    check(!config.validate().empty(), "symbol run of 1");

    config = hanzi::PipelineConfig();
    config.maxParagraphChars = 0;
    check(!config.validate().empty(), "zero paragraph bound");

    config = hanzi::PipelineConfig();
    config.languageHint.clear();
    check(!config.validate().empty(), "empty language");

    config = hanzi::PipelineConfig();
    config.workerCount = 0;
    check(!config.validate().empty(), "no workers");

    config = hanzi::PipelineConfig();
    config.ocrTimeoutMs = -5;
    check(!config.validate().empty(), "negative timeout");
  }

  {
    std::cout << "Error kinds:" << std::endl;
    check(std::string(hanzi::errorKindName(hanzi::ErrorKind::Configuration)) ==
              "configuration",
          "configuration error name");
    check(std::string(hanzi::errorKindName(hanzi::ErrorKind::Cancelled)) ==
              "cancelled",
          "cancelled error name");
  }

  std::cout << std::endl
            << (g_failures == 0 ? "All tests passed" : "Some tests FAILED")
            << std::endl;
  return g_failures == 0 ? 0 : 1;
}
