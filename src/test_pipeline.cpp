#include "DocumentPipeline.hpp"
#include "OutputWriter.hpp"

#include <opencv2/imgcodecs.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

static void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << description
            << std::endl;
  if (!condition) {
    g_failures++;
  }
}

namespace {

using SliceKey = std::pair<int, int>;

/// Scripted engine behaviour shared by every engine instance of a pool
struct EngineScript {
  std::map<SliceKey, std::string> texts;
  std::map<SliceKey, hanzi::EngineErrorKind> failures;
  std::map<SliceKey, int> delaysMs;
  std::set<std::string> missingLanguages;
  std::string imageText;
  hanzi::EngineErrorKind imageError = hanzi::EngineErrorKind::None;
  std::function<void()> onRecognize;
  std::atomic<int> calls{0};
};

/// Rendered slices carry their page and slice index in two pixels
cv::Mat encodeSlice(int pageIndex, int sliceIndex) {
  cv::Mat image(1, 2, CV_8UC1);
  image.at<uchar>(0, 0) = static_cast<uchar>(pageIndex);
  image.at<uchar>(0, 1) = static_cast<uchar>(sliceIndex);
  return image;
}

class ScriptedEngine : public hanzi::OCREngine {
public:
  explicit ScriptedEngine(std::shared_ptr<EngineScript> script)
      : m_script(std::move(script)) {}

  hanzi::EngineErrorKind initialize(const std::string &languageHint,
                                    std::string &errorMessage) override {
    if (m_script->missingLanguages.count(languageHint) > 0) {
      errorMessage = "no trained data for " + languageHint;
      return hanzi::EngineErrorKind::LanguageDataMissing;
    }
    return hanzi::EngineErrorKind::None;
  }

  hanzi::EngineOutcome recognize(const cv::Mat &image,
                                 const std::string &languageHint) override {
    hanzi::EngineOutcome outcome;
    m_script->calls++;
    if (m_script->onRecognize) {
      m_script->onRecognize();
    }

    std::string initError;
    hanzi::EngineErrorKind kind = initialize(languageHint, initError);
    if (kind != hanzi::EngineErrorKind::None) {
      outcome.error = kind;
      outcome.errorMessage = initError;
      return outcome;
    }

    if (image.rows != 1 || image.cols != 2) {
      if (m_script->imageError != hanzi::EngineErrorKind::None) {
        outcome.error = m_script->imageError;
        outcome.errorMessage = "scripted failure";
        return outcome;
      }
      outcome.success = true;
      outcome.text = m_script->imageText;
      return outcome;
    }

    SliceKey key(image.at<uchar>(0, 0), image.at<uchar>(0, 1));
    auto delay = m_script->delaysMs.find(key);
    if (delay != m_script->delaysMs.end()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay->second));
    }

    auto failure = m_script->failures.find(key);
    if (failure != m_script->failures.end()) {
      outcome.error = failure->second;
      outcome.errorMessage = "scripted failure";
      return outcome;
    }

    auto text = m_script->texts.find(key);
    if (text != m_script->texts.end()) {
      outcome.text = text->second;
    }
    outcome.success = true;
    return outcome;
  }

private:
  std::shared_ptr<EngineScript> m_script;
};

class FakeRasterizer : public hanzi::PageRasterizer {
public:
  FakeRasterizer(std::vector<int> pageHeights, std::set<int> corruptPages,
                 std::shared_ptr<std::atomic<int>> opens)
      : m_pageHeights(std::move(pageHeights)),
        m_corruptPages(std::move(corruptPages)), m_opens(std::move(opens)),
        m_open(false) {}

  hanzi::RasterOutcome open(const std::string &path) override {
    hanzi::RasterOutcome outcome;
    (*m_opens)++;
    if (path.find("missing") != std::string::npos) {
      outcome.error = hanzi::RasterErrorKind::UnsupportedDocument;
      outcome.errorMessage = "Failed to load PDF file: " + path;
      return outcome;
    }
    m_open = true;
    outcome.success = true;
    return outcome;
  }

  int pageCount() const override {
    return m_open ? static_cast<int>(m_pageHeights.size()) : 0;
  }

  int pageHeight(int pageIndex) const override {
    return m_pageHeights[static_cast<size_t>(pageIndex)];
  }

  int pageWidth(int) const override { return 595; }

  hanzi::RasterOutcome renderSlice(int pageIndex, const hanzi::Slice &slice,
                                   double) override {
    hanzi::RasterOutcome outcome;
    if (m_corruptPages.count(pageIndex) > 0) {
      outcome.error = hanzi::RasterErrorKind::CorruptPage;
      outcome.errorMessage = "corrupt page stream";
      return outcome;
    }
    outcome.image = encodeSlice(pageIndex, slice.index);
    outcome.success = true;
    return outcome;
  }

  void close() override { m_open = false; }

private:
  std::vector<int> m_pageHeights;
  std::set<int> m_corruptPages;
  std::shared_ptr<std::atomic<int>> m_opens;
  bool m_open;
};

struct Harness {
  std::shared_ptr<EngineScript> script = std::make_shared<EngineScript>();
  std::shared_ptr<std::atomic<int>> opens =
      std::make_shared<std::atomic<int>>(0);
  std::vector<int> pageHeights;
  std::set<int> corruptPages;

  std::unique_ptr<hanzi::DocumentPipeline>
  makePipeline(hanzi::PipelineConfig config) {
    config.verbose = false;
    auto engineScript = script;
    auto heights = pageHeights;
    auto corrupt = corruptPages;
    auto openCounter = opens;
    return std::make_unique<hanzi::DocumentPipeline>(
        config,
        [engineScript]() {
          return std::make_unique<ScriptedEngine>(engineScript);
        },
        [heights, corrupt, openCounter]() {
          return std::make_unique<FakeRasterizer>(heights, corrupt,
                                                  openCounter);
        });
  }
};

bool hasUnitError(const hanzi::DocumentResult &result, hanzi::ErrorKind kind,
                  int pageIndex) {
  for (const auto &error : result.unitErrors) {
    if (error.kind == kind && error.pageIndex == pageIndex) {
      return true;
    }
  }
  return false;
}

} // anonymous namespace

int main() {
  std::cout << "=== Test DocumentPipeline ===" << std::endl << std::endl;

  hanzi::PipelineConfig config;
  config.workerCount = 3;

  {
    std::cout << "Slices completing out of order:" << std::endl;
    Harness h;
    h.pageHeights = {4000};
    h.script->texts[{0, 0}] = "第一片的内容。";
    h.script->texts[{0, 1}] = "第二片的内容。";
    h.script->texts[{0, 2}] = "第三片的内容。";
    h.script->delaysMs[{0, 0}] = 60;
    h.script->delaysMs[{0, 1}] = 30;

    auto pipeline = h.makePipeline(config);
    auto result = pipeline->processFile("report.pdf");
    check(result.success, "document succeeds");
    check(result.sliceCount == 3, "4000 units are three slices");
    check(result.cleaning.cleaned.toString() ==
              "第一片的内容。\n第二片的内容。\n第三片的内容。",
          "text is merged in slice order");
    check(result.unitErrors.empty(), "no unit errors");
  }

  {
    std::cout << "Corrupt page:" << std::endl;
    Harness h;
    h.pageHeights = {1000, 1000, 1000};
    h.corruptPages = {1};
    h.script->texts[{0, 0}] = "甲页。";
    h.script->texts[{1, 0}] = "乙页。";
    h.script->texts[{2, 0}] = "丙页。";

    auto pipeline = h.makePipeline(config);
    auto result = pipeline->processFile("report.PDF");
    check(result.success, "remaining pages still produce a document");
    check(result.processedPages == 2 && result.pageCount == 3,
          "two of three pages processed");
    check(hasUnitError(result, hanzi::ErrorKind::Rasterization, 1),
          "rasterization error recorded for page 2");
    check(result.mergedText == "甲页。\n丙页。", "corrupt page is skipped");
  }

  {
    std::cout << "Engine failure on one slice:" << std::endl;
    Harness h;
    h.pageHeights = {2000};
    h.script->failures[{0, 0}] = hanzi::EngineErrorKind::Timeout;
    h.script->texts[{0, 1}] = "后半部分。";

    auto pipeline = h.makePipeline(config);
    auto result = pipeline->processFile("report.pdf");
    check(result.success, "document succeeds");
    check(result.unitErrors.size() == 1 &&
              result.unitErrors[0].kind == hanzi::ErrorKind::Engine &&
              result.unitErrors[0].sliceIndex == 0,
          "warning record for the failed slice");
    check(result.cleaning.cleaned.toString() == "后半部分。",
          "failed slice contributes empty text");
  }

  {
    std::cout << "Language data missing on a worker:" << std::endl;
    Harness h;
    h.pageHeights = {1000, 1000};
    h.script->texts[{0, 0}] = "第一页。";
    h.script->texts[{1, 0}] = "第二页。";
    h.script->failures[{0, 0}] = hanzi::EngineErrorKind::LanguageDataMissing;

    auto pipeline = h.makePipeline(config);
    auto result = pipeline->processFile("report.pdf");
    check(result.success && result.processedPages == 1,
          "page with missing language data is skipped");
    check(result.mergedText == "第二页。", "other pages are kept");
  }

  {
    std::cout << "Language data missing at start:" << std::endl;
    Harness h;
    h.pageHeights = {1000};
    h.script->missingLanguages = {"chi_sim+eng"};

    auto pipeline = h.makePipeline(config);
    auto result = pipeline->processFile("report.pdf");
    check(!result.success && result.error == hanzi::ErrorKind::Configuration,
          "missing language data is a configuration error");
    check(*h.opens == 0 && h.script->calls == 0,
          "nothing is rendered or recognized");

    hanzi::PipelineConfig withFallback = config;
    withFallback.fallbackLanguage = "eng";
    h.script->texts[{0, 0}] = "fallback text.";
    auto fallbackPipeline = h.makePipeline(withFallback);
    auto fallback = fallbackPipeline->processFile("report.pdf");
    check(fallback.success && fallback.language == "eng",
          "fallback language is used when configured");
    check(fallback.mergedText == "fallback text.", "fallback run produces text");
  }

  {
    std::cout << "Invalid configuration:" << std::endl;
    Harness h;
    h.pageHeights = {1000};
    hanzi::PipelineConfig bad = config;
    bad.overlapPx = bad.sliceHeightPx;
    auto pipeline = h.makePipeline(bad);
    auto result = pipeline->processFile("report.pdf");
    check(result.error == hanzi::ErrorKind::Configuration,
          "invalid geometry is reported before processing");
  }

  {
    std::cout << "Document errors:" << std::endl;
    Harness h;
    h.pageHeights = {1000};
    auto pipeline = h.makePipeline(config);

    auto missing = pipeline->processFile("missing.pdf");
    check(!missing.success && missing.error == hanzi::ErrorKind::Document,
          "unreadable PDF is a document error");

    auto unsupported = pipeline->processFile("notes.docx");
    check(!unsupported.success &&
              unsupported.error == hanzi::ErrorKind::Document,
          "unsupported format is a document error");
  }

  {
    std::cout << "Abort:" << std::endl;
    Harness h;
    h.pageHeights = {1000, 1000, 1000, 1000, 1000, 1000};
    for (int page = 0; page < 6; ++page) {
      h.script->texts[{page, 0}] = "内容。";
    }

    hanzi::PipelineConfig single = config;
    single.workerCount = 1;
    auto pipeline = h.makePipeline(single);
    hanzi::DocumentPipeline *raw = pipeline.get();
    h.script->onRecognize = [raw]() { raw->requestAbort(); };

    auto result = pipeline->processFile("report.pdf");
    check(result.aborted && result.error == hanzi::ErrorKind::Cancelled,
          "aborted document reports cancellation");
    check(!result.success && result.cleaning.cleaned.paragraphs.empty(),
          "no text is produced");
    check(h.script->calls < 6, "queued slices are not recognized");

    pipeline->resetAbort();
    h.script->onRecognize = nullptr;
    auto again = pipeline->processFile("report.pdf");
    check(again.success && again.processedPages == 6,
          "pipeline is usable after resetAbort()");
  }

  {
    std::cout << "Standalone image:" << std::endl;
    fs::path dir = fs::temp_directory_path() / "hanzi_test_pipeline";
    fs::create_directories(dir);
    fs::path imagePath = dir / "scan_20240105.png";
    cv::Mat image(40, 80, CV_8UC3, cv::Scalar(255, 255, 255));
    bool written = cv::imwrite(imagePath.string(), image);
    check(written, "test image written");
    check(hanzi::isSupportedImage("SCAN.JPG") && hanzi::isPdfFile("a.Pdf"),
          "extensions match case-insensitively");

    Harness h;
    h.script->imageText = "图片 中 的 文字 ,识别 完成";
    auto pipeline = h.makePipeline(config);
    auto result = pipeline->processFile(imagePath.string());
    check(result.success && result.pageCount == 1, "image is one unit");
    check(*h.opens == 0, "images bypass the rasterizer");
    check(result.cleaning.cleaned.toString() == "图片中的文字，识别完成",
          "image text is cleaned");
    check(result.cleaning.metadata.date == "2024-01-05",
          "metadata taken from the image name");

    Harness missing;
    missing.script->imageText = "不应出现的文字";
    missing.script->imageError = hanzi::EngineErrorKind::LanguageDataMissing;
    auto skippedPipeline = missing.makePipeline(config);
    auto skipped = skippedPipeline->processFile(imagePath.string());
    check(!skipped.success && skipped.error == hanzi::ErrorKind::Document,
          "image with missing language data is a document error");
    check(skipped.processedPages == 0 &&
              skipped.cleaning.cleaned.paragraphs.empty(),
          "no text is produced for the skipped image");
    check(skipped.unitErrors.size() == 1 &&
              skipped.unitErrors[0].kind == hanzi::ErrorKind::Engine,
          "the skipped image is recorded as an engine error");

    fs::remove_all(dir);
  }

  std::cout << std::endl
            << (g_failures == 0 ? "All tests passed" : "Some tests FAILED")
            << std::endl;
  return g_failures == 0 ? 0 : 1;
}
