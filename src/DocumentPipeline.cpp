#include "DocumentPipeline.hpp"
#include "PopplerRasterizer.hpp"
#include "SliceMerger.hpp"
#include "Slicing.hpp"
#include "TesseractEngine.hpp"

#include <chrono>
#include <deque>
#include <future>
#include <iostream>
#include <set>

namespace hanzi {

struct DocumentPipeline::SliceOutcome {
  RecognitionResult result;
  bool success = false;
  bool cancelled = false;
  EngineErrorKind error = EngineErrorKind::None;
  std::string errorMessage;
};

DocumentPipeline::DocumentPipeline(const PipelineConfig &config)
    : DocumentPipeline(
          config,
          [config]() { return std::make_unique<TesseractEngine>(config); },
          []() { return std::make_unique<PopplerRasterizer>(); }) {}

DocumentPipeline::DocumentPipeline(const PipelineConfig &config,
                                   EnginePool::Factory engineFactory,
                                   RasterizerFactory rasterizerFactory)
    : m_config(config), m_engineFactory(std::move(engineFactory)),
      m_rasterizerFactory(std::move(rasterizerFactory)), m_prepared(false),
      m_abort(false) {}

DocumentPipeline::~DocumentPipeline() {
  if (m_workers) {
    m_workers->join();
  }
}

ErrorKind DocumentPipeline::prepare(std::string &errorMessage) {
  if (m_prepared) {
    return ErrorKind::None;
  }

  std::string problem = m_config.validate();
  if (!problem.empty()) {
    errorMessage = "Invalid configuration: " + problem;
    return ErrorKind::Configuration;
  }

  if (!m_engines) {
    m_engines = std::make_unique<EnginePool>(
        static_cast<size_t>(m_config.workerCount), m_engineFactory);
  }

  std::string language = m_config.languageHint;
  {
    EnginePool::Lease engine = m_engines->acquire();
    if (!engine) {
      errorMessage = "No OCR engine could be created";
      return ErrorKind::Configuration;
    }

    std::string initError;
    EngineErrorKind kind = engine->initialize(language, initError);

    if (kind == EngineErrorKind::LanguageDataMissing &&
        !m_config.fallbackLanguage.empty()) {
      std::cerr << "Warning: " << initError << "; falling back to '"
                << m_config.fallbackLanguage << "'" << std::endl;
      language = m_config.fallbackLanguage;
      initError.clear();
      kind = engine->initialize(language, initError);
    }

    if (kind != EngineErrorKind::None) {
      errorMessage = std::string("OCR engine ") + engineErrorName(kind) +
                     ": " + initError;
      return ErrorKind::Configuration;
    }
  }

  if (!m_workers) {
    m_workers =
        std::make_unique<WorkerPool>(static_cast<size_t>(m_config.workerCount));
  }

  m_language = language;
  m_prepared = true;
  return ErrorKind::None;
}

DocumentPipeline::SliceOutcome
DocumentPipeline::recognizeUnit(const cv::Mat &image, int pageIndex,
                                const Slice &slice) {
  SliceOutcome outcome;
  outcome.result.pageIndex = pageIndex;
  outcome.result.sliceIndex = slice.index;
  outcome.result.verticalOffset = slice.top;

  if (m_abort) {
    outcome.cancelled = true;
    return outcome;
  }

  EnginePool::Lease engine = m_engines->acquire();
  if (!engine) {
    outcome.error = EngineErrorKind::EngineUnavailable;
    outcome.errorMessage = "No OCR engine could be created";
    return outcome;
  }

  EngineOutcome recognized = engine->recognize(image, m_language);
  if (!recognized.success) {
    outcome.error = recognized.error;
    outcome.errorMessage = recognized.errorMessage;
    return outcome;
  }

  outcome.result.text = std::move(recognized.text);
  outcome.result.meanConfidence = recognized.meanConfidence;
  outcome.success = true;
  return outcome;
}

void DocumentPipeline::reportUnitError(DocumentResult &result,
                                       UnitError error) const {
  if (error.kind != ErrorKind::Cancelled) {
    std::cerr << "Warning: " << error.stage << " failed";
    if (error.pageIndex >= 0) {
      std::cerr << " on page " << (error.pageIndex + 1);
    }
    if (error.sliceIndex >= 0) {
      std::cerr << ", slice " << (error.sliceIndex + 1);
    }
    std::cerr << ": " << error.message << std::endl;
  }
  result.unitErrors.push_back(std::move(error));
}

bool DocumentPipeline::beginDocument(DocumentResult &result) {
  std::string message;
  ErrorKind kind = prepare(message);
  if (kind != ErrorKind::None) {
    result.error = kind;
    result.errorMessage = message;
    return false;
  }
  result.language = m_language;
  return true;
}

void DocumentPipeline::finishDocument(DocumentResult &result,
                                      const std::vector<std::string> &pageTexts,
                                      int collapsedOverlaps) {
  SliceMerger merger(m_config);
  result.mergedText = merger.mergeDocument(pageTexts).text;

  result.cleaning =
      cleanRecognizedText(result.mergedText, result.sourcePath, m_config);
  result.cleaning.stats.collapsedOverlaps = collapsedOverlaps;

  if (!result.cleaning.success) {
    result.error = result.cleaning.error;
    result.errorMessage = result.cleaning.errorMessage;
    return;
  }

  result.success = true;
}

DocumentResult DocumentPipeline::processFile(const std::string &path) {
  if (isPdfFile(path)) {
    return processPdf(path);
  }
  if (isSupportedImage(path)) {
    return processImage(path);
  }

  DocumentResult result;
  result.sourcePath = path;
  result.error = ErrorKind::Document;
  result.errorMessage = "Unsupported file format: " + path +
                        " (supported: .pdf";
  for (const auto &ext : supportedImageExtensions()) {
    result.errorMessage += " " + ext;
  }
  result.errorMessage += ")";
  return result;
}

DocumentResult DocumentPipeline::processPdf(const std::string &path) {
  DocumentResult result;
  result.sourcePath = path;

  auto startTime = std::chrono::high_resolution_clock::now();

  if (!beginDocument(result)) {
    return result;
  }

  std::unique_ptr<PageRasterizer> rasterizer = m_rasterizerFactory();
  if (!rasterizer) {
    result.error = ErrorKind::Configuration;
    result.errorMessage = "No rasterizer is available for " + path;
    return result;
  }

  RasterOutcome opened = rasterizer->open(path);
  if (!opened.success) {
    result.error = ErrorKind::Document;
    result.errorMessage = opened.errorMessage;
    return result;
  }

  result.pageCount = rasterizer->pageCount();
  if (m_config.verbose) {
    std::cout << "PDF has " << result.pageCount << " pages" << std::endl;
  }

  std::vector<std::vector<RecognitionResult>> pageResults(
      static_cast<size_t>(result.pageCount));
  std::set<int> skippedPages;

  struct PendingSlice {
    int pageIndex;
    Slice slice;
    std::future<SliceOutcome> future;
  };
  std::deque<PendingSlice> pending;
  const size_t maxInFlight = static_cast<size_t>(m_config.workerCount) * 2;

  // Results are consumed from the front, in submission order, so every page
  // receives its slices in order
  auto collectFront = [&]() {
    PendingSlice front = std::move(pending.front());
    pending.pop_front();

    SliceOutcome outcome;
    try {
      outcome = front.future.get();
    } catch (const std::exception &e) {
      outcome.error = EngineErrorKind::EngineUnavailable;
      outcome.errorMessage = e.what();
    }

    UnitError error;
    error.pageIndex = front.pageIndex;
    error.sliceIndex = front.slice.index;

    if (outcome.cancelled) {
      error.kind = ErrorKind::Cancelled;
      error.stage = "OCR";
      error.message = "cancelled before start";
      reportUnitError(result, std::move(error));
      return;
    }

    if (!outcome.success) {
      error.kind = ErrorKind::Engine;
      error.stage = "OCR";
      error.message =
          std::string(engineErrorName(outcome.error)) + ": " + outcome.errorMessage;
      if (outcome.error == EngineErrorKind::LanguageDataMissing) {
        error.message += " (page skipped)";
        skippedPages.insert(front.pageIndex);
      }
      reportUnitError(result, std::move(error));
      // The slice contributes empty text
      outcome.result.text.clear();
    }

    pageResults[static_cast<size_t>(front.pageIndex)].push_back(
        std::move(outcome.result));
  };

  for (int pageIndex = 0; pageIndex < result.pageCount; ++pageIndex) {
    if (m_abort) {
      break;
    }

    int height = rasterizer->pageHeight(pageIndex);
    if (height < 0) {
      UnitError error;
      error.pageIndex = pageIndex;
      error.kind = ErrorKind::Rasterization;
      error.stage = "rasterization";
      error.message = "page could not be read";
      reportUnitError(result, std::move(error));
      skippedPages.insert(pageIndex);
      continue;
    }

    SliceSequence slices(height, m_config.sliceHeightPx, m_config.overlapPx);
    int sliceTotal = static_cast<int>(slices.collect().size());
    if (m_config.verbose) {
      std::cout << "Processing page " << (pageIndex + 1) << "/"
                << result.pageCount << " (" << sliceTotal << " slices)"
                << std::endl;
    }

    Slice slice;
    while (slices.next(slice)) {
      if (m_abort) {
        break;
      }

      RasterOutcome rendered = rasterizer->renderSlice(pageIndex, slice,
                                                       m_config.scale);
      if (!rendered.success) {
        UnitError error;
        error.pageIndex = pageIndex;
        error.sliceIndex = slice.index;
        error.kind = ErrorKind::Rasterization;
        error.stage = "rasterization";
        error.message = rendered.errorMessage + " (page skipped)";
        reportUnitError(result, std::move(error));
        skippedPages.insert(pageIndex);
        break;
      }

      while (pending.size() >= maxInFlight) {
        collectFront();
      }

      cv::Mat image = std::move(rendered.image);
      PendingSlice unit{pageIndex, slice, {}};
      unit.future = m_workers->push([this, image, pageIndex, slice]() {
        return recognizeUnit(image, pageIndex, slice);
      });
      pending.push_back(std::move(unit));
      result.sliceCount++;
    }
  }

  while (!pending.empty()) {
    collectFront();
  }
  rasterizer->close();

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  if (m_abort) {
    result.aborted = true;
    result.error = ErrorKind::Cancelled;
    result.errorMessage = "Processing aborted";
    return result;
  }

  SliceMerger merger(m_config);
  std::vector<std::string> pageTexts;
  int collapsedOverlaps = 0;

  for (int pageIndex = 0; pageIndex < result.pageCount; ++pageIndex) {
    if (skippedPages.count(pageIndex) > 0) {
      continue;
    }
    MergeOutcome page =
        merger.mergePage(std::move(pageResults[static_cast<size_t>(pageIndex)]));
    collapsedOverlaps += page.collapsedOverlaps;
    pageTexts.push_back(std::move(page.text));
    result.processedPages++;
  }

  if (result.processedPages == 0) {
    result.error = ErrorKind::Document;
    result.errorMessage = "No page of " + path + " could be processed";
    return result;
  }

  finishDocument(result, pageTexts, collapsedOverlaps);

  endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();
  return result;
}

DocumentResult DocumentPipeline::processImage(const std::string &path) {
  DocumentResult result;
  result.sourcePath = path;

  auto startTime = std::chrono::high_resolution_clock::now();

  if (!beginDocument(result)) {
    return result;
  }

  RasterOutcome loaded = loadImageFile(path);
  if (!loaded.success) {
    result.error = ErrorKind::Document;
    result.errorMessage = loaded.errorMessage;
    return result;
  }

  result.pageCount = 1;
  result.sliceCount = 1;

  Slice whole;
  whole.height = loaded.image.rows;
  cv::Mat image = std::move(loaded.image);

  std::future<SliceOutcome> future = m_workers->push(
      [this, image, whole]() { return recognizeUnit(image, 0, whole); });

  SliceOutcome outcome;
  try {
    outcome = future.get();
  } catch (const std::exception &e) {
    outcome.error = EngineErrorKind::EngineUnavailable;
    outcome.errorMessage = e.what();
  }

  if (outcome.cancelled || m_abort) {
    result.aborted = true;
    result.error = ErrorKind::Cancelled;
    result.errorMessage = "Processing aborted";
    return result;
  }

  if (!outcome.success) {
    UnitError error;
    error.kind = ErrorKind::Engine;
    error.stage = "OCR";
    error.message =
        std::string(engineErrorName(outcome.error)) + ": " + outcome.errorMessage;
    bool skipped = outcome.error == EngineErrorKind::LanguageDataMissing;
    if (skipped) {
      error.message += " (page skipped)";
    }
    reportUnitError(result, std::move(error));
    if (skipped) {
      result.error = ErrorKind::Document;
      result.errorMessage = "No page of " + path + " could be processed";
      return result;
    }
    outcome.result.text.clear();
  }

  SliceMerger merger(m_config);
  std::vector<RecognitionResult> results;
  results.push_back(std::move(outcome.result));
  std::vector<std::string> pageTexts{merger.mergePage(std::move(results)).text};
  result.processedPages = 1;

  finishDocument(result, pageTexts, 0);

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();
  return result;
}

} // namespace hanzi
