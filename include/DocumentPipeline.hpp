#ifndef HANZI_DOCUMENT_PIPELINE_HPP
#define HANZI_DOCUMENT_PIPELINE_HPP

#include "EnginePool.hpp"
#include "PageRasterizer.hpp"
#include "PipelineConfig.hpp"
#include "PipelineTypes.hpp"
#include "TextCleaning.hpp"
#include "WorkerPool.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hanzi {

/**
 * @brief Result of processing one PDF or image
 */
struct DocumentResult {
  bool success = false;  ///< Whether text was produced
  bool aborted = false;  ///< Processing stopped on requestAbort()
  ErrorKind error = ErrorKind::None; ///< Document-level failure
  std::string errorMessage; ///< Error message if failed
  std::string sourcePath;
  std::string language;  ///< Language string the engine ran with
  int pageCount = 0;     ///< Pages in the document (1 for an image)
  int processedPages = 0; ///< Pages that contributed text
  int sliceCount = 0;    ///< Slices submitted to OCR
  std::string mergedText; ///< Merged text before filtering
  CleaningResult cleaning; ///< Filtered and normalized text with stats
  std::vector<UnitError> unitErrors; ///< Isolated page and slice failures
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Runs rasterization, OCR, merging and cleaning for documents
 *
 * Pages are rendered slice by slice on the calling thread and the slices
 * are recognized on a worker pool, each worker borrowing an engine from an
 * EnginePool. Results are reordered by page and slice before merging.
 *
 * The configuration is validated and the language data checked once, on
 * the first document, so a batch reports a configuration problem before any
 * page is rendered.
 *
 * Example usage:
 * @code
 * hanzi::PipelineConfig config;
 * hanzi::DocumentPipeline pipeline(config);
 * auto result = pipeline.processFile("scan.pdf");
 * if (result.success) {
 *     std::cout << result.cleaning.cleaned.toString() << std::endl;
 * }
 * @endcode
 */
class DocumentPipeline {
public:
  using RasterizerFactory = std::function<std::unique_ptr<PageRasterizer>()>;

  /**
   * @brief Constructor using Tesseract and Poppler
   */
  explicit DocumentPipeline(const PipelineConfig &config);

  /**
   * @brief Constructor with custom backends
   * @param config Pipeline configuration
   * @param engineFactory Creates one OCR engine per pool slot
   * @param rasterizerFactory Creates a rasterizer per PDF document
   */
  DocumentPipeline(const PipelineConfig &config,
                   EnginePool::Factory engineFactory,
                   RasterizerFactory rasterizerFactory);

  ~DocumentPipeline();

  DocumentPipeline(const DocumentPipeline &) = delete;
  DocumentPipeline &operator=(const DocumentPipeline &) = delete;

  /**
   * @brief Process a PDF or a standalone image, chosen by extension
   */
  DocumentResult processFile(const std::string &path);

  DocumentResult processPdf(const std::string &path);

  DocumentResult processImage(const std::string &path);

  /**
   * @brief Validate the configuration and check the language data
   *
   * Called by the process methods; calling it directly reports problems
   * before the first document.
   *
   * @param errorMessage Receives the problem on failure
   * @return ErrorKind::None when the pipeline is ready
   */
  ErrorKind prepare(std::string &errorMessage);

  /**
   * @brief Ask the running document to stop
   *
   * Safe to call from another thread or a signal handler. Slices that have
   * not started are cancelled; running OCR calls complete.
   */
  void requestAbort() { m_abort = true; }

  bool abortRequested() const { return m_abort; }

  /// Clear a previous abort request
  void resetAbort() { m_abort = false; }

  const PipelineConfig &config() const { return m_config; }

  /// Language used for recognition after prepare()
  const std::string &language() const { return m_language; }

private:
  struct SliceOutcome;

  SliceOutcome recognizeUnit(const cv::Mat &image, int pageIndex,
                             const Slice &slice);
  bool beginDocument(DocumentResult &result);
  void finishDocument(DocumentResult &result,
                      const std::vector<std::string> &pageTexts,
                      int collapsedOverlaps);
  void reportUnitError(DocumentResult &result, UnitError error) const;

  PipelineConfig m_config;
  EnginePool::Factory m_engineFactory;
  RasterizerFactory m_rasterizerFactory;
  std::unique_ptr<EnginePool> m_engines;
  std::unique_ptr<WorkerPool> m_workers;
  std::string m_language;
  bool m_prepared;
  std::atomic<bool> m_abort;
};

} // namespace hanzi

#endif // HANZI_DOCUMENT_PIPELINE_HPP
