#ifndef HANZI_PAGE_RASTERIZER_HPP
#define HANZI_PAGE_RASTERIZER_HPP

#include "PipelineTypes.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace hanzi {

/**
 * @brief Failures a rasterization backend can report
 */
enum class RasterErrorKind {
  None,               ///< No error
  CorruptPage,        ///< One page could not be read or rendered
  UnsupportedDocument ///< The document as a whole cannot be opened
};

/**
 * @brief Result of opening a document or rendering a slice
 */
struct RasterOutcome {
  bool success = false;     ///< Whether the operation succeeded
  cv::Mat image;            ///< Rendered slice (empty for open())
  RasterErrorKind error = RasterErrorKind::None;
  std::string errorMessage; ///< Error message if failed
};

/**
 * @brief Rasterization backend for paged documents
 *
 * Page dimensions are reported in page units (1/72 inch). A rasterizer holds
 * one open document and is used from a single thread.
 */
class PageRasterizer {
public:
  virtual ~PageRasterizer() = default;

  /**
   * @brief Open a document, closing any previous one
   */
  virtual RasterOutcome open(const std::string &path) = 0;

  virtual int pageCount() const = 0;

  /**
   * @brief Height of a page in page units, rounded up
   * @return -1 if the page cannot be read
   */
  virtual int pageHeight(int pageIndex) const = 0;

  /**
   * @brief Width of a page in page units, rounded up
   * @return -1 if the page cannot be read
   */
  virtual int pageWidth(int pageIndex) const = 0;

  /**
   * @brief Render the region of a page covered by a slice
   * @param pageIndex 0-indexed page
   * @param slice Region in page units
   * @param scale Zoom factor; the image is @p scale times the region size
   */
  virtual RasterOutcome renderSlice(int pageIndex, const Slice &slice,
                                    double scale) = 0;

  virtual void close() = 0;
};

/**
 * @brief Extensions accepted as standalone images (lower case, with dot)
 */
const std::vector<std::string> &supportedImageExtensions();

/// Case-insensitive check of the file extension against the image formats
bool isSupportedImage(const std::string &path);

/// Case-insensitive check for a .pdf extension
bool isPdfFile(const std::string &path);

/**
 * @brief Load a standalone image with OpenCV
 */
RasterOutcome loadImageFile(const std::string &path);

} // namespace hanzi

#endif // HANZI_PAGE_RASTERIZER_HPP
