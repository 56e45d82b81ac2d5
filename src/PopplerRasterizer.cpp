#include "PopplerRasterizer.hpp"

#include <opencv2/imgproc.hpp>

#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

#include <cmath>
#include <utility>

namespace hanzi {

PopplerRasterizer::PopplerRasterizer() = default;

PopplerRasterizer::~PopplerRasterizer() = default;

RasterOutcome PopplerRasterizer::open(const std::string &path) {
  RasterOutcome outcome;
  close();

  try {
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(path));

    if (!doc) {
      outcome.error = RasterErrorKind::UnsupportedDocument;
      outcome.errorMessage = "Failed to load PDF file: " + path;
      return outcome;
    }

    if (doc->is_locked()) {
      outcome.error = RasterErrorKind::UnsupportedDocument;
      outcome.errorMessage = "PDF file is password protected: " + path;
      return outcome;
    }

    if (doc->pages() < 1) {
      outcome.error = RasterErrorKind::UnsupportedDocument;
      outcome.errorMessage = "PDF has no pages: " + path;
      return outcome;
    }

    m_document = std::move(doc);
    outcome.success = true;
  } catch (const std::exception &e) {
    outcome.error = RasterErrorKind::UnsupportedDocument;
    outcome.errorMessage = std::string("Failed to open PDF: ") + e.what();
  }

  return outcome;
}

void PopplerRasterizer::close() {
  m_document.reset();
}

int PopplerRasterizer::pageCount() const {
  return m_document ? m_document->pages() : 0;
}

bool PopplerRasterizer::pageSize(int pageIndex, double &width,
                                 double &height) const {
  if (!m_document || pageIndex < 0 || pageIndex >= m_document->pages()) {
    return false;
  }

  std::unique_ptr<poppler::page> page(m_document->create_page(pageIndex));
  if (!page) {
    return false;
  }

  poppler::rectf pageRect = page->page_rect();
  width = pageRect.width();
  height = pageRect.height();

  // Rendering applies the page rotation, so report the rotated size
  poppler::page::orientation_enum orientation = page->orientation();
  if (orientation == poppler::page::landscape ||
      orientation == poppler::page::seascape) {
    std::swap(width, height);
  }

  return width > 0 && height > 0;
}

int PopplerRasterizer::pageHeight(int pageIndex) const {
  double width = 0;
  double height = 0;
  if (!pageSize(pageIndex, width, height)) {
    return -1;
  }
  return static_cast<int>(std::ceil(height));
}

int PopplerRasterizer::pageWidth(int pageIndex) const {
  double width = 0;
  double height = 0;
  if (!pageSize(pageIndex, width, height)) {
    return -1;
  }
  return static_cast<int>(std::ceil(width));
}

cv::Mat PopplerRasterizer::toMat(const poppler::image &image) {
  int width = image.width();
  int height = image.height();
  cv::Mat mat;

  switch (image.format()) {
  case poppler::image::format_argb32: {
    // Stored as BGRA in memory on little-endian hosts
    mat = cv::Mat(height, width, CV_8UC4,
                  const_cast<char *>(image.const_data()),
                  image.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_BGRA2BGR);
    break;
  }
  case poppler::image::format_rgb24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(image.const_data()),
                  image.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_RGB2BGR);
    break;
  }
  case poppler::image::format_bgr24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(image.const_data()),
                  image.bytes_per_row())
              .clone();
    break;
  }
  case poppler::image::format_gray8: {
    mat = cv::Mat(height, width, CV_8UC1,
                  const_cast<char *>(image.const_data()),
                  image.bytes_per_row())
              .clone();
    break;
  }
  default:
    break;
  }

  return mat;
}

RasterOutcome PopplerRasterizer::renderSlice(int pageIndex, const Slice &slice,
                                             double scale) {
  RasterOutcome outcome;

  if (!m_document) {
    outcome.error = RasterErrorKind::UnsupportedDocument;
    outcome.errorMessage = "No document is open";
    return outcome;
  }

  try {
    std::unique_ptr<poppler::page> page(m_document->create_page(pageIndex));
    if (!page) {
      outcome.error = RasterErrorKind::CorruptPage;
      outcome.errorMessage =
          "Failed to create page " + std::to_string(pageIndex + 1);
      return outcome;
    }

    int width = pageWidth(pageIndex);
    if (width <= 0 || slice.height <= 0) {
      outcome.error = RasterErrorKind::CorruptPage;
      outcome.errorMessage =
          "Page " + std::to_string(pageIndex + 1) + " has no drawable area";
      return outcome;
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    double dpi = 72.0 * scale;
    int x = 0;
    int y = static_cast<int>(std::floor(slice.top * scale));
    int w = static_cast<int>(std::ceil(width * scale));
    int h = static_cast<int>(std::ceil((slice.top + slice.height) * scale)) - y;

    poppler::image popplerImage =
        renderer.render_page(page.get(), dpi, dpi, x, y, w, h);

    if (!popplerImage.is_valid()) {
      outcome.error = RasterErrorKind::CorruptPage;
      outcome.errorMessage = "Failed to render page " +
                             std::to_string(pageIndex + 1) + ", slice " +
                             std::to_string(slice.index + 1);
      return outcome;
    }

    outcome.image = toMat(popplerImage);
    if (outcome.image.empty()) {
      outcome.error = RasterErrorKind::CorruptPage;
      outcome.errorMessage = "Unsupported image format";
      return outcome;
    }

    outcome.success = true;
  } catch (const std::exception &e) {
    outcome.error = RasterErrorKind::CorruptPage;
    outcome.errorMessage = std::string("Page rendering failed: ") + e.what();
  }

  return outcome;
}

} // namespace hanzi
