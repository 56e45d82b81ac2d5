#ifndef HANZI_POPPLER_RASTERIZER_HPP
#define HANZI_POPPLER_RASTERIZER_HPP

#include "PageRasterizer.hpp"

#include <memory>
#include <string>

namespace poppler {
class document;
class page;
class image;
} // namespace poppler

namespace hanzi {

/**
 * @brief PageRasterizer backed by Poppler's C++ wrapper
 *
 * Renders with antialiasing at 72 * scale dpi, one slice rectangle at a
 * time, so a tall page is never held in memory at full resolution.
 *
 * Example usage:
 * @code
 * hanzi::PopplerRasterizer rasterizer;
 * if (rasterizer.open("scan.pdf").success) {
 *     hanzi::SliceSequence slices(rasterizer.pageHeight(0), 1500, 100);
 *     hanzi::Slice slice;
 *     while (slices.next(slice)) {
 *         auto outcome = rasterizer.renderSlice(0, slice, 3.0);
 *     }
 * }
 * @endcode
 */
class PopplerRasterizer : public PageRasterizer {
public:
  PopplerRasterizer();
  ~PopplerRasterizer() override;

  PopplerRasterizer(const PopplerRasterizer &) = delete;
  PopplerRasterizer &operator=(const PopplerRasterizer &) = delete;

  RasterOutcome open(const std::string &path) override;
  int pageCount() const override;
  int pageHeight(int pageIndex) const override;
  int pageWidth(int pageIndex) const override;
  RasterOutcome renderSlice(int pageIndex, const Slice &slice,
                            double scale) override;
  void close() override;

  /**
   * @brief Convert a rendered Poppler image to an OpenCV BGR or gray matrix
   * @return Empty matrix for pixel formats OpenCV has no equivalent for
   */
  static cv::Mat toMat(const poppler::image &image);

private:
  /// Page size in page units with the page rotation applied
  bool pageSize(int pageIndex, double &width, double &height) const;

  std::unique_ptr<poppler::document> m_document;
};

} // namespace hanzi

#endif // HANZI_POPPLER_RASTERIZER_HPP
