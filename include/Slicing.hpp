#ifndef HANZI_SLICING_HPP
#define HANZI_SLICING_HPP

#include "PipelineTypes.hpp"

#include <vector>

namespace hanzi {

/**
 * @brief Lazy top-to-bottom sequence of overlapping slices for one page
 *
 * Every slice except the last is exactly @c sliceHeight tall and each
 * consecutive pair shares exactly @c overlap page units. The last slice
 * ends at the page boundary, so it may be shorter. A page no taller than
 * one slice yields a single slice covering the whole page.
 *
 * Example usage:
 * @code
 * hanzi::SliceSequence slices(pageHeight, 1500, 100);
 * hanzi::Slice slice;
 * while (slices.next(slice)) {
 *     render(slice.top, slice.height);
 * }
 * @endcode
 */
class SliceSequence {
public:
  /**
   * @brief Constructor
   * @param pageHeight Page height in page units (0 yields no slices)
   * @param sliceHeight Nominal slice height, must be positive
   * @param overlap Overlap between slices, must be in [0, sliceHeight)
   * @throws std::invalid_argument if the geometry cannot make progress
   */
  SliceSequence(int pageHeight, int sliceHeight, int overlap);

  /**
   * @brief Produce the next slice
   * @param slice Receives the slice
   * @return false once the page is exhausted
   */
  bool next(Slice &slice);

  /**
   * @brief Restart from the top of the page
   */
  void reset();

  /**
   * @brief Materialize the full sequence (does not advance this one)
   */
  std::vector<Slice> collect() const;

private:
  int m_pageHeight;
  int m_sliceHeight;
  int m_overlap;
  int m_nextTop;
  int m_nextIndex;
  bool m_done;
};

} // namespace hanzi

#endif // HANZI_SLICING_HPP
