#include "Slicing.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace hanzi {

SliceSequence::SliceSequence(int pageHeight, int sliceHeight, int overlap)
    : m_pageHeight(std::max(0, pageHeight)), m_sliceHeight(sliceHeight),
      m_overlap(overlap), m_nextTop(0), m_nextIndex(0),
      m_done(pageHeight <= 0) {
  if (sliceHeight <= 0 || overlap < 0 || overlap >= sliceHeight) {
    throw std::invalid_argument(
        "Invalid slice geometry: height " + std::to_string(sliceHeight) +
        ", overlap " + std::to_string(overlap));
  }
}

bool SliceSequence::next(Slice &slice) {
  if (m_done) {
    return false;
  }

  slice.index = m_nextIndex;
  slice.top = m_nextTop;
  slice.height = std::min(m_sliceHeight, m_pageHeight - m_nextTop);
  slice.overlapPx = (m_nextIndex == 0) ? 0 : m_overlap;

  // The window stops once it reaches the page bottom
  if (slice.top + slice.height >= m_pageHeight) {
    m_done = true;
  } else {
    m_nextTop += m_sliceHeight - m_overlap;
    ++m_nextIndex;
  }

  return true;
}

void SliceSequence::reset() {
  m_nextTop = 0;
  m_nextIndex = 0;
  m_done = (m_pageHeight <= 0);
}

std::vector<Slice> SliceSequence::collect() const {
  SliceSequence copy(*this);
  copy.reset();

  std::vector<Slice> slices;
  Slice slice;
  while (copy.next(slice)) {
    slices.push_back(slice);
  }
  return slices;
}

} // namespace hanzi
