#include "PipelineTypes.hpp"

namespace hanzi {

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Rasterization:
    return "rasterization";
  case ErrorKind::Engine:
    return "engine";
  case ErrorKind::Configuration:
    return "configuration";
  case ErrorKind::Normalization:
    return "normalization";
  case ErrorKind::Document:
    return "document";
  case ErrorKind::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

std::string CleanedText::toString() const {
  std::string out;
  for (size_t i = 0; i < paragraphs.size(); ++i) {
    if (i > 0) {
      out += '\n';
    }
    out += paragraphs[i];
  }
  return out;
}

} // namespace hanzi
