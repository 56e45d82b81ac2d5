#include "OCREngine.hpp"

namespace hanzi {

const char *engineErrorName(EngineErrorKind kind) {
  switch (kind) {
  case EngineErrorKind::None:
    return "none";
  case EngineErrorKind::EngineUnavailable:
    return "engine unavailable";
  case EngineErrorKind::LanguageDataMissing:
    return "language data missing";
  case EngineErrorKind::Timeout:
    return "timeout";
  }
  return "unknown";
}

} // namespace hanzi
