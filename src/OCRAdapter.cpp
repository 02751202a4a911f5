#include "OCRAdapter.hpp"

namespace redact {

const char *toString(OCRStatus status) {
  switch (status) {
  case OCRStatus::Ok:
    return "ok";
  case OCRStatus::Unavailable:
    return "unavailable";
  case OCRStatus::Failed:
  default:
    return "failed";
  }
}

} // namespace redact
