#include "error_classifier.hpp"

namespace relay::dispatch {

ErrorClassification ClassifyHttpStatus(int32_t status_code) {
  if (status_code >= 200 && status_code < 300) {
    return ErrorClassification::kNone;
  }
  if (status_code == 408 || status_code == 429) {
    return ErrorClassification::kTransient;
  }
  if (status_code >= 400 && status_code < 500) {
    return ErrorClassification::kNonRetryable;
  }
  return ErrorClassification::kTransient;
}

} // namespace relay::dispatch
