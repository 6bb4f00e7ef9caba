#pragma once

#include <cstdint>

#include "dispatcher.hpp"

namespace relay::dispatch {

// 2xx -> none; 408, 429, 5xx -> transient; other 4xx -> non-retryable.
// Anything else (1xx, 3xx, 0) is treated as transient.
ErrorClassification ClassifyHttpStatus(int32_t status_code);

constexpr bool IsRetryable(ErrorClassification c) {
  return c == ErrorClassification::kTransient;
}

} // namespace relay::dispatch
