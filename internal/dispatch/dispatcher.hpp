#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/channel.hpp"
#include "internal/model/usage.hpp"
#include "internal/util/time.hpp"

namespace relay::core {
class CancellationToken;
}

namespace relay::dispatch {

enum class ErrorClassification : std::uint8_t {
  kNone         = 0,
  kTransient    = 1, // retry on the same channel
  kNonRetryable = 2, // move to the next channel
  kCancellation = 3, // request is canceled
};

constexpr std::string_view ToString(ErrorClassification c) {
  switch (c) {
    case ErrorClassification::kNone:
      return "none";
    case ErrorClassification::kTransient:
      return "transient";
    case ErrorClassification::kNonRetryable:
      return "non_retryable";
    case ErrorClassification::kCancellation:
      return "cancellation";
  }
  return "none";
}

struct DispatchRequest {
  std::string request_id;
  std::string model_id;
  bool        stream = false;
  std::string body;
};

// Receives each response fragment, in order, as soon as it arrives.
using ChunkSink = std::function<void(std::string_view)>;

struct DispatchOutcome {
  ErrorClassification classification = ErrorClassification::kNone;

  util::TimePoint                started_at{};
  util::TimePoint                finished_at{};
  std::optional<util::TimePoint> first_chunk_at;

  std::string              response_body;
  std::vector<std::string> chunks;

  // Upstream HTTP status; 0 when no response was received.
  int32_t                    status_code = 0;
  std::optional<std::string> error_message;

  // request_id / execution_id are filled in by the caller.
  std::optional<model::UsageLog> usage;

  bool Succeeded() const {
    return classification == ErrorClassification::kNone;
  }
};

/*
  Performs one outbound attempt against one channel.

  Implementations never throw for upstream faults; those are reported through
  the classification. A cancellation observed on `cancel` must end the
  attempt promptly with kCancellation.
*/
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual DispatchOutcome Dispatch(const DispatchRequest&         request,
                                   const model::Channel&          channel,
                                   const core::CancellationToken& cancel,
                                   const ChunkSink&               sink) = 0;
};

} // namespace relay::dispatch
