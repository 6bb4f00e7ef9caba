#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace relay::model {

/*
  One attempt against one channel.

  Persisted exactly once, after it reaches a terminal status. response_chunks
  is append-only while the attempt runs and frozen afterwards.
*/
struct RequestExecution {
  std::string id;
  std::string request_id;
  int64_t     channel_id = 0;
  std::string model_id;
  int64_t     attempt = 0;

  ExecutionStatus status = ExecutionStatus::kPending;
  bool            stream = false;

  std::string              request_body;
  std::string              response_body;
  std::vector<std::string> response_chunks;

  std::optional<std::string> error_message;
  int32_t                    error_status_code = 0;

  util::TimePoint                created_at{};
  util::TimePoint                updated_at{};
  std::optional<util::TimePoint> first_chunk_at;

  std::optional<int64_t> metrics_latency_ms;
  std::optional<int64_t> metrics_first_token_latency_ms;
};

} // namespace relay::model
