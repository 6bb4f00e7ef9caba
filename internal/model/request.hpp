#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace relay::model {

enum class RequestSource : std::uint8_t {
  kApi        = 0,
  kPlayground = 1,
  kTest       = 2,
};

constexpr std::string_view ToString(RequestSource source) {
  switch (source) {
    case RequestSource::kApi:
      return "api";
    case RequestSource::kPlayground:
      return "playground";
    case RequestSource::kTest:
      return "test";
  }
  return "api";
}

inline std::optional<RequestSource> ParseRequestSource(std::string_view name) {
  if (name == "api") return RequestSource::kApi;
  if (name == "playground") return RequestSource::kPlayground;
  if (name == "test") return RequestSource::kTest;
  return std::nullopt;
}

/*
  One inbound client call.

  status and the metrics fields are written once, at the terminal transition,
  by the coordinator that owns the request. canceled is the only status that
  can be imposed from outside the attempt history.
*/
struct Request {
  std::string     id;
  util::TimePoint created_at{};
  util::TimePoint updated_at{};

  RequestSource source = RequestSource::kApi;
  std::string   model_id;
  bool          stream = false;
  std::string   request_body;

  RequestStatus status = RequestStatus::kPending;

  // Channel of the attempt that decided the outcome; 0 if none ran.
  int64_t channel_id = 0;

  // Aggregate error summary, only for failed.
  std::optional<std::string> error_message;

  std::optional<int64_t> metrics_latency_ms;
  std::optional<int64_t> metrics_first_token_latency_ms;
};

} // namespace relay::model
