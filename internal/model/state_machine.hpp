#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace relay::model {

/*
  Lifecycle shared by Request and RequestExecution:

    pending -> processing -> {completed, failed, canceled}

  canceled may also be entered directly from pending, since cancellation can
  be imposed before the first attempt starts.
*/

enum class RequestStatus : std::uint8_t {
  kPending    = 0,
  kProcessing = 1,
  kCompleted  = 2,
  kFailed     = 3,
  kCanceled   = 4,
};

enum class ExecutionStatus : std::uint8_t {
  kPending    = 0,
  kProcessing = 1,
  kCompleted  = 2,
  kFailed     = 3,
  kCanceled   = 4,
};

namespace detail {

constexpr bool IsTerminalValue(std::uint8_t v) {
  return v >= 2;
}

constexpr bool CanTransitionValue(std::uint8_t from, std::uint8_t to) {
  if (from == to) {
    return false;
  }
  if (IsTerminalValue(from)) {
    return false;
  }
  if (to == 0) {
    return false;
  }
  // pending may be canceled or failed without ever processing
  if (from == 0) {
    return true;
  }
  return IsTerminalValue(to);
}

constexpr std::string_view StatusName(std::uint8_t v) {
  switch (v) {
    case 0:
      return "pending";
    case 1:
      return "processing";
    case 2:
      return "completed";
    case 3:
      return "failed";
    case 4:
      return "canceled";
  }
  return "unknown";
}

constexpr std::optional<std::uint8_t> ParseStatusValue(std::string_view name) {
  for (std::uint8_t v = 0; v <= 4; ++v) {
    if (StatusName(v) == name) {
      return v;
    }
  }
  return std::nullopt;
}

} // namespace detail

constexpr bool IsTerminal(RequestStatus status) {
  return detail::IsTerminalValue(static_cast<std::uint8_t>(status));
}

constexpr bool IsTerminal(ExecutionStatus status) {
  return detail::IsTerminalValue(static_cast<std::uint8_t>(status));
}

constexpr bool CanTransition(RequestStatus from, RequestStatus to) {
  return detail::CanTransitionValue(static_cast<std::uint8_t>(from), static_cast<std::uint8_t>(to));
}

constexpr bool CanTransition(ExecutionStatus from, ExecutionStatus to) {
  return detail::CanTransitionValue(static_cast<std::uint8_t>(from), static_cast<std::uint8_t>(to));
}

constexpr std::string_view ToString(RequestStatus status) {
  return detail::StatusName(static_cast<std::uint8_t>(status));
}

constexpr std::string_view ToString(ExecutionStatus status) {
  return detail::StatusName(static_cast<std::uint8_t>(status));
}

inline std::optional<RequestStatus> ParseRequestStatus(std::string_view name) {
  auto v = detail::ParseStatusValue(name);
  if (!v) return std::nullopt;
  return static_cast<RequestStatus>(*v);
}

inline std::optional<ExecutionStatus> ParseExecutionStatus(std::string_view name) {
  auto v = detail::ParseStatusValue(name);
  if (!v) return std::nullopt;
  return static_cast<ExecutionStatus>(*v);
}

static_assert(CanTransition(RequestStatus::kPending, RequestStatus::kProcessing));
static_assert(CanTransition(RequestStatus::kProcessing, RequestStatus::kCanceled));
static_assert(!CanTransition(RequestStatus::kCompleted, RequestStatus::kFailed));
static_assert(!CanTransition(ExecutionStatus::kProcessing, ExecutionStatus::kPending));

} // namespace relay::model
