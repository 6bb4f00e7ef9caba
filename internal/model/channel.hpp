#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relay::model {

enum class ChannelStatus : std::uint8_t {
  kEnabled  = 0,
  kDisabled = 1,
  kArchived = 2,
};

constexpr std::string_view ToString(ChannelStatus status) {
  switch (status) {
    case ChannelStatus::kEnabled:
      return "enabled";
    case ChannelStatus::kDisabled:
      return "disabled";
    case ChannelStatus::kArchived:
      return "archived";
  }
  return "disabled";
}

inline std::optional<ChannelStatus> ParseChannelStatus(std::string_view name) {
  if (name.empty() || name == "enabled") return ChannelStatus::kEnabled;
  if (name == "disabled") return ChannelStatus::kDisabled;
  if (name == "archived") return ChannelStatus::kArchived;
  return std::nullopt;
}

struct Channel {
  int64_t       id = 0;
  std::string   name;
  ChannelStatus status = ChannelStatus::kEnabled;

  // Only consulted by the weighted strategy; absent counts as 1.
  std::optional<double> weight;

  std::string base_url;
  std::string api_key;

  // Empty means every model is served.
  std::vector<std::string> supported_models;

  bool Supports(std::string_view model_id) const {
    if (supported_models.empty() || model_id.empty()) {
      return true;
    }
    return std::find(supported_models.begin(), supported_models.end(), model_id) != supported_models.end();
  }
};

} // namespace relay::model
