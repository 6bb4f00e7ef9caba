#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <vector>

#include "internal/model/channel.hpp"

namespace relay::registry {

/*
  Current channel set.

  Writers replace the whole vector, so a snapshot handed to a coordinator is
  never mutated underneath it.
*/
class ChannelRegistry {
 public:
  using Snapshot = std::shared_ptr<const std::vector<model::Channel>>;

  ChannelRegistry();
  explicit ChannelRegistry(std::vector<model::Channel> channels);

  Snapshot All() const;

  // Enabled channels able to serve model_id, in registration order.
  std::vector<model::Channel> Candidates(std::string_view model_id) const;

  std::optional<model::Channel> Find(int64_t channel_id) const;

  void Upsert(const model::Channel& channel);

  // Both return false when the channel is unknown.
  bool SetStatus(int64_t channel_id, model::ChannelStatus status);
  bool SetWeight(int64_t channel_id, std::optional<double> weight);

 private:
  mutable std::shared_mutex mutex_;
  Snapshot                  channels_;
};

} // namespace relay::registry
