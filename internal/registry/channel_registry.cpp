#include "channel_registry.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relay::registry {

using relay::observability::IntField;
using relay::observability::StringField;

namespace {

void ValidateWeight(const std::optional<double>& weight) {
  if (weight && (*weight < 0.0 || !std::isfinite(*weight))) {
    throw util::InvalidArgument("channel weight must be a finite value >= 0");
  }
}

} // namespace

ChannelRegistry::ChannelRegistry() : channels_(std::make_shared<const std::vector<model::Channel>>()) {
}

ChannelRegistry::ChannelRegistry(std::vector<model::Channel> channels) {
  for (const auto& channel : channels) {
    ValidateWeight(channel.weight);
  }
  channels_ = std::make_shared<const std::vector<model::Channel>>(std::move(channels));
}

ChannelRegistry::Snapshot ChannelRegistry::All() const {
  std::shared_lock lock(mutex_);
  return channels_;
}

std::vector<model::Channel> ChannelRegistry::Candidates(std::string_view model_id) const {
  auto snapshot = All();

  std::vector<model::Channel> out;
  out.reserve(snapshot->size());
  for (const auto& channel : *snapshot) {
    if (channel.status == model::ChannelStatus::kEnabled && channel.Supports(model_id)) {
      out.push_back(channel);
    }
  }
  return out;
}

std::optional<model::Channel> ChannelRegistry::Find(int64_t channel_id) const {
  auto snapshot = All();
  auto it       = std::find_if(snapshot->begin(), snapshot->end(), [&](const model::Channel& c) { return c.id == channel_id; });
  if (it == snapshot->end()) return std::nullopt;
  return *it;
}

void ChannelRegistry::Upsert(const model::Channel& channel) {
  ValidateWeight(channel.weight);

  std::unique_lock lock(mutex_);
  auto             next = std::make_shared<std::vector<model::Channel>>(*channels_);
  auto             it   = std::find_if(next->begin(), next->end(), [&](const model::Channel& c) { return c.id == channel.id; });
  if (it == next->end()) {
    next->push_back(channel);
  } else {
    *it = channel;
  }
  channels_ = std::move(next);
}

bool ChannelRegistry::SetStatus(int64_t channel_id, model::ChannelStatus status) {
  std::unique_lock lock(mutex_);
  auto             next = std::make_shared<std::vector<model::Channel>>(*channels_);
  auto             it   = std::find_if(next->begin(), next->end(), [&](const model::Channel& c) { return c.id == channel_id; });
  if (it == next->end()) return false;
  if (it->status == status) return true;

  it->status = status;
  channels_  = std::move(next);
  lock.unlock();

  RELAY_LOG_INFO("channel status changed", {IntField("channel_id", channel_id), StringField("status", model::ToString(status))});
  return true;
}

bool ChannelRegistry::SetWeight(int64_t channel_id, std::optional<double> weight) {
  ValidateWeight(weight);

  std::unique_lock lock(mutex_);
  auto             next = std::make_shared<std::vector<model::Channel>>(*channels_);
  auto             it   = std::find_if(next->begin(), next->end(), [&](const model::Channel& c) { return c.id == channel_id; });
  if (it == next->end()) return false;

  it->weight = weight;
  channels_  = std::move(next);
  return true;
}

} // namespace relay::registry
