#include "load_balancer.hpp"

#include <cstdlib>
#include <string>

namespace relay::balancer {

std::vector<const model::Channel*> Eligible(const std::vector<model::Channel>& candidates, const ExcludedChannels& excluded) {
  std::vector<const model::Channel*> out;
  out.reserve(candidates.size());
  for (const auto& channel : candidates) {
    if (channel.status != model::ChannelStatus::kEnabled) continue;
    if (excluded.count(channel.id)) continue;
    out.push_back(&channel);
  }
  return out;
}

bool DebugEnabledByEnv() {
  const char* value = std::getenv("RELAY_DEBUG_LOAD_BALANCER_ENABLED");
  if (!value) return false;
  const std::string v(value);
  return v == "1" || v == "true" || v == "TRUE" || v == "yes";
}

} // namespace relay::balancer
