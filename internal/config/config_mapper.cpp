#include "config_mapper.hpp"

#include <cmath>
#include <string>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace relay::config {

using relay::runtime::config::RuntimeConfig;

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw util::InvalidArgument("invalid configuration: " + message);
  }
}

} // namespace

void ValidatePolicy(const model::RetryPolicy& policy) {
  Require(policy.max_channel_retries >= 0, "retry_policy.max_channel_retries must be >= 0");
  Require(policy.max_single_channel_retries >= 0, "retry_policy.max_single_channel_retries must be >= 0");
  Require(policy.retry_delay_ms >= 0, "retry_policy.retry_delay_ms must be >= 0");
  for (const auto& rule : policy.auto_disable.rules) {
    Require(rule.status_code >= 100 && rule.status_code <= 599, "auto_disable status must be an HTTP status");
    Require(rule.times >= 1, "auto_disable times must be >= 1");
  }
}

void ValidateConfig(const RuntimeConfig& config) {
  const auto& retry = config.retry_policy();
  Require(model::ParseLoadBalancerStrategy(retry.load_balancer_strategy()).has_value(),
          "unknown load_balancer_strategy '" + retry.load_balancer_strategy() + "'");
  for (const auto& rule : retry.auto_disable().statuses()) {
    Require(rule.times() >= 0, "auto_disable times must be >= 0");
  }
  ValidatePolicy(ToRetryPolicy(retry));

  const auto& lb = config.load_balancer();
  if (lb.has_cooldown_penalty()) {
    Require(lb.cooldown_penalty() >= 0.0 && lb.cooldown_penalty() <= 1.0, "load_balancer.cooldown_penalty must be within [0, 1]");
  }
  if (lb.has_exploration_score()) {
    Require(lb.exploration_score() >= 0.0 && lb.exploration_score() <= 1.0, "load_balancer.exploration_score must be within [0, 1]");
  }

  const auto& dispatch = config.dispatch();
  Require(dispatch.kind().empty() || dispatch.kind() == "http" || dispatch.kind() == "simulated",
          "dispatch.kind must be 'http' or 'simulated'");

  std::unordered_set<int64_t> ids;
  for (const auto& channel : config.channels()) {
    const auto label = "channel " + std::to_string(channel.id());
    Require(channel.id() > 0, "channel ids must be positive");
    Require(ids.insert(channel.id()).second, "duplicate " + label);
    Require(model::ParseChannelStatus(channel.status()).has_value(), label + ": unknown status '" + channel.status() + "'");
    if (channel.has_weight()) {
      Require(channel.weight() >= 0.0 && std::isfinite(channel.weight()), label + ": weight must be >= 0");
    }
  }

  for (const auto& profile : config.simulation().profiles()) {
    Require(profile.failure_rate() >= 0.0 && profile.failure_rate() <= 1.0, "simulation failure_rate must be within [0, 1]");
  }

  if (config.database().has_sqlite()) {
    Require(!config.database().sqlite().path().empty(), "database.sqlite.path is required");
  }
}

model::RetryPolicy ToRetryPolicy(const relay::runtime::config::RetryPolicyConfig& config) {
  model::RetryPolicy policy;
  if (config.has_enabled()) policy.enabled = config.enabled();
  if (config.has_max_channel_retries()) policy.max_channel_retries = config.max_channel_retries();
  if (config.has_max_single_channel_retries()) policy.max_single_channel_retries = config.max_single_channel_retries();
  if (config.has_retry_delay_ms()) policy.retry_delay_ms = config.retry_delay_ms();

  if (auto strategy = model::ParseLoadBalancerStrategy(config.load_balancer_strategy())) {
    policy.load_balancer_strategy = *strategy;
  }

  policy.auto_disable.enabled = config.auto_disable().enabled();
  for (const auto& rule : config.auto_disable().statuses()) {
    model::AutoDisableRule out;
    out.status_code = rule.status();
    out.times       = rule.times() > 0 ? rule.times() : 1;
    policy.auto_disable.rules.push_back(out);
  }
  return policy;
}

std::vector<model::Channel> ToChannels(const RuntimeConfig& config) {
  std::vector<model::Channel> out;
  out.reserve(static_cast<size_t>(config.channels_size()));
  for (const auto& c : config.channels()) {
    model::Channel channel;
    channel.id       = c.id();
    channel.name     = c.name().empty() ? "channel-" + std::to_string(c.id()) : c.name();
    channel.status   = model::ParseChannelStatus(c.status()).value_or(model::ChannelStatus::kDisabled);
    channel.base_url = c.base_url();
    channel.api_key  = c.api_key();
    if (c.has_weight()) channel.weight = c.weight();
    channel.supported_models.assign(c.supported_models().begin(), c.supported_models().end());
    out.push_back(std::move(channel));
  }
  return out;
}

balancer::BalancerOptions ToBalancerOptions(const relay::runtime::config::LoadBalancerConfig& config) {
  balancer::BalancerOptions options;
  if (config.window_seconds() > 0) options.health.window = std::chrono::seconds(config.window_seconds());
  if (config.cooldown_ms() > 0) options.health.cooldown_ms = config.cooldown_ms();
  if (config.has_cooldown_penalty()) options.health.cooldown_penalty = config.cooldown_penalty();
  if (config.latency_reference_ms() > 0) options.health.latency_reference_ms = config.latency_reference_ms();
  if (config.has_exploration_score()) options.exploration_score = config.exploration_score();
  if (config.has_seed()) options.seed = config.seed();
  options.debug = config.debug();
  return options;
}

dispatch::HttpOptions ToHttpOptions(const relay::runtime::config::DispatchConfig& config) {
  dispatch::HttpOptions options;
  if (config.connect_timeout_ms() > 0) options.connect_timeout_ms = config.connect_timeout_ms();
  if (config.request_timeout_ms() > 0) options.request_timeout_ms = config.request_timeout_ms();
  if (!config.request_path().empty()) options.request_path = config.request_path();
  if (!config.user_agent().empty()) options.user_agent = config.user_agent();
  return options;
}

std::unordered_map<int64_t, dispatch::ChannelProfile> ToChannelProfiles(const relay::runtime::config::SimulationConfig& config) {
  std::unordered_map<int64_t, dispatch::ChannelProfile> out;
  for (const auto& p : config.profiles()) {
    dispatch::ChannelProfile profile;
    profile.failure_rate      = p.failure_rate();
    profile.failure_status    = p.failure_status();
    profile.latency_ms        = p.latency_ms();
    profile.first_chunk_ms    = p.first_chunk_ms();
    profile.chunks            = p.chunks() > 0 ? p.chunks() : profile.chunks;
    profile.completion_tokens = p.completion_tokens();
    out[p.channel_id()]       = profile;
  }
  return out;
}

} // namespace relay::config
