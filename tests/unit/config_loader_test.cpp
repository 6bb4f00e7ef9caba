#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "internal/config/config_mapper.hpp"
#include "internal/config/policy_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using relay::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "relay_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool RejectsYaml(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigMapsToRuntimeTypes() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "/tmp/relay/audit.db"
    wal_mode: false
retry_policy:
  enabled: true
  max_channel_retries: 4
  max_single_channel_retries: 1
  retry_delay_ms: 250
  load_balancer_strategy: weighted
  auto_disable:
    enabled: true
    statuses:
      - status: 429
        times: 3
load_balancer:
  seed: 7
  window_seconds: 120
  cooldown_ms: 5000
  cooldown_penalty: 0.5
  exploration_score: 0.05
dispatch:
  kind: simulated
  request_timeout_ms: 20000
channels:
  - id: 1
    name: primary
    weight: 3
    base_url: "https://api.example.com/v1"
    api_key: "0123456789"
    supported_models: [gpt-4o, gpt-4o-mini]
  - id: 2
    status: disabled
workers:
  threads: 8
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().sqlite().path() == "/tmp/relay/audit.db");
  assert(config.database().sqlite().has_wal_mode() && !config.database().sqlite().wal_mode());
  assert(config.workers().threads() == 8);

  const auto policy = relay::config::ToRetryPolicy(config.retry_policy());
  assert(policy.enabled);
  assert(policy.max_channel_retries == 4);
  assert(policy.max_single_channel_retries == 1);
  assert(policy.retry_delay_ms == 250);
  assert(policy.load_balancer_strategy == relay::model::LoadBalancerStrategy::kWeighted);
  assert(policy.auto_disable.enabled);
  assert(policy.auto_disable.rules.size() == 1);
  assert(policy.auto_disable.rules[0].status_code == 429 && policy.auto_disable.rules[0].times == 3);

  const auto channels = relay::config::ToChannels(config);
  assert(channels.size() == 2);
  assert(channels[0].name == "primary");
  assert(channels[0].weight == 3.0);
  // quoted numeric scalars stay strings
  assert(channels[0].api_key == "0123456789");
  assert(channels[0].supported_models.size() == 2);
  assert(channels[1].name == "channel-2");
  assert(channels[1].status == relay::model::ChannelStatus::kDisabled);
  assert(!channels[1].weight.has_value());

  const auto lb = relay::config::ToBalancerOptions(config.load_balancer());
  assert(lb.seed == 7u);
  assert(lb.health.window == std::chrono::seconds(120));
  assert(lb.health.cooldown_ms == 5000);
  assert(lb.health.cooldown_penalty == 0.5);
  assert(lb.exploration_score == 0.05);

  const auto http = relay::config::ToHttpOptions(config.dispatch());
  assert(http.request_timeout_ms == 20000);
  assert(http.connect_timeout_ms == 10000);
}

void TestOmittedPolicyFieldsUseDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(retry_policy:
  retry_delay_ms: 0
)");
  const auto policy = relay::config::ToRetryPolicy(config.retry_policy());
  assert(policy.enabled);
  assert(policy.max_channel_retries == 3);
  assert(policy.max_single_channel_retries == 2);
  // explicit zero is kept
  assert(policy.retry_delay_ms == 0);
  assert(policy.load_balancer_strategy == relay::model::LoadBalancerStrategy::kAdaptive);
  assert(!policy.auto_disable.enabled);
}

void TestEmptyDocumentIsValid() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.channels_size() == 0);
  assert(!config.database().has_sqlite());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\relay\\\"quoted\"\\db.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\relay\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(retry_policy:
  max_channel_retries: 2
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/relay/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "missing config file must be reported");
}

void TestInvalidValuesAreRejected() {
  assert(RejectsYaml("retry_policy:\n  load_balancer_strategy: round_robin\n"));
  assert(RejectsYaml("retry_policy:\n  max_channel_retries: -1\n"));
  assert(RejectsYaml("retry_policy:\n  retry_delay_ms: -5\n"));
  assert(RejectsYaml("retry_policy:\n  auto_disable:\n    statuses:\n      - status: 42\n        times: 1\n"));
  assert(RejectsYaml("load_balancer:\n  cooldown_penalty: 1.5\n"));
  assert(RejectsYaml("load_balancer:\n  exploration_score: -0.1\n"));
  assert(RejectsYaml("load_balancer:\n  exploration_score: 1.5\n"));
  assert(RejectsYaml("dispatch:\n  kind: grpc\n"));
  assert(RejectsYaml("channels:\n  - id: 0\n"));
  assert(RejectsYaml("channels:\n  - id: 1\n  - id: 1\n"));
  assert(RejectsYaml("channels:\n  - id: 1\n    status: paused\n"));
  assert(RejectsYaml("channels:\n  - id: 1\n    weight: -2\n"));
  assert(RejectsYaml("simulation:\n  profiles:\n    - channel_id: 1\n      failure_rate: 2\n"));
  assert(RejectsYaml("database:\n  sqlite:\n    wal_mode: true\n"));

  bool invalid_argument = false;
  try {
    (void)ConfigLoader::LoadFromYamlString("dispatch:\n  kind: grpc\n");
  } catch (const relay::util::InvalidArgument& e) {
    invalid_argument = std::string(e.what()).find("invalid configuration") == 0;
  }
  assert(invalid_argument && "semantic problems surface as InvalidArgument");
}

void TestSimulationProfiles() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(simulation:
  seed: 3
  profiles:
    - channel_id: 1
      failure_rate: 0.25
      failure_status: 429
      latency_ms: 80
    - channel_id: 2
      chunks: 0
)");
  const auto profiles = relay::config::ToChannelProfiles(config.simulation());
  assert(profiles.size() == 2);
  assert(profiles.at(1).failure_rate == 0.25);
  assert(profiles.at(1).failure_status == 429);
  assert(profiles.at(1).latency_ms == 80);
  // zero chunks keeps the default chunk count
  assert(profiles.at(2).chunks == relay::dispatch::ChannelProfile{}.chunks);
}

void TestPolicyStoreSnapshotsAreIsolated() {
  relay::config::PolicyStore store;

  const auto before = store.Snapshot();
  assert(before->max_channel_retries == 3);

  relay::model::RetryPolicy next;
  next.max_channel_retries = 1;
  next.enabled             = false;
  store.Update(next);

  assert(before->max_channel_retries == 3);
  assert(before->enabled);
  assert(store.Snapshot()->max_channel_retries == 1);
  assert(!store.Snapshot()->enabled);

  relay::model::RetryPolicy invalid;
  invalid.retry_delay_ms = -1;
  bool threw             = false;
  try {
    store.Update(invalid);
  } catch (const relay::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "invalid policy must be rejected");
  assert(store.Snapshot()->max_channel_retries == 1);
}

void TestExtremeRetryBoundsAreAccepted() {
  const auto config = ConfigLoader::LoadFromYamlString(
      "retry_policy:\n  max_channel_retries: 2147483647\n  max_single_channel_retries: 2147483647\n");
  const auto policy = relay::config::ToRetryPolicy(config.retry_policy());

  constexpr int64_t kMax = std::numeric_limits<int32_t>::max();
  assert(policy.max_channel_retries == kMax);
  assert(policy.max_single_channel_retries == kMax);
  assert(policy.MaxAttempts() == kMax * (kMax + 1));

  relay::config::PolicyStore store(policy);
  assert(store.Snapshot()->max_single_channel_retries == kMax);
}

} // namespace

int main() {
  TestFullConfigMapsToRuntimeTypes();
  TestOmittedPolicyFieldsUseDefaults();
  TestEmptyDocumentIsValid();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestInvalidValuesAreRejected();
  TestSimulationProfiles();
  TestPolicyStoreSnapshotsAreIsolated();
  TestExtremeRetryBoundsAreAccepted();

  std::cout << "relay_unit_config_loader: pass\n";
  return 0;
}
