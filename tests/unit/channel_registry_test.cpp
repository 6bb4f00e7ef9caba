#include <assert.h>

#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "internal/registry/auto_disable.hpp"
#include "internal/registry/channel_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using relay::model::AutoDisablePolicy;
using relay::model::Channel;
using relay::model::ChannelStatus;
using relay::model::ExecutionStatus;
using relay::registry::AutoDisabler;
using relay::registry::ChannelRegistry;

Channel MakeChannel(int64_t id, std::vector<std::string> models = {}) {
  Channel channel;
  channel.id               = id;
  channel.name             = "ch-" + std::to_string(id);
  channel.supported_models = std::move(models);
  return channel;
}

void TestCandidatesFilterStatusAndModel() {
  auto archived   = MakeChannel(3);
  archived.status = ChannelStatus::kArchived;
  auto disabled   = MakeChannel(4);
  disabled.status = ChannelStatus::kDisabled;

  ChannelRegistry registry({MakeChannel(1, {"gpt-4o"}), MakeChannel(2), archived, disabled, MakeChannel(5, {"claude"})});

  const auto gpt = registry.Candidates("gpt-4o");
  assert(gpt.size() == 2);
  assert(gpt[0].id == 1 && gpt[1].id == 2);

  const auto claude = registry.Candidates("claude");
  assert(claude.size() == 2);
  assert(claude[0].id == 2 && claude[1].id == 5);

  // no model means any enabled channel
  assert(registry.Candidates("").size() == 3);
  assert(registry.All()->size() == 5);
}

void TestSnapshotsAreNotMutatedByWriters() {
  ChannelRegistry registry({MakeChannel(1), MakeChannel(2)});

  const auto before = registry.All();
  assert(registry.SetStatus(1, ChannelStatus::kDisabled));
  registry.Upsert(MakeChannel(9));

  assert(before->size() == 2);
  assert((*before)[0].status == ChannelStatus::kEnabled);

  const auto after = registry.All();
  assert(after->size() == 3);
  assert(registry.Find(1)->status == ChannelStatus::kDisabled);
  assert(registry.Candidates("x").size() == 2);
}

void TestUpsertReplacesExisting() {
  ChannelRegistry registry;
  registry.Upsert(MakeChannel(1));

  auto updated     = MakeChannel(1);
  updated.base_url = "https://upstream.example/v1";
  registry.Upsert(updated);

  assert(registry.All()->size() == 1);
  assert(registry.Find(1)->base_url == "https://upstream.example/v1");
  assert(!registry.Find(2).has_value());
}

void TestUnknownChannelUpdatesReturnFalse() {
  ChannelRegistry registry({MakeChannel(1)});
  assert(!registry.SetStatus(42, ChannelStatus::kDisabled));
  assert(!registry.SetWeight(42, 2.0));
  assert(registry.SetWeight(1, 2.5));
  assert(registry.Find(1)->weight == 2.5);
  assert(registry.SetWeight(1, std::nullopt));
  assert(!registry.Find(1)->weight.has_value());
}

void TestInvalidWeightsAreRejected() {
  bool threw = false;
  try {
    auto channel   = MakeChannel(1);
    channel.weight = -1.0;
    ChannelRegistry registry({channel});
  } catch (const relay::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "negative weight must be rejected at construction");

  ChannelRegistry registry({MakeChannel(1)});
  threw = false;
  try {
    registry.SetWeight(1, std::numeric_limits<double>::infinity());
  } catch (const relay::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "infinite weight must be rejected");
  assert(!registry.Find(1)->weight.has_value());
}

AutoDisablePolicy PolicyFor(int32_t status_code, int32_t times) {
  AutoDisablePolicy policy;
  policy.enabled = true;
  policy.rules   = {{status_code, times}};
  return policy;
}

void TestAutoDisableAfterRepeatedFailures() {
  auto         registry = std::make_shared<ChannelRegistry>(std::vector<Channel>{MakeChannel(1), MakeChannel(2)});
  AutoDisabler disabler(registry);
  const auto   policy = PolicyFor(429, 3);

  assert(!disabler.Observe(policy, 1, ExecutionStatus::kFailed, 429));
  assert(!disabler.Observe(policy, 1, ExecutionStatus::kFailed, 429));
  assert(disabler.Count(1, 429) == 2);

  // other statuses and other channels do not count
  assert(!disabler.Observe(policy, 1, ExecutionStatus::kFailed, 500));
  assert(!disabler.Observe(policy, 2, ExecutionStatus::kFailed, 429));
  assert(disabler.Count(1, 500) == 0);

  assert(disabler.Observe(policy, 1, ExecutionStatus::kFailed, 429));
  assert(registry->Find(1)->status == ChannelStatus::kDisabled);
  assert(registry->Find(2)->status == ChannelStatus::kEnabled);
  assert(disabler.Count(1, 429) == 0);
}

void TestSuccessResetsCounters() {
  auto         registry = std::make_shared<ChannelRegistry>(std::vector<Channel>{MakeChannel(1)});
  AutoDisabler disabler(registry);
  const auto   policy = PolicyFor(503, 2);

  assert(!disabler.Observe(policy, 1, ExecutionStatus::kFailed, 503));
  assert(!disabler.Observe(policy, 1, ExecutionStatus::kCanceled, 0));
  assert(disabler.Count(1, 503) == 1);

  assert(!disabler.Observe(policy, 1, ExecutionStatus::kCompleted, 0));
  assert(disabler.Count(1, 503) == 0);

  assert(!disabler.Observe(policy, 1, ExecutionStatus::kFailed, 503));
  assert(registry->Find(1)->status == ChannelStatus::kEnabled);
}

void TestDisabledPolicyNeverCounts() {
  auto         registry = std::make_shared<ChannelRegistry>(std::vector<Channel>{MakeChannel(1)});
  AutoDisabler disabler(registry);

  auto policy    = PolicyFor(503, 1);
  policy.enabled = false;
  assert(!disabler.Observe(policy, 1, ExecutionStatus::kFailed, 503));
  assert(disabler.Count(1, 503) == 0);
  assert(registry->Find(1)->status == ChannelStatus::kEnabled);
}

} // namespace

int main() {
  TestCandidatesFilterStatusAndModel();
  TestSnapshotsAreNotMutatedByWriters();
  TestUpsertReplacesExisting();
  TestUnknownChannelUpdatesReturnFalse();
  TestInvalidWeightsAreRejected();
  TestAutoDisableAfterRepeatedFailures();
  TestSuccessResetsCounters();
  TestDisabledPolicyNeverCounts();

  std::cout << "relay_unit_channel_registry: pass\n";
  return 0;
}
