#include <assert.h>

#include <cmath>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/balancer/weighted_balancer.hpp"
#include "internal/balancer/weighted_draw.hpp"
#include "internal/util/errors.hpp"

namespace {

using relay::balancer::ExcludedChannels;
using relay::balancer::WeightedBalancer;
using relay::balancer::WeightedPicker;
using relay::model::Channel;
using relay::model::ChannelStatus;

Channel MakeChannel(int64_t id, std::optional<double> weight) {
  Channel channel;
  channel.id     = id;
  channel.name   = "ch-" + std::to_string(id);
  channel.weight = weight;
  return channel;
}

std::map<int64_t, int> Tally(WeightedBalancer& lb, const std::vector<Channel>& candidates, const ExcludedChannels& excluded, int trials) {
  std::map<int64_t, int> counts;
  for (int i = 0; i < trials; ++i) {
    auto chosen = lb.SelectChannel(candidates, excluded);
    assert(chosen.has_value());
    ++counts[chosen->id];
  }
  return counts;
}

void TestFrequencyConvergesToWeights() {
  WeightedBalancer lb(7);
  const std::vector<Channel> candidates = {MakeChannel(1, 1.0), MakeChannel(2, 3.0), MakeChannel(3, 6.0)};

  const int  trials = 20000;
  const auto counts = Tally(lb, candidates, {}, trials);

  const double expected[] = {0.1, 0.3, 0.6};
  for (int64_t id = 1; id <= 3; ++id) {
    const double observed = static_cast<double>(counts.at(id)) / trials;
    assert(std::fabs(observed - expected[id - 1]) < 0.02);
  }
}

void TestMissingWeightCountsAsOne() {
  WeightedBalancer lb(11);
  const std::vector<Channel> candidates = {MakeChannel(1, std::nullopt), MakeChannel(2, 1.0)};

  const int  trials   = 10000;
  const auto counts   = Tally(lb, candidates, {}, trials);
  const auto observed = static_cast<double>(counts.at(1)) / trials;
  assert(std::fabs(observed - 0.5) < 0.03);
}

void TestZeroWeightIsNeverChosen() {
  WeightedBalancer lb(3);
  const std::vector<Channel> candidates = {MakeChannel(1, 0.0), MakeChannel(2, 2.0)};

  const auto counts = Tally(lb, candidates, {}, 2000);
  assert(counts.count(1) == 0);
  assert(counts.at(2) == 2000);
}

void TestAllZeroWeightsFallBackToUniform() {
  WeightedBalancer lb(5);
  const std::vector<Channel> candidates = {MakeChannel(1, 0.0), MakeChannel(2, 0.0)};

  const auto counts = Tally(lb, candidates, {}, 4000);
  assert(counts.at(1) > 1600);
  assert(counts.at(2) > 1600);
}

void TestExclusionAndDisabledChannels() {
  WeightedBalancer lb(9);

  auto disabled   = MakeChannel(3, 100.0);
  disabled.status = ChannelStatus::kDisabled;
  const std::vector<Channel> candidates = {MakeChannel(1, 1.0), MakeChannel(2, 1.0), disabled};

  const auto counts = Tally(lb, candidates, {1}, 500);
  assert(counts.size() == 1);
  assert(counts.at(2) == 500);

  assert(!lb.SelectChannel(candidates, {1, 2}).has_value());
  assert(!lb.SelectChannel({}, {}).has_value());
}

void TestSeededSequencesAreReproducible() {
  WeightedBalancer a(1234);
  WeightedBalancer b(1234);
  const std::vector<Channel> candidates = {MakeChannel(1, 1.0), MakeChannel(2, 1.0), MakeChannel(3, 1.0)};

  for (int i = 0; i < 200; ++i) {
    assert(a.SelectChannel(candidates, {})->id == b.SelectChannel(candidates, {})->id);
  }
}

void TestPickerRejectsEmptyInput() {
  WeightedPicker picker(1);
  bool           threw = false;
  try {
    picker.Draw({});
  } catch (const relay::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "empty weight set must be rejected");

  // negative and non-finite weights are treated as zero
  for (int i = 0; i < 500; ++i) {
    assert(picker.Draw({-5.0, INFINITY, 2.0}) == 2);
  }
}

} // namespace

int main() {
  TestFrequencyConvergesToWeights();
  TestMissingWeightCountsAsOne();
  TestZeroWeightIsNeverChosen();
  TestAllZeroWeightsFallBackToUniform();
  TestExclusionAndDisabledChannels();
  TestSeededSequencesAreReproducible();
  TestPickerRejectsEmptyInput();

  std::cout << "relay_unit_weighted_balancer: pass\n";
  return 0;
}
