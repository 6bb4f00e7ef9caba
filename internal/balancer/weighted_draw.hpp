#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <vector>

namespace relay::balancer {

/*
  Weighted-random index draw shared by both strategies.

  Draws with probability w_i / sum(w). Zero weights are never drawn unless
  every weight is zero, in which case the draw is uniform.
*/
class WeightedPicker {
 public:
  explicit WeightedPicker(std::optional<uint64_t> seed = std::nullopt);

  // Caller guarantees weights is non-empty.
  size_t Draw(const std::vector<double>& weights);

 private:
  std::mutex      mutex_;
  std::mt19937_64 engine_;
};

} // namespace relay::balancer
