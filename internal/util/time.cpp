#include "time.hpp"

namespace relay::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

int64_t MillisBetween(TimePoint start, TimePoint end) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
}

} // namespace relay::util
