#pragma once

#include <cstdint>
#include <string>

namespace relay::model {

// Token counts reported by the usage subsystem for one execution.
struct UsageLog {
  std::string request_id;
  std::string execution_id;

  int64_t prompt_tokens               = 0;
  int64_t completion_tokens           = 0;
  int64_t completion_reasoning_tokens = 0;
  int64_t completion_audio_tokens     = 0;
};

} // namespace relay::model
