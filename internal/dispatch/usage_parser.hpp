#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/usage.hpp"

namespace relay::dispatch {

// Reads the OpenAI-style `usage` object from a JSON response body.
std::optional<model::UsageLog> ParseUsage(std::string_view json);

// Scans SSE events newest first and returns the first usage object found.
std::optional<model::UsageLog> ParseStreamUsage(const std::vector<std::string>& events);

} // namespace relay::dispatch
