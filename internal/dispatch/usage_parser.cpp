#include "usage_parser.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

namespace relay::dispatch {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

int64_t NumberField(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != Value::kNumberValue) {
    return 0;
  }
  return static_cast<int64_t>(it->second.number_value());
}

const Struct* ObjectField(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != Value::kStructValue) {
    return nullptr;
  }
  return &it->second.struct_value();
}

std::string_view StripDataPrefix(std::string_view event) {
  // an event may carry "event:" / "id:" lines before the data line
  const auto pos = event.rfind("data:");
  if (pos == std::string_view::npos) {
    return event;
  }
  auto data = event.substr(pos + 5);
  while (!data.empty() && (data.front() == ' ' || data.front() == '\t')) data.remove_prefix(1);
  while (!data.empty() && (data.back() == '\n' || data.back() == '\r' || data.back() == ' ')) data.remove_suffix(1);
  return data;
}

} // namespace

std::optional<model::UsageLog> ParseUsage(std::string_view json) {
  if (json.empty() || json.front() != '{') {
    return std::nullopt;
  }

  Struct                                   root;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  if (!google::protobuf::util::JsonStringToMessage(std::string(json), &root, options).ok()) {
    return std::nullopt;
  }

  const Struct* usage = ObjectField(root, "usage");
  if (!usage) {
    return std::nullopt;
  }

  model::UsageLog out;
  out.prompt_tokens     = NumberField(*usage, "prompt_tokens");
  out.completion_tokens = NumberField(*usage, "completion_tokens");
  if (const Struct* details = ObjectField(*usage, "completion_tokens_details")) {
    out.completion_reasoning_tokens = NumberField(*details, "reasoning_tokens");
    out.completion_audio_tokens     = NumberField(*details, "audio_tokens");
  }
  return out;
}

std::optional<model::UsageLog> ParseStreamUsage(const std::vector<std::string>& events) {
  for (auto it = events.rbegin(); it != events.rend(); ++it) {
    const auto data = StripDataPrefix(*it);
    if (data == "[DONE]") continue;
    if (auto usage = ParseUsage(data)) {
      return usage;
    }
  }
  return std::nullopt;
}

} // namespace relay::dispatch
