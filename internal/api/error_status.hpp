#pragma once

#include <exception>
#include <string_view>

namespace relay::api {

struct ErrorStatus {
  std::string_view code;
  int              exit_code;
};

// Maps relay::util exceptions to a stable error code and process exit code.
ErrorStatus ToErrorStatus(const std::exception& e);

} // namespace relay::api
