#include "error_status.hpp"

#include "internal/util/errors.hpp"

namespace relay::api {

ErrorStatus ToErrorStatus(const std::exception& e) {
  using namespace relay::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {"INVALID_ARGUMENT", 2};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {"NOT_FOUND", 3};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {"ALREADY_EXISTS", 4};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {"FAILED_PRECONDITION", 5};
  }

  return {"INTERNAL", 1};
}

} // namespace relay::api
