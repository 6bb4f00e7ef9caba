#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/execution.hpp"
#include "internal/model/request.hpp"
#include "internal/model/usage.hpp"
#include "internal/util/time.hpp"

namespace relay::recorder {

struct AuditTrail {
  model::Request                       request;
  std::vector<model::RequestExecution> executions; // ordered by attempt
  std::vector<model::UsageLog>         usage;
};

/*
  Durable audit trail of requests and their attempts.

  RecordExecution is called exactly once per attempt, after the attempt
  reached a terminal status. FinalizeRequest is called exactly once per
  request; a second call fails with util::InvalidState.

  Persistence failures surface as util exceptions or std::runtime_error.
*/
class ExecutionRecorder {
 public:
  explicit ExecutionRecorder(std::shared_ptr<db::Repository> repository);

  void CreateRequest(const model::Request& request);
  void RecordExecution(const model::RequestExecution& execution);
  void FinalizeRequest(const model::Request& request);
  void RecordUsage(const model::UsageLog& usage);

  std::optional<model::Request> GetRequest(const std::string& request_id);
  std::optional<AuditTrail>     LoadAudit(const std::string& request_id);

  std::vector<model::Request>          ListRequests(const db::Page& page);
  std::vector<model::RequestExecution> ExecutionsSince(util::TimePoint since);

  std::vector<model::UsageLog>   UsageForRequest(const std::string& request_id);
  std::optional<model::UsageLog> UsageForExecution(const std::string& execution_id);

  // Deletes requests created before `cutoff`; returns how many were removed.
  uint64_t PruneBefore(util::TimePoint cutoff);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace relay::recorder
