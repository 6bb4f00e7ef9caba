#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace relay::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRequest(Transaction&, const model::Request&) override;
  std::optional<model::Request> GetRequest(Transaction&, const std::string&) override;
  Result UpdateRequest(Transaction&, const model::Request&) override;
  std::vector<model::Request> ListRequests(Transaction&, const Page&) override;
  Result DeleteRequestsBefore(Transaction&, uint64_t cutoff_ms, uint64_t& deleted) override;

  Result InsertExecution(Transaction&, const model::RequestExecution&) override;
  std::optional<model::RequestExecution> GetExecution(Transaction&, const std::string&) override;
  std::vector<model::RequestExecution> ListExecutions(Transaction&, const std::string& request_id) override;
  std::vector<model::RequestExecution> ListExecutionsSince(Transaction&, uint64_t created_at_ms) override;

  Result InsertUsage(Transaction&, const model::UsageLog&) override;
  std::vector<model::UsageLog> ListUsage(Transaction&, const std::string& request_id) override;
  std::optional<model::UsageLog> GetUsageByExecution(Transaction&, const std::string& execution_id) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::Request>                requests;
    std::unordered_map<std::string, model::RequestExecution>       executions;
    std::unordered_map<std::string, std::vector<std::string>>      executions_by_request;
    std::unordered_map<std::string, std::vector<model::UsageLog>>  usage_by_request;
  };

  // Held by the open transaction for its whole lifetime.
  std::mutex mutex_;
  State      state_;
};

}
