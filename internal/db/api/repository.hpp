#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/execution.hpp"
#include "internal/model/request.hpp"
#include "internal/model/usage.hpp"

namespace relay::db {

struct Page {
  std::size_t offset = 0;
  std::size_t limit  = 100;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Executions are insert-only; a second insert of the same id fails with
    AlreadyExists
  - ListExecutions returns a request's executions ordered by attempt

  The DB is the source of truth for:
    request terminal status
    the per-attempt audit trail
    usage counters
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Requests
  // ---------------------------------------------------------------------

  virtual Result InsertRequest(Transaction&, const model::Request&) = 0;

  virtual std::optional<model::Request> GetRequest(Transaction&, const std::string& id) = 0;

  virtual Result UpdateRequest(Transaction&, const model::Request&) = 0;

  // Newest first.
  virtual std::vector<model::Request> ListRequests(Transaction&, const Page& page) = 0;

  // Removes requests created before the cutoff together with their
  // executions and usage rows.
  virtual Result DeleteRequestsBefore(Transaction&, uint64_t cutoff_ms, uint64_t& deleted) = 0;

  // ---------------------------------------------------------------------
  // Executions
  // ---------------------------------------------------------------------

  virtual Result InsertExecution(Transaction&, const model::RequestExecution&) = 0;

  virtual std::optional<model::RequestExecution> GetExecution(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::RequestExecution> ListExecutions(Transaction&, const std::string& request_id) = 0;

  virtual std::vector<model::RequestExecution> ListExecutionsSince(Transaction&, uint64_t created_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Usage
  // ---------------------------------------------------------------------

  virtual Result InsertUsage(Transaction&, const model::UsageLog&) = 0;

  virtual std::vector<model::UsageLog> ListUsage(Transaction&, const std::string& request_id) = 0;

  virtual std::optional<model::UsageLog> GetUsageByExecution(Transaction&, const std::string& execution_id) = 0;
};

} // namespace relay::db
