#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace relay::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates tables and indexes if missing.
  static void BootstrapSchema(SqliteDB& db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  static std::vector<model::RequestExecution> ReadExecutions(sqlite3* db, sqlite3_stmt* st);
  static void LoadChunks(sqlite3* db, model::RequestExecution& execution);
};

}
