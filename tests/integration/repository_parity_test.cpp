#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"

#if RELAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using relay::db::ErrorCode;
using relay::db::Page;
using relay::db::Repository;
using relay::db::memory::MemoryRepository;
using relay::model::ExecutionStatus;
using relay::model::Request;
using relay::model::RequestExecution;
using relay::model::RequestStatus;
using relay::model::UsageLog;
using relay::util::TimePoint;
using namespace std::chrono_literals;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// Backends persist millisecond precision.
TimePoint NowTruncated() {
  return relay::util::FromUnixMillis(NowMs());
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

Request MakeRequest(const std::string& id, TimePoint created_at) {
  Request r;
  r.id           = id;
  r.created_at   = created_at;
  r.updated_at   = created_at;
  r.model_id     = "gpt-4o";
  r.stream       = true;
  r.request_body = std::string("{\"messages\":[]}\0tail", 20);
  r.status       = RequestStatus::kProcessing;
  return r;
}

RequestExecution MakeExecution(const std::string& request_id, int64_t attempt, TimePoint at) {
  RequestExecution e;
  e.id           = request_id + "-" + std::to_string(attempt);
  e.request_id   = request_id;
  e.channel_id   = 10 + attempt;
  e.model_id     = "gpt-4o";
  e.attempt      = attempt;
  e.stream       = true;
  e.request_body = "{}";
  e.created_at   = at;
  e.updated_at   = at + 250ms;
  if (attempt == 1) {
    e.status             = ExecutionStatus::kFailed;
    e.error_message      = "upstream returned HTTP 503";
    e.error_status_code  = 503;
    e.metrics_latency_ms = 250;
  } else {
    e.status                         = ExecutionStatus::kCompleted;
    e.response_chunks                = {"data: {\"a\":1}", "data: {\"b\":2}", "data: [DONE]"};
    e.first_chunk_at                 = at + 40ms;
    e.metrics_latency_ms             = 250;
    e.metrics_first_token_latency_ms = 40;
  }
  return e;
}

void VerifyRequestLifecycle(Repository& repo, const std::string& id) {
  const auto now = NowTruncated();
  {
    auto tx = repo.Begin();
    assert(repo.InsertRequest(*tx, MakeRequest(id, now)));
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto dup = repo.InsertRequest(*tx, MakeRequest(id, now));
    assert(!dup && dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx     = repo.Begin();
  auto stored = repo.GetRequest(*tx, id);
  assert(stored.has_value());
  assert(stored->created_at == now);
  assert(stored->request_body.size() == 20);
  assert(stored->status == RequestStatus::kProcessing);
  assert(!stored->error_message.has_value());

  stored->status                         = RequestStatus::kFailed;
  stored->updated_at                     = now + 2s;
  stored->channel_id                     = 12;
  stored->error_message                  = "all attempts failed";
  stored->metrics_first_token_latency_ms = std::nullopt;
  assert(repo.UpdateRequest(*tx, *stored));

  auto missing = MakeRequest(id + "-missing", now);
  auto res     = repo.UpdateRequest(*tx, missing);
  assert(!res && res.code == ErrorCode::NotFound);
  tx->Commit();

  auto verify = repo.Begin();
  auto final  = repo.GetRequest(*verify, id);
  assert(final->status == RequestStatus::kFailed);
  assert(final->channel_id == 12);
  assert(final->updated_at == now + 2s);
  assert(final->error_message == std::optional<std::string>("all attempts failed"));
  verify->Commit();
}

void VerifyExecutionsAndUsage(Repository& repo, const std::string& id) {
  const auto now = NowTruncated();
  {
    auto tx = repo.Begin();
    assert(repo.InsertRequest(*tx, MakeRequest(id, now)));
    assert(repo.InsertExecution(*tx, MakeExecution(id, 2, now + 1s)));
    assert(repo.InsertExecution(*tx, MakeExecution(id, 1, now)));

    UsageLog usage;
    usage.request_id                  = id;
    usage.execution_id                = id + "-2";
    usage.prompt_tokens               = 9;
    usage.completion_tokens           = 77;
    usage.completion_reasoning_tokens = 5;
    assert(repo.InsertUsage(*tx, usage));
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto dup = repo.InsertExecution(*tx, MakeExecution(id, 1, now));
    assert(!dup && dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx     = repo.Begin();
    auto orphan = repo.InsertExecution(*tx, MakeExecution(id + "-ghost", 1, now));
    assert(!orphan && orphan.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  auto tx         = repo.Begin();
  auto executions = repo.ListExecutions(*tx, id);
  assert(executions.size() == 2);
  assert(executions[0].attempt == 1 && executions[1].attempt == 2);

  const auto& failed = executions[0];
  assert(failed.status == ExecutionStatus::kFailed);
  assert(failed.error_status_code == 503);
  assert(failed.error_message == std::optional<std::string>("upstream returned HTTP 503"));
  assert(failed.response_chunks.empty());
  assert(!failed.first_chunk_at.has_value());
  assert(!failed.metrics_first_token_latency_ms.has_value());

  const auto& completed = executions[1];
  assert(completed.status == ExecutionStatus::kCompleted);
  assert(completed.response_chunks.size() == 3);
  assert(completed.response_chunks[2] == "data: [DONE]");
  assert(completed.first_chunk_at == now + 1s + 40ms);
  assert(completed.updated_at == now + 1s + 250ms);
  assert(completed.metrics_first_token_latency_ms == 40);
  assert(!completed.error_message.has_value());

  auto single = repo.GetExecution(*tx, id + "-2");
  assert(single.has_value() && single->response_chunks == completed.response_chunks);
  assert(!repo.GetExecution(*tx, id + "-9").has_value());

  auto usage = repo.ListUsage(*tx, id);
  assert(usage.size() == 1);
  assert(usage[0].completion_tokens == 77 && usage[0].completion_reasoning_tokens == 5);
  assert(repo.GetUsageByExecution(*tx, id + "-2")->prompt_tokens == 9);
  assert(!repo.GetUsageByExecution(*tx, id + "-1").has_value());
  tx->Commit();
}

void VerifyRollbackDiscardsWrites(Repository& repo, const std::string& id) {
  const auto now = NowTruncated();
  {
    auto tx = repo.Begin();
    assert(repo.InsertRequest(*tx, MakeRequest(id, now)));
    assert(repo.InsertExecution(*tx, MakeExecution(id, 1, now)));
    // reads inside the transaction see its writes
    assert(repo.ListExecutions(*tx, id).size() == 1);
    tx->Rollback();
  }

  // destroyed without commit
  {
    auto tx = repo.Begin();
    assert(repo.InsertRequest(*tx, MakeRequest(id + "-dropped", now)));
  }

  auto tx = repo.Begin();
  assert(!repo.GetRequest(*tx, id).has_value());
  assert(!repo.GetRequest(*tx, id + "-dropped").has_value());
  assert(repo.ListExecutions(*tx, id).empty());
  tx->Commit();
}

void VerifyListingWindowAndPrune(Repository& repo, const std::string& prefix) {
  const auto now = NowTruncated();
  {
    auto tx = repo.Begin();
    assert(repo.InsertRequest(*tx, MakeRequest(prefix + "-old", now - 72h)));
    assert(repo.InsertExecution(*tx, MakeExecution(prefix + "-old", 1, now - 72h)));
    UsageLog usage;
    usage.request_id   = prefix + "-old";
    usage.execution_id = prefix + "-old-1";
    assert(repo.InsertUsage(*tx, usage));

    assert(repo.InsertRequest(*tx, MakeRequest(prefix + "-new", now + 1h)));
    assert(repo.InsertExecution(*tx, MakeExecution(prefix + "-new", 1, now + 1h)));
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto page = repo.ListRequests(*tx, Page{0, 1});
    assert(page.size() == 1);
    assert(page[0].id == prefix + "-new");

    auto since = repo.ListExecutionsSince(*tx, relay::util::ToUnixMillis(now + 30min));
    assert(since.size() == 1);
    assert(since[0].request_id == prefix + "-new");
    tx->Commit();
  }

  uint64_t deleted = 0;
  {
    auto tx = repo.Begin();
    assert(repo.DeleteRequestsBefore(*tx, relay::util::ToUnixMillis(now - 24h), deleted));
    tx->Commit();
  }
  assert(deleted == 1);

  auto tx = repo.Begin();
  assert(!repo.GetRequest(*tx, prefix + "-old").has_value());
  assert(repo.ListExecutions(*tx, prefix + "-old").empty());
  assert(repo.ListUsage(*tx, prefix + "-old").empty());
  assert(!repo.GetExecution(*tx, prefix + "-old-1").has_value());
  assert(repo.GetRequest(*tx, prefix + "-new").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo = backend.make_repository();
  const auto now  = NowTruncated();
  {
    auto tx = repo->Begin();
    assert(repo->InsertRequest(*tx, MakeRequest(id, now)));
    assert(repo->InsertExecution(*tx, MakeExecution(id, 1, now)));
    assert(repo->InsertExecution(*tx, MakeExecution(id, 2, now + 1s)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx         = repo->Begin();
  auto executions = repo->ListExecutions(*tx, id);
  assert(executions.size() == 2);
  assert(executions[1].response_chunks.size() == 3);
  assert(repo->GetRequest(*tx, id)->created_at == now);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if RELAY_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("relay_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<relay::db::sqlite::SqliteDB>(db_path);
    relay::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<relay::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

void RunBackend(BackendFactory backend) {
  auto repo = backend.make_repository();

  const auto prefix = backend.name + "-" + std::to_string(NowMs());
  VerifyRequestLifecycle(*repo, prefix + "-lifecycle");
  VerifyExecutionsAndUsage(*repo, prefix + "-executions");
  VerifyRollbackDiscardsWrites(*repo, prefix + "-rollback");
  VerifyListingWindowAndPrune(*repo, prefix + "-window");

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-restart");
  backend.cleanup();

  std::cout << "relay_integration_repository_parity[" << backend.name << "]: pass\n";
}

} // namespace

int main() {
  RunBackend(MakeMemoryFactory());
#if RELAY_DB_SQLITE
  RunBackend(MakeSqliteFactory());
#endif
  return 0;
}
