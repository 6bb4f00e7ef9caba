#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/time.hpp"

namespace relay::db::sqlite {

using relay::db::ErrorCode;
using relay::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  BindU64(st, idx, util::ToUnixMillis(tp));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

util::TimePoint ColTime(sqlite3_stmt* st, int col) {
  return util::FromUnixMillis(static_cast<uint64_t>(ColI64(st, col)));
}

model::Request ReadRequest(sqlite3_stmt* st) {
  model::Request r;
  r.id                             = ColText(st, 0);
  r.created_at                     = ColTime(st, 1);
  r.updated_at                     = ColTime(st, 2);
  r.source                         = static_cast<model::RequestSource>(sqlite3_column_int(st, 3));
  r.model_id                       = ColText(st, 4);
  r.stream                         = sqlite3_column_int(st, 5) != 0;
  r.request_body                   = ColBlob(st, 6);
  r.status                         = static_cast<model::RequestStatus>(sqlite3_column_int(st, 7));
  r.channel_id                     = ColI64(st, 8);
  r.error_message                  = ColOptText(st, 9);
  r.metrics_latency_ms             = ColOptI64(st, 10);
  r.metrics_first_token_latency_ms = ColOptI64(st, 11);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  for (const char* sql : sql::kBootstrapSql) {
    db.Exec(sql);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

Result SqliteRepository::InsertRequest(Transaction& t, const model::Request& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_REQUEST);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindTime(st.get(), 2, r.created_at);
  BindTime(st.get(), 3, r.updated_at);
  sqlite3_bind_int(st.get(), 4, static_cast<int>(r.source));
  BindText(st.get(), 5, r.model_id);
  sqlite3_bind_int(st.get(), 6, r.stream ? 1 : 0);
  BindBlob(st.get(), 7, r.request_body);
  sqlite3_bind_int(st.get(), 8, static_cast<int>(r.status));
  BindI64(st.get(), 9, r.channel_id);
  BindOptText(st.get(), 10, r.error_message);
  BindOptI64(st.get(), 11, r.metrics_latency_ms);
  BindOptI64(st.get(), 12, r.metrics_first_token_latency_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::Request> SqliteRepository::GetRequest(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_REQUEST);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRequest(st.get());
}

Result SqliteRepository::UpdateRequest(Transaction& t, const model::Request& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_REQUEST);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindTime(st.get(), 1, r.updated_at);
  sqlite3_bind_int(st.get(), 2, static_cast<int>(r.status));
  BindI64(st.get(), 3, r.channel_id);
  BindOptText(st.get(), 4, r.error_message);
  BindOptI64(st.get(), 5, r.metrics_latency_ms);
  BindOptI64(st.get(), 6, r.metrics_first_token_latency_ms);
  BindText(st.get(), 7, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "request " + r.id);
  return Result::Ok();
}

std::vector<model::Request> SqliteRepository::ListRequests(Transaction& t, const Page& page) {
  auto*                       db = TX(t).Handle();
  std::vector<model::Request> out;
  Statement                   st(db, sql::LIST_REQUESTS);
  if (!st) return out;

  BindU64(st.get(), 1, page.limit);
  BindU64(st.get(), 2, page.offset);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadRequest(st.get()));
  }
  return out;
}

Result SqliteRepository::DeleteRequestsBefore(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted) {
  deleted = 0;
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_REQUESTS_BEFORE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, cutoff_ms);
  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  deleted = static_cast<uint64_t>(sqlite3_changes(db));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result SqliteRepository::InsertExecution(Transaction& t, const model::RequestExecution& r) {
  auto* db = TX(t).Handle();
  {
    Statement st(db, sql::INSERT_EXECUTION);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.request_id);
    BindI64(st.get(), 3, r.channel_id);
    BindText(st.get(), 4, r.model_id);
    sqlite3_bind_int64(st.get(), 5, r.attempt);
    sqlite3_bind_int(st.get(), 6, static_cast<int>(r.status));
    sqlite3_bind_int(st.get(), 7, r.stream ? 1 : 0);
    BindBlob(st.get(), 8, r.request_body);
    BindBlob(st.get(), 9, r.response_body);
    BindOptText(st.get(), 10, r.error_message);
    sqlite3_bind_int(st.get(), 11, r.error_status_code);
    BindTime(st.get(), 12, r.created_at);
    BindTime(st.get(), 13, r.updated_at);
    if (r.first_chunk_at) {
      BindTime(st.get(), 14, *r.first_chunk_at);
    } else {
      sqlite3_bind_null(st.get(), 14);
    }
    BindOptI64(st.get(), 15, r.metrics_latency_ms);
    BindOptI64(st.get(), 16, r.metrics_first_token_latency_ms);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
  }

  Statement chunk_st(db, sql::INSERT_CHUNK);
  if (!chunk_st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  for (size_t seq = 0; seq < r.response_chunks.size(); ++seq) {
    sqlite3_reset(chunk_st.get());
    sqlite3_clear_bindings(chunk_st.get());
    BindText(chunk_st.get(), 1, r.id);
    BindU64(chunk_st.get(), 2, seq);
    BindBlob(chunk_st.get(), 3, r.response_chunks[seq]);
    auto result = Translate(db, sqlite3_step(chunk_st.get()));
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::RequestExecution> SqliteRepository::ReadExecutions(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::RequestExecution> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    model::RequestExecution r;
    r.id                = ColText(st, 0);
    r.request_id        = ColText(st, 1);
    r.channel_id        = ColI64(st, 2);
    r.model_id          = ColText(st, 3);
    r.attempt           = sqlite3_column_int64(st, 4);
    r.status            = static_cast<model::ExecutionStatus>(sqlite3_column_int(st, 5));
    r.stream            = sqlite3_column_int(st, 6) != 0;
    r.request_body      = ColBlob(st, 7);
    r.response_body     = ColBlob(st, 8);
    r.error_message     = ColOptText(st, 9);
    r.error_status_code = sqlite3_column_int(st, 10);
    r.created_at        = ColTime(st, 11);
    r.updated_at        = ColTime(st, 12);
    if (auto first_chunk_ms = ColOptI64(st, 13)) {
      r.first_chunk_at = util::FromUnixMillis(static_cast<uint64_t>(*first_chunk_ms));
    }
    r.metrics_latency_ms             = ColOptI64(st, 14);
    r.metrics_first_token_latency_ms = ColOptI64(st, 15);
    out.push_back(std::move(r));
  }

  for (auto& execution : out) {
    LoadChunks(db, execution);
  }
  return out;
}

void SqliteRepository::LoadChunks(sqlite3* db, model::RequestExecution& execution) {
  Statement st(db, sql::SELECT_CHUNKS);
  if (!st) return;

  BindText(st.get(), 1, execution.id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    execution.response_chunks.push_back(ColBlob(st.get(), 0));
  }
}

std::optional<model::RequestExecution> SqliteRepository::GetExecution(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_EXECUTION);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  auto rows = ReadExecutions(db, st.get());
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::vector<model::RequestExecution> SqliteRepository::ListExecutions(Transaction& t, const std::string& request_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::LIST_EXECUTIONS);
  if (!st) return {};

  BindText(st.get(), 1, request_id);
  return ReadExecutions(db, st.get());
}

std::vector<model::RequestExecution> SqliteRepository::ListExecutionsSince(Transaction& t, uint64_t created_at_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::LIST_EXECUTIONS_SINCE);
  if (!st) return {};

  BindU64(st.get(), 1, created_at_ms);
  return ReadExecutions(db, st.get());
}

// ------------------------------------------------------------------
// Usage
// ------------------------------------------------------------------

Result SqliteRepository::InsertUsage(Transaction& t, const model::UsageLog& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_USAGE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.request_id);
  BindText(st.get(), 2, r.execution_id);
  BindI64(st.get(), 3, r.prompt_tokens);
  BindI64(st.get(), 4, r.completion_tokens);
  BindI64(st.get(), 5, r.completion_reasoning_tokens);
  BindI64(st.get(), 6, r.completion_audio_tokens);
  return Translate(db, sqlite3_step(st.get()));
}

static model::UsageLog ReadUsage(sqlite3_stmt* st) {
  model::UsageLog u;
  u.request_id                  = ColText(st, 0);
  u.execution_id                = ColText(st, 1);
  u.prompt_tokens               = ColI64(st, 2);
  u.completion_tokens           = ColI64(st, 3);
  u.completion_reasoning_tokens = ColI64(st, 4);
  u.completion_audio_tokens     = ColI64(st, 5);
  return u;
}

std::vector<model::UsageLog> SqliteRepository::ListUsage(Transaction& t, const std::string& request_id) {
  auto*                        db = TX(t).Handle();
  std::vector<model::UsageLog> out;
  Statement                    st(db, sql::LIST_USAGE);
  if (!st) return out;

  BindText(st.get(), 1, request_id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadUsage(st.get()));
  }
  return out;
}

std::optional<model::UsageLog> SqliteRepository::GetUsageByExecution(Transaction& t, const std::string& execution_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::GET_USAGE_BY_EXECUTION);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, execution_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadUsage(st.get());
}

} // namespace relay::db::sqlite
