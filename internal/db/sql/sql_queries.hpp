#pragma once

namespace relay::db::sql {

/*
  Canonical SQL for the SQLite recorder.

  Timestamps are unix milliseconds. Nullable metric columns map to
  std::optional on the model side.
*/

// schema

static constexpr const char* kBootstrapSql[] = {
    "CREATE TABLE IF NOT EXISTS requests ("
    " id TEXT PRIMARY KEY,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL,"
    " source INTEGER NOT NULL,"
    " model_id TEXT NOT NULL,"
    " stream INTEGER NOT NULL,"
    " request_body BLOB,"
    " status INTEGER NOT NULL,"
    " channel_id INTEGER NOT NULL DEFAULT 0,"
    " error_message TEXT,"
    " metrics_latency_ms INTEGER,"
    " metrics_first_token_latency_ms INTEGER);",

    "CREATE INDEX IF NOT EXISTS idx_requests_created ON requests(created_at_ms);",

    "CREATE TABLE IF NOT EXISTS request_executions ("
    " id TEXT PRIMARY KEY,"
    " request_id TEXT NOT NULL REFERENCES requests(id) ON DELETE CASCADE,"
    " channel_id INTEGER NOT NULL,"
    " model_id TEXT NOT NULL,"
    " attempt INTEGER NOT NULL,"
    " status INTEGER NOT NULL,"
    " stream INTEGER NOT NULL,"
    " request_body BLOB,"
    " response_body BLOB,"
    " error_message TEXT,"
    " error_status_code INTEGER NOT NULL DEFAULT 0,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL,"
    " first_chunk_at_ms INTEGER,"
    " metrics_latency_ms INTEGER,"
    " metrics_first_token_latency_ms INTEGER);",

    "CREATE INDEX IF NOT EXISTS idx_executions_request ON request_executions(request_id, attempt);",
    "CREATE INDEX IF NOT EXISTS idx_executions_created ON request_executions(created_at_ms);",

    "CREATE TABLE IF NOT EXISTS execution_chunks ("
    " execution_id TEXT NOT NULL REFERENCES request_executions(id) ON DELETE CASCADE,"
    " seq INTEGER NOT NULL,"
    " chunk BLOB NOT NULL,"
    " PRIMARY KEY (execution_id, seq));",

    "CREATE TABLE IF NOT EXISTS usage_logs ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " request_id TEXT NOT NULL REFERENCES requests(id) ON DELETE CASCADE,"
    " execution_id TEXT NOT NULL,"
    " prompt_tokens INTEGER NOT NULL,"
    " completion_tokens INTEGER NOT NULL,"
    " completion_reasoning_tokens INTEGER NOT NULL,"
    " completion_audio_tokens INTEGER NOT NULL);",

    "CREATE INDEX IF NOT EXISTS idx_usage_request ON usage_logs(request_id);",
    "CREATE INDEX IF NOT EXISTS idx_usage_execution ON usage_logs(execution_id);",
};

// requests

#define RELAY_REQUEST_COLUMNS                                                                                                       \
  "id,created_at_ms,updated_at_ms,source,model_id,stream,request_body,status,channel_id,error_message,metrics_latency_ms," \
  "metrics_first_token_latency_ms"

static constexpr const char* INSERT_REQUEST = "INSERT INTO requests(" RELAY_REQUEST_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_REQUEST = "SELECT " RELAY_REQUEST_COLUMNS " FROM requests WHERE id=?;";

static constexpr const char* UPDATE_REQUEST =
    "UPDATE requests SET updated_at_ms=?,status=?,channel_id=?,error_message=?,metrics_latency_ms=?,metrics_first_token_latency_ms=?"
    " WHERE id=?;";

static constexpr const char* LIST_REQUESTS =
    "SELECT " RELAY_REQUEST_COLUMNS " FROM requests ORDER BY created_at_ms DESC, id ASC LIMIT ? OFFSET ?;";

static constexpr const char* DELETE_REQUESTS_BEFORE = "DELETE FROM requests WHERE created_at_ms < ?;";

// executions

#define RELAY_EXECUTION_COLUMNS                                                                                             \
  "id,request_id,channel_id,model_id,attempt,status,stream,request_body,response_body,error_message,error_status_code," \
  "created_at_ms,updated_at_ms,first_chunk_at_ms,metrics_latency_ms,metrics_first_token_latency_ms"

static constexpr const char* INSERT_EXECUTION =
    "INSERT INTO request_executions(" RELAY_EXECUTION_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_EXECUTION = "SELECT " RELAY_EXECUTION_COLUMNS " FROM request_executions WHERE id=?;";

static constexpr const char* LIST_EXECUTIONS =
    "SELECT " RELAY_EXECUTION_COLUMNS " FROM request_executions WHERE request_id=? ORDER BY attempt ASC;";

static constexpr const char* LIST_EXECUTIONS_SINCE =
    "SELECT " RELAY_EXECUTION_COLUMNS " FROM request_executions WHERE created_at_ms>=? ORDER BY created_at_ms ASC, id ASC;";

static constexpr const char* INSERT_CHUNK = "INSERT INTO execution_chunks(execution_id,seq,chunk) VALUES(?,?,?);";

static constexpr const char* SELECT_CHUNKS = "SELECT chunk FROM execution_chunks WHERE execution_id=? ORDER BY seq ASC;";

// usage

static constexpr const char* INSERT_USAGE =
    "INSERT INTO usage_logs(request_id,execution_id,prompt_tokens,completion_tokens,completion_reasoning_tokens,completion_audio_tokens)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* LIST_USAGE =
    "SELECT request_id,execution_id,prompt_tokens,completion_tokens,completion_reasoning_tokens,completion_audio_tokens"
    " FROM usage_logs WHERE request_id=? ORDER BY id ASC;";

static constexpr const char* GET_USAGE_BY_EXECUTION =
    "SELECT request_id,execution_id,prompt_tokens,completion_tokens,completion_reasoning_tokens,completion_audio_tokens"
    " FROM usage_logs WHERE execution_id=? ORDER BY id ASC LIMIT 1;";

#undef RELAY_REQUEST_COLUMNS
#undef RELAY_EXECUTION_COLUMNS

}
