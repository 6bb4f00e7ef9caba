#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace relay::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

Result MemoryRepository::InsertRequest(Transaction& t, const model::Request& r) {
  if (TX(t).View().requests.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "request " + r.id);

  const auto id = r.id;
  auto&      s  = TX(t).Mutable([id](State& st) { st.requests.erase(id); });
  s.requests[r.id] = r;
  return Result::Ok();
}

std::optional<model::Request> MemoryRepository::GetRequest(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.requests.find(id);
  if (it == s.requests.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateRequest(Transaction& t, const model::Request& r) {
  const auto& view = TX(t).View();
  auto        it   = view.requests.find(r.id);
  if (it == view.requests.end()) return Result::Err(ErrorCode::NotFound, "request " + r.id);

  auto  previous = it->second;
  auto& s        = TX(t).Mutable([previous](State& st) { st.requests[previous.id] = previous; });
  s.requests[r.id] = r;
  return Result::Ok();
}

std::vector<model::Request> MemoryRepository::ListRequests(Transaction& t, const Page& page) {
  const auto&                 s = TX(t).View();
  std::vector<model::Request> records;
  records.reserve(s.requests.size());
  for (const auto& [_, record] : s.requests) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const model::Request& a, const model::Request& b) {
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.id < b.id;
  });

  if (page.offset >= records.size()) return {};
  const auto end = std::min(records.size(), page.offset + page.limit);
  return {records.begin() + static_cast<std::ptrdiff_t>(page.offset), records.begin() + static_cast<std::ptrdiff_t>(end)};
}

Result MemoryRepository::DeleteRequestsBefore(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted) {
  deleted = 0;

  std::vector<std::string> doomed;
  for (const auto& [id, request] : TX(t).View().requests) {
    if (util::ToUnixMillis(request.created_at) < cutoff_ms) doomed.push_back(id);
  }

  for (const auto& id : doomed) {
    const auto& view = TX(t).View();

    model::Request                       request = view.requests.at(id);
    std::vector<std::string>             execution_ids;
    std::vector<model::RequestExecution> executions;
    std::vector<model::UsageLog>         usage;
    if (auto it = view.executions_by_request.find(id); it != view.executions_by_request.end()) {
      execution_ids = it->second;
      for (const auto& execution_id : execution_ids) executions.push_back(view.executions.at(execution_id));
    }
    if (auto it = view.usage_by_request.find(id); it != view.usage_by_request.end()) {
      usage = it->second;
    }

    auto& s = TX(t).Mutable([request, execution_ids, executions, usage](State& st) {
      st.requests[request.id] = request;
      for (const auto& execution : executions) st.executions[execution.id] = execution;
      if (!execution_ids.empty()) st.executions_by_request[request.id] = execution_ids;
      if (!usage.empty()) st.usage_by_request[request.id] = usage;
    });

    for (const auto& execution_id : execution_ids) s.executions.erase(execution_id);
    s.executions_by_request.erase(id);
    s.usage_by_request.erase(id);
    s.requests.erase(id);
    ++deleted;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result MemoryRepository::InsertExecution(Transaction& t, const model::RequestExecution& r) {
  const auto& view = TX(t).View();
  if (view.executions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "execution " + r.id);
  if (!view.requests.contains(r.request_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown request " + r.request_id);

  const auto id         = r.id;
  const auto request_id = r.request_id;
  auto&      s          = TX(t).Mutable([id, request_id](State& st) {
    st.executions.erase(id);
    auto& ids = st.executions_by_request[request_id];
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    if (ids.empty()) st.executions_by_request.erase(request_id);
  });
  s.executions[r.id] = r;
  s.executions_by_request[r.request_id].push_back(r.id);
  return Result::Ok();
}

std::optional<model::RequestExecution> MemoryRepository::GetExecution(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.executions.find(id);
  if (it == s.executions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RequestExecution> MemoryRepository::ListExecutions(Transaction& t, const std::string& request_id) {
  const auto&                          s = TX(t).View();
  std::vector<model::RequestExecution> out;
  auto                                 it = s.executions_by_request.find(request_id);
  if (it == s.executions_by_request.end()) return out;

  for (const auto& id : it->second) out.push_back(s.executions.at(id));
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.attempt < b.attempt; });
  return out;
}

std::vector<model::RequestExecution> MemoryRepository::ListExecutionsSince(Transaction& t, uint64_t created_at_ms) {
  std::vector<model::RequestExecution> out;
  for (const auto& [_, execution] : TX(t).View().executions) {
    if (util::ToUnixMillis(execution.created_at) >= created_at_ms) out.push_back(execution);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
  });
  return out;
}

// ------------------------------------------------------------------
// Usage
// ------------------------------------------------------------------

Result MemoryRepository::InsertUsage(Transaction& t, const model::UsageLog& r) {
  if (!TX(t).View().requests.contains(r.request_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown request " + r.request_id);
  }

  const auto request_id = r.request_id;
  auto&      s          = TX(t).Mutable([request_id](State& st) {
    auto& rows = st.usage_by_request[request_id];
    rows.pop_back();
    if (rows.empty()) st.usage_by_request.erase(request_id);
  });
  s.usage_by_request[r.request_id].push_back(r);
  return Result::Ok();
}

std::vector<model::UsageLog> MemoryRepository::ListUsage(Transaction& t, const std::string& request_id) {
  const auto& s  = TX(t).View();
  auto        it = s.usage_by_request.find(request_id);
  if (it == s.usage_by_request.end()) return {};
  return it->second;
}

std::optional<model::UsageLog> MemoryRepository::GetUsageByExecution(Transaction& t, const std::string& execution_id) {
  const auto& s  = TX(t).View();
  auto        it = s.executions.find(execution_id);
  if (it == s.executions.end()) return std::nullopt;

  auto rows = s.usage_by_request.find(it->second.request_id);
  if (rows == s.usage_by_request.end()) return std::nullopt;
  for (const auto& row : rows->second) {
    if (row.execution_id == execution_id) return row;
  }
  return std::nullopt;
}

} // namespace relay::db::memory
