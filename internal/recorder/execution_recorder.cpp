#include "execution_recorder.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace relay::recorder {

using relay::observability::IntField;
using relay::observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace

ExecutionRecorder::ExecutionRecorder(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("execution recorder: repository is null");
  }
}

void ExecutionRecorder::CreateRequest(const model::Request& request) {
  if (request.id.empty()) {
    throw util::InvalidArgument("create request: id is empty");
  }
  if (model::IsTerminal(request.status)) {
    throw util::InvalidState("create request: request " + request.id + " is already " + std::string(model::ToString(request.status)));
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertRequest(*tx, request), "create request");
  tx->Commit();
}

void ExecutionRecorder::RecordExecution(const model::RequestExecution& execution) {
  if (!model::IsTerminal(execution.status)) {
    throw util::InvalidState("record execution: execution " + execution.id + " is still " +
                             std::string(model::ToString(execution.status)));
  }

  observability::SpanScope span("relay.recorder.record_execution");
  span.SetAttribute("request_id", execution.request_id);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertExecution(*tx, execution), "record execution");
  tx->Commit();
}

void ExecutionRecorder::FinalizeRequest(const model::Request& request) {
  if (!model::IsTerminal(request.status)) {
    throw util::InvalidState("finalize request: status " + std::string(model::ToString(request.status)) + " is not terminal");
  }

  auto tx     = repository_->Begin();
  auto stored = repository_->GetRequest(*tx, request.id);
  if (!stored) {
    throw util::NotFound("finalize request: request " + request.id + " not found");
  }
  if (!model::CanTransition(stored->status, request.status)) {
    throw util::InvalidState("finalize request: request " + request.id + " cannot move from " +
                             std::string(model::ToString(stored->status)) + " to " + std::string(model::ToString(request.status)));
  }

  ThrowIfDbError(repository_->UpdateRequest(*tx, request), "finalize request");
  tx->Commit();

  RELAY_LOG_DEBUG("request finalized", {StringField("request_id", request.id), StringField("status", model::ToString(request.status))});
}

void ExecutionRecorder::RecordUsage(const model::UsageLog& usage) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertUsage(*tx, usage), "record usage");
  tx->Commit();
}

std::optional<model::Request> ExecutionRecorder::GetRequest(const std::string& request_id) {
  auto tx      = repository_->Begin();
  auto request = repository_->GetRequest(*tx, request_id);
  tx->Commit();
  return request;
}

std::optional<AuditTrail> ExecutionRecorder::LoadAudit(const std::string& request_id) {
  auto tx      = repository_->Begin();
  auto request = repository_->GetRequest(*tx, request_id);
  if (!request) {
    tx->Rollback();
    return std::nullopt;
  }

  AuditTrail trail;
  trail.request    = std::move(*request);
  trail.executions = repository_->ListExecutions(*tx, request_id);
  trail.usage      = repository_->ListUsage(*tx, request_id);
  tx->Commit();
  return trail;
}

std::vector<model::Request> ExecutionRecorder::ListRequests(const db::Page& page) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListRequests(*tx, page);
  tx->Commit();
  return rows;
}

std::vector<model::RequestExecution> ExecutionRecorder::ExecutionsSince(util::TimePoint since) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListExecutionsSince(*tx, util::ToUnixMillis(since));
  tx->Commit();
  return rows;
}

std::vector<model::UsageLog> ExecutionRecorder::UsageForRequest(const std::string& request_id) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListUsage(*tx, request_id);
  tx->Commit();
  return rows;
}

std::optional<model::UsageLog> ExecutionRecorder::UsageForExecution(const std::string& execution_id) {
  auto tx  = repository_->Begin();
  auto row = repository_->GetUsageByExecution(*tx, execution_id);
  tx->Commit();
  return row;
}

uint64_t ExecutionRecorder::PruneBefore(util::TimePoint cutoff) {
  uint64_t deleted = 0;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteRequestsBefore(*tx, util::ToUnixMillis(cutoff), deleted), "prune requests");
  tx->Commit();

  RELAY_LOG_INFO("requests pruned", {IntField("deleted", static_cast<int64_t>(deleted)), IntField("cutoff_ms", static_cast<int64_t>(util::ToUnixMillis(cutoff)))});
  return deleted;
}

} // namespace relay::recorder
