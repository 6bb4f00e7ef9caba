#include "relay_service.hpp"

#include <functional>
#include <unordered_set>

#include "internal/config/policy_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace relay::service {

using relay::observability::IntField;
using relay::observability::StringField;

namespace {

class InFlightGuard {
 public:
  explicit InFlightGuard(std::function<void()> release) : release_(std::move(release)) {
  }
  ~InFlightGuard() {
    release_();
  }

  InFlightGuard(const InFlightGuard&)            = delete;
  InFlightGuard& operator=(const InFlightGuard&) = delete;

 private:
  std::function<void()> release_;
};

} // namespace

RelayService::RelayService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.recorder || !ctx_.registry || !ctx_.balancers || !ctx_.dispatcher || !ctx_.policies) {
    throw util::InvalidArgument("relay service: incomplete service context");
  }
}

std::shared_ptr<core::CancellationToken> RelayService::Register(const std::string& request_id) {
  auto            token = std::make_shared<core::CancellationToken>();
  std::lock_guard lock(inflight_mutex_);
  if (!inflight_.emplace(request_id, token).second) {
    throw util::AlreadyExists("request " + request_id + " is already in flight");
  }
  return token;
}

void RelayService::Unregister(const std::string& request_id) {
  std::lock_guard lock(inflight_mutex_);
  inflight_.erase(request_id);
}

core::TerminalRequest RelayService::Handle(model::Request request, const dispatch::ChunkSink& sink) {
  if (request.id.empty()) {
    request.id = util::GenerateId();
  }

  const auto    request_id = request.id;
  auto          token      = Register(request_id);
  InFlightGuard guard([this, request_id] { Unregister(request_id); });

  core::CoordinatorDeps deps;
  deps.recorder      = ctx_.recorder;
  deps.registry      = ctx_.registry;
  deps.balancers     = ctx_.balancers;
  deps.dispatcher    = ctx_.dispatcher;
  deps.auto_disabler = ctx_.auto_disabler;
  deps.sleeper       = ctx_.sleeper;

  core::RetryCoordinator coordinator(std::move(deps), ctx_.policies->Snapshot());
  return coordinator.Execute(std::move(request), *token, sink);
}

bool RelayService::Cancel(const std::string& request_id) {
  std::shared_ptr<core::CancellationToken> token;
  {
    std::lock_guard lock(inflight_mutex_);
    auto            it = inflight_.find(request_id);
    if (it == inflight_.end()) return false;
    token = it->second;
  }
  token->Cancel();
  RELAY_LOG_INFO("request cancel requested", {StringField("request_id", request_id)});
  return true;
}

std::size_t RelayService::CancelAll() {
  std::vector<std::shared_ptr<core::CancellationToken>> tokens;
  {
    std::lock_guard lock(inflight_mutex_);
    tokens.reserve(inflight_.size());
    for (const auto& [_, token] : inflight_) tokens.push_back(token);
  }
  for (const auto& token : tokens) token->Cancel();
  if (!tokens.empty()) {
    RELAY_LOG_WARN("canceling in-flight requests", {IntField("count", static_cast<int64_t>(tokens.size()))});
  }
  return tokens.size();
}

std::size_t RelayService::InFlight() const {
  std::lock_guard lock(inflight_mutex_);
  return inflight_.size();
}

std::optional<recorder::AuditTrail> RelayService::Audit(const std::string& request_id) {
  return ctx_.recorder->LoadAudit(request_id);
}

std::vector<metrics::ChannelPerformance> RelayService::Performance(util::TimePoint since) {
  const auto executions = ctx_.recorder->ExecutionsSince(since);

  std::unordered_set<std::string> request_ids;
  std::vector<model::UsageLog>    usage;
  for (const auto& execution : executions) {
    if (!request_ids.insert(execution.request_id).second) continue;
    auto rows = ctx_.recorder->UsageForRequest(execution.request_id);
    usage.insert(usage.end(), rows.begin(), rows.end());
  }
  return metrics::SummarizeByChannel(executions, usage);
}

uint64_t RelayService::Prune(util::TimePoint cutoff) {
  return ctx_.recorder->PruneBefore(cutoff);
}

} // namespace relay::service
