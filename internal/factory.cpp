#include "factory.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/balancer/balancer_set.hpp"
#include "internal/config/config_mapper.hpp"
#include "internal/config/policy_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/simulated_dispatcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recorder/execution_recorder.hpp"
#include "internal/registry/auto_disable.hpp"
#include "internal/registry/channel_registry.hpp"
#include "internal/runtime/request_worker.hpp"
#include "internal/util/time.hpp"
#if RELAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RELAY_DISPATCH_CURL
#include "internal/dispatch/http_dispatcher.hpp"
#endif

namespace relay::factory {

using relay::observability::IntField;
using relay::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const relay::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RELAY_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.has_wal_mode() ? sqlite.wal_mode() : true);
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<dispatch::Dispatcher> BuildDispatcher(const relay::runtime::config::RuntimeConfig& config, std::string_view kind) {
  std::string resolved(kind.empty() ? std::string_view(config.dispatch().kind()) : kind);
  if (resolved.empty()) resolved = "http";

  if (resolved == "simulated") {
    const auto& simulation = config.simulation();
    std::optional<uint64_t> seed;
    if (simulation.seed() != 0) seed = simulation.seed();
    return std::make_shared<dispatch::SimulatedDispatcher>(config::ToChannelProfiles(simulation), seed);
  }

  if (resolved == "http") {
#if RELAY_DISPATCH_CURL
    return std::make_shared<dispatch::HttpDispatcher>(config::ToHttpOptions(config.dispatch()));
#else
    throw std::runtime_error("http dispatcher requested but not enabled at build time");
#endif
  }

  throw std::runtime_error("unknown dispatcher kind '" + resolved + "'");
}

/*
    Build full application dependency graph
*/
Application Build(const relay::runtime::config::RuntimeConfig& config, std::string_view dispatcher_kind) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  auto recorder  = std::make_shared<recorder::ExecutionRecorder>(app.repository);

  // ------------------------------------------------------------------
  // Channels, health and selection
  // ------------------------------------------------------------------
  auto registry       = std::make_shared<registry::ChannelRegistry>(config::ToChannels(config));
  auto auto_disabler  = std::make_shared<registry::AutoDisabler>(registry);
  auto balancer_opts  = config::ToBalancerOptions(config.load_balancer());
  auto tracker        = std::make_shared<balancer::HealthTracker>(balancer_opts.health);
  auto balancers      = std::make_shared<balancer::LoadBalancerSet>(tracker, balancer_opts);

  const auto now      = util::Now();
  const auto hydrated = tracker->Hydrate(recorder->ExecutionsSince(now - balancer_opts.health.window), now);
  RELAY_LOG_INFO("channel health hydrated",
                 {IntField("executions", static_cast<int64_t>(hydrated)), IntField("channels", static_cast<int64_t>(registry->All()->size()))});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto& ctx         = app.context;
  ctx.recorder      = recorder;
  ctx.registry      = registry;
  ctx.auto_disabler = auto_disabler;
  ctx.balancers     = balancers;
  ctx.dispatcher    = BuildDispatcher(config, dispatcher_kind);
  ctx.policies      = std::make_shared<config::PolicyStore>(config::ToRetryPolicy(config.retry_policy()));

  app.service = std::make_shared<service::RelayService>(ctx);

  const auto threads = config.workers().threads() > 0 ? config.workers().threads() : 4;
  app.workers        = std::make_shared<runtime::RequestWorkerPool>(app.service, threads);

  RELAY_LOG_INFO("relay built",
                 {StringField("database", config.database().has_sqlite() ? "sqlite" : "memory"),
                  StringField("strategy", model::ToString(ctx.policies->Snapshot()->load_balancer_strategy)),
                  IntField("workers", static_cast<int64_t>(threads))});
  return app;
}

} // namespace relay::factory
