#pragma once

#include <memory>
#include <string_view>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/service/relay_service.hpp"
#include "internal/service/service_context.hpp"

namespace relay::runtime {
class RequestWorkerPool;
}

namespace relay::factory {

/*
  Application

  Owns all long-lived singletons used by relayctl.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  service::ServiceContext                    context;
  std::shared_ptr<service::RelayService>     service;
  std::shared_ptr<runtime::RequestWorkerPool> workers;
};

std::shared_ptr<db::Repository> BuildRepository(const relay::runtime::config::RuntimeConfig& config);

// "http" (default) or "simulated"; an explicit override wins over dispatch.kind.
std::shared_ptr<dispatch::Dispatcher> BuildDispatcher(const relay::runtime::config::RuntimeConfig& config, std::string_view kind = {});

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and dispatcher types.
  Workers are constructed but not started.
*/
Application Build(const relay::runtime::config::RuntimeConfig& config, std::string_view dispatcher_kind = {});

} // namespace relay::factory
