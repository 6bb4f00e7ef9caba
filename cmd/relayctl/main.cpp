#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "internal/api/audit_view.hpp"
#include "internal/api/error_status.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/channel_registry.hpp"
#include "internal/runtime/request_worker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using relay::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  relayctl --config <config.yaml> send <body-file|-> [--model M] [--stream] [--source api|playground|test]\n"
            << "  relayctl --config <config.yaml> simulate <requests> [--concurrency N] [--model M] [--stream]\n"
            << "  relayctl --config <config.yaml> audit <request-id>\n"
            << "  relayctl --config <config.yaml> stats [--since-ms T]\n"
            << "  relayctl --config <config.yaml> prune <days>\n";
}

/*
  Signals cannot touch the service directly; this thread turns SIGINT/SIGTERM
  into cooperative cancellation of every in-flight request.
*/
class SignalWatcher {
 public:
  explicit SignalWatcher(std::shared_ptr<relay::service::RelayService> service) : service_(std::move(service)) {
    thread_ = std::thread([this] {
      while (!done_) {
        if (!g_running) {
          service_->CancelAll();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
    });
  }

  ~SignalWatcher() {
    done_ = true;
    if (thread_.joinable()) thread_.join();
  }

 private:
  std::shared_ptr<relay::service::RelayService> service_;
  std::atomic<bool>                             done_{false};
  std::thread                                   thread_;
};

struct Options {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> flags;
  bool                               stream = false;
};

static Options ParseOptions(int argc, char** argv, int first) {
  Options out;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--stream") {
      out.stream = true;
    } else if (arg.rfind("--", 0) == 0) {
      if (i + 1 >= argc) throw relay::util::InvalidArgument("missing value for " + arg);
      out.flags[arg.substr(2)] = argv[++i];
    } else {
      out.positional.push_back(arg);
    }
  }
  return out;
}

static std::string ReadBody(const std::string& path) {
  if (path == "-") {
    return {std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) throw relay::util::NotFound("cannot open body file " + path);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

static uint64_t ParseCount(const std::string& value, const std::string& what) {
  try {
    size_t     used = 0;
    const auto n    = std::stoull(value, &used);
    if (used != value.size()) throw std::invalid_argument(value);
    return n;
  } catch (const std::logic_error&) {
    throw relay::util::InvalidArgument(what + " must be a non-negative integer, got '" + value + "'");
  }
}

static relay::model::Request BuildRequest(const Options& options, std::string body) {
  relay::model::Request request;
  request.model_id     = options.flags.count("model") ? options.flags.at("model") : "";
  request.stream       = options.stream;
  request.request_body = std::move(body);
  if (auto it = options.flags.find("source"); it != options.flags.end()) {
    auto source = relay::model::ParseRequestSource(it->second);
    if (!source) throw relay::util::InvalidArgument("unknown source '" + it->second + "'");
    request.source = *source;
  }
  return request;
}

// ------------------------------------------------------------

static int RunSend(relay::factory::Application& app, const Options& options) {
  if (options.positional.empty()) {
    Usage();
    return 1;
  }

  auto request = BuildRequest(options, ReadBody(options.positional[0]));

  SignalWatcher watcher(app.service);
  auto          terminal = app.service->Handle(std::move(request), [](std::string_view chunk) {
    std::cout << chunk << "\n\n";
    std::cout.flush();
  });

  auto trail = app.service->Audit(terminal.request.id);
  if (!trail) throw relay::util::NotFound("audit trail for " + terminal.request.id);

  if (!terminal.request.stream && terminal.request.status == relay::model::RequestStatus::kCompleted) {
    std::cout << terminal.executions.back().response_body << "\n";
  }
  std::cerr << relay::api::ToJson(relay::api::ToRequestView(*trail)) << "\n";
  return terminal.request.status == relay::model::RequestStatus::kCompleted ? 0 : 6;
}

static int RunSimulate(relay::factory::Application& app, const Options& options) {
  if (options.positional.empty()) {
    Usage();
    return 1;
  }

  const auto count   = ParseCount(options.positional[0], "requests");
  auto       workers = app.workers;
  if (auto it = options.flags.find("concurrency"); it != options.flags.end()) {
    workers = std::make_shared<relay::runtime::RequestWorkerPool>(app.service, ParseCount(it->second, "concurrency"));
  }

  const auto started = relay::util::Now();

  SignalWatcher watcher(app.service);
  workers->Start();

  std::vector<std::future<relay::core::TerminalRequest>> pending;
  pending.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    pending.push_back(workers->Submit(BuildRequest(options, "{\"simulated\":" + std::to_string(i) + "}")));
  }

  std::map<std::string, uint64_t> by_status;
  for (auto& future : pending) {
    const auto terminal = future.get();
    ++by_status[std::string(relay::model::ToString(terminal.request.status))];
  }
  workers->Stop();

  for (const auto& [status, n] : by_status) {
    std::cerr << status << "=" << n << "\n";
  }

  const auto report = relay::api::ToPerformanceReport(app.service->Performance(started), *app.context.registry->All());
  std::cout << relay::api::ToJson(report) << "\n";
  return 0;
}

static int RunAudit(relay::factory::Application& app, const Options& options) {
  if (options.positional.empty()) {
    Usage();
    return 1;
  }

  auto trail = app.service->Audit(options.positional[0]);
  if (!trail) throw relay::util::NotFound("request " + options.positional[0] + " not found");

  std::cout << relay::api::ToJson(relay::api::ToRequestView(*trail)) << "\n";
  return 0;
}

static int RunStats(relay::factory::Application& app, const Options& options) {
  relay::util::TimePoint since{};
  if (auto it = options.flags.find("since-ms"); it != options.flags.end()) {
    since = relay::util::FromUnixMillis(ParseCount(it->second, "since-ms"));
  }

  const auto report = relay::api::ToPerformanceReport(app.service->Performance(since), *app.context.registry->All());
  std::cout << relay::api::ToJson(report) << "\n";
  return 0;
}

static int RunPrune(relay::factory::Application& app, const Options& options) {
  if (options.positional.empty()) {
    Usage();
    return 1;
  }

  const auto days    = ParseCount(options.positional[0], "days");
  const auto cutoff  = relay::util::Now() - std::chrono::hours(24 * days);
  const auto deleted = app.service->Prune(cutoff);
  std::cout << "deleted=" << deleted << "\n";
  return 0;
}

// ------------------------------------------------------------

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  int rc = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = relay::config::ConfigLoader::LoadFromYaml(config_path);

    relay::observability::InitializeTracing(config);
    relay::observability::InitializeMetrics(config);
    relay::observability::InitializeLogging(config);

    auto options = ParseOptions(argc, argv, 4);

    // Register signal handlers before any request starts.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = relay::factory::Build(config, cmd == "simulate" ? "simulated" : "");

    if (cmd == "send") {
      rc = RunSend(app, options);
    } else if (cmd == "simulate") {
      rc = RunSimulate(app, options);
    } else if (cmd == "audit") {
      rc = RunAudit(app, options);
    } else if (cmd == "stats") {
      rc = RunStats(app, options);
    } else if (cmd == "prune") {
      rc = RunPrune(app, options);
    } else {
      Usage();
      rc = 1;
    }

    app.workers->Stop();
  } catch (const std::exception& e) {
    const auto status = relay::api::ToErrorStatus(e);
    RELAY_LOG_ERROR("relayctl failed", {StringField("command", cmd), StringField("code", status.code), StringField("error", e.what())});
    rc = status.exit_code;
  }

  relay::observability::ShutdownLogging();
  relay::observability::ShutdownMetrics();
  relay::observability::ShutdownTracing();
  return rc;
}
