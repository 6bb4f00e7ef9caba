#pragma once

#include <cstdint>
#include <string>

#include "dispatcher.hpp"

namespace relay::dispatch {

struct HttpOptions {
  uint32_t    connect_timeout_ms = 10000;
  uint32_t    request_timeout_ms = 300000;
  std::string request_path       = "/chat/completions";
  std::string user_agent         = "relay-manager/0.1";
};

/*
  libcurl dispatcher. POSTs the opaque request body to the channel and, for
  streaming requests, splits the server-sent event stream into chunks on
  blank lines. An exception thrown by the caller's sink aborts the transfer
  and propagates out of Dispatch().
*/
class HttpDispatcher final : public Dispatcher {
 public:
  explicit HttpDispatcher(HttpOptions options = {});

  HttpDispatcher(const HttpDispatcher&)            = delete;
  HttpDispatcher& operator=(const HttpDispatcher&) = delete;

  DispatchOutcome Dispatch(const DispatchRequest&         request,
                           const model::Channel&          channel,
                           const core::CancellationToken& cancel,
                           const ChunkSink&               sink) override;

  std::string EndpointFor(const model::Channel& channel) const;

 private:
  HttpOptions options_;
};

} // namespace relay::dispatch
