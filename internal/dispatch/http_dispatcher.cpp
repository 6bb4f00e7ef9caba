#include "http_dispatcher.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <exception>
#include <memory>
#include <stdexcept>

#include "internal/core/cancellation.hpp"
#include "internal/dispatch/chunk_tee.hpp"
#include "internal/dispatch/error_classifier.hpp"
#include "internal/dispatch/usage_parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace relay::dispatch {

using relay::observability::IntField;
using relay::observability::StringField;

namespace {

struct TransferContext {
  CURL*                          curl   = nullptr;
  ChunkTee*                      tee    = nullptr;
  const core::CancellationToken* cancel = nullptr;
  bool                           stream = false;
  std::string                    body;
  std::string                    pending;
  // set when the caller's sink throws; rethrown once curl has unwound
  std::exception_ptr             sink_error;
};

bool UpstreamOk(CURL* curl) {
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  return status >= 200 && status < 300;
}

// Emits every complete SSE event held in ctx.pending.
void DrainEvents(TransferContext& ctx) {
  for (;;) {
    auto pos = ctx.pending.find("\n\n");
    size_t sep = 2;
    const auto crlf = ctx.pending.find("\r\n\r\n");
    if (crlf != std::string::npos && (pos == std::string::npos || crlf < pos)) {
      pos = crlf;
      sep = 4;
    }
    if (pos == std::string::npos) {
      return;
    }
    ctx.tee->Push(std::string_view(ctx.pending).substr(0, pos));
    ctx.pending.erase(0, pos + sep);
  }
}

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto&        ctx = *static_cast<TransferContext*>(userdata);
  const size_t n   = size * nmemb;
  if (ctx.cancel->IsCancelled()) {
    return 0;
  }

  ctx.body.append(ptr, n);
  if (ctx.stream && UpstreamOk(ctx.curl)) {
    ctx.pending.append(ptr, n);
    try {
      DrainEvents(ctx);
    } catch (...) {
      // exceptions must not cross libcurl's C frames; returning 0 aborts the transfer
      ctx.sink_error = std::current_exception();
      return 0;
    }
  }
  return n;
}

int ProgressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto& ctx = *static_cast<TransferContext*>(userdata);
  return ctx.cancel->IsCancelled() ? 1 : 0;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void AppendHeader(HeaderList& list, const std::string& line) {
  curl_slist* next = curl_slist_append(list.get(), line.c_str());
  if (next) {
    list.release();
    list.reset(next);
  }
}

// libcurl's global state is set up once per process and torn down at exit,
// never by an individual dispatcher.
void EnsureCurlGlobalInit() {
  static const CURLcode code = [] {
    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc == CURLE_OK) {
      std::atexit(curl_global_cleanup);
    }
    return rc;
  }();
  if (code != CURLE_OK) {
    throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
  }
}

} // namespace

HttpDispatcher::HttpDispatcher(HttpOptions options) : options_(std::move(options)) {
  EnsureCurlGlobalInit();
}

std::string HttpDispatcher::EndpointFor(const model::Channel& channel) const {
  std::string base = channel.base_url;
  while (!base.empty() && base.back() == '/') base.pop_back();

  std::string path = options_.request_path;
  if (!path.empty() && path.front() != '/') path.insert(path.begin(), '/');
  return base + path;
}

DispatchOutcome HttpDispatcher::Dispatch(const DispatchRequest&         request,
                                         const model::Channel&          channel,
                                         const core::CancellationToken& cancel,
                                         const ChunkSink&               sink) {
  observability::SpanScope span("relay.dispatch.http");
  span.SetAttribute("channel_id", static_cast<std::int64_t>(channel.id));

  DispatchOutcome outcome;
  outcome.started_at = util::Now();

  ChunkTee tee(sink);
  auto     finish = [&](ErrorClassification classification, std::optional<std::string> error) {
    outcome.classification = classification;
    outcome.error_message  = std::move(error);
    outcome.first_chunk_at = tee.FirstChunkAt();
    outcome.chunks         = tee.TakeChunks();
    outcome.finished_at    = util::Now();
    if (outcome.error_message) {
      span.RecordException(*outcome.error_message);
    }
    return std::move(outcome);
  };

  if (cancel.IsCancelled()) {
    return finish(ErrorClassification::kCancellation, "canceled before dispatch");
  }

  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    return finish(ErrorClassification::kTransient, "curl_easy_init failed");
  }

  TransferContext ctx;
  ctx.curl   = curl.get();
  ctx.tee    = &tee;
  ctx.cancel = &cancel;
  ctx.stream = request.stream;

  const auto url = EndpointFor(channel);

  HeaderList headers(nullptr, &curl_slist_free_all);
  AppendHeader(headers, "Content-Type: application/json");
  AppendHeader(headers, request.stream ? "Accept: text/event-stream" : "Accept: application/json");
  if (!channel.api_key.empty()) {
    AppendHeader(headers, "Authorization: Bearer " + channel.api_key);
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout_ms));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.request_timeout_ms));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, ProgressCallback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

  const CURLcode code = curl_easy_perform(curl.get());
  if (ctx.sink_error) {
    std::rethrow_exception(ctx.sink_error);
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  outcome.status_code = static_cast<int32_t>(status);

  if (cancel.IsCancelled()) {
    outcome.response_body = std::move(ctx.body);
    return finish(ErrorClassification::kCancellation, "canceled during dispatch");
  }

  if (code != CURLE_OK) {
    RELAY_LOG_WARN("upstream transfer failed",
                   {IntField("channel_id", channel.id), StringField("url", url), StringField("error", curl_easy_strerror(code))});
    outcome.status_code = 0;
    const std::string reason = code == CURLE_OPERATION_TIMEDOUT ? "timeout: " : "transport: ";
    return finish(ErrorClassification::kTransient, reason + curl_easy_strerror(code));
  }

  // trailing event without a terminating blank line
  if (request.stream && !ctx.pending.empty()) {
    tee.Push(ctx.pending);
    ctx.pending.clear();
  }

  outcome.response_body = std::move(ctx.body);
  const auto classification = ClassifyHttpStatus(outcome.status_code);
  span.SetAttribute("http.status_code", static_cast<std::int64_t>(outcome.status_code));

  if (classification != ErrorClassification::kNone) {
    std::string message = "upstream returned HTTP " + std::to_string(outcome.status_code);
    if (!outcome.response_body.empty()) {
      message += ": " + outcome.response_body.substr(0, 512);
    }
    return finish(classification, std::move(message));
  }

  outcome.usage = request.stream ? ParseStreamUsage(tee.Chunks()) : ParseUsage(outcome.response_body);
  return finish(ErrorClassification::kNone, std::nullopt);
}

} // namespace relay::dispatch
