#include "server/relay/status_translator.h"

#include "server/relay/completion_envelope.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace chatwarden {

namespace {

std::string JoinTarget(const std::string& base_url, const std::string& target) {
  std::string base = base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  if (target.empty() || target.front() != '/') {
    return base + "/" + target;
  }
  return base + target;
}

}  // namespace

ClientIntent ReadClientIntent(const std::string& body) {
  ClientIntent intent;
  json parsed = json::parse(body, nullptr, false);
  if (!parsed.is_object()) {
    return intent;
  }
  auto model = parsed.find("model");
  if (model != parsed.end() && model->is_string()) {
    intent.model = model->get<std::string>();
  }
  auto stream = parsed.find("stream");
  if (stream != parsed.end() && stream->is_boolean()) {
    intent.stream = stream->get<bool>();
  }
  return intent;
}

StatusTranslator::StatusTranslator(const HttpTransport* transport,
                                   RelayOptions options,
                                   MetricsRegistry* metrics,
                                   log::EventLog* events)
    : transport_(transport),
      options_(std::move(options)),
      metrics_(metrics),
      events_(events) {}

void StatusTranslator::Handle(const HttpRequest& request,
                              ResponseWriter& writer) const {
  if (request.method == "GET" && request.path == "/health") {
    writer.SendJson(
        200, json{{"status", "ok"}, {"service", "chatwarden-relay"}}.dump());
    return;
  }
  if (request.method == "GET" && request.path == "/metrics" && metrics_) {
    writer.Send(200, "text/plain; version=0.0.4", metrics_->RenderPrometheus());
    return;
  }
  Relay(request, writer);
}

void StatusTranslator::Relay(const HttpRequest& request,
                             ResponseWriter& writer) const {
  auto start = std::chrono::steady_clock::now();
  if (metrics_) {
    metrics_->RecordRequest();
  }
  std::string request_id = RequestIdFor(request);
  ClientIntent intent = ReadClientIntent(request.body);

  HttpHeaders headers = WithoutHeaders(
      request.headers,
      {"Host", "Content-Length", "Connection", "Transfer-Encoding",
       "Expect"});
  if (!HasHeader(headers, "X-Request-Id")) {
    headers.emplace_back("X-Request-Id", request_id);
  }

  try {
    auto upstream =
        transport_->Open(request.method, JoinTarget(options_.backend_url,
                                                    request.target),
                         request.body, headers, options_.timeout_seconds);
    if (upstream->status() == options_.block_status) {
      TranslateBlock(*upstream, intent, request_id, writer);
    } else if (intent.stream && upstream->status() == 200) {
      RelayStream(*upstream, request_id, writer);
    } else {
      RelayBuffered(*upstream, request_id, writer);
    }
  } catch (const HttpTransportError& ex) {
    if (writer.head_written()) {
      // Mid-stream failure: the client sees a truncated body.
      if (events_) {
        events_->Emit(log::Level::WARN, "relay", "transport_error",
                      {{"request_id", request_id},
                       {"error", ex.what()},
                       {"mid_stream", true}});
      }
      if (metrics_) {
        metrics_->RecordTransportError();
      }
    } else {
      SendTransportError(ex, request_id, writer);
    }
  }

  if (metrics_) {
    metrics_->RecordLatency(std::chrono::duration<double, std::milli>(
                                std::chrono::steady_clock::now() - start)
                                .count());
  }
}

void StatusTranslator::TranslateBlock(HttpStream& upstream,
                                      const ClientIntent& intent,
                                      const std::string& request_id,
                                      ResponseWriter& writer) const {
  std::string raw = upstream.ReadToEnd();
  std::string body = raw;
  if (IsChunked(upstream.headers()) && !DecodeChunkedBody(raw, &body)) {
    body = raw;
  }
  std::string message = ExtractBlockMessage(body);
  std::string id = NewCompletionId();
  int64_t created = NowSeconds();

  if (intent.stream) {
    writer.Send(200, "text/event-stream",
                BuildStreamBody(id, created, intent.model, message),
                {{"Cache-Control", "no-cache"}});
  } else {
    writer.SendJson(
        200, BuildCompletionBody(id, created, intent.model, message)
                 .dump(-1, ' ', false, json::error_handler_t::replace));
  }

  if (metrics_) {
    metrics_->RecordBlockTranslated(intent.stream);
  }
  if (events_) {
    events_->Emit(log::Level::INFO, "relay", "block_translated",
                  {{"request_id", request_id},
                   {"model", intent.model},
                   {"stream", intent.stream},
                   {"upstream_status", upstream.status()},
                   {"message", log::Excerpt(message)}});
  }
}

void StatusTranslator::RelayStream(HttpStream& upstream,
                                   const std::string& request_id,
                                   ResponseWriter& writer) const {
  if (!writer.WriteHead(upstream.status(),
                        WithoutHeaders(upstream.headers(), {"Connection"}))) {
    return;
  }
  std::vector<char> buffer(kStreamReadBytes);
  std::size_t relayed = 0;
  while (true) {
    std::size_t n = upstream.Read(buffer.data(), buffer.size());
    if (n == 0) {
      break;
    }
    if (!writer.WriteBody(buffer.data(), n)) {
      // Client went away; dropping `upstream` closes the backend connection.
      if (events_) {
        events_->Emit(log::Level::DEBUG, "relay", "client_disconnected",
                      {{"request_id", request_id}, {"bytes", relayed}});
      }
      return;
    }
    relayed += n;
  }
}

void StatusTranslator::RelayBuffered(HttpStream& upstream,
                                     const std::string& request_id,
                                     ResponseWriter& writer) const {
  std::string raw = upstream.ReadToEnd();
  if (upstream.status() >= 400) {
    if (metrics_) {
      metrics_->RecordUpstreamError();
    }
    if (events_) {
      events_->Emit(log::Level::WARN, "relay", "upstream_error",
                    {{"request_id", request_id},
                     {"status", upstream.status()},
                     {"body", log::Excerpt(raw, 200)}});
    }
  }
  if (!writer.WriteHead(upstream.status(),
                        WithoutHeaders(upstream.headers(), {"Connection"}))) {
    return;
  }
  writer.Write(raw);
}

void StatusTranslator::SendTransportError(const HttpTransportError& error,
                                          const std::string& request_id,
                                          ResponseWriter& writer) const {
  if (metrics_) {
    metrics_->RecordTransportError();
  }
  if (events_) {
    events_->Emit(log::Level::ERROR, "relay", "transport_error",
                  {{"request_id", request_id},
                   {"backend_url", options_.backend_url},
                   {"error", error.what()},
                   {"timed_out", error.timed_out()}});
  }
  writer.SendJson(error.timed_out() ? 504 : 502,
                  BuildErrorBody(std::string("Proxy error: ") + error.what(),
                                 error.timed_out() ? "proxy_timeout"
                                                   : "proxy_error"));
}

}  // namespace chatwarden
