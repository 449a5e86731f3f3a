#include "server/gateway/gateway_service.h"

#include "net/http_client.h"
#include "server/relay/completion_envelope.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <exception>

using json = nlohmann::json;

namespace chatwarden {

namespace {

void SendTransportError(const HttpTransportError& error,
                        ResponseWriter& writer) {
  writer.SendJson(error.timed_out() ? 504 : 502,
                  BuildErrorBody(std::string("Proxy error: ") + error.what(),
                                 error.timed_out() ? "proxy_timeout"
                                                   : "proxy_error"));
}

std::string StringField(const json& object, const char* key,
                        const std::string& fallback) {
  if (object.is_object()) {
    auto it = object.find(key);
    if (it != object.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return fallback;
}

}  // namespace

GatewayService::GatewayService(ChatBackend* backend,
                               const PreflightGuard& preflight,
                               const StreamingCoordinator& coordinator,
                               int block_status, MetricsRegistry* metrics,
                               log::EventLog* events)
    : backend_(backend),
      preflight_(preflight),
      coordinator_(coordinator),
      block_status_(block_status),
      metrics_(metrics),
      events_(events) {}

bool GatewayService::IsChatCompletionPath(const std::string& path) {
  return path == "/v1/chat/completions" || path == "/chat/completions";
}

void GatewayService::Handle(const HttpRequest& request,
                            ResponseWriter& writer) const {
  if (request.method == "GET" && request.path == "/health") {
    writer.SendJson(
        200, json{{"status", "ok"}, {"service", "chatwarden-gateway"}}.dump());
    return;
  }
  if (request.method == "GET" && request.path == "/metrics" && metrics_) {
    writer.Send(200, "text/plain; version=0.0.4", metrics_->RenderPrometheus());
    return;
  }
  if (IsChatCompletionPath(request.path)) {
    if (request.method != "POST") {
      writer.Send(405, "application/json",
                  BuildErrorBody("Method not allowed", "invalid_request_error"),
                  {{"Allow", "POST"}});
      return;
    }
    HandleChatCompletion(request, writer);
    return;
  }
  Passthrough(request, writer);
}

void GatewayService::HandleChatCompletion(const HttpRequest& request,
                                          ResponseWriter& writer) const {
  auto start = std::chrono::steady_clock::now();
  if (metrics_) {
    metrics_->RecordRequest();
  }
  std::string request_id = RequestIdFor(request);

  try {
    PreflightDecision decision =
        preflight_.Check(ParseChatRequest(request.body), request_id);
    if (!decision.forwarded()) {
      if (metrics_) {
        metrics_->RecordPromptBlocked();
      }
      SendBlock(decision.signal, writer);
    } else {
      if (metrics_) {
        metrics_->RecordTurnsRemoved(decision.turns_removed);
        if (decision.stream_coerced) {
          metrics_->RecordStreamCoerced();
        }
      }
      CompletionOutcome outcome =
          coordinator_.Complete(decision.request, request_id);
      RenderOutcome(outcome, decision.request, writer);
    }
  } catch (const RequestFormatError& ex) {
    if (events_) {
      events_->Emit(log::Level::WARN, "gateway", "request_invalid",
                    {{"request_id", request_id}, {"error", ex.what()}});
    }
    writer.SendJson(422, BuildErrorBody(ex.what(), "invalid_request_error"));
  } catch (const std::exception& ex) {
    if (events_) {
      events_->Emit(log::Level::ERROR, "gateway", "request_failed",
                    {{"request_id", request_id}, {"error", ex.what()}});
    }
    if (!writer.head_written()) {
      writer.SendJson(500, BuildErrorBody(ex.what(), "internal_error"));
    }
  }

  if (metrics_) {
    metrics_->RecordLatency(std::chrono::duration<double, std::milli>(
                                std::chrono::steady_clock::now() - start)
                                .count());
  }
}

void GatewayService::RenderOutcome(const CompletionOutcome& outcome,
                                   const ChatRequest& request,
                                   ResponseWriter& writer) const {
  switch (outcome.kind) {
    case CompletionOutcome::Kind::kTransportError:
      if (metrics_) {
        metrics_->RecordTransportError();
      }
      writer.SendJson(
          outcome.timed_out ? 504 : 502,
          BuildErrorBody("Proxy error: " + outcome.error,
                         outcome.timed_out ? "proxy_timeout" : "proxy_error"));
      return;
    case CompletionOutcome::Kind::kUpstreamError:
      if (metrics_) {
        metrics_->RecordUpstreamError();
      }
      writer.Send(outcome.response.status, outcome.response.content_type,
                  outcome.response.body);
      return;
    case CompletionOutcome::Kind::kSuppress:
      if (metrics_) {
        metrics_->RecordReplySuppressed();
      }
      SendBlock(outcome.signal, writer);
      return;
    case CompletionOutcome::Kind::kAllow:
      break;
  }

  if (!outcome.restream) {
    writer.Send(outcome.response.status, outcome.response.content_type,
                outcome.response.body);
    return;
  }

  const json& raw = outcome.reply.raw;
  std::string id = StringField(raw, "id", {});
  if (id.empty()) {
    id = NewCompletionId();
  }
  int64_t created = NowSeconds();
  if (raw.is_object() && raw.contains("created") &&
      raw["created"].is_number_integer()) {
    created = raw["created"].get<int64_t>();
  }
  std::string model = StringField(raw, "model", request.model);
  std::string finish_reason = "stop";
  if (raw.is_object() && raw.contains("choices") && raw["choices"].is_array() &&
      !raw["choices"].empty()) {
    finish_reason = StringField(raw["choices"][0], "finish_reason", "stop");
  }
  writer.Send(200, "text/event-stream",
              BuildStreamBody(id, created, model, *outcome.reply.content,
                              finish_reason),
              {{"Cache-Control", "no-cache"}});
}

void GatewayService::SendBlock(const ViolationSignal& signal,
                               ResponseWriter& writer) const {
  writer.SendJson(block_status_,
                  BuildErrorBody(signal.message_for_client, "policy_violation",
                                 "content_blocked"));
}

void GatewayService::Passthrough(const HttpRequest& request,
                                 ResponseWriter& writer) const {
  HttpHeaders headers = WithoutHeaders(
      request.headers,
      {"Host", "Content-Length", "Connection", "Transfer-Encoding",
       "Expect"});
  try {
    auto response =
        backend_->Forward(request.method, request.target, request.body, headers);
    writer.Send(response.status, response.content_type, response.body);
  } catch (const HttpTransportError& ex) {
    if (metrics_) {
      metrics_->RecordTransportError();
    }
    if (events_) {
      events_->Emit(log::Level::ERROR, "gateway", "transport_error",
                    {{"request_id", RequestIdFor(request)},
                     {"path", request.path},
                     {"error", ex.what()},
                     {"timed_out", ex.timed_out()}});
    }
    SendTransportError(ex, writer);
  }
}

}  // namespace chatwarden
