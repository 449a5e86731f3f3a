#include "server/policy/streaming_coordinator.h"

#include "net/http_client.h"

namespace chatwarden {

StreamingCoordinator::StreamingCoordinator(ChatBackend* backend,
                                           const ResponseGuard& guard,
                                           log::EventLog* events)
    : backend_(backend), guard_(guard), events_(events) {}

bool StreamingCoordinator::SuppressStreaming(ChatRequest* request,
                                             log::EventLog* events,
                                             const std::string& request_id) {
  if (!request->stream) {
    return false;
  }
  request->stream = false;
  request->metadata[kOriginalStreamKey] = true;
  if (events) {
    events->Emit(log::Level::INFO, "coordinator", "stream_forced_off",
                 {{"request_id", request_id}, {"model", request->model}});
  }
  return true;
}

bool StreamingCoordinator::OriginallyStreamed(const ChatRequest& request) {
  auto it = request.metadata.find(kOriginalStreamKey);
  return it != request.metadata.end() && it->second.is_boolean() &&
         it->second.get<bool>();
}

CompletionOutcome StreamingCoordinator::Complete(
    const ChatRequest& request, const std::string& request_id) const {
  CompletionOutcome outcome;

  ChatRequest outbound = request;
  outbound.stream = false;

  try {
    outcome.response = backend_->Complete(SerializeChatRequest(outbound));
  } catch (const HttpTransportError& ex) {
    outcome.kind = CompletionOutcome::Kind::kTransportError;
    outcome.error = ex.what();
    outcome.timed_out = ex.timed_out();
    if (events_) {
      events_->Emit(log::Level::ERROR, "coordinator", "transport_error",
                    {{"request_id", request_id},
                     {"error", ex.what()},
                     {"timed_out", ex.timed_out()}});
    }
    return outcome;
  }

  if (outcome.response.status < 200 || outcome.response.status >= 300) {
    outcome.kind = CompletionOutcome::Kind::kUpstreamError;
    if (events_) {
      events_->Emit(log::Level::WARN, "coordinator", "upstream_error",
                    {{"request_id", request_id},
                     {"status", outcome.response.status},
                     {"body", log::Excerpt(outcome.response.body, 200)}});
    }
    return outcome;
  }

  auto decision = guard_.Inspect(ParseBackendReply(outcome.response.body),
                                 request_id);
  if (!decision.allowed()) {
    outcome.kind = CompletionOutcome::Kind::kSuppress;
    outcome.signal = decision.signal;
    return outcome;
  }
  outcome.kind = CompletionOutcome::Kind::kAllow;
  outcome.reply = std::move(decision.reply);
  outcome.restream = OriginallyStreamed(request) && outcome.reply.content.has_value();
  return outcome;
}

}  // namespace chatwarden
