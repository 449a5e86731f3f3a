#pragma once

#include "server/backend/chat_backend.h"
#include "server/http/http_message.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "server/policy/preflight_guard.h"
#include "server/policy/streaming_coordinator.h"

#include <string>

namespace chatwarden {

// Moderating gateway in front of the upstream model server.
//
// Chat completions run the full pipeline: parse, PreflightGuard (block or
// sanitize), one backend call through StreamingCoordinator, and the verdict
// rendered as a block signal, the backend's reply, or an SSE replay when the
// client had asked for a stream. Other routes are forwarded unmoderated.
class GatewayService {
 public:
  GatewayService(ChatBackend* backend, const PreflightGuard& preflight,
                 const StreamingCoordinator& coordinator, int block_status,
                 MetricsRegistry* metrics = nullptr,
                 log::EventLog* events = nullptr);

  void Handle(const HttpRequest& request, ResponseWriter& writer) const;

  void HandleChatCompletion(const HttpRequest& request,
                            ResponseWriter& writer) const;

  static bool IsChatCompletionPath(const std::string& path);

 private:
  void RenderOutcome(const CompletionOutcome& outcome,
                     const ChatRequest& request, ResponseWriter& writer) const;
  void SendBlock(const ViolationSignal& signal, ResponseWriter& writer) const;
  void Passthrough(const HttpRequest& request, ResponseWriter& writer) const;

  ChatBackend* backend_;
  const PreflightGuard& preflight_;
  const StreamingCoordinator& coordinator_;
  int block_status_;
  MetricsRegistry* metrics_;
  log::EventLog* events_;
};

}  // namespace chatwarden
