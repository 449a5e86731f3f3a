#pragma once

#include "server/backend/chat_backend.h"
#include "server/logging/logger.h"
#include "server/policy/conversation.h"
#include "server/policy/response_guard.h"

#include <string>

namespace chatwarden {

struct CompletionOutcome {
  enum class Kind { kAllow, kSuppress, kUpstreamError, kTransportError };

  Kind kind{Kind::kAllow};
  // Backend answer as received (kAllow and kUpstreamError).
  BackendResponse response;
  BackendReply reply;
  ViolationSignal signal;
  // kAllow: the client asked for a stream and the reply has text to replay.
  bool restream{false};
  // kTransportError.
  std::string error;
  bool timed_out{false};
};

// The response guard can only judge a complete reply, so streamed requests are
// downgraded to a single non-streaming backend call. The original intent is
// kept in request metadata and reported back as `restream` so the transport
// layer can present the allowed reply in the shape the client asked for.
class StreamingCoordinator {
 public:
  static constexpr const char* kOriginalStreamKey = "original_stream_request";

  StreamingCoordinator(ChatBackend* backend, const ResponseGuard& guard,
                       log::EventLog* events = nullptr);

  // Clears request->stream and records the original value. Returns true when
  // the request had asked for a stream.
  static bool SuppressStreaming(ChatRequest* request, log::EventLog* events,
                                const std::string& request_id = {});
  static bool OriginallyStreamed(const ChatRequest& request);

  CompletionOutcome Complete(const ChatRequest& request,
                             const std::string& request_id = {}) const;

 private:
  ChatBackend* backend_;
  const ResponseGuard& guard_;
  log::EventLog* events_;
};

}  // namespace chatwarden
