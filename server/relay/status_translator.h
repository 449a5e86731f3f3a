#pragma once

#include "net/http_client.h"
#include "server/http/http_message.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <string>

namespace chatwarden {

struct RelayOptions {
  // Moderation gateway (or any OpenAI-compatible server).
  std::string backend_url{"http://127.0.0.1:4000"};
  // Status the backend uses to signal a policy rejection.
  int block_status{400};
  int timeout_seconds{600};
};

// What the client asked for, read from its request body. Non-JSON bodies keep
// the defaults.
struct ClientIntent {
  std::string model{"unknown"};
  bool stream{false};
};

ClientIntent ReadClientIntent(const std::string& body);

// Client-facing relay in front of the gateway. Every request is forwarded
// once; a policy rejection coming back is rewritten into a successful
// assistant message (JSON or SSE, matching the request) so chat front ends
// render it instead of an error. Everything else passes through untouched,
// and 200 streams are relayed as the bytes arrive.
class StatusTranslator {
 public:
  static constexpr std::size_t kStreamReadBytes = 4096;

  StatusTranslator(const HttpTransport* transport, RelayOptions options,
                   MetricsRegistry* metrics = nullptr,
                   log::EventLog* events = nullptr);

  // /health and /metrics are answered locally; everything else is relayed.
  void Handle(const HttpRequest& request, ResponseWriter& writer) const;

  void Relay(const HttpRequest& request, ResponseWriter& writer) const;

 private:
  void TranslateBlock(HttpStream& upstream, const ClientIntent& intent,
                      const std::string& request_id,
                      ResponseWriter& writer) const;
  void RelayStream(HttpStream& upstream, const std::string& request_id,
                   ResponseWriter& writer) const;
  void RelayBuffered(HttpStream& upstream, const std::string& request_id,
                     ResponseWriter& writer) const;
  void SendTransportError(const HttpTransportError& error,
                          const std::string& request_id,
                          ResponseWriter& writer) const;

  const HttpTransport* transport_;
  RelayOptions options_;
  MetricsRegistry* metrics_;
  log::EventLog* events_;
};

}  // namespace chatwarden
