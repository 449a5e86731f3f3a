#pragma once

#include "server/logging/logger.h"
#include "server/policy/conversation.h"
#include "server/policy/history_sanitizer.h"
#include "server/policy/policy_classifier.h"

#include <cstddef>
#include <string>

namespace chatwarden {

struct PreflightDecision {
  enum class Action { kForward, kReject };

  Action action{Action::kForward};
  // Rewritten request (kForward).
  ChatRequest request;
  // kReject.
  ViolationSignal signal;
  std::size_t turns_removed{0};
  bool stream_coerced{false};

  bool forwarded() const { return action == Action::kForward; }
};

// Gatekeeper run before the backend is called.
//
// The newest user turn is checked first and a match rejects the request
// outright; this check is fail-closed, so classifier errors propagate. Only a
// clean request gets its history sanitized (fail-open) and its stream flag
// handed to StreamingCoordinator.
class PreflightGuard {
 public:
  PreflightGuard(const ContentClassifier& classifier,
                 const HistorySanitizer& sanitizer, std::string block_message,
                 log::EventLog* events = nullptr);

  // Throws RequestFormatError when the conversation has no user turn.
  PreflightDecision Check(ChatRequest request,
                          const std::string& request_id = {}) const;

 private:
  const ContentClassifier& classifier_;
  const HistorySanitizer& sanitizer_;
  std::string block_message_;
  log::EventLog* events_;
};

}  // namespace chatwarden
