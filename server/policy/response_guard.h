#pragma once

#include "server/logging/logger.h"
#include "server/policy/conversation.h"
#include "server/policy/policy_classifier.h"

#include <string>

namespace chatwarden {

struct ResponseDecision {
  enum class Action { kAllow, kSuppress };

  Action action{Action::kAllow};
  BackendReply reply;
  ViolationSignal signal;

  bool allowed() const { return action == Action::kAllow; }
};

// Polices a complete backend reply. Unparseable or content-free replies are
// allowed through unchanged, and so is a reply the classifier fails on.
class ResponseGuard {
 public:
  ResponseGuard(const ContentClassifier& classifier, std::string block_message,
                log::EventLog* events = nullptr);

  ResponseDecision Inspect(const BackendReply& reply,
                           const std::string& request_id = {}) const;

 private:
  const ContentClassifier& classifier_;
  std::string block_message_;
  log::EventLog* events_;
};

}  // namespace chatwarden
