#pragma once

#include "server/logging/logger.h"
#include "server/policy/conversation.h"
#include "server/policy/policy_classifier.h"

#include <cstddef>
#include <string>

namespace chatwarden {

struct SanitizeResult {
  Conversation conversation;
  std::size_t removed{0};
  // The original conversation was returned because repair emptied the
  // dialogue or failed.
  bool fell_back{false};
};

// Removes policy-violating turns from conversation history while keeping the
// dialogue well formed: it starts with a user turn and roles alternate. A
// leading system preamble is carried through untouched.
//
// Flagged user turns take the assistant reply that follows them along; a
// flagged assistant reply after a clean user turn is dropped alone and the
// user turn stays (pairing only runs user -> assistant). Tool and other
// unpoliced turns are never removed for content.
class HistorySanitizer {
 public:
  explicit HistorySanitizer(const ContentClassifier& classifier,
                            log::EventLog* events = nullptr);

  SanitizeResult Sanitize(const Conversation& conversation,
                          const std::string& request_id = {}) const;

 private:
  Conversation RepairDialogue(const Conversation& dialogue,
                              const std::string& request_id,
                              std::size_t* removed) const;
  void Emit(log::Level level, const std::string& event,
            const std::string& request_id, nlohmann::json fields) const;

  const ContentClassifier& classifier_;
  log::EventLog* events_;
};

}  // namespace chatwarden
