#include "server/policy/response_guard.h"

#include <exception>
#include <utility>

namespace chatwarden {

ResponseGuard::ResponseGuard(const ContentClassifier& classifier,
                             std::string block_message, log::EventLog* events)
    : classifier_(classifier),
      block_message_(std::move(block_message)),
      events_(events) {}

ResponseDecision ResponseGuard::Inspect(const BackendReply& reply,
                                        const std::string& request_id) const {
  ResponseDecision decision;
  decision.reply = reply;
  if (!reply.content || reply.content->empty()) {
    return decision;
  }

  PolicyMatch match;
  bool flagged = false;
  try {
    flagged = classifier_.Classify(*reply.content, &match);
  } catch (const std::exception& ex) {
    if (events_) {
      events_->Emit(log::Level::WARN, "response_guard",
                    "response_guard_failed",
                    {{"request_id", request_id}, {"error", ex.what()}});
    }
    return decision;
  }
  if (!flagged) {
    return decision;
  }

  decision.action = ResponseDecision::Action::kSuppress;
  decision.signal.blocked = true;
  decision.signal.message_for_client = block_message_;
  decision.signal.detail = match.rule;
  if (events_) {
    events_->Emit(log::Level::INFO, "response_guard", "reply_suppressed",
                  {{"request_id", request_id},
                   {"rule", match.rule},
                   {"excerpt", log::Excerpt(*reply.content)}});
  }
  return decision;
}

}  // namespace chatwarden
