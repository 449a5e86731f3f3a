#include "server/policy/preflight_guard.h"

#include "server/policy/streaming_coordinator.h"

#include <utility>

namespace chatwarden {

PreflightGuard::PreflightGuard(const ContentClassifier& classifier,
                               const HistorySanitizer& sanitizer,
                               std::string block_message,
                               log::EventLog* events)
    : classifier_(classifier),
      sanitizer_(sanitizer),
      block_message_(std::move(block_message)),
      events_(events) {}

PreflightDecision PreflightGuard::Check(ChatRequest request,
                                        const std::string& request_id) const {
  const Turn* last_user = nullptr;
  for (auto it = request.conversation.rbegin();
       it != request.conversation.rend(); ++it) {
    if (it->role == Role::kUser) {
      last_user = &*it;
      break;
    }
  }
  if (!last_user) {
    throw RequestFormatError("conversation has no user message");
  }

  PreflightDecision decision;
  PolicyMatch match;
  if (classifier_.Classify(last_user->content, &match)) {
    decision.action = PreflightDecision::Action::kReject;
    decision.signal.blocked = true;
    decision.signal.message_for_client = block_message_;
    decision.signal.detail = match.rule;
    if (events_) {
      events_->Emit(log::Level::INFO, "preflight", "prompt_blocked",
                    {{"request_id", request_id},
                     {"model", request.model},
                     {"rule", match.rule},
                     {"excerpt", log::Excerpt(last_user->content)}});
    }
    return decision;
  }

  auto sanitized = sanitizer_.Sanitize(request.conversation, request_id);
  request.conversation = std::move(sanitized.conversation);
  decision.turns_removed = sanitized.removed;
  decision.stream_coerced =
      StreamingCoordinator::SuppressStreaming(&request, events_, request_id);
  decision.request = std::move(request);
  return decision;
}

}  // namespace chatwarden
