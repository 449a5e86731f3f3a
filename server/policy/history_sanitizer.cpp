#include "server/policy/history_sanitizer.h"

#include <exception>
#include <utility>

namespace chatwarden {

HistorySanitizer::HistorySanitizer(const ContentClassifier& classifier,
                                   log::EventLog* events)
    : classifier_(classifier), events_(events) {}

SanitizeResult HistorySanitizer::Sanitize(const Conversation& conversation,
                                          const std::string& request_id) const {
  SanitizeResult result;
  result.conversation = conversation;

  auto start = DialogueStart(conversation);
  // Nothing to repair beyond the turn that triggered this request.
  if (conversation.size() - start <= 1) {
    return result;
  }

  Conversation dialogue(conversation.begin() + start, conversation.end());
  Conversation repaired;
  std::size_t removed = 0;
  try {
    repaired = RepairDialogue(dialogue, request_id, &removed);
  } catch (const std::exception& ex) {
    Emit(log::Level::WARN, "sanitize_failed", request_id,
         {{"error", ex.what()}});
    result.fell_back = true;
    return result;
  }

  if (repaired.empty()) {
    Emit(log::Level::WARN, "sanitize_emptied", request_id,
         {{"turns", dialogue.size()}});
    result.fell_back = true;
    return result;
  }

  if (removed > 0) {
    Emit(log::Level::INFO, "history_sanitized", request_id,
         {{"removed", removed},
          {"turns_before", conversation.size()},
          {"turns_after", start + repaired.size()}});
  }

  result.conversation.assign(conversation.begin(), conversation.begin() + start);
  result.conversation.insert(result.conversation.end(), repaired.begin(),
                             repaired.end());
  result.removed = removed;
  return result;
}

Conversation HistorySanitizer::RepairDialogue(const Conversation& dialogue,
                                              const std::string& request_id,
                                              std::size_t* removed) const {
  Conversation kept;
  std::size_t i = 0;
  while (i < dialogue.size()) {
    const Turn& turn = dialogue[i];
    PolicyMatch match;
    if (turn.role == Role::kOther ||
        !classifier_.Classify(turn.content, &match)) {
      kept.push_back(turn);
      ++i;
      continue;
    }
    if (turn.role == Role::kUser) {
      ++*removed;
      Emit(log::Level::DEBUG, "turn_removed", request_id,
           {{"role", "user"}, {"rule", match.rule},
            {"excerpt", log::Excerpt(turn.content)}});
      if (i + 1 < dialogue.size() && dialogue[i + 1].role == Role::kAssistant) {
        ++*removed;
        Emit(log::Level::DEBUG, "turn_removed", request_id,
             {{"role", "assistant"}, {"paired", true},
              {"excerpt", log::Excerpt(dialogue[i + 1].content)}});
        i += 2;
      } else {
        ++i;
      }
      continue;
    }
    // A violating reply whose prompt was clean should not exist.
    ++*removed;
    Emit(log::Level::WARN, "orphan_violation", request_id,
         {{"role", WireRole(turn)}, {"rule", match.rule},
          {"excerpt", log::Excerpt(turn.content)}});
    ++i;
  }

  std::size_t leading = 0;
  while (leading < kept.size() && kept[leading].role == Role::kAssistant) {
    ++leading;
  }
  *removed += leading;

  // Collapse same-role runs, keeping the newest turn of each run. Tool
  // results answer distinct calls, so unpoliced turns are never merged.
  Conversation alternating;
  for (std::size_t k = leading; k < kept.size(); ++k) {
    if (!alternating.empty() && kept[k].role != Role::kOther &&
        alternating.back().role == kept[k].role) {
      alternating.back() = kept[k];
      ++*removed;
    } else {
      alternating.push_back(kept[k]);
    }
  }
  return alternating;
}

void HistorySanitizer::Emit(log::Level level, const std::string& event,
                            const std::string& request_id,
                            nlohmann::json fields) const {
  if (!events_) {
    return;
  }
  fields["request_id"] = request_id;
  events_->Emit(level, "sanitizer", event, fields);
}

}  // namespace chatwarden
