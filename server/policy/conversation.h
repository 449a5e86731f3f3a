#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chatwarden {

// kOther covers tool, function and any other role the gateway does not
// police.
enum class Role { kSystem, kUser, kAssistant, kOther };

const char* RoleName(Role role);

struct Turn {
  Role role{Role::kUser};
  // Moderatable text: the string content, or the text parts joined by '\n'.
  std::string content;
  // The message object as received. Re-emitted verbatim upstream; null for
  // turns built in code, which serialize as {role, content}.
  nlohmann::json message;
};

// Role string as it appears on the wire.
std::string WireRole(const Turn& turn);

inline bool operator==(const Turn& a, const Turn& b) {
  return a.role == b.role && a.content == b.content;
}
inline bool operator!=(const Turn& a, const Turn& b) { return !(a == b); }

// Ordered as the model sees it. Leading system turns form a preamble; the
// user/assistant dialogue follows.
using Conversation = std::vector<Turn>;

// Index of the first non-system turn (conversation.size() if none).
std::size_t DialogueStart(const Conversation& conversation);

// The request body violates the chat-completion contract.
class RequestFormatError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ChatRequest {
  Conversation conversation;
  std::string model{"unknown"};
  bool stream{false};
  // Every other top-level request field, re-emitted verbatim upstream.
  nlohmann::json passthrough = nlohmann::json::object();
  // Gateway-internal annotations; never serialized to the backend.
  std::map<std::string, nlohmann::json> metadata;
};

struct ViolationSignal {
  bool blocked{false};
  std::string message_for_client;
  // Which rule fired. Logged, never shown to the client.
  std::string detail;
};

struct BackendReply {
  // choices[0].message.content when it is a string.
  std::optional<std::string> content;
  // Parsed body, or null when the body was not JSON.
  nlohmann::json raw;
};

// Throws RequestFormatError on anything outside the accepted shape.
ChatRequest ParseChatRequest(const std::string& body);
std::string SerializeChatRequest(const ChatRequest& request);

// Never throws; unparseable bodies yield an empty reply.
BackendReply ParseBackendReply(const std::string& body);

}  // namespace chatwarden
