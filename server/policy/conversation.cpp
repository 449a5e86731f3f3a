#include "server/policy/conversation.h"

#include <utility>

using json = nlohmann::json;

namespace chatwarden {
namespace {
Role ParseRole(const json& msg, std::size_t index) {
  if (!msg.contains("role") || !msg["role"].is_string()) {
    throw RequestFormatError("messages[" + std::to_string(index) +
                             "].role must be a string");
  }
  auto role = msg["role"].get<std::string>();
  if (role == "user") {
    return Role::kUser;
  }
  if (role == "assistant") {
    return Role::kAssistant;
  }
  if (role == "system") {
    return Role::kSystem;
  }
  return Role::kOther;
}

std::string ParseContent(const json& msg, std::size_t index) {
  if (!msg.contains("content") || msg["content"].is_null()) {
    return {};
  }
  const auto& content = msg["content"];
  if (content.is_string()) {
    return content.get<std::string>();
  }
  if (content.is_array()) {
    // Content parts: only text parts carry moderatable text.
    std::string text;
    for (const auto& part : content) {
      if (part.is_object() && part.contains("type") &&
          part["type"] == "text" && part.contains("text") &&
          part["text"].is_string()) {
        if (!text.empty()) {
          text += "\n";
        }
        text += part["text"].get<std::string>();
      }
    }
    return text;
  }
  throw RequestFormatError("messages[" + std::to_string(index) +
                           "].content must be a string, array or null");
}

bool Policed(Role role) { return role == Role::kUser || role == Role::kAssistant; }
}  // namespace

const char* RoleName(Role role) {
  switch (role) {
    case Role::kSystem:
      return "system";
    case Role::kUser:
      return "user";
    case Role::kAssistant:
      return "assistant";
    case Role::kOther:
      return "other";
  }
  return "unknown";
}

std::string WireRole(const Turn& turn) {
  if (turn.message.is_object()) {
    auto it = turn.message.find("role");
    if (it != turn.message.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return RoleName(turn.role);
}

std::size_t DialogueStart(const Conversation& conversation) {
  std::size_t i = 0;
  while (i < conversation.size() && conversation[i].role == Role::kSystem) {
    ++i;
  }
  return i;
}

ChatRequest ParseChatRequest(const std::string& body) {
  json j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw RequestFormatError("request body must be a JSON object");
  }
  if (!j.contains("messages") || !j["messages"].is_array() ||
      j["messages"].empty()) {
    throw RequestFormatError("messages must be a non-empty array");
  }

  ChatRequest request;
  bool dialogue_started = false;
  std::size_t index = 0;
  for (const auto& msg : j["messages"]) {
    if (!msg.is_object()) {
      throw RequestFormatError("messages[" + std::to_string(index) +
                               "] must be an object");
    }
    Turn turn;
    turn.role = ParseRole(msg, index);
    if (Policed(turn.role)) {
      turn.content = ParseContent(msg, index);
    } else if (msg.contains("content") && msg["content"].is_string()) {
      turn.content = msg["content"].get<std::string>();
    }
    // Past the preamble a system turn is carried like any unpoliced role.
    if (turn.role == Role::kSystem && dialogue_started) {
      turn.role = Role::kOther;
    }
    if (turn.role != Role::kSystem) {
      dialogue_started = true;
    }
    turn.message = msg;
    request.conversation.push_back(std::move(turn));
    ++index;
  }

  if (j.contains("model")) {
    if (!j["model"].is_string()) {
      throw RequestFormatError("model must be a string");
    }
    request.model = j["model"].get<std::string>();
  }
  if (j.contains("stream") && !j["stream"].is_null()) {
    if (!j["stream"].is_boolean()) {
      throw RequestFormatError("stream must be a boolean");
    }
    request.stream = j["stream"].get<bool>();
  }

  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it.key() == "messages" || it.key() == "model" || it.key() == "stream") {
      continue;
    }
    request.passthrough[it.key()] = it.value();
  }
  return request;
}

std::string SerializeChatRequest(const ChatRequest& request) {
  json j = request.passthrough.is_object() ? request.passthrough
                                           : json::object();
  j["model"] = request.model;
  json messages = json::array();
  for (const auto& turn : request.conversation) {
    if (turn.message.is_object()) {
      messages.push_back(turn.message);
    } else {
      messages.push_back({{"role", RoleName(turn.role)}, {"content", turn.content}});
    }
  }
  j["messages"] = std::move(messages);
  j["stream"] = request.stream;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

BackendReply ParseBackendReply(const std::string& body) {
  BackendReply reply;
  json j = json::parse(body, nullptr, false);
  if (j.is_discarded()) {
    return reply;
  }
  reply.raw = j;
  if (!j.is_object() || !j.contains("choices") || !j["choices"].is_array() ||
      j["choices"].empty()) {
    return reply;
  }
  const auto& choice = j["choices"][0];
  if (!choice.is_object() || !choice.contains("message") ||
      !choice["message"].is_object()) {
    return reply;
  }
  const auto& message = choice["message"];
  if (message.contains("content") && message["content"].is_string()) {
    reply.content = message["content"].get<std::string>();
  }
  return reply;
}

}  // namespace chatwarden
