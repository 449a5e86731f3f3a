#include "server/relay/completion_envelope.h"

#include <chrono>
#include <cstdio>
#include <random>

using json = nlohmann::json;

namespace chatwarden {

namespace {

constexpr const char* kFallbackBlockMessage = "Request blocked by content policy";

}  // namespace

std::string NewCompletionId() {
  thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> dist;
  char buf[9];
  std::snprintf(buf, sizeof(buf), "%08x", dist(rng));
  return std::string("chatcmpl-") + buf;
}

int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

json BuildCompletionBody(const std::string& id, int64_t created,
                         const std::string& model, const std::string& content,
                         const std::string& finish_reason) {
  json choice = {{"index", 0},
                 {"message", {{"role", "assistant"}, {"content", content}}},
                 {"finish_reason", finish_reason}};
  return {{"id", id},
          {"object", "chat.completion"},
          {"created", created},
          {"model", model},
          {"choices", json::array({choice})},
          {"usage",
           {{"prompt_tokens", 0},
            {"completion_tokens", 0},
            {"total_tokens", 0}}}};
}

std::string BuildStreamChunk(const std::string& id, int64_t created,
                             const std::string& model, const json& delta,
                             const std::string& finish_reason) {
  json choice = {{"index", 0}, {"delta", delta}};
  choice["finish_reason"] =
      finish_reason.empty() ? json(nullptr) : json(finish_reason);
  json chunk = {{"id", id},
                {"object", "chat.completion.chunk"},
                {"created", created},
                {"model", model},
                {"choices", json::array({choice})}};
  return "data: " + chunk.dump(-1, ' ', false, json::error_handler_t::replace) +
         "\n\n";
}

std::string BuildStreamBody(const std::string& id, int64_t created,
                            const std::string& model,
                            const std::string& content,
                            const std::string& finish_reason) {
  std::string body;
  body += BuildStreamChunk(id, created, model,
                           {{"role", "assistant"}, {"content", content}});
  body += BuildStreamChunk(id, created, model, json::object(),
                           finish_reason.empty() ? "stop" : finish_reason);
  body += "data: [DONE]\n\n";
  return body;
}

std::string ExtractBlockMessage(const std::string& body) {
  json parsed = json::parse(body, nullptr, false);
  if (!parsed.is_object()) {
    return kFallbackBlockMessage;
  }
  auto error = parsed.find("error");
  if (error != parsed.end()) {
    if (error->is_object()) {
      auto message = error->find("message");
      if (message != error->end() && message->is_string()) {
        return message->get<std::string>();
      }
    } else if (error->is_string()) {
      return error->get<std::string>();
    }
  }
  auto detail = parsed.find("detail");
  if (detail != parsed.end() && detail->is_string()) {
    return detail->get<std::string>();
  }
  return kFallbackBlockMessage;
}

std::string BuildErrorBody(const std::string& message, const std::string& type,
                           const std::string& code) {
  json error = {{"message", message}, {"type", type}};
  if (!code.empty()) {
    error["code"] = code;
  }
  return json{{"error", error}}.dump(-1, ' ', false,
                                     json::error_handler_t::replace);
}

}  // namespace chatwarden
