#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace chatwarden {

// Builders for OpenAI-style chat-completion envelopes. The relay wraps a
// policy message in them; the gateway uses them to replay an allowed reply
// as a stream.

// "chatcmpl-" followed by 8 lowercase hex digits.
std::string NewCompletionId();
int64_t NowSeconds();

// Non-streaming `chat.completion` object with one assistant choice and zero
// usage counters.
nlohmann::json BuildCompletionBody(const std::string& id, int64_t created,
                                   const std::string& model,
                                   const std::string& content,
                                   const std::string& finish_reason = "stop");

// One `data: {...}\n\n` SSE frame of a `chat.completion.chunk`.
// `finish_reason` empty means null.
std::string BuildStreamChunk(const std::string& id, int64_t created,
                             const std::string& model,
                             const nlohmann::json& delta,
                             const std::string& finish_reason = {});

// Complete SSE body: a delta carrying the role and the whole content, a
// closing frame with an empty delta, then `data: [DONE]`.
std::string BuildStreamBody(const std::string& id, int64_t created,
                            const std::string& model,
                            const std::string& content,
                            const std::string& finish_reason = "stop");

// Human-readable message from a block-signal body. Tries error.message, then
// error as a string, then detail, then a fixed fallback.
std::string ExtractBlockMessage(const std::string& body);

// {"error":{"message":...,"type":...[,"code":...]}}
std::string BuildErrorBody(const std::string& message, const std::string& type,
                           const std::string& code = {});

}  // namespace chatwarden
