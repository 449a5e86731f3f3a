#include <catch2/catch.hpp>

#include "server/policy/conversation.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace chatwarden;

TEST_CASE("ParseChatRequest reads turns, model and stream", "[conversation]") {
  auto request = ParseChatRequest(R"({
    "model": "llama3",
    "stream": true,
    "temperature": 0.2,
    "messages": [
      {"role": "system", "content": "be brief"},
      {"role": "user", "content": "hi"},
      {"role": "assistant", "content": "hello"},
      {"role": "user", "content": "how are you"}
    ]})");
  REQUIRE(request.model == "llama3");
  REQUIRE(request.stream);
  REQUIRE(request.conversation.size() == 4);
  REQUIRE(request.conversation[0] == Turn{Role::kSystem, "be brief"});
  REQUIRE(request.conversation[3] == Turn{Role::kUser, "how are you"});
  REQUIRE(DialogueStart(request.conversation) == 1);
  REQUIRE(request.passthrough["temperature"].get<double>() == 0.2);
  REQUIRE_FALSE(request.passthrough.contains("messages"));
}

TEST_CASE("ParseChatRequest applies defaults", "[conversation]") {
  auto request =
      ParseChatRequest(R"({"messages":[{"role":"user","content":"hi"}]})");
  REQUIRE(request.model == "unknown");
  REQUIRE_FALSE(request.stream);
  REQUIRE(request.metadata.empty());
}

TEST_CASE("ParseChatRequest flattens text content parts", "[conversation]") {
  auto request = ParseChatRequest(R"({"messages":[{"role":"user","content":[
      {"type":"text","text":"first"},
      {"type":"image_url","image_url":{"url":"http://x/img.png"}},
      {"type":"text","text":"second"}]}]})");
  REQUIRE(request.conversation[0].content == "first\nsecond");
}

TEST_CASE("ParseChatRequest treats null content as empty", "[conversation]") {
  auto request = ParseChatRequest(
      R"({"messages":[{"role":"user","content":"q"},{"role":"assistant","content":null}]})");
  REQUIRE(request.conversation[1].content.empty());
}

TEST_CASE("ParseChatRequest rejects malformed bodies", "[conversation]") {
  REQUIRE_THROWS_AS(ParseChatRequest("not json"), RequestFormatError);
  REQUIRE_THROWS_AS(ParseChatRequest("[]"), RequestFormatError);
  REQUIRE_THROWS_AS(ParseChatRequest(R"({"model":"m"})"), RequestFormatError);
  REQUIRE_THROWS_AS(ParseChatRequest(R"({"messages":[]})"), RequestFormatError);
  REQUIRE_THROWS_AS(ParseChatRequest(R"({"messages":["hi"]})"),
                    RequestFormatError);
  REQUIRE_THROWS_AS(ParseChatRequest(R"({"messages":[{"content":"x"}]})"),
                    RequestFormatError);
  REQUIRE_THROWS_AS(
      ParseChatRequest(R"({"messages":[{"role":"user","content":5}]})"),
      RequestFormatError);
  REQUIRE_THROWS_AS(
      ParseChatRequest(
          R"({"stream":"yes","messages":[{"role":"user","content":"x"}]})"),
      RequestFormatError);
  REQUIRE_THROWS_AS(
      ParseChatRequest(
          R"({"model":7,"messages":[{"role":"user","content":"x"}]})"),
      RequestFormatError);
}

TEST_CASE("ParseChatRequest carries unpoliced roles", "[conversation]") {
  auto request = ParseChatRequest(R"({"messages":[
      {"role":"system","content":"be brief"},
      {"role":"user","content":"hi"},
      {"role":"tool","tool_call_id":"c1","content":"42"},
      {"role":"system","content":"late"},
      {"role":"developer","content":{"unusual":true}}]})");
  REQUIRE(request.conversation.size() == 5);
  REQUIRE(request.conversation[0].role == Role::kSystem);
  REQUIRE(request.conversation[2].role == Role::kOther);
  REQUIRE(request.conversation[2].content == "42");
  REQUIRE(request.conversation[3].role == Role::kOther);
  REQUIRE(WireRole(request.conversation[3]) == "system");
  REQUIRE(request.conversation[4].content.empty());
  REQUIRE(DialogueStart(request.conversation) == 1);
}

TEST_CASE("SerializeChatRequest re-emits messages verbatim",
          "[conversation]") {
  json body = json::parse(R"({"model":"gpt-4o","messages":[
      {"role":"user","name":"alice","content":[
        {"type":"text","text":"what is in this image?"},
        {"type":"image_url","image_url":{"url":"http://x/img.png"}}]},
      {"role":"assistant","content":null,
       "tool_calls":[{"id":"c1","type":"function",
                      "function":{"name":"f","arguments":"{}"}}]},
      {"role":"tool","tool_call_id":"c1","content":"42"}]})");
  auto request = ParseChatRequest(body.dump());
  REQUIRE(request.conversation[0].content == "what is in this image?");

  auto out = json::parse(SerializeChatRequest(request));
  REQUIRE(out["messages"] == body["messages"]);
}

TEST_CASE("SerializeChatRequest builds turns made in code", "[conversation]") {
  ChatRequest request;
  request.conversation = {{Role::kUser, "hi"}, {Role::kAssistant, "hello"}};
  auto out = json::parse(SerializeChatRequest(request));
  REQUIRE(out["messages"] ==
          json::parse(R"([{"role":"user","content":"hi"},
                          {"role":"assistant","content":"hello"}])"));
}

TEST_CASE("SerializeChatRequest keeps extra fields and drops metadata",
          "[conversation]") {
  auto request = ParseChatRequest(
      R"({"model":"m","stream":true,"max_tokens":64,"messages":[{"role":"user","content":"hi"}]})");
  request.stream = false;
  request.metadata["original_stream_request"] = true;

  auto out = json::parse(SerializeChatRequest(request));
  REQUIRE(out["model"] == "m");
  REQUIRE(out["stream"] == false);
  REQUIRE(out["max_tokens"] == 64);
  REQUIRE(out["messages"].size() == 1);
  REQUIRE(out["messages"][0]["role"] == "user");
  REQUIRE(out["messages"][0]["content"] == "hi");
  REQUIRE_FALSE(out.contains("original_stream_request"));
  REQUIRE_FALSE(out.contains("metadata"));
}

TEST_CASE("ParseBackendReply extracts the first choice", "[conversation]") {
  auto reply = ParseBackendReply(
      R"({"choices":[{"message":{"role":"assistant","content":"hey"}}]})");
  REQUIRE(reply.content.has_value());
  REQUIRE(*reply.content == "hey");
  REQUIRE(reply.raw.is_object());
}

TEST_CASE("ParseBackendReply tolerates unexpected shapes", "[conversation]") {
  REQUIRE_FALSE(ParseBackendReply("<html>").content.has_value());
  REQUIRE(ParseBackendReply("<html>").raw.is_null());
  REQUIRE_FALSE(ParseBackendReply(R"({"choices":[]})").content.has_value());
  REQUIRE_FALSE(
      ParseBackendReply(R"({"choices":[{"message":{"tool_calls":[]}}]})")
          .content.has_value());
  REQUIRE_FALSE(ParseBackendReply(R"({"choices":"x"})").content.has_value());
}
