#include <catch2/catch.hpp>

#include "server/policy/response_guard.h"
#include "tests/unit/fakes.h"

using namespace chatwarden;

namespace {
PolicyClassifier MakeClassifier() {
  return PolicyClassifier({"rabbit"}, {});
}
}  // namespace

TEST_CASE("ResponseGuard allows clean replies unchanged", "[response_guard]") {
  auto classifier = MakeClassifier();
  ResponseGuard guard(classifier, "reply blocked");
  auto reply = ParseBackendReply(
      R"({"choices":[{"message":{"role":"assistant","content":"hello"}}]})");

  auto decision = guard.Inspect(reply);
  REQUIRE(decision.allowed());
  REQUIRE(decision.reply.content == reply.content);
  REQUIRE(decision.reply.raw == reply.raw);
}

TEST_CASE("ResponseGuard suppresses flagged replies", "[response_guard]") {
  auto classifier = MakeClassifier();
  testing::RecordingEventLog events;
  ResponseGuard guard(classifier, "reply blocked", &events);

  auto decision = guard.Inspect(
      ParseBackendReply(
          R"({"choices":[{"message":{"content":"A Rabbit appears"}}]})"),
      "req-r");
  REQUIRE(decision.action == ResponseDecision::Action::kSuppress);
  REQUIRE(decision.signal.blocked);
  REQUIRE(decision.signal.message_for_client == "reply blocked");
  REQUIRE(decision.signal.detail == "rabbit");
  REQUIRE(events.Count("reply_suppressed") == 1);
  REQUIRE(events.Find("reply_suppressed")->fields["request_id"] == "req-r");
}

TEST_CASE("ResponseGuard allows replies with nothing to police",
          "[response_guard]") {
  auto classifier = MakeClassifier();
  ResponseGuard guard(classifier, "reply blocked");

  REQUIRE(guard.Inspect(ParseBackendReply("upstream exploded")).allowed());
  REQUIRE(guard.Inspect(ParseBackendReply(R"({"choices":[]})")).allowed());
  REQUIRE(guard
              .Inspect(ParseBackendReply(
                  R"({"choices":[{"message":{"content":null,"tool_calls":[]}}]})"))
              .allowed());
  REQUIRE(guard
              .Inspect(ParseBackendReply(
                  R"({"choices":[{"message":{"content":""}}]})"))
              .allowed());
}

TEST_CASE("ResponseGuard fails open when the classifier throws",
          "[response_guard]") {
  testing::ScriptedClassifier classifier;
  classifier.failing = {"boom"};
  testing::RecordingEventLog events;
  ResponseGuard guard(classifier, "reply blocked", &events);

  auto reply = ParseBackendReply(
      R"({"choices":[{"message":{"content":"boom goes the reply"}}]})");
  auto decision = guard.Inspect(reply, "req-x");
  REQUIRE(decision.allowed());
  REQUIRE(decision.reply.content == reply.content);
  REQUIRE_FALSE(decision.signal.blocked);
  REQUIRE(events.Count("response_guard_failed") == 1);
  REQUIRE(events.Find("response_guard_failed")->level == log::Level::WARN);
  REQUIRE(events.Count("reply_suppressed") == 0);
}
