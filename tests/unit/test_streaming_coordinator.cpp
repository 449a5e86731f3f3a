#include <catch2/catch.hpp>

#include "server/policy/streaming_coordinator.h"
#include "tests/unit/fakes.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace chatwarden;

namespace {

struct CoordinatorFixture {
  PolicyClassifier classifier{{"rabbit"}, {}};
  testing::RecordingEventLog events;
  ResponseGuard guard{classifier, "reply blocked", &events};
  testing::FakeChatBackend backend;
  StreamingCoordinator coordinator{&backend, guard, &events};
};

ChatRequest StreamedRequest() {
  ChatRequest request;
  request.model = "llama3";
  request.conversation = {{Role::kUser, "hi"}};
  request.stream = true;
  StreamingCoordinator::SuppressStreaming(&request, nullptr);
  return request;
}

}  // namespace

TEST_CASE("SuppressStreaming only acts on streaming requests",
          "[coordinator]") {
  testing::RecordingEventLog events;
  ChatRequest request;
  REQUIRE_FALSE(StreamingCoordinator::SuppressStreaming(&request, &events));
  REQUIRE(request.metadata.empty());
  REQUIRE(events.events.empty());

  request.stream = true;
  REQUIRE(StreamingCoordinator::SuppressStreaming(&request, &events, "req-1"));
  REQUIRE_FALSE(request.stream);
  REQUIRE(StreamingCoordinator::OriginallyStreamed(request));
  REQUIRE(events.Find("stream_forced_off")->fields["request_id"] == "req-1");
}

TEST_CASE("Coordinator makes one non-streaming backend call",
          "[coordinator]") {
  CoordinatorFixture f;
  auto outcome = f.coordinator.Complete(StreamedRequest(), "req-c");

  REQUIRE(f.backend.complete_calls == 1);
  auto sent = json::parse(f.backend.last_body);
  REQUIRE(sent["stream"] == false);
  REQUIRE_FALSE(sent.contains("original_stream_request"));
  REQUIRE(outcome.kind == CompletionOutcome::Kind::kAllow);
  REQUIRE(outcome.restream);
  REQUIRE(*outcome.reply.content == "hello there");
}

TEST_CASE("Coordinator does not restream a non-streaming request",
          "[coordinator]") {
  CoordinatorFixture f;
  ChatRequest request;
  request.conversation = {{Role::kUser, "hi"}};
  auto outcome = f.coordinator.Complete(request);
  REQUIRE(outcome.kind == CompletionOutcome::Kind::kAllow);
  REQUIRE_FALSE(outcome.restream);
  REQUIRE(outcome.response.status == 200);
}

TEST_CASE("Coordinator does not restream a reply without text",
          "[coordinator]") {
  CoordinatorFixture f;
  f.backend.response.body =
      R"({"choices":[{"message":{"role":"assistant","tool_calls":[]}}]})";
  auto outcome = f.coordinator.Complete(StreamedRequest());
  REQUIRE(outcome.kind == CompletionOutcome::Kind::kAllow);
  REQUIRE_FALSE(outcome.restream);
}

TEST_CASE("Coordinator suppresses a flagged reply", "[coordinator]") {
  CoordinatorFixture f;
  f.backend.response = testing::FakeChatBackend::Reply("a rabbit!");
  auto outcome = f.coordinator.Complete(StreamedRequest());
  REQUIRE(outcome.kind == CompletionOutcome::Kind::kSuppress);
  REQUIRE(outcome.signal.message_for_client == "reply blocked");
  REQUIRE_FALSE(outcome.restream);
}

TEST_CASE("Coordinator passes upstream errors through unpoliced",
          "[coordinator]") {
  CoordinatorFixture f;
  f.backend.response.status = 503;
  f.backend.response.body = R"({"error":"model loading, rabbit"})";
  auto outcome = f.coordinator.Complete(StreamedRequest());
  REQUIRE(outcome.kind == CompletionOutcome::Kind::kUpstreamError);
  REQUIRE(outcome.response.status == 503);
  REQUIRE(outcome.response.body == R"({"error":"model loading, rabbit"})");
  REQUIRE(f.events.Count("upstream_error") == 1);
  REQUIRE(f.events.Count("reply_suppressed") == 0);
}

TEST_CASE("Coordinator reports transport failures", "[coordinator]") {
  CoordinatorFixture f;
  f.backend.throw_transport = true;
  f.backend.timed_out = true;
  auto outcome = f.coordinator.Complete(StreamedRequest(), "req-t");
  REQUIRE(outcome.kind == CompletionOutcome::Kind::kTransportError);
  REQUIRE(outcome.timed_out);
  REQUIRE_FALSE(outcome.error.empty());
  REQUIRE(f.events.Find("transport_error")->level == log::Level::ERROR);
}
