#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace chatwarden {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds. Model calls are slow, so the tail reaches
  // two minutes.
  static constexpr std::array<double, 9> kBuckets{
      10.0, 50.0, 250.0, 1000.0, 2500.0, 5000.0, 15000.0, 60000.0, 120000.0};
  std::array<std::atomic<uint64_t>, 10> counts{}; // 9 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

// Moderation and relay counters for one service ("gateway" or "relay"),
// rendered at GET /metrics.
class MetricsRegistry {
public:
  explicit MetricsRegistry(std::string service = "gateway");

  void RecordRequest();
  void RecordPromptBlocked();
  void RecordReplySuppressed();
  void RecordTurnsRemoved(std::size_t turns);
  void RecordStreamCoerced();
  void RecordBlockTranslated(bool streamed);
  void RecordUpstreamError();
  void RecordTransportError();
  void RecordLatency(double request_ms);

  std::string RenderPrometheus() const;

private:
  std::string service_;
  std::atomic<uint64_t> requests_{0};
  std::atomic<uint64_t> prompts_blocked_{0};
  std::atomic<uint64_t> replies_suppressed_{0};
  std::atomic<uint64_t> turns_removed_{0};
  std::atomic<uint64_t> streams_coerced_{0};
  std::atomic<uint64_t> blocks_translated_json_{0};
  std::atomic<uint64_t> blocks_translated_sse_{0};
  std::atomic<uint64_t> upstream_errors_{0};
  std::atomic<uint64_t> transport_errors_{0};
  LatencyHistogram request_latency_;
};

} // namespace chatwarden
