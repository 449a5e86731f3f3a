#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace chatwarden {

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)), std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  // +Inf bucket always increments.
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

MetricsRegistry::MetricsRegistry(std::string service) : service_(std::move(service)) {}

void MetricsRegistry::RecordRequest() {
  requests_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordPromptBlocked() {
  prompts_blocked_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordReplySuppressed() {
  replies_suppressed_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordTurnsRemoved(std::size_t turns) {
  turns_removed_.fetch_add(turns, std::memory_order_relaxed);
}

void MetricsRegistry::RecordStreamCoerced() {
  streams_coerced_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordBlockTranslated(bool streamed) {
  if (streamed) {
    blocks_translated_sse_.fetch_add(1, std::memory_order_relaxed);
  } else {
    blocks_translated_json_.fetch_add(1, std::memory_order_relaxed);
  }
}

void MetricsRegistry::RecordUpstreamError() {
  upstream_errors_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordTransportError() {
  transport_errors_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordLatency(double request_ms) {
  request_latency_.Record(request_ms);
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::ostringstream out;
  const std::string label = "{service=\"" + service_ + "\"}";

  auto counter = [&](const char *name, const char *help, uint64_t value) {
    out << "# HELP chatwarden_" << name << " " << help << "\n";
    out << "# TYPE chatwarden_" << name << " counter\n";
    out << "chatwarden_" << name << label << " " << value << "\n";
  };

  counter("requests_total", "Total requests handled", requests_.load());
  counter("prompts_blocked_total", "Requests rejected on the newest user turn",
          prompts_blocked_.load());
  counter("replies_suppressed_total", "Backend replies withheld by the response guard",
          replies_suppressed_.load());
  counter("history_turns_removed_total", "Turns dropped from conversation history",
          turns_removed_.load());
  counter("streams_coerced_total", "Streaming requests forced to non-streaming",
          streams_coerced_.load());

  out << "# HELP chatwarden_blocks_translated_total Policy blocks rewritten into success envelopes\n";
  out << "# TYPE chatwarden_blocks_translated_total counter\n";
  out << "chatwarden_blocks_translated_total{service=\"" << service_
      << "\",shape=\"json\"} " << blocks_translated_json_.load() << "\n";
  out << "chatwarden_blocks_translated_total{service=\"" << service_
      << "\",shape=\"sse\"} " << blocks_translated_sse_.load() << "\n";

  counter("upstream_errors_total", "Non-block error statuses relayed from upstream",
          upstream_errors_.load());
  counter("transport_errors_total", "Upstream connections that failed or timed out",
          transport_errors_.load());

  // --- Request latency histogram ---
  out << "# HELP chatwarden_request_duration_ms Request end-to-end latency in milliseconds\n";
  out << "# TYPE chatwarden_request_duration_ms histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << "chatwarden_request_duration_ms_bucket{service=\"" << service_
        << "\",le=\"" << std::fixed << std::setprecision(0)
        << LatencyHistogram::kBuckets[i] << "\"} "
        << request_latency_.counts[i].load() << "\n";
  }
  out << "chatwarden_request_duration_ms_bucket{service=\"" << service_
      << "\",le=\"+Inf\"} "
      << request_latency_.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << "chatwarden_request_duration_ms_sum" << label << " "
      << request_latency_.sum_ms.load() << "\n";
  out << "chatwarden_request_duration_ms_count" << label << " "
      << request_latency_.total.load() << "\n";

  return out.str();
}

} // namespace chatwarden
