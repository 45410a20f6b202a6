#include "cellar/observability.hpp"

#include <bit>
#include <cstdio>

namespace cellar {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_counter(std::string& out, const char* name, const std::atomic<uint64_t>& c, bool first = false) {
  if (!first) out += ',';
  out += '"';
  out += name;
  out += "\":";
  out += std::to_string(c.load(std::memory_order_relaxed));
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.50) / 1000.0);
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.95) / 1000.0);
  out += buf;
  out += ",\"p99_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.99) / 1000.0);
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// ServiceStats
// ---------------------------------------------------------------------------

std::string ServiceStats::to_json() const {
  std::string out;
  out.reserve(640);
  out += "{\"sessions\":{";
  append_counter(out, "created", sessions_created, true);
  append_counter(out, "touched", sessions_touched);
  append_counter(out, "expired", sessions_expired);
  out += "},\"reaper\":{";
  append_counter(out, "sweeps_run", sweeps_run, true);
  append_counter(out, "sweep_failures", sweep_failures);
  out += "},\"interception\":{";
  append_counter(out, "saves_redirected", saves_redirected, true);
  append_counter(out, "saves_failed", saves_failed);
  append_counter(out, "path_escapes_blocked", path_escapes_blocked);
  append_counter(out, "leaks", interception_leaks);
  out += "},\"uploads\":{";
  append_counter(out, "accepted", uploads_accepted, true);
  append_counter(out, "rejected", uploads_rejected);
  out += "},\"executions\":{";
  append_counter(out, "total", executions_total, true);
  append_counter(out, "failed", executions_failed);
  append_counter(out, "cancelled", executions_cancelled);
  out += ",\"latency\":";
  out += execution_latency.to_json();
  out += "}}";
  return out;
}

ServiceStats& global_service_stats() {
  static ServiceStats inst;
  return inst;
}

}  // namespace cellar
