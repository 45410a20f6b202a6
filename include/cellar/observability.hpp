#pragma once

// cellar/observability.hpp — Process-wide service counters.
//
// All counters are relaxed atomics: they are monotonically increasing tallies
// read for dashboards and the `cellar stats` command, never used for control
// flow. to_json() takes a point-in-time snapshot; fields may be mutually
// inconsistent by a few counts under load.

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace cellar {

// Power-of-two microsecond buckets: bucket i covers [2^(i-1), 2^i) us.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);
  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;
  // p in [0,1]; returns the midpoint of the bucket containing the percentile.
  double percentile(double p) const;
  std::string to_json() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_us_{0};
};

struct ServiceStats {
  std::atomic<uint64_t> sessions_created{0};
  std::atomic<uint64_t> sessions_touched{0};
  std::atomic<uint64_t> sessions_expired{0};
  std::atomic<uint64_t> sweeps_run{0};
  std::atomic<uint64_t> sweep_failures{0};
  std::atomic<uint64_t> saves_redirected{0};
  std::atomic<uint64_t> saves_failed{0};
  std::atomic<uint64_t> path_escapes_blocked{0};
  std::atomic<uint64_t> interception_leaks{0};
  std::atomic<uint64_t> executions_total{0};
  std::atomic<uint64_t> executions_failed{0};
  std::atomic<uint64_t> executions_cancelled{0};
  std::atomic<uint64_t> uploads_accepted{0};
  std::atomic<uint64_t> uploads_rejected{0};

  LatencyHistogram execution_latency;

  std::string to_json() const;
};

ServiceStats& global_service_stats();

}  // namespace cellar
