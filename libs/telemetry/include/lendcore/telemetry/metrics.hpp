#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <mutex>
#include <string_view>
#include <vector>

namespace lendcore {
namespace telemetry {

enum class Metric : std::uint16_t {
  kSignup,
  kOpCommitted,
  kOpRejected,
  kOpReverted,
  kRiskSafe,
  kRiskHighRisk,
  kRiskUnavailable,
  kTokenCallFailure,
  kPartialDeposit,
  kRevertShortfall,
  kContribution,
  kMint,
  kCount,
};

enum class Latency : std::uint16_t {
  kRiskCall,
  kTokenCall,
  kCount,
};

[[nodiscard]] std::string_view metric_name(Metric metric) noexcept;
[[nodiscard]] std::string_view latency_name(Latency latency) noexcept;

// Latency distribution for one timed call site. Bucket i counts samples in
// [2^(i-1), 2^i) ns and the last bucket absorbs anything slower. A percentile
// is answered with the midpoint of the bucket holding the ranked sample.
class LatencyHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;
  [[nodiscard]] std::int64_t max() const noexcept { return max_; }

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t min_{std::numeric_limits<std::int64_t>::max()};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_midpoint(std::size_t idx) noexcept;
};

class Metrics {
 public:
  struct CounterSample {
    Metric metric{Metric::kCount};
    std::uint64_t value{0};
  };

  struct LatencySummary {
    Latency latency{Latency::kCount};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p99_ns{0.0};
  };

  void increment(Metric metric, std::uint64_t delta = 1);
  void record_latency(Latency latency, std::chrono::nanoseconds elapsed);

  [[nodiscard]] std::uint64_t counter(Metric metric) const;
  [[nodiscard]] std::vector<CounterSample> counters() const;
  // Summaries of every non-empty histogram; histograms are reset afterwards.
  [[nodiscard]] std::vector<LatencySummary> drain_latency();

 private:
  static constexpr std::size_t kCounters = static_cast<std::size_t>(Metric::kCount);
  static constexpr std::size_t kHistograms = static_cast<std::size_t>(Latency::kCount);

  mutable std::mutex mutex_;
  std::array<std::uint64_t, kCounters> counters_{};
  std::array<LatencyHistogram, kHistograms> histograms_{};
};

// Records the lifetime of the scope into `metrics` when non-null.
class ScopedLatency {
 public:
  ScopedLatency(Metrics* metrics, Latency latency) noexcept
      : metrics_(metrics), latency_(latency), start_(std::chrono::steady_clock::now()) {}
  ScopedLatency(const ScopedLatency&) = delete;
  ScopedLatency& operator=(const ScopedLatency&) = delete;
  ~ScopedLatency();

 private:
  Metrics* metrics_;
  Latency latency_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace telemetry
}  // namespace lendcore
