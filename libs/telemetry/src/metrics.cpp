#include "lendcore/telemetry/metrics.hpp"

#include <algorithm>
#include <bit>
#include <cmath>

namespace lendcore {
namespace telemetry {

std::string_view metric_name(Metric metric) noexcept {
  switch (metric) {
    case Metric::kSignup:
      return "signup";
    case Metric::kOpCommitted:
      return "op_committed";
    case Metric::kOpRejected:
      return "op_rejected";
    case Metric::kOpReverted:
      return "op_reverted";
    case Metric::kRiskSafe:
      return "risk_safe";
    case Metric::kRiskHighRisk:
      return "risk_high_risk";
    case Metric::kRiskUnavailable:
      return "risk_unavailable";
    case Metric::kTokenCallFailure:
      return "token_call_failure";
    case Metric::kPartialDeposit:
      return "partial_deposit";
    case Metric::kRevertShortfall:
      return "revert_shortfall";
    case Metric::kContribution:
      return "contribution";
    case Metric::kMint:
      return "mint";
    case Metric::kCount:
      break;
  }
  return "unknown";
}

std::string_view latency_name(Latency latency) noexcept {
  switch (latency) {
    case Latency::kRiskCall:
      return "risk_call";
    case Latency::kTokenCall:
      return "token_call";
    case Latency::kCount:
      break;
  }
  return "unknown";
}

std::size_t LatencyHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  // bucket[i] covers [2^(i-1), 2^i)
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t LatencyHistogram::bucket_midpoint(std::size_t idx) noexcept {
  if (idx <= 1) {
    return 1;
  }
  return static_cast<std::int64_t>(3) << (idx - 2);
}

void LatencyHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  min_ = std::min(min_, value_ns);
  max_ = std::max(max_, value_ns);
}

void LatencyHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
  min_ = std::numeric_limits<std::int64_t>::max();
  max_ = 0;
}

double LatencyHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double LatencyHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  const auto target =
      std::max<std::uint64_t>(1, static_cast<std::uint64_t>(std::ceil(static_cast<double>(count_) * p)));
  std::uint64_t cumulative = 0;
  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target) {
      return static_cast<double>(bucket_midpoint(idx));
    }
  }
  return static_cast<double>(max_);
}

void Metrics::increment(Metric metric, std::uint64_t delta) {
  const auto idx = static_cast<std::size_t>(metric);
  if (idx >= kCounters) {
    return;
  }
  std::scoped_lock lock(mutex_);
  counters_[idx] += delta;
}

void Metrics::record_latency(Latency latency, std::chrono::nanoseconds elapsed) {
  const auto idx = static_cast<std::size_t>(latency);
  if (idx >= kHistograms) {
    return;
  }
  std::scoped_lock lock(mutex_);
  histograms_[idx].record(elapsed.count());
}

std::uint64_t Metrics::counter(Metric metric) const {
  const auto idx = static_cast<std::size_t>(metric);
  if (idx >= kCounters) {
    return 0;
  }
  std::scoped_lock lock(mutex_);
  return counters_[idx];
}

std::vector<Metrics::CounterSample> Metrics::counters() const {
  std::scoped_lock lock(mutex_);
  std::vector<CounterSample> out;
  out.reserve(kCounters);
  for (std::size_t idx = 0; idx < kCounters; ++idx) {
    out.push_back(CounterSample{.metric = static_cast<Metric>(idx), .value = counters_[idx]});
  }
  return out;
}

std::vector<Metrics::LatencySummary> Metrics::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<LatencySummary> summaries;
  for (std::size_t idx = 0; idx < kHistograms; ++idx) {
    auto& hist = histograms_[idx];
    if (hist.count() == 0) {
      continue;
    }
    summaries.push_back(LatencySummary{
        .latency = static_cast<Latency>(idx),
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p99_ns = hist.percentile(0.99),
    });
    hist.reset();
  }
  return summaries;
}

ScopedLatency::~ScopedLatency() {
  if (metrics_) {
    metrics_->record_latency(latency_, std::chrono::steady_clock::now() - start_);
  }
}

}  // namespace telemetry
}  // namespace lendcore
