#include "flashvault/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>
#include <utility>

namespace flashvault {
namespace telemetry {

const char* metric_name(Metric metric) noexcept {
  switch (metric) {
    case Metric::kSessionsSettled:
      return "sessions_settled";
    case Metric::kSessionsReverted:
      return "sessions_reverted";
    case Metric::kSettlements:
      return "settlements";
    case Metric::kFeesCollected:
      return "fees_collected";
    case Metric::kAppsRegistered:
      return "apps_registered";
    case Metric::kEventPublishFailures:
      return "event_publish_failures";
    case Metric::kLockLatency:
      return "lock_latency";
    case Metric::kCount:
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
  if (idx < 2) {
    return 1;
  }
  return static_cast<std::int64_t>(3) << (idx - 2);
}

void LatencyHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  max_ = std::max(max_, value_ns);
}

void LatencyHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
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
  const auto target = static_cast<std::uint64_t>(static_cast<double>(count_) * p);
  std::uint64_t cumulative = 0;
  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target) {
      return static_cast<double>(bucket_midpoint(idx));
    }
  }
  return static_cast<double>(max_);
}

TelemetrySink::TelemetrySink(std::size_t buffer_size) {
  buffer_.reserve(buffer_size);
}

void TelemetrySink::increment(Metric metric, std::int64_t delta) {
  std::scoped_lock lock(mutex_);
  buffer_.push_back(Sample{.metric = metric, .value = delta});
  totals_[static_cast<std::size_t>(metric) % kMetricCount] += delta;
}

void TelemetrySink::record_latency(Metric metric, std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  histograms_[static_cast<std::size_t>(metric) % kMetricCount].record(latency.count());
}

std::int64_t TelemetrySink::total(Metric metric) const {
  std::scoped_lock lock(mutex_);
  return totals_[static_cast<std::size_t>(metric) % kMetricCount];
}

std::vector<Sample> TelemetrySink::drain() {
  std::scoped_lock lock(mutex_);
  auto copy = std::move(buffer_);
  buffer_.clear();
  return copy;
}

std::vector<TelemetrySink::Summary> TelemetrySink::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<Summary> summaries;
  for (std::size_t idx = 0; idx < kMetricCount; ++idx) {
    auto& hist = histograms_[idx];
    if (hist.count() == 0) {
      continue;
    }
    summaries.push_back(Summary{
        .metric = static_cast<Metric>(idx),
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p99_ns = hist.percentile(0.99),
    });
    hist.reset();
  }
  return summaries;
}

}  // namespace telemetry
}  // namespace flashvault
