#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <mutex>
#include <vector>

namespace flashvault {
namespace telemetry {

enum class Metric : std::uint16_t {
  kSessionsSettled = 0,
  kSessionsReverted,
  kSettlements,
  kFeesCollected,
  kAppsRegistered,
  kEventPublishFailures,
  kLockLatency,
  kCount,
};

inline constexpr std::size_t kMetricCount = static_cast<std::size_t>(Metric::kCount);

const char* metric_name(Metric metric) noexcept;

struct Sample {
  Metric metric{Metric::kSessionsSettled};
  std::int64_t value{};
};

// Log2 buckets from 1ns to ~1s.
class LatencyHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_midpoint(std::size_t idx) noexcept;
};

class TelemetrySink {
 public:
  explicit TelemetrySink(std::size_t buffer_size = 1024);

  void increment(Metric metric, std::int64_t delta = 1);
  void record_latency(Metric metric, std::chrono::nanoseconds latency);

  // Running total of every increment since construction.
  [[nodiscard]] std::int64_t total(Metric metric) const;
  [[nodiscard]] std::vector<Sample> drain();

  struct Summary {
    Metric metric{Metric::kLockLatency};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p99_ns{0.0};
  };

  [[nodiscard]] std::vector<Summary> drain_latency();

 private:
  mutable std::mutex mutex_;
  std::vector<Sample> buffer_{};
  std::array<std::int64_t, kMetricCount> totals_{};
  std::array<LatencyHistogram, kMetricCount> histograms_{};
};

}  // namespace telemetry
}  // namespace flashvault
