#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <mutex>
#include <string_view>
#include <vector>

namespace perpcore {
namespace telemetry {

enum class Metric : std::uint8_t {
  kPositionsOpened,
  kPositionsIncreased,
  kPositionsDecreased,
  kPositionsClosed,
  kPositionsLiquidated,
  kFundingSettlements,
  kFundingRateUpdates,
  kRejected,
  kShortfallEvents,
  kShortfallAmount,
  kLiquidationFees,
  kTradingFees,
  kCount,
};

enum class Operation : std::uint8_t {
  kOpen,
  kIncrease,
  kDecrease,
  kClose,
  kLiquidate,
  kApplyFunding,
  kUpdateFundingRates,
  kCount,
};

[[nodiscard]] std::string_view to_string(Metric metric) noexcept;
[[nodiscard]] std::string_view to_string(Operation operation) noexcept;

// Log2-bucket latency histogram, 1ns to ~1s.
class StreamingHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] std::int64_t max() const noexcept { return max_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t min_{std::numeric_limits<std::int64_t>::max()};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_upper_bound(std::size_t idx) noexcept;
};

class TelemetrySink {
 public:
  struct Counter {
    Metric metric{Metric::kCount};
    std::int64_t value{0};
  };

  struct LatencySummary {
    Operation operation{Operation::kCount};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p99_ns{0.0};
    std::int64_t max_ns{0};
  };

  void increment(Metric metric, std::int64_t delta = 1);
  void record_latency(Operation operation, std::chrono::nanoseconds latency);

  [[nodiscard]] std::int64_t value(Metric metric) const;
  // Non-zero counters; counters are cumulative and never reset.
  [[nodiscard]] std::vector<Counter> counters() const;
  // Operations with samples since the last drain; their histograms are reset.
  [[nodiscard]] std::vector<LatencySummary> drain_latency();

 private:
  static constexpr std::size_t kMetricCount = static_cast<std::size_t>(Metric::kCount);
  static constexpr std::size_t kOperationCount = static_cast<std::size_t>(Operation::kCount);

  mutable std::mutex mutex_;
  std::array<std::int64_t, kMetricCount> counters_{};
  std::array<StreamingHistogram, kOperationCount> histograms_{};
};

}  // namespace telemetry
}  // namespace perpcore
