#include "perpcore/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>

namespace perpcore {
namespace telemetry {

std::string_view to_string(Metric metric) noexcept {
  switch (metric) {
    case Metric::kPositionsOpened:
      return "positions_opened";
    case Metric::kPositionsIncreased:
      return "positions_increased";
    case Metric::kPositionsDecreased:
      return "positions_decreased";
    case Metric::kPositionsClosed:
      return "positions_closed";
    case Metric::kPositionsLiquidated:
      return "positions_liquidated";
    case Metric::kFundingSettlements:
      return "funding_settlements";
    case Metric::kFundingRateUpdates:
      return "funding_rate_updates";
    case Metric::kRejected:
      return "rejected";
    case Metric::kShortfallEvents:
      return "shortfall_events";
    case Metric::kShortfallAmount:
      return "shortfall_amount";
    case Metric::kLiquidationFees:
      return "liquidation_fees";
    case Metric::kTradingFees:
      return "trading_fees";
    case Metric::kCount:
      break;
  }
  return "unknown";
}

std::string_view to_string(Operation operation) noexcept {
  switch (operation) {
    case Operation::kOpen:
      return "open";
    case Operation::kIncrease:
      return "increase";
    case Operation::kDecrease:
      return "decrease";
    case Operation::kClose:
      return "close";
    case Operation::kLiquidate:
      return "liquidate";
    case Operation::kApplyFunding:
      return "apply_funding";
    case Operation::kUpdateFundingRates:
      return "update_funding_rates";
    case Operation::kCount:
      break;
  }
  return "unknown";
}

// bucket[i] covers [2^(i-1), 2^i); bucket 0 holds non-positive samples.
std::size_t StreamingHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t StreamingHistogram::bucket_upper_bound(std::size_t idx) noexcept {
  return static_cast<std::int64_t>(1) << idx;
}

void StreamingHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  min_ = std::min(min_, value_ns);
  max_ = std::max(max_, value_ns);
}

void StreamingHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
  min_ = std::numeric_limits<std::int64_t>::max();
  max_ = 0;
}

double StreamingHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double StreamingHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  const auto target = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(static_cast<double>(count_) * p));
  std::uint64_t cumulative = 0;
  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target) {
      return static_cast<double>(std::min(bucket_upper_bound(idx), max_));
    }
  }
  return static_cast<double>(max_);
}

void TelemetrySink::increment(Metric metric, std::int64_t delta) {
  if (metric == Metric::kCount) {
    return;
  }
  std::scoped_lock lock(mutex_);
  counters_[static_cast<std::size_t>(metric)] += delta;
}

void TelemetrySink::record_latency(Operation operation, std::chrono::nanoseconds latency) {
  if (operation == Operation::kCount) {
    return;
  }
  std::scoped_lock lock(mutex_);
  histograms_[static_cast<std::size_t>(operation)].record(latency.count());
}

std::int64_t TelemetrySink::value(Metric metric) const {
  if (metric == Metric::kCount) {
    return 0;
  }
  std::scoped_lock lock(mutex_);
  return counters_[static_cast<std::size_t>(metric)];
}

std::vector<TelemetrySink::Counter> TelemetrySink::counters() const {
  std::scoped_lock lock(mutex_);
  std::vector<Counter> out;
  for (std::size_t idx = 0; idx < kMetricCount; ++idx) {
    if (counters_[idx] != 0) {
      out.push_back(Counter{static_cast<Metric>(idx), counters_[idx]});
    }
  }
  return out;
}

std::vector<TelemetrySink::LatencySummary> TelemetrySink::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<LatencySummary> summaries;

  for (std::size_t idx = 0; idx < kOperationCount; ++idx) {
    auto& hist = histograms_[idx];
    if (hist.count() == 0) {
      continue;
    }
    summaries.push_back(LatencySummary{
        .operation = static_cast<Operation>(idx),
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p99_ns = hist.percentile(0.99),
        .max_ns = hist.max(),
    });
    hist.reset();
  }

  return summaries;
}

}  // namespace telemetry
}  // namespace perpcore
