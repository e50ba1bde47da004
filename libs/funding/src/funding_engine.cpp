#include "perpcore/funding/funding_engine.hpp"

#include "perpcore/math/fixed_point.hpp"

namespace perpcore {
namespace funding {

SweepReport FundingEngine::update_funding_rates(common::Timestamp now, const common::ExchangeParams& params) {
  SweepReport report;

  for (auto* slot : instruments_.slots()) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    FundingState& state = slot->funding;

    if (now < state.last_funding_update_time + params.funding_interval) {
      ++report.not_due;
      continue;
    }

    const oracle::MarkIndexQuote quote = feed_.prices(slot->id);
    if (!quote.ok() || quote.index_price <= 0) {
      ++report.failed;
      continue;
    }

    state.global_funding_rate = math::funding_rate(quote.mark_price, quote.index_price, params.funding_rate_factor);
    state.last_funding_update_time = now;

    ++report.updated;
    report.updates.push_back(RateUpdate{
        .instrument = slot->id,
        .mark_price = quote.mark_price,
        .index_price = quote.index_price,
        .funding_rate = state.global_funding_rate,
        .updated_at = now,
    });
  }

  return report;
}

Settlement FundingEngine::settle(common::Position& position,
                                 const FundingState& state,
                                 common::Timestamp now,
                                 const common::ExchangeParams& params) {
  Settlement settlement;
  if (now <= position.last_funding_time) {
    return settlement;
  }

  const std::int64_t intervals = (now - position.last_funding_time) / params.funding_interval;
  if (intervals == 0) {
    return settlement;
  }

  const std::int64_t rate = math::checked_mul(state.global_funding_rate, intervals);
  const std::int64_t payment = math::funding_payment(position.size, rate, position.side);

  std::int64_t collected = payment;
  if (payment > 0) {
    if (payment > position.collateral) {
      settlement.shortfall = payment - position.collateral;
      collected = position.collateral;
    }
    position.collateral -= collected;
  } else {
    position.collateral = math::checked_sub(position.collateral, payment);
  }

  position.accumulated_funding = math::checked_add(position.accumulated_funding, collected);
  position.last_funding_time = now;

  settlement.applied = true;
  settlement.intervals = intervals;
  settlement.payment = payment;
  return settlement;
}

}  // namespace funding
}  // namespace perpcore
