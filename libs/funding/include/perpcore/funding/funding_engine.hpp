#pragma once

#include <cstdint>
#include <vector>

#include "perpcore/common/params.hpp"
#include "perpcore/common/position.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/funding/instrument_table.hpp"
#include "perpcore/oracle/price_feed.hpp"

namespace perpcore {
namespace funding {

struct RateUpdate {
  common::InstrumentId instrument{0};
  std::int64_t mark_price{0};
  std::int64_t index_price{0};
  std::int64_t funding_rate{0};
  common::Timestamp updated_at{0};
};

struct SweepReport {
  std::size_t updated{0};
  std::size_t not_due{0};
  std::size_t failed{0};  // price feed could not serve the instrument
  std::vector<RateUpdate> updates{};
};

struct Settlement {
  bool applied{false};
  std::int64_t intervals{0};
  std::int64_t payment{0};    // owed by the position; negative when received
  std::int64_t shortfall{0};  // part of a positive payment the collateral could not cover
};

class FundingEngine {
 public:
  FundingEngine(const oracle::PriceFeed& feed, InstrumentTable& instruments)
      : feed_(feed), instruments_(instruments) {}

  // Recomputes the global rate of every instrument whose interval elapsed.
  // Locks one instrument at a time.
  SweepReport update_funding_rates(common::Timestamp now, const common::ExchangeParams& params);

  // Settles whole elapsed intervals into `position`. The caller must hold the
  // instrument's slot lock. Collateral never goes below zero: funding owed
  // beyond it is returned as shortfall.
  static Settlement settle(common::Position& position,
                           const FundingState& state,
                           common::Timestamp now,
                           const common::ExchangeParams& params);

 private:
  const oracle::PriceFeed& feed_;
  InstrumentTable& instruments_;
};

}  // namespace funding
}  // namespace perpcore
