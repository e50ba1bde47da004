#pragma once

#include <cstdint>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace common {

struct ExchangeParams {
  Timestamp funding_interval{3'600};
  std::int64_t funding_rate_factor{1'000};
  std::int32_t maintenance_margin_bps{200};
  std::int32_t liquidation_fee_bps{100};
  std::int32_t taker_fee_bps{0};
  std::int32_t maker_fee_bps{0};  // quoted only; solver-side fills are not booked here
  std::int64_t max_leverage{50};
  Timestamp price_snapshot_max_age{30};
  bool one_position_per_instrument{false};
};

[[nodiscard]] inline bool valid(const ExchangeParams& params) noexcept {
  return params.funding_interval > 0 && params.funding_rate_factor >= 0 &&
         params.maintenance_margin_bps > 0 && params.maintenance_margin_bps < kBasisPointDenominator &&
         params.liquidation_fee_bps >= 0 && params.liquidation_fee_bps <= kBasisPointDenominator &&
         params.taker_fee_bps >= 0 && params.taker_fee_bps <= kBasisPointDenominator &&
         params.maker_fee_bps >= 0 && params.maker_fee_bps <= kBasisPointDenominator &&
         params.max_leverage > 0 && params.price_snapshot_max_age >= 0;
}

}  // namespace common
}  // namespace perpcore
