#pragma once

#include <cstdint>

#include "perpcore/common/position.hpp"
#include "perpcore/common/types.hpp"

namespace perpcore {
namespace risk {

class LiquidationEvaluator {
 public:
  struct Report {
    bool liquidatable{false};
    std::int64_t price{0};
    std::int64_t notional{0};
    std::int64_t pnl{0};
    std::int64_t effective_collateral{0};  // max(0, collateral + pnl)
    std::int64_t maintenance_margin{0};
    std::int64_t deficit{0};               // maintenance_margin - effective_collateral when liquidatable
    std::int64_t liquidation_price{0};
  };

  // Pure: everything comes from the arguments, so a check and a subsequent
  // liquidation fed the same price always agree.
  [[nodiscard]] static Report evaluate(const common::Position& position,
                                       std::int64_t price,
                                       std::int32_t maintenance_margin_bps);

  [[nodiscard]] static bool is_liquidatable(const common::Position& position,
                                            std::int64_t price,
                                            std::int32_t maintenance_margin_bps) {
    return evaluate(position, price, maintenance_margin_bps).liquidatable;
  }
};

}  // namespace risk
}  // namespace perpcore
