#include "perpcore/risk/liquidation_evaluator.hpp"

#include <algorithm>

#include "perpcore/math/fixed_point.hpp"

namespace perpcore {
namespace risk {

LiquidationEvaluator::Report LiquidationEvaluator::evaluate(const common::Position& position,
                                                            std::int64_t price,
                                                            std::int32_t maintenance_margin_bps) {
  Report report;
  report.price = price;
  report.notional = math::notional(position.size, price);
  report.pnl = math::pnl(position.size, position.entry_price, price, position.side);
  report.effective_collateral = std::max<std::int64_t>(0, math::checked_add(position.collateral, report.pnl));
  report.maintenance_margin = math::required_margin(report.notional, maintenance_margin_bps);
  report.liquidation_price = math::liquidation_price(position.size, position.collateral, position.entry_price,
                                                     maintenance_margin_bps, position.side);

  if (report.effective_collateral < report.maintenance_margin) {
    report.liquidatable = true;
    report.deficit = report.maintenance_margin - report.effective_collateral;
  }
  return report;
}

}  // namespace risk
}  // namespace perpcore
