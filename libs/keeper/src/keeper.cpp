#include "perpcore/keeper/keeper.hpp"

#include "perpcore/ingest/commands.hpp"
#include "perpcore/ingest/frame.hpp"

namespace perpcore {
namespace keeper {

template <typename Command>
engine::Ack Keeper::submit(common::Timestamp now, const Command& command) {
  return processor_.execute(ingest::make_internal_frame(account_, next_nonce_++, now, command));
}

KeeperReport Keeper::run_once(common::Timestamp now) {
  KeeperReport report;

  const auto sweep = submit(now, ingest::commands::UpdateFundingRates{});
  report.sweep_status = sweep.status;
  report.rates_updated = sweep.value;

  for (const auto id : ledger_.open_position_ids()) {
    ++report.scanned;
    if (!ledger_.is_liquidatable(id)) {
      continue;
    }

    // The ledger reads the price once more and uses it for both its own
    // check and the settlement.
    const auto ack = submit(now, ingest::commands::Liquidate{.position_id = id});
    if (!ack.ok()) {
      ++report.failed;
      continue;
    }
    ++report.liquidated;
    report.fees_earned += ack.value;
    report.liquidated_ids.push_back(id);
  }

  return report;
}

}  // namespace keeper
}  // namespace perpcore
