#pragma once

#include <cstdint>
#include <unordered_set>

#include "perpcore/common/time_utils.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/custody/collateral_vault.hpp"
#include "perpcore/ingest/frame.hpp"
#include "perpcore/ledger/ledger_types.hpp"
#include "perpcore/ledger/position_ledger.hpp"
#include "perpcore/oracle/price_oracle.hpp"
#include "perpcore/wal/journal.hpp"

namespace perpcore {
namespace engine {

// Per-command acknowledgement. `value` depends on the command:
//   open -> position id, close/decrease -> payout, increase -> new size,
//   liquidate -> fee earned, apply funding -> payment,
//   update funding rates -> instruments updated, deposit/withdraw -> balance.
struct Ack {
  ledger::Status status{ledger::Status::kOk};
  std::uint16_t reject_code{0};
  std::int64_t value{0};

  [[nodiscard]] bool ok() const noexcept { return status == ledger::Status::kOk; }
};

// Executes verified frames against the ledger, oracle and vault. The clock
// the ledger and oracle read is moved to each frame's timestamp first (never
// backwards) and moved back if the frame is rejected, so a journal replayed
// through a fresh processor reproduces the same state. Accepted frames are
// appended to the journal when one is given.
class CommandProcessor {
 public:
  struct Options {
    // Accounts allowed to publish oracle prices.
    std::unordered_set<common::AccountId> price_publishers{};
  };

  CommandProcessor(ledger::PositionLedger& ledger,
                   oracle::PriceOracle& oracle,
                   custody::CollateralVault& vault,
                   common::ManualClock& clock,
                   Options options,
                   wal::Writer* journal = nullptr);

  Ack execute(const ingest::Frame& frame);

  [[nodiscard]] std::uint64_t executed() const noexcept { return executed_; }
  [[nodiscard]] std::uint64_t rejected() const noexcept { return rejected_; }

 private:
  Ack dispatch(const ingest::Frame& frame);
  Ack price_update(common::AccountId caller, const ingest::commands::PriceUpdate& command);
  Ack deposit(common::AccountId caller, const ingest::commands::Deposit& command);
  Ack withdraw(common::AccountId caller, const ingest::commands::Withdraw& command);

  ledger::PositionLedger& ledger_;
  oracle::PriceOracle& oracle_;
  custody::CollateralVault& vault_;
  common::ManualClock& clock_;
  Options options_;
  wal::Writer* journal_;
  std::uint64_t executed_{0};
  std::uint64_t rejected_{0};
};

}  // namespace engine
}  // namespace perpcore
