#pragma once

#include <cstdint>
#include <vector>

#include "perpcore/common/types.hpp"
#include "perpcore/engine/command_processor.hpp"
#include "perpcore/ledger/ledger_types.hpp"
#include "perpcore/ledger/position_ledger.hpp"

namespace perpcore {
namespace keeper {

struct KeeperReport {
  ledger::Status sweep_status{ledger::Status::kOk};
  std::int64_t rates_updated{0};
  std::size_t scanned{0};
  std::size_t liquidated{0};
  std::size_t failed{0};  // liquidatable but the liquidation was rejected
  std::int64_t fees_earned{0};
  std::vector<common::PositionId> liquidated_ids{};
};

// Periodic maintenance pass: funding-rate sweep, then a liquidation scan.
// Every action is submitted as a command frame from the keeper account
// through the processor, so it is journaled and replays like any other
// command.
class Keeper {
 public:
  // next_nonce must be above every nonce the keeper account has used.
  Keeper(const ledger::PositionLedger& ledger,
         engine::CommandProcessor& processor,
         common::AccountId account,
         std::uint64_t next_nonce)
      : ledger_(ledger), processor_(processor), account_(account), next_nonce_(next_nonce) {}

  KeeperReport run_once(common::Timestamp now);

  [[nodiscard]] std::uint64_t next_nonce() const noexcept { return next_nonce_; }

 private:
  template <typename Command>
  engine::Ack submit(common::Timestamp now, const Command& command);

  const ledger::PositionLedger& ledger_;
  engine::CommandProcessor& processor_;
  common::AccountId account_;
  std::uint64_t next_nonce_;
};

}  // namespace keeper
}  // namespace perpcore
