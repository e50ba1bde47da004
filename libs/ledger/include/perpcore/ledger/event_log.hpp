#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>
#include <string_view>
#include <vector>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace ledger {

enum class EventKind : std::uint8_t {
  kPositionOpened,
  kPositionIncreased,
  kPositionDecreased,
  kPositionClosed,
  kPositionLiquidated,
  kFundingSettled,
  kFundingRateUpdated,
  kShortfallRecorded,
  kInstrumentAdded,
  kParamsUpdated,
  kPaused,
  kUnpaused,
  kAgentAuthorized,
  kAgentRevoked,
};

[[nodiscard]] std::string_view to_string(EventKind kind) noexcept;

// Field meaning depends on kind:
//   price    - execution or settlement price
//   entry_price - position entry price after the change (open/increase)
//   amount   - payout (close/decrease/liquidate), payment (funding settled),
//              new rate (funding rate updated)
//   counterparty - liquidator or agent
struct LedgerEvent {
  std::uint64_t sequence{0};
  EventKind kind{EventKind::kPositionOpened};
  common::Timestamp timestamp{0};
  common::PositionId position_id{0};
  common::AccountId account{0};
  common::AccountId counterparty{0};
  common::InstrumentId instrument{0};
  common::Side side{common::Side::kLong};
  std::int64_t size{0};
  std::int64_t collateral{0};
  std::int64_t price{0};
  std::int64_t entry_price{0};
  std::int64_t pnl{0};
  std::int64_t amount{0};
  std::int64_t fee{0};
  std::int64_t shortfall{0};
  bool flagged{false};  // needs operator attention (unrecovered deficit)
};

class EventLog {
 public:
  using Subscriber = std::function<void(const LedgerEvent&)>;

  // Stores the event under the next sequence (starting at 1) and returns the
  // stored copy. Subscribers are not notified.
  LedgerEvent append(LedgerEvent event);
  // Notifies subscribers on the calling thread. No log lock is held while
  // they run.
  void publish(const LedgerEvent& event) const;
  // append() then publish().
  std::uint64_t push(LedgerEvent event);
  void subscribe(Subscriber subscriber);

  [[nodiscard]] std::vector<LedgerEvent> events_since(
      std::uint64_t since_sequence = 0,
      std::size_t limit = std::numeric_limits<std::size_t>::max()) const;
  [[nodiscard]] std::vector<LedgerEvent> flagged() const;
  [[nodiscard]] std::uint64_t last_sequence() const;
  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<LedgerEvent> events_{};
  std::vector<Subscriber> subscribers_{};
  std::uint64_t next_sequence_{1};
};

}  // namespace ledger
}  // namespace perpcore
