#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "perpcore/common/params.hpp"
#include "perpcore/common/position.hpp"
#include "perpcore/common/time_utils.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/custody/custody.hpp"
#include "perpcore/funding/funding_engine.hpp"
#include "perpcore/funding/instrument_table.hpp"
#include "perpcore/ledger/event_log.hpp"
#include "perpcore/ledger/ledger_types.hpp"
#include "perpcore/oracle/price_feed.hpp"
#include "perpcore/telemetry/telemetry_sink.hpp"

namespace perpcore {
namespace ledger {

// Owns every open position and the per-instrument funding state.
//
// Every mutating operation follows the same sequence on a working copy of the
// record: settle funding, compute, move collateral through custody, commit.
// A rejection or a refused transfer leaves the ledger untouched. Operations on
// one instrument are serialized by that instrument's slot lock; different
// instruments run in parallel. Event subscribers are notified after the
// operation has released its locks, so they may query or call the ledger.
class PositionLedger {
 public:
  struct Options {
    common::ExchangeParams params{};
    common::AccountId treasury{0};  // receives trading fees
    bool start_paused{false};
  };

  // custody, feed and clock must outlive the ledger; events and telemetry are optional.
  PositionLedger(custody::Custody& custody,
                 const oracle::PriceFeed& feed,
                 const common::Clock& clock,
                 Options options,
                 EventLog* events = nullptr,
                 telemetry::TelemetrySink* telemetry = nullptr);

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;

  // Trading
  OpenResult open(common::AccountId caller, const OpenRequest& request);
  CloseResult close(common::AccountId caller, common::PositionId id, std::int64_t size_to_close);
  IncreaseResult increase(common::AccountId caller,
                          common::PositionId id,
                          std::int64_t additional_collateral,
                          std::int64_t additional_size);
  // Strictly partial: size_to_reduce must be below the position's size.
  CloseResult decrease(common::AccountId caller, common::PositionId id, std::int64_t size_to_reduce);

  // Funding
  FundingResult apply_funding(common::PositionId id);
  SweepResult update_funding_rates();

  // Liquidation. The first overload reads the price once and uses it for both
  // the check and the settlement; the second uses a pinned snapshot, which
  // ages from the feed's quote time.
  LiquidationResult liquidate(common::AccountId caller, common::PositionId id);
  LiquidationResult liquidate(common::AccountId caller, common::PositionId id, const PriceSnapshot& snapshot);
  [[nodiscard]] bool is_liquidatable(common::PositionId id) const;
  [[nodiscard]] bool is_liquidatable(common::PositionId id, const PriceSnapshot& snapshot) const;
  [[nodiscard]] LiquidationCheck liquidation_report(common::PositionId id) const;
  [[nodiscard]] std::optional<PriceSnapshot> price_snapshot(common::InstrumentId instrument) const;

  // Queries
  [[nodiscard]] std::optional<common::Position> get_position(common::PositionId id) const;
  [[nodiscard]] std::vector<common::Position> positions_for(common::AccountId owner) const;
  [[nodiscard]] std::vector<common::PositionId> open_position_ids() const;
  [[nodiscard]] std::size_t position_count() const;
  [[nodiscard]] std::vector<common::InstrumentId> supported_instruments() const;
  [[nodiscard]] bool is_supported(common::InstrumentId instrument) const;
  [[nodiscard]] std::optional<funding::FundingState> funding_state(common::InstrumentId instrument) const;
  [[nodiscard]] common::ExchangeParams params() const;
  [[nodiscard]] std::int64_t total_shortfall(common::InstrumentId instrument) const;
  [[nodiscard]] bool is_paused() const noexcept { return paused_.load(std::memory_order_acquire); }
  [[nodiscard]] common::AccountId treasury() const noexcept { return treasury_; }

  // Administration
  Status add_instrument(common::InstrumentId instrument);
  Status set_params(const common::ExchangeParams& params);
  void pause();
  void unpause();
  Status authorize_agent(common::AccountId owner, common::AccountId agent);
  Status revoke_agent(common::AccountId owner, common::AccountId agent);
  [[nodiscard]] bool is_authorized(common::AccountId owner, common::AccountId caller) const;

 private:
  using Slot = funding::InstrumentTable::Slot;

  // Locked view of one position: holds its instrument's slot lock and a copy
  // of the record taken under that lock.
  struct Locked {
    Slot* slot{nullptr};
    std::unique_lock<std::mutex> lock{};
    common::Position position{};
  };

  Status lock_position(common::PositionId id, Locked& out);
  Status read_price(common::InstrumentId instrument,
                    std::int64_t& price,
                    common::Timestamp* quoted_at = nullptr) const;
  Status validate_snapshot(const PriceSnapshot& snapshot,
                           common::InstrumentId instrument,
                           common::Timestamp now,
                           const common::ExchangeParams& params) const;
  Status collect(common::AccountId owner, common::AssetId asset, std::int64_t collateral, std::int64_t fee);
  CloseResult reduce(common::AccountId caller,
                     common::PositionId id,
                     std::int64_t size,
                     bool allow_full,
                     telemetry::Operation operation);
  LiquidationResult execute_liquidation(common::AccountId caller,
                                        common::PositionId id,
                                        const PriceSnapshot* snapshot);

  void commit_insert(common::Position& position);
  void commit_update(const common::Position& position);
  void commit_erase(const common::Position& position);
  [[nodiscard]] bool has_open_position(common::AccountId owner, common::InstrumentId instrument) const;

  void record_settlement(const common::Position& position,
                         const funding::Settlement& settlement,
                         common::Timestamp now);
  void record_shortfall(const common::Position& position,
                        std::int64_t amount,
                        std::int64_t price,
                        common::Timestamp now);
  void emit(const LedgerEvent& event);
  void publish_pending();
  void count(telemetry::Metric metric, std::int64_t delta = 1);
  void finish(telemetry::Operation operation, std::chrono::nanoseconds started, Status status);

  custody::Custody& custody_;
  const oracle::PriceFeed& feed_;
  const common::Clock& clock_;
  const common::AccountId treasury_;
  EventLog* events_;
  telemetry::TelemetrySink* telemetry_;

  funding::InstrumentTable instruments_;
  funding::FundingEngine funding_engine_;

  mutable std::shared_mutex params_mutex_;
  common::ExchangeParams params_;
  std::atomic<bool> paused_;

  mutable std::shared_mutex agents_mutex_;
  std::unordered_map<common::AccountId, std::unordered_set<common::AccountId>> agents_{};

  // Lock order: slot mutex, then positions_mutex_.
  mutable std::shared_mutex positions_mutex_;
  std::unordered_map<common::PositionId, common::Position> positions_{};
  std::unordered_map<common::AccountId, std::vector<common::PositionId>> by_owner_{};
  common::PositionId next_position_id_{1};

  mutable std::mutex shortfall_mutex_;
  std::unordered_map<common::InstrumentId, std::int64_t> shortfalls_{};

  // Sequenced events not yet handed to subscribers.
  std::mutex pending_mutex_;
  std::vector<LedgerEvent> pending_events_{};
};

}  // namespace ledger
}  // namespace perpcore
