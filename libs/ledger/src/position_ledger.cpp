#include "perpcore/ledger/position_ledger.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "perpcore/math/fixed_point.hpp"
#include "perpcore/risk/liquidation_evaluator.hpp"

namespace perpcore {
namespace ledger {

namespace {

Status from_transfer(custody::TransferStatus status) noexcept {
  switch (status) {
    case custody::TransferStatus::kOk:
      return Status::kOk;
    case custody::TransferStatus::kInsufficientBalance:
      return Status::kInsufficientFunds;
    case custody::TransferStatus::kUnsupportedAsset:
      return Status::kUnsupportedAsset;
  }
  return Status::kUnsupportedAsset;
}

}  // namespace

PositionLedger::PositionLedger(custody::Custody& custody,
                               const oracle::PriceFeed& feed,
                               const common::Clock& clock,
                               Options options,
                               EventLog* events,
                               telemetry::TelemetrySink* telemetry)
    : custody_(custody),
      feed_(feed),
      clock_(clock),
      treasury_(options.treasury),
      events_(events),
      telemetry_(telemetry),
      instruments_(),
      funding_engine_(feed, instruments_),
      params_(options.params),
      paused_(options.start_paused) {
  if (!common::valid(options.params)) {
    throw std::invalid_argument("invalid exchange parameters");
  }
}

// ---------------------------------------------------------------------------
// Trading
// ---------------------------------------------------------------------------

OpenResult PositionLedger::open(common::AccountId caller, const OpenRequest& request) {
  const auto started = common::now_steady();
  const common::ExchangeParams params = this->params();
  OpenResult result;

  auto run = [&]() -> Status {
    if (caller == 0 || request.owner == 0) {
      return Status::kInvalidAccount;
    }
    if (request.collateral <= 0 || request.size <= 0) {
      return Status::kInvalidAmount;
    }
    if (request.leverage <= 0) {
      return Status::kInvalidLeverage;
    }
    if (request.leverage > params.max_leverage) {
      return Status::kLeverageTooHigh;
    }
    if (request.expected_price <= 0 || request.slippage_tolerance_bps < 0) {
      return Status::kInvalidPrice;
    }
    if (is_paused()) {
      return Status::kPaused;
    }
    Slot* slot = instruments_.find(request.instrument);
    if (!slot) {
      return Status::kUnsupportedInstrument;
    }
    if (!is_authorized(request.owner, caller)) {
      return Status::kUnauthorized;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);

    if (params.one_position_per_instrument && has_open_position(request.owner, request.instrument)) {
      return Status::kDuplicatePosition;
    }

    std::int64_t price = 0;
    if (const Status status = read_price(request.instrument, price); status != Status::kOk) {
      return status;
    }

    const std::int64_t notional = math::notional(request.size, price);
    if (request.collateral < notional / request.leverage) {
      return Status::kInsufficientMargin;
    }
    if (slot->funding.global_funding_rate > request.max_funding_rate) {
      return Status::kFundingRateExceeded;
    }
    const std::int64_t deviation = price > request.expected_price ? price - request.expected_price
                                                                  : request.expected_price - price;
    if (math::checked_mul(deviation, common::kBasisPointDenominator) >
        math::checked_mul(request.slippage_tolerance_bps, request.expected_price)) {
      return Status::kSlippageExceeded;
    }

    const auto asset = custody_.collateral_asset_for(request.instrument);
    if (!asset) {
      return Status::kAssetNotConfigured;
    }
    const std::int64_t fee = math::apply_bps(notional, params.taker_fee_bps);
    if (const Status status = collect(request.owner, *asset, request.collateral, fee); status != Status::kOk) {
      return status;
    }

    const common::Timestamp now = clock_.now();
    common::Position position{
        .id = 0,
        .owner = request.owner,
        .instrument = request.instrument,
        .side = request.side,
        .collateral = request.collateral,
        .size = request.size,
        .entry_price = price,
        .last_funding_time = now,
        .accumulated_funding = 0,
        .leverage = request.leverage,
        .opened_at = now,
    };
    commit_insert(position);

    result.position_id = position.id;
    result.entry_price = price;
    result.notional = notional;
    result.fee = fee;

    count(telemetry::Metric::kPositionsOpened);
    if (fee > 0) {
      count(telemetry::Metric::kTradingFees, fee);
    }
    emit(LedgerEvent{
        .kind = EventKind::kPositionOpened,
        .timestamp = now,
        .position_id = position.id,
        .account = position.owner,
        .counterparty = caller,
        .instrument = position.instrument,
        .side = position.side,
        .size = position.size,
        .collateral = position.collateral,
        .price = price,
        .entry_price = price,
        .fee = fee,
    });
    return Status::kOk;
  };

  result.status = run();
  finish(telemetry::Operation::kOpen, started, result.status);
  return result;
}

CloseResult PositionLedger::close(common::AccountId caller, common::PositionId id, std::int64_t size_to_close) {
  return reduce(caller, id, size_to_close, true, telemetry::Operation::kClose);
}

CloseResult PositionLedger::decrease(common::AccountId caller, common::PositionId id, std::int64_t size_to_reduce) {
  return reduce(caller, id, size_to_reduce, false, telemetry::Operation::kDecrease);
}

CloseResult PositionLedger::reduce(common::AccountId caller,
                                   common::PositionId id,
                                   std::int64_t size,
                                   bool allow_full,
                                   telemetry::Operation operation) {
  const auto started = common::now_steady();
  const common::ExchangeParams params = this->params();
  CloseResult result;

  auto run = [&]() -> Status {
    if (caller == 0) {
      return Status::kInvalidAccount;
    }
    if (size <= 0) {
      return Status::kInvalidSize;
    }
    if (is_paused()) {
      return Status::kPaused;
    }

    Locked locked;
    if (const Status status = lock_position(id, locked); status != Status::kOk) {
      return status;
    }
    common::Position& working = locked.position;

    if (!is_authorized(working.owner, caller)) {
      return Status::kUnauthorized;
    }
    if (size > working.size || (!allow_full && size == working.size)) {
      return Status::kInvalidSize;
    }

    std::int64_t price = 0;
    if (const Status status = read_price(working.instrument, price); status != Status::kOk) {
      return status;
    }
    const auto asset = custody_.collateral_asset_for(working.instrument);
    if (!asset) {
      return Status::kAssetNotConfigured;
    }

    const common::Timestamp now = clock_.now();
    const funding::Settlement settlement = funding::FundingEngine::settle(working, locked.slot->funding, now, params);

    // Collateral share is fixed before PnL touches it.
    const std::int64_t returned = math::mul_div(working.collateral, size, working.size);
    const std::int64_t pnl = math::pnl(size, working.entry_price, price, working.side);
    const std::int64_t gross = math::checked_add(returned, pnl);
    const std::int64_t payout = std::max<std::int64_t>(0, gross);
    const std::int64_t loss_shortfall = gross < 0 ? -gross : 0;
    const bool full = size == working.size;

    if (!full) {
      working.size -= size;
      working.collateral -= returned;
    }

    if (const Status status = from_transfer(custody_.credit(working.owner, *asset, payout)); status != Status::kOk) {
      return status;
    }

    if (full) {
      commit_erase(working);
    } else {
      commit_update(working);
    }
    record_settlement(working, settlement, now);
    if (loss_shortfall > 0) {
      record_shortfall(working, loss_shortfall, price, now);
    }

    result.price = price;
    result.realized_pnl = pnl;
    result.collateral_returned = returned;
    result.payout = payout;
    result.shortfall = settlement.shortfall + loss_shortfall;
    result.funding_paid = settlement.payment;
    result.remaining_size = full ? 0 : working.size;
    result.position_closed = full;

    count(full ? telemetry::Metric::kPositionsClosed : telemetry::Metric::kPositionsDecreased);
    emit(LedgerEvent{
        .kind = full ? EventKind::kPositionClosed : EventKind::kPositionDecreased,
        .timestamp = now,
        .position_id = working.id,
        .account = working.owner,
        .counterparty = caller,
        .instrument = working.instrument,
        .side = working.side,
        .size = size,
        .collateral = returned,
        .price = price,
        .pnl = pnl,
        .amount = payout,
        .shortfall = loss_shortfall,
    });
    return Status::kOk;
  };

  result.status = run();
  finish(operation, started, result.status);
  return result;
}

IncreaseResult PositionLedger::increase(common::AccountId caller,
                                        common::PositionId id,
                                        std::int64_t additional_collateral,
                                        std::int64_t additional_size) {
  const auto started = common::now_steady();
  const common::ExchangeParams params = this->params();
  IncreaseResult result;

  auto run = [&]() -> Status {
    if (caller == 0) {
      return Status::kInvalidAccount;
    }
    if (additional_collateral <= 0 || additional_size <= 0) {
      return Status::kInvalidAmount;
    }
    if (is_paused()) {
      return Status::kPaused;
    }

    Locked locked;
    if (const Status status = lock_position(id, locked); status != Status::kOk) {
      return status;
    }
    common::Position& working = locked.position;

    if (!is_authorized(working.owner, caller)) {
      return Status::kUnauthorized;
    }

    std::int64_t price = 0;
    if (const Status status = read_price(working.instrument, price); status != Status::kOk) {
      return status;
    }
    const auto asset = custody_.collateral_asset_for(working.instrument);
    if (!asset) {
      return Status::kAssetNotConfigured;
    }

    const common::Timestamp now = clock_.now();
    const funding::Settlement settlement = funding::FundingEngine::settle(working, locked.slot->funding, now, params);

    // Only the added notional is held to the position's original leverage.
    const std::int64_t added_notional = math::notional(additional_size, price);
    if (additional_collateral < added_notional / working.leverage) {
      return Status::kInsufficientMargin;
    }
    const std::int64_t fee = math::apply_bps(added_notional, params.taker_fee_bps);
    const std::int64_t entry_price =
        math::weighted_entry_price(working.entry_price, working.size, price, additional_size);
    const std::int64_t new_size = math::checked_add(working.size, additional_size);
    const std::int64_t new_collateral = math::checked_add(working.collateral, additional_collateral);

    if (const Status status = collect(working.owner, *asset, additional_collateral, fee); status != Status::kOk) {
      return status;
    }

    working.entry_price = entry_price;
    working.size = new_size;
    working.collateral = new_collateral;
    commit_update(working);
    record_settlement(working, settlement, now);

    result.price = price;
    result.size = working.size;
    result.collateral = working.collateral;
    result.entry_price = working.entry_price;
    result.fee = fee;
    result.funding_paid = settlement.payment;

    count(telemetry::Metric::kPositionsIncreased);
    if (fee > 0) {
      count(telemetry::Metric::kTradingFees, fee);
    }
    emit(LedgerEvent{
        .kind = EventKind::kPositionIncreased,
        .timestamp = now,
        .position_id = working.id,
        .account = working.owner,
        .counterparty = caller,
        .instrument = working.instrument,
        .side = working.side,
        .size = additional_size,
        .collateral = additional_collateral,
        .price = price,
        .entry_price = working.entry_price,
        .fee = fee,
    });
    return Status::kOk;
  };

  result.status = run();
  finish(telemetry::Operation::kIncrease, started, result.status);
  return result;
}

// ---------------------------------------------------------------------------
// Funding
// ---------------------------------------------------------------------------

FundingResult PositionLedger::apply_funding(common::PositionId id) {
  const auto started = common::now_steady();
  const common::ExchangeParams params = this->params();
  FundingResult result;

  auto run = [&]() -> Status {
    if (is_paused()) {
      return Status::kPaused;
    }
    Locked locked;
    if (const Status status = lock_position(id, locked); status != Status::kOk) {
      return status;
    }

    const common::Timestamp now = clock_.now();
    const funding::Settlement settlement =
        funding::FundingEngine::settle(locked.position, locked.slot->funding, now, params);
    result.applied = settlement.applied;
    result.intervals = settlement.intervals;
    result.payment = settlement.payment;
    result.shortfall = settlement.shortfall;
    if (!settlement.applied) {
      return Status::kOk;
    }

    commit_update(locked.position);
    record_settlement(locked.position, settlement, now);
    return Status::kOk;
  };

  result.status = run();
  finish(telemetry::Operation::kApplyFunding, started, result.status);
  return result;
}

SweepResult PositionLedger::update_funding_rates() {
  const auto started = common::now_steady();
  const common::ExchangeParams params = this->params();
  SweepResult result;

  if (is_paused()) {
    result.status = Status::kPaused;
  } else {
    const common::Timestamp now = clock_.now();
    result.report = funding_engine_.update_funding_rates(now, params);
    for (const auto& update : result.report.updates) {
      count(telemetry::Metric::kFundingRateUpdates);
      emit(LedgerEvent{
          .kind = EventKind::kFundingRateUpdated,
          .timestamp = update.updated_at,
          .instrument = update.instrument,
          .price = update.mark_price,
          .amount = update.funding_rate,
      });
    }
  }

  finish(telemetry::Operation::kUpdateFundingRates, started, result.status);
  return result;
}

// ---------------------------------------------------------------------------
// Liquidation
// ---------------------------------------------------------------------------

LiquidationResult PositionLedger::liquidate(common::AccountId caller, common::PositionId id) {
  return execute_liquidation(caller, id, nullptr);
}

LiquidationResult PositionLedger::liquidate(common::AccountId caller,
                                            common::PositionId id,
                                            const PriceSnapshot& snapshot) {
  return execute_liquidation(caller, id, &snapshot);
}

LiquidationResult PositionLedger::execute_liquidation(common::AccountId caller,
                                                      common::PositionId id,
                                                      const PriceSnapshot* snapshot) {
  const auto started = common::now_steady();
  const common::ExchangeParams params = this->params();
  LiquidationResult result;

  auto run = [&]() -> Status {
    if (caller == 0) {
      return Status::kInvalidAccount;
    }
    if (is_paused()) {
      return Status::kPaused;
    }

    Locked locked;
    if (const Status status = lock_position(id, locked); status != Status::kOk) {
      return status;
    }
    common::Position& working = locked.position;
    const common::Timestamp now = clock_.now();

    std::int64_t price = 0;
    if (snapshot) {
      if (const Status status = validate_snapshot(*snapshot, working.instrument, now, params);
          status != Status::kOk) {
        return status;
      }
      price = snapshot->price;
    } else if (const Status status = read_price(working.instrument, price); status != Status::kOk) {
      return status;
    }

    // Same price for the check and the settlement below.
    if (!risk::LiquidationEvaluator::is_liquidatable(working, price, params.maintenance_margin_bps)) {
      return Status::kNotLiquidatable;
    }
    const auto asset = custody_.collateral_asset_for(working.instrument);
    if (!asset) {
      return Status::kAssetNotConfigured;
    }

    const funding::Settlement settlement = funding::FundingEngine::settle(working, locked.slot->funding, now, params);

    const std::int64_t pnl = math::pnl(working.size, working.entry_price, price, working.side);
    const std::int64_t equity = math::checked_add(working.collateral, pnl);
    const std::int64_t remaining = std::max<std::int64_t>(0, equity);
    const std::int64_t loss_shortfall = equity < 0 ? -equity : 0;
    const std::int64_t fee =
        std::min(math::apply_bps(math::notional(working.size, price), params.liquidation_fee_bps), remaining);
    const std::int64_t owner_payout = remaining - fee;

    if (const Status status = from_transfer(custody_.credit(caller, *asset, fee)); status != Status::kOk) {
      return status;
    }
    if (const Status status = from_transfer(custody_.credit(working.owner, *asset, owner_payout));
        status != Status::kOk) {
      if (custody_.debit(caller, *asset, fee) != custody::TransferStatus::kOk) {
        throw std::runtime_error("custody refused to reverse a liquidation fee credit");
      }
      return status;
    }

    commit_erase(working);
    record_settlement(working, settlement, now);
    if (loss_shortfall > 0) {
      record_shortfall(working, loss_shortfall, price, now);
    }

    result.price = price;
    result.pnl = pnl;
    result.fee = fee;
    result.owner_payout = owner_payout;
    result.shortfall = settlement.shortfall + loss_shortfall;
    result.funding_paid = settlement.payment;

    count(telemetry::Metric::kPositionsLiquidated);
    if (fee > 0) {
      count(telemetry::Metric::kLiquidationFees, fee);
    }
    emit(LedgerEvent{
        .kind = EventKind::kPositionLiquidated,
        .timestamp = now,
        .position_id = working.id,
        .account = working.owner,
        .counterparty = caller,
        .instrument = working.instrument,
        .side = working.side,
        .size = working.size,
        .collateral = working.collateral,
        .price = price,
        .pnl = pnl,
        .amount = owner_payout,
        .fee = fee,
        .shortfall = loss_shortfall,
    });
    return Status::kOk;
  };

  result.status = run();
  finish(telemetry::Operation::kLiquidate, started, result.status);
  return result;
}

bool PositionLedger::is_liquidatable(common::PositionId id) const {
  return liquidation_report(id).report.liquidatable;
}

bool PositionLedger::is_liquidatable(common::PositionId id, const PriceSnapshot& snapshot) const {
  const auto position = get_position(id);
  if (!position) {
    return false;
  }
  const common::ExchangeParams params = this->params();
  if (validate_snapshot(snapshot, position->instrument, clock_.now(), params) != Status::kOk) {
    return false;
  }
  return risk::LiquidationEvaluator::is_liquidatable(*position, snapshot.price, params.maintenance_margin_bps);
}

LiquidationCheck PositionLedger::liquidation_report(common::PositionId id) const {
  LiquidationCheck check;
  const auto position = get_position(id);
  if (!position) {
    check.status = Status::kPositionNotFound;
    return check;
  }
  std::int64_t price = 0;
  if (const Status status = read_price(position->instrument, price); status != Status::kOk) {
    check.status = status;
    return check;
  }
  check.report = risk::LiquidationEvaluator::evaluate(*position, price, params().maintenance_margin_bps);
  return check;
}

std::optional<PriceSnapshot> PositionLedger::price_snapshot(common::InstrumentId instrument) const {
  // Aged from the feed's quote time, not from when the snapshot was taken.
  std::int64_t price = 0;
  common::Timestamp quoted_at = 0;
  if (read_price(instrument, price, &quoted_at) != Status::kOk) {
    return std::nullopt;
  }
  return PriceSnapshot{instrument, price, quoted_at};
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<common::Position> PositionLedger::get_position(common::PositionId id) const {
  std::shared_lock lock(positions_mutex_);
  if (auto it = positions_.find(id); it != positions_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<common::Position> PositionLedger::positions_for(common::AccountId owner) const {
  std::shared_lock lock(positions_mutex_);
  std::vector<common::Position> out;
  if (auto it = by_owner_.find(owner); it != by_owner_.end()) {
    out.reserve(it->second.size());
    for (const auto id : it->second) {
      out.push_back(positions_.at(id));
    }
  }
  return out;
}

std::vector<common::PositionId> PositionLedger::open_position_ids() const {
  std::vector<common::PositionId> ids;
  {
    std::shared_lock lock(positions_mutex_);
    ids.reserve(positions_.size());
    for (const auto& [id, position] : positions_) {
      ids.push_back(id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::size_t PositionLedger::position_count() const {
  std::shared_lock lock(positions_mutex_);
  return positions_.size();
}

std::vector<common::InstrumentId> PositionLedger::supported_instruments() const {
  return instruments_.ids();
}

bool PositionLedger::is_supported(common::InstrumentId instrument) const {
  return instruments_.contains(instrument);
}

std::optional<funding::FundingState> PositionLedger::funding_state(common::InstrumentId instrument) const {
  Slot* slot = instruments_.find(instrument);
  if (!slot) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(slot->mutex);
  return slot->funding;
}

common::ExchangeParams PositionLedger::params() const {
  std::shared_lock lock(params_mutex_);
  return params_;
}

std::int64_t PositionLedger::total_shortfall(common::InstrumentId instrument) const {
  std::lock_guard<std::mutex> lock(shortfall_mutex_);
  if (auto it = shortfalls_.find(instrument); it != shortfalls_.end()) {
    return it->second;
  }
  return 0;
}

// ---------------------------------------------------------------------------
// Administration
// ---------------------------------------------------------------------------

Status PositionLedger::add_instrument(common::InstrumentId instrument) {
  const common::Timestamp now = clock_.now();
  if (!instruments_.add(instrument, now)) {
    return Status::kInstrumentExists;
  }
  emit(LedgerEvent{.kind = EventKind::kInstrumentAdded, .timestamp = now, .instrument = instrument});
  publish_pending();
  return Status::kOk;
}

Status PositionLedger::set_params(const common::ExchangeParams& params) {
  if (!common::valid(params)) {
    return Status::kInvalidParams;
  }
  {
    std::unique_lock lock(params_mutex_);
    params_ = params;
  }
  emit(LedgerEvent{.kind = EventKind::kParamsUpdated, .timestamp = clock_.now()});
  publish_pending();
  return Status::kOk;
}

void PositionLedger::pause() {
  if (!paused_.exchange(true, std::memory_order_acq_rel)) {
    emit(LedgerEvent{.kind = EventKind::kPaused, .timestamp = clock_.now()});
    publish_pending();
  }
}

void PositionLedger::unpause() {
  if (paused_.exchange(false, std::memory_order_acq_rel)) {
    emit(LedgerEvent{.kind = EventKind::kUnpaused, .timestamp = clock_.now()});
    publish_pending();
  }
}

Status PositionLedger::authorize_agent(common::AccountId owner, common::AccountId agent) {
  if (owner == 0 || agent == 0 || owner == agent) {
    return Status::kInvalidAccount;
  }
  {
    std::unique_lock lock(agents_mutex_);
    agents_[owner].insert(agent);
  }
  emit(LedgerEvent{.kind = EventKind::kAgentAuthorized,
                   .timestamp = clock_.now(),
                   .account = owner,
                   .counterparty = agent});
  publish_pending();
  return Status::kOk;
}

Status PositionLedger::revoke_agent(common::AccountId owner, common::AccountId agent) {
  {
    std::unique_lock lock(agents_mutex_);
    auto it = agents_.find(owner);
    if (it == agents_.end() || it->second.erase(agent) == 0) {
      return Status::kUnauthorized;
    }
    if (it->second.empty()) {
      agents_.erase(it);
    }
  }
  emit(LedgerEvent{.kind = EventKind::kAgentRevoked,
                   .timestamp = clock_.now(),
                   .account = owner,
                   .counterparty = agent});
  publish_pending();
  return Status::kOk;
}

bool PositionLedger::is_authorized(common::AccountId owner, common::AccountId caller) const {
  if (caller == owner) {
    return true;
  }
  std::shared_lock lock(agents_mutex_);
  auto it = agents_.find(owner);
  return it != agents_.end() && it->second.contains(caller);
}

// ---------------------------------------------------------------------------
// Internals
// ---------------------------------------------------------------------------

Status PositionLedger::lock_position(common::PositionId id, Locked& out) {
  common::InstrumentId instrument = 0;
  {
    std::shared_lock lock(positions_mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) {
      return Status::kPositionNotFound;
    }
    instrument = it->second.instrument;
  }

  Slot* slot = instruments_.find(instrument);
  if (!slot) {
    return Status::kUnsupportedInstrument;
  }
  out.slot = slot;
  out.lock = std::unique_lock<std::mutex>(slot->mutex);

  // The record may have been closed while waiting for the slot.
  std::shared_lock lock(positions_mutex_);
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    return Status::kPositionNotFound;
  }
  out.position = it->second;
  return Status::kOk;
}

Status PositionLedger::read_price(common::InstrumentId instrument,
                                  std::int64_t& price,
                                  common::Timestamp* quoted_at) const {
  const oracle::PriceQuote quote = feed_.price(instrument);
  switch (quote.status) {
    case oracle::FeedStatus::kOk:
      break;
    case oracle::FeedStatus::kStale:
      return Status::kPriceStale;
    case oracle::FeedStatus::kNotSupported:
      return Status::kPriceUnavailable;
  }
  if (quote.price <= 0) {
    return Status::kPriceUnavailable;
  }
  price = quote.price;
  if (quoted_at) {
    *quoted_at = quote.timestamp;
  }
  return Status::kOk;
}

Status PositionLedger::validate_snapshot(const PriceSnapshot& snapshot,
                                         common::InstrumentId instrument,
                                         common::Timestamp now,
                                         const common::ExchangeParams& params) const {
  if (snapshot.instrument != instrument) {
    return Status::kSnapshotMismatch;
  }
  if (snapshot.price <= 0) {
    return Status::kInvalidPrice;
  }
  if (snapshot.observed_at > now || now - snapshot.observed_at > params.price_snapshot_max_age) {
    return Status::kStaleSnapshot;
  }
  return Status::kOk;
}

Status PositionLedger::collect(common::AccountId owner,
                               common::AssetId asset,
                               std::int64_t collateral,
                               std::int64_t fee) {
  const std::int64_t total = math::checked_add(collateral, fee);
  if (const Status status = from_transfer(custody_.debit(owner, asset, total)); status != Status::kOk) {
    return status;
  }
  if (fee == 0) {
    return Status::kOk;
  }
  if (const Status status = from_transfer(custody_.credit(treasury_, asset, fee)); status != Status::kOk) {
    if (custody_.credit(owner, asset, total) != custody::TransferStatus::kOk) {
      throw std::runtime_error("custody refused to reverse a collateral debit");
    }
    return status;
  }
  return Status::kOk;
}

void PositionLedger::commit_insert(common::Position& position) {
  std::unique_lock lock(positions_mutex_);
  position.id = next_position_id_++;
  positions_.emplace(position.id, position);
  by_owner_[position.owner].push_back(position.id);
}

void PositionLedger::commit_update(const common::Position& position) {
  std::unique_lock lock(positions_mutex_);
  positions_.at(position.id) = position;
}

void PositionLedger::commit_erase(const common::Position& position) {
  std::unique_lock lock(positions_mutex_);
  positions_.erase(position.id);
  if (auto it = by_owner_.find(position.owner); it != by_owner_.end()) {
    auto& ids = it->second;
    ids.erase(std::remove(ids.begin(), ids.end(), position.id), ids.end());
    if (ids.empty()) {
      by_owner_.erase(it);
    }
  }
}

bool PositionLedger::has_open_position(common::AccountId owner, common::InstrumentId instrument) const {
  std::shared_lock lock(positions_mutex_);
  auto it = by_owner_.find(owner);
  if (it == by_owner_.end()) {
    return false;
  }
  return std::any_of(it->second.begin(), it->second.end(), [&](common::PositionId id) {
    return positions_.at(id).instrument == instrument;
  });
}

void PositionLedger::record_settlement(const common::Position& position,
                                       const funding::Settlement& settlement,
                                       common::Timestamp now) {
  if (!settlement.applied) {
    return;
  }
  count(telemetry::Metric::kFundingSettlements);
  emit(LedgerEvent{
      .kind = EventKind::kFundingSettled,
      .timestamp = now,
      .position_id = position.id,
      .account = position.owner,
      .instrument = position.instrument,
      .side = position.side,
      .size = position.size,
      .collateral = position.collateral,
      .amount = settlement.payment,
      .shortfall = settlement.shortfall,
  });
  if (settlement.shortfall > 0) {
    record_shortfall(position, settlement.shortfall, 0, now);
  }
}

void PositionLedger::record_shortfall(const common::Position& position,
                                      std::int64_t amount,
                                      std::int64_t price,
                                      common::Timestamp now) {
  {
    std::lock_guard<std::mutex> lock(shortfall_mutex_);
    auto& total = shortfalls_[position.instrument];
    total = math::checked_add(total, amount);
  }
  count(telemetry::Metric::kShortfallEvents);
  count(telemetry::Metric::kShortfallAmount, amount);
  emit(LedgerEvent{
      .kind = EventKind::kShortfallRecorded,
      .timestamp = now,
      .position_id = position.id,
      .account = position.owner,
      .instrument = position.instrument,
      .side = position.side,
      .price = price,
      .shortfall = amount,
      .flagged = true,
  });
}

// Events are sequenced when emitted, possibly under a slot lock, and handed
// to subscribers later by publish_pending() once the operation has released
// its locks.
void PositionLedger::emit(const LedgerEvent& event) {
  if (!events_) {
    return;
  }
  const LedgerEvent stored = events_->append(event);
  std::lock_guard<std::mutex> lock(pending_mutex_);
  pending_events_.push_back(stored);
}

void PositionLedger::publish_pending() {
  if (!events_) {
    return;
  }
  std::vector<LedgerEvent> batch;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    batch.swap(pending_events_);
  }
  for (const auto& event : batch) {
    events_->publish(event);
  }
}

void PositionLedger::count(telemetry::Metric metric, std::int64_t delta) {
  if (telemetry_) {
    telemetry_->increment(metric, delta);
  }
}

void PositionLedger::finish(telemetry::Operation operation, std::chrono::nanoseconds started, Status status) {
  publish_pending();
  if (!telemetry_) {
    return;
  }
  telemetry_->record_latency(operation, common::now_steady() - started);
  if (status != Status::kOk) {
    telemetry_->increment(telemetry::Metric::kRejected);
  }
}

}  // namespace ledger
}  // namespace perpcore
