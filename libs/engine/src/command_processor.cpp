#include "perpcore/engine/command_processor.hpp"

#include <algorithm>
#include <stdexcept>

namespace perpcore {
namespace engine {

namespace {

using ledger::Status;
namespace cmd = ingest::commands;

Ack make_ack(Status status, std::int64_t value = 0) {
  return Ack{status, ledger::reject_code(status), status == Status::kOk ? value : 0};
}

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

CommandProcessor::CommandProcessor(ledger::PositionLedger& ledger,
                                   oracle::PriceOracle& oracle,
                                   custody::CollateralVault& vault,
                                   common::ManualClock& clock,
                                   Options options,
                                   wal::Writer* journal)
    : ledger_(ledger),
      oracle_(oracle),
      vault_(vault),
      clock_(clock),
      options_(std::move(options)),
      journal_(journal) {}

Ack CommandProcessor::execute(const ingest::Frame& frame) {
  // Rejected frames are not journaled, so they must not move the clock either.
  const common::Timestamp previous = clock_.now();
  clock_.set(std::max(previous, frame.header.timestamp));

  Ack ack;
  try {
    ack = dispatch(frame);
  } catch (const std::overflow_error&) {
    ack = make_ack(Status::kArithmeticOverflow);
  } catch (const std::domain_error&) {
    ack = make_ack(Status::kArithmeticOverflow);
  } catch (const std::runtime_error&) {
    // decode failures; the ledger itself only throws the two above
    ack = make_ack(Status::kMalformedCommand);
  }

  if (!ack.ok()) {
    clock_.set(previous);
    ++rejected_;
    return ack;
  }

  ++executed_;
  if (journal_) {
    journal_->append(ingest::serialize(frame));
  }
  return ack;
}

Ack CommandProcessor::dispatch(const ingest::Frame& frame) {
  const common::AccountId caller = frame.header.caller;
  const std::span<const std::byte> payload(frame.payload);

  switch (frame.header.kind) {
    case ingest::CommandKind::kOpenPosition: {
      const auto command = cmd::decode_open_position(payload);
      const auto result = ledger_.open(caller,
                                       ledger::OpenRequest{
                                           .owner = command.owner,
                                           .instrument = command.instrument,
                                           .side = command.side,
                                           .collateral = command.collateral,
                                           .size = command.size,
                                           .leverage = command.leverage,
                                           .max_funding_rate = command.max_funding_rate,
                                           .expected_price = command.expected_price,
                                           .slippage_tolerance_bps = command.slippage_tolerance_bps,
                                       });
      return make_ack(result.status, static_cast<std::int64_t>(result.position_id));
    }
    case ingest::CommandKind::kClosePosition: {
      const auto command = cmd::decode_close_position(payload);
      const auto result = ledger_.close(caller, command.position_id, command.size);
      return make_ack(result.status, result.payout);
    }
    case ingest::CommandKind::kIncreasePosition: {
      const auto command = cmd::decode_increase_position(payload);
      const auto result = ledger_.increase(caller, command.position_id, command.collateral, command.size);
      return make_ack(result.status, result.size);
    }
    case ingest::CommandKind::kDecreasePosition: {
      const auto command = cmd::decode_decrease_position(payload);
      const auto result = ledger_.decrease(caller, command.position_id, command.size);
      return make_ack(result.status, result.payout);
    }
    case ingest::CommandKind::kLiquidate: {
      const auto command = cmd::decode_liquidate(payload);
      const auto result = ledger_.liquidate(caller, command.position_id);
      return make_ack(result.status, result.fee);
    }
    case ingest::CommandKind::kApplyFunding: {
      const auto command = cmd::decode_apply_funding(payload);
      const auto result = ledger_.apply_funding(command.position_id);
      return make_ack(result.status, result.payment);
    }
    case ingest::CommandKind::kUpdateFundingRates: {
      const auto result = ledger_.update_funding_rates();
      return make_ack(result.status, static_cast<std::int64_t>(result.report.updated));
    }
    case ingest::CommandKind::kPriceUpdate:
      return price_update(caller, cmd::decode_price_update(payload));
    case ingest::CommandKind::kDeposit:
      return deposit(caller, cmd::decode_deposit(payload));
    case ingest::CommandKind::kWithdraw:
      return withdraw(caller, cmd::decode_withdraw(payload));
    case ingest::CommandKind::kAuthorizeAgent: {
      const auto command = cmd::decode_authorize_agent(payload);
      return make_ack(ledger_.authorize_agent(caller, command.agent));
    }
    case ingest::CommandKind::kRevokeAgent: {
      const auto command = cmd::decode_revoke_agent(payload);
      return make_ack(ledger_.revoke_agent(caller, command.agent));
    }
  }
  return make_ack(Status::kMalformedCommand);
}

Ack CommandProcessor::price_update(common::AccountId caller, const cmd::PriceUpdate& command) {
  if (!options_.price_publishers.contains(caller)) {
    return make_ack(Status::kUnauthorized);
  }
  if (command.mark_price <= 0 || command.index_price <= 0) {
    return make_ack(Status::kInvalidPrice);
  }
  if (!oracle_.update_price(command.instrument, command.mark_price, command.index_price)) {
    return make_ack(Status::kUnsupportedInstrument);
  }
  return make_ack(Status::kOk, command.mark_price);
}

Ack CommandProcessor::deposit(common::AccountId caller, const cmd::Deposit& command) {
  if (caller == 0) {
    return make_ack(Status::kInvalidAccount);
  }
  if (command.amount <= 0) {
    return make_ack(Status::kInvalidAmount);
  }
  const Status status = from_transfer(vault_.deposit(caller, command.asset, command.amount));
  return make_ack(status, vault_.balance(caller, command.asset).available);
}

Ack CommandProcessor::withdraw(common::AccountId caller, const cmd::Withdraw& command) {
  if (caller == 0) {
    return make_ack(Status::kInvalidAccount);
  }
  if (command.amount <= 0) {
    return make_ack(Status::kInvalidAmount);
  }
  const Status status = from_transfer(vault_.withdraw(caller, command.asset, command.amount));
  return make_ack(status, vault_.balance(caller, command.asset).available);
}

}  // namespace engine
}  // namespace perpcore
