#pragma once

#include <cstdint>
#include <string_view>

#include "perpcore/common/types.hpp"
#include "perpcore/funding/funding_engine.hpp"
#include "perpcore/risk/liquidation_evaluator.hpp"

namespace perpcore {
namespace ledger {

enum class Status : std::uint8_t {
  kOk,

  // validation: bad input, rejected before any state is read or changed
  kInvalidAccount,
  kInvalidAmount,
  kInvalidLeverage,
  kLeverageTooHigh,
  kInvalidSize,
  kInvalidPrice,
  kInvalidParams,
  kMalformedCommand,   // undecodable command payload
  kArithmeticOverflow,  // amounts too large for fixed-point math

  // precondition: rejected before any state change
  kPaused,
  kUnsupportedInstrument,
  kInstrumentExists,
  kPositionNotFound,
  kUnauthorized,
  kDuplicatePosition,
  kInsufficientMargin,
  kFundingRateExceeded,
  kSlippageExceeded,
  kNotLiquidatable,
  kPriceUnavailable,
  kPriceStale,
  kAssetNotConfigured,
  kStaleSnapshot,
  kSnapshotMismatch,

  // custody refused a transfer; fully rolled back
  kInsufficientFunds,
  kUnsupportedAsset,
};

enum class ErrorClass : std::uint8_t {
  kNone,
  kValidation,
  kPrecondition,
  kInsufficientFunds,
};

[[nodiscard]] ErrorClass classify(Status status) noexcept;
[[nodiscard]] std::string_view to_string(Status status) noexcept;
[[nodiscard]] std::string_view to_string(ErrorClass error_class) noexcept;
// Stable wire code: 0 for kOk, 31xx validation, 32xx precondition, 33xx funds.
[[nodiscard]] std::uint16_t reject_code(Status status) noexcept;

struct OpenRequest {
  common::AccountId owner{0};
  common::InstrumentId instrument{0};
  common::Side side{common::Side::kLong};
  std::int64_t collateral{0};
  std::int64_t size{0};
  std::int64_t leverage{0};
  std::int64_t max_funding_rate{0};        // bps per interval
  std::int64_t expected_price{0};          // caller's reference execution price
  std::int64_t slippage_tolerance_bps{0};
};

struct OpenResult {
  Status status{Status::kOk};
  common::PositionId position_id{0};
  std::int64_t entry_price{0};
  std::int64_t notional{0};
  std::int64_t fee{0};

  [[nodiscard]] bool ok() const noexcept { return status == Status::kOk; }
};

// Result of close and decrease.
struct CloseResult {
  Status status{Status::kOk};
  std::int64_t price{0};
  std::int64_t realized_pnl{0};
  std::int64_t collateral_returned{0};
  std::int64_t payout{0};
  std::int64_t shortfall{0};     // loss beyond returned collateral, plus unpaid funding
  std::int64_t funding_paid{0};  // settled just before the reduction
  std::int64_t remaining_size{0};
  bool position_closed{false};

  [[nodiscard]] bool ok() const noexcept { return status == Status::kOk; }
};

struct IncreaseResult {
  Status status{Status::kOk};
  std::int64_t price{0};
  std::int64_t size{0};
  std::int64_t collateral{0};
  std::int64_t entry_price{0};
  std::int64_t fee{0};
  std::int64_t funding_paid{0};

  [[nodiscard]] bool ok() const noexcept { return status == Status::kOk; }
};

struct FundingResult {
  Status status{Status::kOk};
  bool applied{false};
  std::int64_t intervals{0};
  std::int64_t payment{0};
  std::int64_t shortfall{0};

  [[nodiscard]] bool ok() const noexcept { return status == Status::kOk; }
};

struct LiquidationResult {
  Status status{Status::kOk};
  std::int64_t price{0};
  std::int64_t pnl{0};
  std::int64_t fee{0};
  std::int64_t owner_payout{0};
  std::int64_t shortfall{0};
  std::int64_t funding_paid{0};

  [[nodiscard]] bool ok() const noexcept { return status == Status::kOk; }
};

// One price read pinned for a check-then-act sequence.
struct PriceSnapshot {
  common::InstrumentId instrument{0};
  std::int64_t price{0};
  common::Timestamp observed_at{0};
};

struct SweepResult {
  Status status{Status::kOk};
  funding::SweepReport report{};

  [[nodiscard]] bool ok() const noexcept { return status == Status::kOk; }
};

struct LiquidationCheck {
  Status status{Status::kOk};
  risk::LiquidationEvaluator::Report report{};

  [[nodiscard]] bool ok() const noexcept { return status == Status::kOk; }
};

}  // namespace ledger
}  // namespace perpcore
