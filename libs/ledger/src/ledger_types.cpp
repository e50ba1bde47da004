#include "perpcore/ledger/ledger_types.hpp"

namespace perpcore {
namespace ledger {

ErrorClass classify(Status status) noexcept {
  switch (status) {
    case Status::kOk:
      return ErrorClass::kNone;
    case Status::kInvalidAccount:
    case Status::kInvalidAmount:
    case Status::kInvalidLeverage:
    case Status::kLeverageTooHigh:
    case Status::kInvalidSize:
    case Status::kInvalidPrice:
    case Status::kInvalidParams:
    case Status::kMalformedCommand:
    case Status::kArithmeticOverflow:
      return ErrorClass::kValidation;
    case Status::kInsufficientFunds:
    case Status::kUnsupportedAsset:
      return ErrorClass::kInsufficientFunds;
    default:
      return ErrorClass::kPrecondition;
  }
}

std::string_view to_string(Status status) noexcept {
  switch (status) {
    case Status::kOk:
      return "ok";
    case Status::kInvalidAccount:
      return "invalid_account";
    case Status::kInvalidAmount:
      return "invalid_amount";
    case Status::kInvalidLeverage:
      return "invalid_leverage";
    case Status::kLeverageTooHigh:
      return "leverage_too_high";
    case Status::kInvalidSize:
      return "invalid_size";
    case Status::kInvalidPrice:
      return "invalid_price";
    case Status::kInvalidParams:
      return "invalid_params";
    case Status::kMalformedCommand:
      return "malformed_command";
    case Status::kArithmeticOverflow:
      return "arithmetic_overflow";
    case Status::kPaused:
      return "paused";
    case Status::kUnsupportedInstrument:
      return "unsupported_instrument";
    case Status::kInstrumentExists:
      return "instrument_exists";
    case Status::kPositionNotFound:
      return "position_not_found";
    case Status::kUnauthorized:
      return "unauthorized";
    case Status::kDuplicatePosition:
      return "duplicate_position";
    case Status::kInsufficientMargin:
      return "insufficient_margin";
    case Status::kFundingRateExceeded:
      return "funding_rate_exceeded";
    case Status::kSlippageExceeded:
      return "slippage_exceeded";
    case Status::kNotLiquidatable:
      return "not_liquidatable";
    case Status::kPriceUnavailable:
      return "price_unavailable";
    case Status::kPriceStale:
      return "price_stale";
    case Status::kAssetNotConfigured:
      return "asset_not_configured";
    case Status::kStaleSnapshot:
      return "stale_snapshot";
    case Status::kSnapshotMismatch:
      return "snapshot_mismatch";
    case Status::kInsufficientFunds:
      return "insufficient_funds";
    case Status::kUnsupportedAsset:
      return "unsupported_asset";
  }
  return "unknown";
}

std::string_view to_string(ErrorClass error_class) noexcept {
  switch (error_class) {
    case ErrorClass::kNone:
      return "none";
    case ErrorClass::kValidation:
      return "validation";
    case ErrorClass::kPrecondition:
      return "precondition";
    case ErrorClass::kInsufficientFunds:
      return "insufficient_funds";
  }
  return "unknown";
}

std::uint16_t reject_code(Status status) noexcept {
  const auto ordinal = static_cast<std::uint16_t>(status);
  switch (classify(status)) {
    case ErrorClass::kNone:
      return 0;
    case ErrorClass::kValidation:
      return static_cast<std::uint16_t>(3100 + ordinal - static_cast<std::uint16_t>(Status::kInvalidAccount));
    case ErrorClass::kPrecondition:
      return static_cast<std::uint16_t>(3200 + ordinal - static_cast<std::uint16_t>(Status::kPaused));
    case ErrorClass::kInsufficientFunds:
      return static_cast<std::uint16_t>(3300 + ordinal - static_cast<std::uint16_t>(Status::kInsufficientFunds));
  }
  return 3999;
}

}  // namespace ledger
}  // namespace perpcore
