#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace custody {

enum class TransferStatus : std::uint8_t {
  kOk,
  kInsufficientBalance,
  kUnsupportedAsset,
};

inline constexpr std::string_view to_string(TransferStatus status) noexcept {
  switch (status) {
    case TransferStatus::kOk:
      return "ok";
    case TransferStatus::kInsufficientBalance:
      return "insufficient_balance";
    case TransferStatus::kUnsupportedAsset:
      return "unsupported_asset";
  }
  return "unknown";
}

// Transfer primitives the position ledger is allowed to call. An instance is
// the exchange's capability over user balances; whoever holds it can move
// collateral between users and the exchange pool.
class Custody {
 public:
  virtual ~Custody() = default;

  // user -> exchange pool
  [[nodiscard]] virtual TransferStatus debit(common::AccountId owner, common::AssetId asset, std::int64_t amount) = 0;
  // exchange pool -> user
  [[nodiscard]] virtual TransferStatus credit(common::AccountId owner, common::AssetId asset, std::int64_t amount) = 0;
  // nullopt when no collateral asset is configured for the instrument
  [[nodiscard]] virtual std::optional<common::AssetId> collateral_asset_for(common::InstrumentId instrument) const = 0;
};

}  // namespace custody
}  // namespace perpcore
