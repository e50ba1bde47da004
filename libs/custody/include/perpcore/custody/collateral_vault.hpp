#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "perpcore/common/types.hpp"
#include "perpcore/custody/custody.hpp"

namespace perpcore {
namespace custody {

struct Balance {
  std::int64_t available{0};
};

// In-memory custody. Users deposit and withdraw directly; moving funds to and
// from the exchange pool requires the handle returned by bind_exchange().
class CollateralVault {
 public:
  CollateralVault() = default;
  CollateralVault(const CollateralVault&) = delete;
  CollateralVault& operator=(const CollateralVault&) = delete;

  void add_supported_asset(common::AssetId asset);
  [[nodiscard]] bool is_supported(common::AssetId asset) const;
  void set_collateral_asset(common::InstrumentId instrument, common::AssetId asset);

  TransferStatus deposit(common::AccountId account, common::AssetId asset, std::int64_t amount);
  TransferStatus withdraw(common::AccountId account, common::AssetId asset, std::int64_t amount);

  [[nodiscard]] Balance balance(common::AccountId account, common::AssetId asset) const;
  // Net collateral held by the exchange; negative once payouts exceed what was escrowed.
  [[nodiscard]] std::int64_t pool_balance(common::AssetId asset) const;

  // Issues the single exchange capability. Throws std::logic_error if one was
  // already issued. The handle must not outlive the vault.
  [[nodiscard]] std::unique_ptr<Custody> bind_exchange();

 private:
  class ExchangeHandle;

  struct BalanceKey {
    common::AccountId account{0};
    common::AssetId asset{0};

    bool operator==(const BalanceKey&) const = default;
  };

  struct BalanceKeyHash {
    std::size_t operator()(const BalanceKey& key) const noexcept {
      return std::hash<std::uint64_t>{}(key.account * 0x9E3779B97F4A7C15ull ^ key.asset);
    }
  };

  TransferStatus debit_to_pool(common::AccountId owner, common::AssetId asset, std::int64_t amount);
  TransferStatus credit_from_pool(common::AccountId owner, common::AssetId asset, std::int64_t amount);
  std::optional<common::AssetId> collateral_asset(common::InstrumentId instrument) const;

  mutable std::mutex mutex_;
  std::unordered_set<common::AssetId> supported_assets_{};
  std::unordered_map<common::InstrumentId, common::AssetId> collateral_assets_{};
  std::unordered_map<BalanceKey, Balance, BalanceKeyHash> balances_{};
  std::unordered_map<common::AssetId, std::int64_t> pool_{};
  bool exchange_bound_{false};
};

}  // namespace custody
}  // namespace perpcore
