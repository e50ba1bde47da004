#include "perpcore/custody/collateral_vault.hpp"

#include <stdexcept>

namespace perpcore {
namespace custody {

class CollateralVault::ExchangeHandle final : public Custody {
 public:
  explicit ExchangeHandle(CollateralVault& vault) : vault_(vault) {}

  TransferStatus debit(common::AccountId owner, common::AssetId asset, std::int64_t amount) override {
    return vault_.debit_to_pool(owner, asset, amount);
  }

  TransferStatus credit(common::AccountId owner, common::AssetId asset, std::int64_t amount) override {
    return vault_.credit_from_pool(owner, asset, amount);
  }

  std::optional<common::AssetId> collateral_asset_for(common::InstrumentId instrument) const override {
    return vault_.collateral_asset(instrument);
  }

 private:
  CollateralVault& vault_;
};

void CollateralVault::add_supported_asset(common::AssetId asset) {
  std::lock_guard<std::mutex> lock(mutex_);
  supported_assets_.insert(asset);
}

bool CollateralVault::is_supported(common::AssetId asset) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return supported_assets_.contains(asset);
}

void CollateralVault::set_collateral_asset(common::InstrumentId instrument, common::AssetId asset) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!supported_assets_.contains(asset)) {
    throw std::invalid_argument("collateral asset is not supported by the vault");
  }
  collateral_assets_[instrument] = asset;
}

TransferStatus CollateralVault::deposit(common::AccountId account, common::AssetId asset, std::int64_t amount) {
  if (amount <= 0) {
    throw std::invalid_argument("deposit amount must be positive");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (!supported_assets_.contains(asset)) {
    return TransferStatus::kUnsupportedAsset;
  }
  balances_[BalanceKey{account, asset}].available += amount;
  return TransferStatus::kOk;
}

TransferStatus CollateralVault::withdraw(common::AccountId account, common::AssetId asset, std::int64_t amount) {
  if (amount <= 0) {
    throw std::invalid_argument("withdraw amount must be positive");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (!supported_assets_.contains(asset)) {
    return TransferStatus::kUnsupportedAsset;
  }
  auto it = balances_.find(BalanceKey{account, asset});
  if (it == balances_.end() || it->second.available < amount) {
    return TransferStatus::kInsufficientBalance;
  }
  it->second.available -= amount;
  return TransferStatus::kOk;
}

Balance CollateralVault::balance(common::AccountId account, common::AssetId asset) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = balances_.find(BalanceKey{account, asset}); it != balances_.end()) {
    return it->second;
  }
  return {};
}

std::int64_t CollateralVault::pool_balance(common::AssetId asset) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = pool_.find(asset); it != pool_.end()) {
    return it->second;
  }
  return 0;
}

std::unique_ptr<Custody> CollateralVault::bind_exchange() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (exchange_bound_) {
    throw std::logic_error("exchange capability already issued");
  }
  exchange_bound_ = true;
  return std::make_unique<ExchangeHandle>(*this);
}

TransferStatus CollateralVault::debit_to_pool(common::AccountId owner, common::AssetId asset, std::int64_t amount) {
  if (amount < 0) {
    throw std::invalid_argument("debit amount must not be negative");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (!supported_assets_.contains(asset)) {
    return TransferStatus::kUnsupportedAsset;
  }
  if (amount == 0) {
    return TransferStatus::kOk;
  }
  auto it = balances_.find(BalanceKey{owner, asset});
  if (it == balances_.end() || it->second.available < amount) {
    return TransferStatus::kInsufficientBalance;
  }
  it->second.available -= amount;
  pool_[asset] += amount;
  return TransferStatus::kOk;
}

TransferStatus CollateralVault::credit_from_pool(common::AccountId owner, common::AssetId asset, std::int64_t amount) {
  if (amount < 0) {
    throw std::invalid_argument("credit amount must not be negative");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (!supported_assets_.contains(asset)) {
    return TransferStatus::kUnsupportedAsset;
  }
  if (amount == 0) {
    return TransferStatus::kOk;
  }
  balances_[BalanceKey{owner, asset}].available += amount;
  pool_[asset] -= amount;
  return TransferStatus::kOk;
}

std::optional<common::AssetId> CollateralVault::collateral_asset(common::InstrumentId instrument) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = collateral_assets_.find(instrument); it != collateral_assets_.end()) {
    return it->second;
  }
  return std::nullopt;
}

}  // namespace custody
}  // namespace perpcore
