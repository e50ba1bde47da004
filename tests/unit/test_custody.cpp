#include "test_custody.hpp"

#include <cassert>
#include <stdexcept>

#include "perpcore/common/spsc_ring.hpp"
#include "perpcore/common/time_utils.hpp"
#include "perpcore/custody/collateral_vault.hpp"
#include "perpcore/oracle/price_oracle.hpp"

namespace perpcore::tests {

void test_collateral_vault() {
  using custody::TransferStatus;

  custody::CollateralVault vault;
  vault.add_supported_asset(1);
  assert(vault.is_supported(1));
  assert(!vault.is_supported(2));

  assert(vault.deposit(7, 1, 100) == TransferStatus::kOk);
  assert(vault.deposit(7, 2, 100) == TransferStatus::kUnsupportedAsset);
  assert(vault.withdraw(7, 1, 150) == TransferStatus::kInsufficientBalance);
  assert(vault.withdraw(7, 1, 40) == TransferStatus::kOk);
  assert(vault.balance(7, 1).available == 60);

  bool threw = false;
  try {
    static_cast<void>(vault.deposit(7, 1, 0));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    vault.set_collateral_asset(1, 2);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  vault.set_collateral_asset(1, 1);

  auto exchange = vault.bind_exchange();
  assert(exchange->collateral_asset_for(1) == 1);
  assert(!exchange->collateral_asset_for(5).has_value());

  // Only one capability is ever issued.
  threw = false;
  try {
    static_cast<void>(vault.bind_exchange());
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);

  assert(exchange->debit(7, 1, 70) == TransferStatus::kInsufficientBalance);
  assert(exchange->debit(7, 1, 50) == TransferStatus::kOk);
  assert(vault.pool_balance(1) == 50);
  assert(exchange->credit(8, 1, 80) == TransferStatus::kOk);
  assert(vault.pool_balance(1) == -30);
  assert(vault.balance(8, 1).available == 80);
  assert(exchange->credit(8, 2, 10) == TransferStatus::kUnsupportedAsset);
  assert(exchange->credit(8, 1, 0) == TransferStatus::kOk);
}

void test_price_oracle() {
  common::ManualClock clock{1'000};
  oracle::PriceOracle oracle{clock, 60};
  oracle.add_instrument(1, 3'000, 2'990);

  auto quote = oracle.prices(1);
  assert(quote.ok());
  assert(quote.mark_price == 3'000);
  assert(quote.index_price == 2'990);
  assert(oracle.price(1).price == 3'000);
  assert(oracle.price(2).status == oracle::FeedStatus::kNotSupported);

  clock.advance(60);
  assert(oracle.price(1).ok());
  clock.advance(1);
  assert(oracle.price(1).status == oracle::FeedStatus::kStale);

  assert(oracle.update_price(1, 3'100, 3'000));
  assert(oracle.price(1).ok());
  assert(oracle.price(1).timestamp == 1'061);
  assert(!oracle.update_price(2, 1, 1));

  bool threw = false;
  try {
    oracle.add_instrument(1, 1, 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    static_cast<void>(oracle.update_price(1, 0, 1));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void test_spsc_ring() {
  common::SpscRing<int> ring(4);
  assert(ring.capacity() == 4);
  assert(ring.empty());
  assert(ring.try_push(1));
  assert(ring.try_push(2));
  assert(ring.try_push(3));
  assert(!ring.try_push(4));  // one slot stays empty
  assert(ring.size() == 3);
  assert(ring.try_pop() == 1);
  assert(ring.try_push(4));
  assert(ring.try_pop() == 2);
  assert(ring.try_pop() == 3);
  assert(ring.try_pop() == 4);
  assert(!ring.try_pop().has_value());

  bool threw = false;
  try {
    common::SpscRing<int> bad(3);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace perpcore::tests
