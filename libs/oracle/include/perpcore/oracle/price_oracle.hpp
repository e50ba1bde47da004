#pragma once

#include <cstdint>
#include <shared_mutex>
#include <unordered_map>

#include "perpcore/common/time_utils.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/oracle/price_feed.hpp"

namespace perpcore {
namespace oracle {

// Operator-fed mark/index store. A quote older than max_age seconds is
// reported as stale; max_age == 0 disables the check.
class PriceOracle final : public PriceFeed {
 public:
  PriceOracle(const common::Clock& clock, common::Timestamp max_age);

  void add_instrument(common::InstrumentId instrument, std::int64_t mark_price, std::int64_t index_price);
  // Returns false for unknown instruments.
  bool update_price(common::InstrumentId instrument, std::int64_t mark_price, std::int64_t index_price);
  [[nodiscard]] bool has_instrument(common::InstrumentId instrument) const;

  [[nodiscard]] PriceQuote price(common::InstrumentId instrument) const override;
  [[nodiscard]] MarkIndexQuote prices(common::InstrumentId instrument) const override;

 private:
  struct Entry {
    std::int64_t mark_price{0};
    std::int64_t index_price{0};
    common::Timestamp updated_at{0};
  };

  const common::Clock& clock_;
  common::Timestamp max_age_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<common::InstrumentId, Entry> entries_{};

  static void check_prices(std::int64_t mark_price, std::int64_t index_price);
};

}  // namespace oracle
}  // namespace perpcore
