#include "perpcore/oracle/price_oracle.hpp"

#include <mutex>
#include <stdexcept>

namespace perpcore {
namespace oracle {

PriceOracle::PriceOracle(const common::Clock& clock, common::Timestamp max_age)
    : clock_(clock), max_age_(max_age) {
  if (max_age < 0) {
    throw std::invalid_argument("oracle max_age must not be negative");
  }
}

void PriceOracle::check_prices(std::int64_t mark_price, std::int64_t index_price) {
  if (mark_price <= 0 || index_price <= 0) {
    throw std::invalid_argument("oracle prices must be positive");
  }
}

void PriceOracle::add_instrument(common::InstrumentId instrument,
                                 std::int64_t mark_price,
                                 std::int64_t index_price) {
  check_prices(mark_price, index_price);
  std::unique_lock lock(mutex_);
  auto [it, inserted] = entries_.try_emplace(instrument);
  if (!inserted) {
    throw std::invalid_argument("instrument already registered with oracle");
  }
  it->second = Entry{mark_price, index_price, clock_.now()};
}

bool PriceOracle::update_price(common::InstrumentId instrument,
                               std::int64_t mark_price,
                               std::int64_t index_price) {
  check_prices(mark_price, index_price);
  std::unique_lock lock(mutex_);
  auto it = entries_.find(instrument);
  if (it == entries_.end()) {
    return false;
  }
  it->second = Entry{mark_price, index_price, clock_.now()};
  return true;
}

bool PriceOracle::has_instrument(common::InstrumentId instrument) const {
  std::shared_lock lock(mutex_);
  return entries_.contains(instrument);
}

PriceQuote PriceOracle::price(common::InstrumentId instrument) const {
  const MarkIndexQuote quote = prices(instrument);
  return PriceQuote{quote.status, quote.mark_price, quote.timestamp};
}

MarkIndexQuote PriceOracle::prices(common::InstrumentId instrument) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(instrument);
  if (it == entries_.end()) {
    return MarkIndexQuote{};
  }
  const Entry& entry = it->second;
  MarkIndexQuote quote{FeedStatus::kOk, entry.mark_price, entry.index_price, entry.updated_at};
  if (max_age_ > 0 && clock_.now() - entry.updated_at > max_age_) {
    quote.status = FeedStatus::kStale;
  }
  return quote;
}

}  // namespace oracle
}  // namespace perpcore
