#include "perpcore/math/fixed_point.hpp"

#include <limits>
#include <stdexcept>

namespace perpcore {
namespace math {

namespace {

using I128 = __int128;

constexpr I128 kMax = std::numeric_limits<std::int64_t>::max();
constexpr I128 kMin = std::numeric_limits<std::int64_t>::min();

std::int64_t narrow(I128 value, const char* what) {
  if (value > kMax || value < kMin) {
    throw std::overflow_error(what);
  }
  return static_cast<std::int64_t>(value);
}

I128 abs128(I128 value) noexcept {
  return value < 0 ? -value : value;
}

// Largest 128-bit product of two 64-bit operands is below 2^126, so a single
// widening multiply cannot overflow.
I128 wide_mul(std::int64_t a, std::int64_t b) noexcept {
  return static_cast<I128>(a) * static_cast<I128>(b);
}

}  // namespace

std::int64_t mul_div(std::int64_t a, std::int64_t b, std::int64_t divisor) {
  if (divisor == 0) {
    throw std::domain_error("mul_div: division by zero");
  }
  return narrow(wide_mul(a, b) / divisor, "mul_div: result exceeds 64 bits");
}

std::int64_t checked_add(std::int64_t a, std::int64_t b) {
  return narrow(static_cast<I128>(a) + b, "checked_add: overflow");
}

std::int64_t checked_sub(std::int64_t a, std::int64_t b) {
  return narrow(static_cast<I128>(a) - b, "checked_sub: overflow");
}

std::int64_t checked_mul(std::int64_t a, std::int64_t b) {
  return narrow(wide_mul(a, b), "checked_mul: overflow");
}

std::int64_t apply_bps(std::int64_t amount, std::int64_t bps) {
  return mul_div(amount, bps, common::kBasisPointDenominator);
}

std::int64_t notional(std::int64_t size, std::int64_t price) {
  return mul_div(size, price, common::kPriceScale);
}

std::int64_t required_margin(std::int64_t notional_value, std::int64_t rate_bps) {
  return apply_bps(notional_value, rate_bps);
}

std::int64_t pnl(std::int64_t size,
                 std::int64_t entry_price,
                 std::int64_t current_price,
                 common::Side side) {
  const I128 delta = static_cast<I128>(current_price) - entry_price;
  const bool profit = (side == common::Side::kLong) ? delta > 0 : delta < 0;
  const I128 magnitude = abs128(delta) * abs128(size) / common::kPriceScale;
  return narrow(profit ? magnitude : -magnitude, "pnl: result exceeds 64 bits");
}

std::int64_t funding_rate(std::int64_t mark_price, std::int64_t index_price, std::int64_t factor) {
  if (index_price == 0) {
    throw std::domain_error("funding_rate: index price is zero");
  }
  const I128 delta = static_cast<I128>(mark_price) - index_price;
  const I128 magnitude = abs128(delta) * factor / index_price;
  return narrow(delta < 0 ? -magnitude : magnitude, "funding_rate: result exceeds 64 bits");
}

std::int64_t funding_payment(std::int64_t size, std::int64_t rate_bps, common::Side side) {
  const std::int64_t payment = mul_div(size, rate_bps, common::kBasisPointDenominator);
  return side == common::Side::kLong ? payment : -payment;
}

std::int64_t liquidation_price(std::int64_t size,
                               std::int64_t collateral,
                               std::int64_t entry_price,
                               std::int64_t maintenance_rate_bps,
                               common::Side side) {
  if (size == 0) {
    throw std::domain_error("liquidation_price: size is zero");
  }
  const I128 scale = common::kPriceScale;
  const I128 bps = common::kBasisPointDenominator;
  const I128 entry_notional = wide_mul(size, entry_price) / scale;

  if (side == common::Side::kLong) {
    if (collateral < required_margin(static_cast<std::int64_t>(entry_notional), maintenance_rate_bps)) {
      return 0;
    }
    // collateral + size*(p - entry)/scale = m*size*p/(scale*bps)
    //   => p = (entry_notional - collateral) * scale * bps / (size * (bps - m))
    const I128 numerator = (entry_notional - collateral) * scale * bps;
    const I128 denominator = static_cast<I128>(size) * (bps - maintenance_rate_bps);
    if (numerator <= 0 || denominator <= 0) {
      return 0;
    }
    return narrow(numerator / denominator, "liquidation_price: result exceeds 64 bits");
  }

  // collateral + size*(entry - p)/scale = m*size*p/(scale*bps)
  //   => p = (entry_notional + collateral) * scale * bps / (size * (bps + m))
  const I128 numerator = (entry_notional + collateral) * scale * bps;
  const I128 denominator = static_cast<I128>(size) * (bps + maintenance_rate_bps);
  const I128 price = numerator / denominator;
  return narrow(price > entry_price ? price : static_cast<I128>(entry_price) + 1,
                "liquidation_price: result exceeds 64 bits");
}

std::int64_t weighted_entry_price(std::int64_t old_entry,
                                  std::int64_t old_size,
                                  std::int64_t price,
                                  std::int64_t added_size) {
  const I128 total_size = static_cast<I128>(old_size) + added_size;
  if (total_size == 0) {
    throw std::domain_error("weighted_entry_price: total size is zero");
  }
  const I128 weighted = wide_mul(old_entry, old_size) + wide_mul(price, added_size);
  return narrow(weighted / total_size, "weighted_entry_price: result exceeds 64 bits");
}

}  // namespace math
}  // namespace perpcore
