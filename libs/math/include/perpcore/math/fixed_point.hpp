#pragma once

#include <cstdint>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace math {

// Fixed-point position arithmetic. Amounts, sizes and prices carry
// common::kPriceScale fractional units; rates are basis points.
//
// Every routine widens to 128 bits internally. A result that does not fit in
// 64 bits throws std::overflow_error; a zero divisor throws std::domain_error.
// Divisions truncate toward zero.

[[nodiscard]] std::int64_t mul_div(std::int64_t a, std::int64_t b, std::int64_t divisor);
[[nodiscard]] std::int64_t checked_add(std::int64_t a, std::int64_t b);
[[nodiscard]] std::int64_t checked_sub(std::int64_t a, std::int64_t b);
[[nodiscard]] std::int64_t checked_mul(std::int64_t a, std::int64_t b);

// amount * bps / 10000
[[nodiscard]] std::int64_t apply_bps(std::int64_t amount, std::int64_t bps);

// size * price / kPriceScale
[[nodiscard]] std::int64_t notional(std::int64_t size, std::int64_t price);

// notional * rate_bps / 10000
[[nodiscard]] std::int64_t required_margin(std::int64_t notional_value, std::int64_t rate_bps);

// Signed profit of `size` units bought (long) or sold (short) at entry_price,
// marked at current_price.
[[nodiscard]] std::int64_t pnl(std::int64_t size,
                               std::int64_t entry_price,
                               std::int64_t current_price,
                               common::Side side);

// sign(mark - index) * |mark - index| * factor / index, in bps per interval.
[[nodiscard]] std::int64_t funding_rate(std::int64_t mark_price,
                                        std::int64_t index_price,
                                        std::int64_t factor);

// Amount the position pays for `rate_bps` (positive = paid, negative =
// received). Longs pay size * rate / 10000 when rate > 0; shorts pay when
// rate < 0.
[[nodiscard]] std::int64_t funding_payment(std::int64_t size, std::int64_t rate_bps, common::Side side);

// Price at which collateral + pnl equals the maintenance margin.
// Long: 0 when collateral is already under margin at entry or no positive
// price exists. Short: always strictly above entry.
[[nodiscard]] std::int64_t liquidation_price(std::int64_t size,
                                             std::int64_t collateral,
                                             std::int64_t entry_price,
                                             std::int64_t maintenance_rate_bps,
                                             common::Side side);

// (old_entry * old_size + price * added_size) / (old_size + added_size)
[[nodiscard]] std::int64_t weighted_entry_price(std::int64_t old_entry,
                                                std::int64_t old_size,
                                                std::int64_t price,
                                                std::int64_t added_size);

}  // namespace math
}  // namespace perpcore
