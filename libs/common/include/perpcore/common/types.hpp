#pragma once

#include <cstdint>
#include <string_view>

namespace perpcore {
namespace common {

using InstrumentId = std::uint32_t;
using AssetId = std::uint32_t;
using AccountId = std::uint64_t;
using PositionId = std::uint64_t;
using Timestamp = std::int64_t;  // unix seconds

inline constexpr std::int64_t kPriceScale = 100'000'000;  // 8 fractional digits
inline constexpr std::int64_t kBasisPointDenominator = 10'000;

enum class Side : std::uint8_t {
  kLong,
  kShort,
};

inline constexpr std::string_view to_string(Side side) noexcept {
  return side == Side::kLong ? "long" : "short";
}

}  // namespace common
}  // namespace perpcore
