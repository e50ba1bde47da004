#pragma once

#include <cstdint>
#include <string_view>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace oracle {

enum class FeedStatus : std::uint8_t {
  kOk,
  kNotSupported,
  kStale,
};

inline constexpr std::string_view to_string(FeedStatus status) noexcept {
  switch (status) {
    case FeedStatus::kOk:
      return "ok";
    case FeedStatus::kNotSupported:
      return "not_supported";
    case FeedStatus::kStale:
      return "stale";
  }
  return "unknown";
}

struct PriceQuote {
  FeedStatus status{FeedStatus::kNotSupported};
  std::int64_t price{0};
  common::Timestamp timestamp{0};

  [[nodiscard]] bool ok() const noexcept { return status == FeedStatus::kOk; }
};

struct MarkIndexQuote {
  FeedStatus status{FeedStatus::kNotSupported};
  std::int64_t mark_price{0};
  std::int64_t index_price{0};
  common::Timestamp timestamp{0};

  [[nodiscard]] bool ok() const noexcept { return status == FeedStatus::kOk; }
};

class PriceFeed {
 public:
  virtual ~PriceFeed() = default;

  // Current mark price.
  [[nodiscard]] virtual PriceQuote price(common::InstrumentId instrument) const = 0;
  [[nodiscard]] virtual MarkIndexQuote prices(common::InstrumentId instrument) const = 0;
};

}  // namespace oracle
}  // namespace perpcore
