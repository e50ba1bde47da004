#pragma once

#include <cstdint>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace common {

struct Position {
  PositionId id{0};
  AccountId owner{0};
  InstrumentId instrument{0};
  Side side{Side::kLong};
  std::int64_t collateral{0};
  std::int64_t size{0};
  std::int64_t entry_price{0};
  Timestamp last_funding_time{0};
  std::int64_t accumulated_funding{0};  // + paid, - received
  std::int64_t leverage{1};
  Timestamp opened_at{0};
};

}  // namespace common
}  // namespace perpcore
