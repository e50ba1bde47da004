#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace ingest {

enum class CommandKind : std::uint8_t {
  kOpenPosition = 1,
  kClosePosition,
  kIncreasePosition,
  kDecreasePosition,
  kLiquidate,
  kApplyFunding,
  kUpdateFundingRates,
  kPriceUpdate,
  kDeposit,
  kWithdraw,
  kAuthorizeAgent,
  kRevokeAgent,
};

[[nodiscard]] constexpr bool is_known(std::uint8_t raw) noexcept {
  return raw >= static_cast<std::uint8_t>(CommandKind::kOpenPosition) &&
         raw <= static_cast<std::uint8_t>(CommandKind::kRevokeAgent);
}

namespace commands {

struct OpenPosition {
  common::AccountId owner{0};
  common::InstrumentId instrument{0};
  common::Side side{common::Side::kLong};
  std::int64_t collateral{0};
  std::int64_t size{0};
  std::int64_t leverage{0};
  std::int64_t max_funding_rate{0};
  std::int64_t expected_price{0};
  std::int64_t slippage_tolerance_bps{0};
};

struct ClosePosition {
  common::PositionId position_id{0};
  std::int64_t size{0};
};

struct IncreasePosition {
  common::PositionId position_id{0};
  std::int64_t collateral{0};
  std::int64_t size{0};
};

struct DecreasePosition {
  common::PositionId position_id{0};
  std::int64_t size{0};
};

struct Liquidate {
  common::PositionId position_id{0};
};

struct ApplyFunding {
  common::PositionId position_id{0};
};

struct UpdateFundingRates {};

struct PriceUpdate {
  common::InstrumentId instrument{0};
  std::int64_t mark_price{0};
  std::int64_t index_price{0};
};

struct Deposit {
  common::AssetId asset{0};
  std::int64_t amount{0};
};

struct Withdraw {
  common::AssetId asset{0};
  std::int64_t amount{0};
};

struct AuthorizeAgent {
  common::AccountId agent{0};
};

struct RevokeAgent {
  common::AccountId agent{0};
};

// Wire kind of each command type.
template <typename T>
struct KindOf;
template <> struct KindOf<OpenPosition> { static constexpr CommandKind value = CommandKind::kOpenPosition; };
template <> struct KindOf<ClosePosition> { static constexpr CommandKind value = CommandKind::kClosePosition; };
template <> struct KindOf<IncreasePosition> { static constexpr CommandKind value = CommandKind::kIncreasePosition; };
template <> struct KindOf<DecreasePosition> { static constexpr CommandKind value = CommandKind::kDecreasePosition; };
template <> struct KindOf<Liquidate> { static constexpr CommandKind value = CommandKind::kLiquidate; };
template <> struct KindOf<ApplyFunding> { static constexpr CommandKind value = CommandKind::kApplyFunding; };
template <> struct KindOf<UpdateFundingRates> { static constexpr CommandKind value = CommandKind::kUpdateFundingRates; };
template <> struct KindOf<PriceUpdate> { static constexpr CommandKind value = CommandKind::kPriceUpdate; };
template <> struct KindOf<Deposit> { static constexpr CommandKind value = CommandKind::kDeposit; };
template <> struct KindOf<Withdraw> { static constexpr CommandKind value = CommandKind::kWithdraw; };
template <> struct KindOf<AuthorizeAgent> { static constexpr CommandKind value = CommandKind::kAuthorizeAgent; };
template <> struct KindOf<RevokeAgent> { static constexpr CommandKind value = CommandKind::kRevokeAgent; };

template <typename T>
inline constexpr CommandKind kind_of = KindOf<T>::value;

namespace detail {

// All integers are little-endian on the wire.
template <typename T>
inline void append_primitive(std::vector<std::byte>& buffer, T value) {
  auto raw = std::bit_cast<std::array<std::byte, sizeof(T)>>(value);
  if constexpr (std::endian::native == std::endian::big) {
    std::reverse(raw.begin(), raw.end());
  }
  buffer.insert(buffer.end(), raw.begin(), raw.end());
}

template <typename T>
inline T read_primitive(std::span<const std::byte> data, std::size_t& offset) {
  if (offset + sizeof(T) > data.size()) {
    throw std::runtime_error("command decode out of bounds");
  }
  std::array<std::byte, sizeof(T)> storage{};
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), sizeof(T), storage.begin());
  if constexpr (std::endian::native == std::endian::big) {
    std::reverse(storage.begin(), storage.end());
  }
  offset += sizeof(T);
  return std::bit_cast<T>(storage);
}

inline common::Side read_side(std::span<const std::byte> data, std::size_t& offset) {
  const auto raw = read_primitive<std::uint8_t>(data, offset);
  if (raw > static_cast<std::uint8_t>(common::Side::kShort)) {
    throw std::runtime_error("command decode: invalid side");
  }
  return static_cast<common::Side>(raw);
}

}  // namespace detail

inline std::vector<std::byte> encode(const OpenPosition& msg) {
  std::vector<std::byte> buffer;
  buffer.reserve(sizeof(std::uint64_t) + sizeof(std::uint32_t) + 1 + sizeof(std::int64_t) * 6);
  detail::append_primitive<std::uint64_t>(buffer, msg.owner);
  detail::append_primitive<std::uint32_t>(buffer, msg.instrument);
  detail::append_primitive<std::uint8_t>(buffer, static_cast<std::uint8_t>(msg.side));
  detail::append_primitive<std::int64_t>(buffer, msg.collateral);
  detail::append_primitive<std::int64_t>(buffer, msg.size);
  detail::append_primitive<std::int64_t>(buffer, msg.leverage);
  detail::append_primitive<std::int64_t>(buffer, msg.max_funding_rate);
  detail::append_primitive<std::int64_t>(buffer, msg.expected_price);
  detail::append_primitive<std::int64_t>(buffer, msg.slippage_tolerance_bps);
  return buffer;
}

inline OpenPosition decode_open_position(std::span<const std::byte> data) {
  std::size_t offset = 0;
  OpenPosition msg;
  msg.owner = detail::read_primitive<std::uint64_t>(data, offset);
  msg.instrument = detail::read_primitive<std::uint32_t>(data, offset);
  msg.side = detail::read_side(data, offset);
  msg.collateral = detail::read_primitive<std::int64_t>(data, offset);
  msg.size = detail::read_primitive<std::int64_t>(data, offset);
  msg.leverage = detail::read_primitive<std::int64_t>(data, offset);
  msg.max_funding_rate = detail::read_primitive<std::int64_t>(data, offset);
  msg.expected_price = detail::read_primitive<std::int64_t>(data, offset);
  msg.slippage_tolerance_bps = detail::read_primitive<std::int64_t>(data, offset);
  return msg;
}

inline std::vector<std::byte> encode(const ClosePosition& msg) {
  std::vector<std::byte> buffer;
  buffer.reserve(sizeof(std::uint64_t) + sizeof(std::int64_t));
  detail::append_primitive<std::uint64_t>(buffer, msg.position_id);
  detail::append_primitive<std::int64_t>(buffer, msg.size);
  return buffer;
}

inline ClosePosition decode_close_position(std::span<const std::byte> data) {
  std::size_t offset = 0;
  ClosePosition msg;
  msg.position_id = detail::read_primitive<std::uint64_t>(data, offset);
  msg.size = detail::read_primitive<std::int64_t>(data, offset);
  return msg;
}

inline std::vector<std::byte> encode(const IncreasePosition& msg) {
  std::vector<std::byte> buffer;
  buffer.reserve(sizeof(std::uint64_t) + sizeof(std::int64_t) * 2);
  detail::append_primitive<std::uint64_t>(buffer, msg.position_id);
  detail::append_primitive<std::int64_t>(buffer, msg.collateral);
  detail::append_primitive<std::int64_t>(buffer, msg.size);
  return buffer;
}

inline IncreasePosition decode_increase_position(std::span<const std::byte> data) {
  std::size_t offset = 0;
  IncreasePosition msg;
  msg.position_id = detail::read_primitive<std::uint64_t>(data, offset);
  msg.collateral = detail::read_primitive<std::int64_t>(data, offset);
  msg.size = detail::read_primitive<std::int64_t>(data, offset);
  return msg;
}

inline std::vector<std::byte> encode(const DecreasePosition& msg) {
  std::vector<std::byte> buffer;
  buffer.reserve(sizeof(std::uint64_t) + sizeof(std::int64_t));
  detail::append_primitive<std::uint64_t>(buffer, msg.position_id);
  detail::append_primitive<std::int64_t>(buffer, msg.size);
  return buffer;
}

inline DecreasePosition decode_decrease_position(std::span<const std::byte> data) {
  std::size_t offset = 0;
  DecreasePosition msg;
  msg.position_id = detail::read_primitive<std::uint64_t>(data, offset);
  msg.size = detail::read_primitive<std::int64_t>(data, offset);
  return msg;
}

inline std::vector<std::byte> encode(const Liquidate& msg) {
  std::vector<std::byte> buffer;
  detail::append_primitive<std::uint64_t>(buffer, msg.position_id);
  return buffer;
}

inline Liquidate decode_liquidate(std::span<const std::byte> data) {
  std::size_t offset = 0;
  Liquidate msg;
  msg.position_id = detail::read_primitive<std::uint64_t>(data, offset);
  return msg;
}

inline std::vector<std::byte> encode(const ApplyFunding& msg) {
  std::vector<std::byte> buffer;
  detail::append_primitive<std::uint64_t>(buffer, msg.position_id);
  return buffer;
}

inline ApplyFunding decode_apply_funding(std::span<const std::byte> data) {
  std::size_t offset = 0;
  ApplyFunding msg;
  msg.position_id = detail::read_primitive<std::uint64_t>(data, offset);
  return msg;
}

inline std::vector<std::byte> encode(const UpdateFundingRates&) {
  return {};
}

inline std::vector<std::byte> encode(const PriceUpdate& msg) {
  std::vector<std::byte> buffer;
  buffer.reserve(sizeof(std::uint32_t) + sizeof(std::int64_t) * 2);
  detail::append_primitive<std::uint32_t>(buffer, msg.instrument);
  detail::append_primitive<std::int64_t>(buffer, msg.mark_price);
  detail::append_primitive<std::int64_t>(buffer, msg.index_price);
  return buffer;
}

inline PriceUpdate decode_price_update(std::span<const std::byte> data) {
  std::size_t offset = 0;
  PriceUpdate msg;
  msg.instrument = detail::read_primitive<std::uint32_t>(data, offset);
  msg.mark_price = detail::read_primitive<std::int64_t>(data, offset);
  msg.index_price = detail::read_primitive<std::int64_t>(data, offset);
  return msg;
}

inline std::vector<std::byte> encode(const Deposit& msg) {
  std::vector<std::byte> buffer;
  buffer.reserve(sizeof(std::uint32_t) + sizeof(std::int64_t));
  detail::append_primitive<std::uint32_t>(buffer, msg.asset);
  detail::append_primitive<std::int64_t>(buffer, msg.amount);
  return buffer;
}

inline Deposit decode_deposit(std::span<const std::byte> data) {
  std::size_t offset = 0;
  Deposit msg;
  msg.asset = detail::read_primitive<std::uint32_t>(data, offset);
  msg.amount = detail::read_primitive<std::int64_t>(data, offset);
  return msg;
}

inline std::vector<std::byte> encode(const Withdraw& msg) {
  std::vector<std::byte> buffer;
  buffer.reserve(sizeof(std::uint32_t) + sizeof(std::int64_t));
  detail::append_primitive<std::uint32_t>(buffer, msg.asset);
  detail::append_primitive<std::int64_t>(buffer, msg.amount);
  return buffer;
}

inline Withdraw decode_withdraw(std::span<const std::byte> data) {
  std::size_t offset = 0;
  Withdraw msg;
  msg.asset = detail::read_primitive<std::uint32_t>(data, offset);
  msg.amount = detail::read_primitive<std::int64_t>(data, offset);
  return msg;
}

inline std::vector<std::byte> encode(const AuthorizeAgent& msg) {
  std::vector<std::byte> buffer;
  detail::append_primitive<std::uint64_t>(buffer, msg.agent);
  return buffer;
}

inline AuthorizeAgent decode_authorize_agent(std::span<const std::byte> data) {
  std::size_t offset = 0;
  AuthorizeAgent msg;
  msg.agent = detail::read_primitive<std::uint64_t>(data, offset);
  return msg;
}

inline std::vector<std::byte> encode(const RevokeAgent& msg) {
  std::vector<std::byte> buffer;
  detail::append_primitive<std::uint64_t>(buffer, msg.agent);
  return buffer;
}

inline RevokeAgent decode_revoke_agent(std::span<const std::byte> data) {
  std::size_t offset = 0;
  RevokeAgent msg;
  msg.agent = detail::read_primitive<std::uint64_t>(data, offset);
  return msg;
}

}  // namespace commands
}  // namespace ingest
}  // namespace perpcore
