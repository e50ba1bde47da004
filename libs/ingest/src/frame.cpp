#include "perpcore/ingest/frame.hpp"

#include <algorithm>
#include <stdexcept>

namespace perpcore {
namespace ingest {

std::string_view to_string(CommandKind kind) noexcept {
  switch (kind) {
    case CommandKind::kOpenPosition:
      return "open_position";
    case CommandKind::kClosePosition:
      return "close_position";
    case CommandKind::kIncreasePosition:
      return "increase_position";
    case CommandKind::kDecreasePosition:
      return "decrease_position";
    case CommandKind::kLiquidate:
      return "liquidate";
    case CommandKind::kApplyFunding:
      return "apply_funding";
    case CommandKind::kUpdateFundingRates:
      return "update_funding_rates";
    case CommandKind::kPriceUpdate:
      return "price_update";
    case CommandKind::kDeposit:
      return "deposit";
    case CommandKind::kWithdraw:
      return "withdraw";
    case CommandKind::kAuthorizeAgent:
      return "authorize_agent";
    case CommandKind::kRevokeAgent:
      return "revoke_agent";
  }
  return "unknown";
}

std::vector<std::byte> encode_header(const FrameHeader& header) {
  std::vector<std::byte> buffer;
  buffer.reserve(kHeaderSize);
  commands::detail::append_primitive<std::uint64_t>(buffer, header.caller);
  commands::detail::append_primitive<std::uint64_t>(buffer, header.nonce);
  commands::detail::append_primitive<std::int64_t>(buffer, header.timestamp);
  commands::detail::append_primitive<std::uint8_t>(buffer, static_cast<std::uint8_t>(header.kind));
  return buffer;
}

FrameHeader decode_header(std::span<const std::byte> data) {
  std::size_t offset = 0;
  FrameHeader header;
  header.caller = commands::detail::read_primitive<std::uint64_t>(data, offset);
  header.nonce = commands::detail::read_primitive<std::uint64_t>(data, offset);
  header.timestamp = commands::detail::read_primitive<std::int64_t>(data, offset);
  const auto raw_kind = commands::detail::read_primitive<std::uint8_t>(data, offset);
  if (!is_known(raw_kind)) {
    throw std::runtime_error("frame decode: unknown command kind");
  }
  header.kind = static_cast<CommandKind>(raw_kind);
  return header;
}

std::vector<std::byte> signing_bytes(const FrameHeader& header, std::span<const std::byte> payload) {
  auto message = encode_header(header);
  message.insert(message.end(), payload.begin(), payload.end());
  return message;
}

std::vector<std::byte> serialize(const Frame& frame) {
  auto buffer = encode_header(frame.header);
  buffer.reserve(kHeaderSize + sizeof(std::uint32_t) + frame.payload.size() + auth::kSignatureSize);
  commands::detail::append_primitive<std::uint32_t>(buffer, static_cast<std::uint32_t>(frame.payload.size()));
  buffer.insert(buffer.end(), frame.payload.begin(), frame.payload.end());
  const auto sig = std::as_bytes(std::span(frame.signature));
  buffer.insert(buffer.end(), sig.begin(), sig.end());
  return buffer;
}

Frame deserialize(std::span<const std::byte> data) {
  Frame frame;
  frame.header = decode_header(data);
  std::size_t offset = kHeaderSize;
  const auto payload_size = commands::detail::read_primitive<std::uint32_t>(data, offset);
  if (data.size() - offset != payload_size + auth::kSignatureSize) {
    throw std::runtime_error("frame decode: size mismatch");
  }
  const auto payload = data.subspan(offset, payload_size);
  frame.payload.assign(payload.begin(), payload.end());
  offset += payload_size;
  std::transform(data.begin() + static_cast<std::ptrdiff_t>(offset), data.end(), frame.signature.begin(),
                 [](std::byte b) { return static_cast<std::uint8_t>(b); });
  return frame;
}

Frame sign_frame(const FrameHeader& header, std::vector<std::byte> payload, const auth::CommandSigner& signer) {
  Frame frame{.header = header, .payload = std::move(payload)};
  frame.signature = signer.sign(signing_bytes(frame.header, frame.payload));
  return frame;
}

}  // namespace ingest
}  // namespace perpcore
