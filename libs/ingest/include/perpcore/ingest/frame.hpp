#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "perpcore/auth/key_registry.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/ingest/commands.hpp"

namespace perpcore {
namespace ingest {

[[nodiscard]] std::string_view to_string(CommandKind kind) noexcept;

struct FrameHeader {
  common::AccountId caller{0};
  std::uint64_t nonce{0};          // strictly increasing per caller
  common::Timestamp timestamp{0};  // execution time, seconds
  CommandKind kind{CommandKind::kOpenPosition};
};

// caller:8 nonce:8 timestamp:8 kind:1
constexpr std::size_t kHeaderSize = 25;

// Wire format: [header:25][payload_size:4][payload:N][signature:64]
// The signature covers header + payload.
struct Frame {
  FrameHeader header{};
  std::vector<std::byte> payload{};
  auth::Signature signature{};
};

[[nodiscard]] std::vector<std::byte> encode_header(const FrameHeader& header);
[[nodiscard]] FrameHeader decode_header(std::span<const std::byte> data);

[[nodiscard]] std::vector<std::byte> signing_bytes(const FrameHeader& header, std::span<const std::byte> payload);

[[nodiscard]] std::vector<std::byte> serialize(const Frame& frame);
// Throws std::runtime_error on truncated or malformed input.
[[nodiscard]] Frame deserialize(std::span<const std::byte> data);

[[nodiscard]] Frame sign_frame(const FrameHeader& header,
                               std::vector<std::byte> payload,
                               const auth::CommandSigner& signer);

template <typename Command>
[[nodiscard]] Frame make_frame(common::AccountId caller,
                               std::uint64_t nonce,
                               common::Timestamp timestamp,
                               const Command& command,
                               const auth::CommandSigner& signer) {
  const FrameHeader header{
      .caller = caller,
      .nonce = nonce,
      .timestamp = timestamp,
      .kind = commands::kind_of<Command>,
  };
  return sign_frame(header, commands::encode(command), signer);
}

// Frame raised inside the daemon (keeper actions). It goes straight to the
// processor and the journal without passing ingress, so it carries no
// signature.
template <typename Command>
[[nodiscard]] Frame make_internal_frame(common::AccountId caller,
                                        std::uint64_t nonce,
                                        common::Timestamp timestamp,
                                        const Command& command) {
  return Frame{
      .header =
          FrameHeader{
              .caller = caller,
              .nonce = nonce,
              .timestamp = timestamp,
              .kind = commands::kind_of<Command>,
          },
      .payload = commands::encode(command),
      .signature = {},
  };
}

}  // namespace ingest
}  // namespace perpcore
