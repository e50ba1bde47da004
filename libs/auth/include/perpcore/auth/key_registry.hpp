#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSignatureSize = 64;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;

// Verify `signature` over `message` with an explicit public key.
[[nodiscard]] bool verify(const PublicKey& public_key,
                          std::span<const std::byte> message,
                          const Signature& signature);

// Hex codec for configuration files. nullopt unless exactly 64 hex characters.
[[nodiscard]] std::optional<PublicKey> public_key_from_hex(std::string_view hex);
[[nodiscard]] std::string to_hex(const PublicKey& public_key);

// Account -> public key map consulted by the ingress pipeline.
class KeyRegistry {
 public:
  KeyRegistry();

  void register_account(common::AccountId account, const PublicKey& public_key);
  void unregister_account(common::AccountId account);
  [[nodiscard]] bool has_account(common::AccountId account) const;
  [[nodiscard]] std::optional<PublicKey> public_key(common::AccountId account) const;

  // False for unknown accounts.
  [[nodiscard]] bool verify(common::AccountId account,
                            std::span<const std::byte> message,
                            const Signature& signature) const;

  [[nodiscard]] std::size_t account_count() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::AccountId, PublicKey> keys_;
};

// Client-side signing key for one account.
class CommandSigner {
 public:
  // Fresh random keypair.
  CommandSigner();
  explicit CommandSigner(const SecretKey& secret_key);

  [[nodiscard]] Signature sign(std::span<const std::byte> message) const;
  [[nodiscard]] const PublicKey& public_key() const noexcept { return public_key_; }

 private:
  SecretKey secret_key_{};
  PublicKey public_key_{};
};

}  // namespace auth
}  // namespace perpcore
