#include "perpcore/auth/key_registry.hpp"

#include <sodium.h>

#include <stdexcept>

namespace perpcore {
namespace auth {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

// Ensure sodium is initialized before any crypto operations
void ensure_sodium_init() {
  static SodiumInitializer init;
}

}  // namespace

bool verify(const PublicKey& public_key, std::span<const std::byte> message, const Signature& signature) {
  ensure_sodium_init();

  return crypto_sign_verify_detached(
             signature.data(),
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             public_key.data()) == 0;
}

std::optional<PublicKey> public_key_from_hex(std::string_view hex) {
  ensure_sodium_init();
  if (hex.size() != kPublicKeySize * 2) {
    return std::nullopt;
  }
  PublicKey key{};
  std::size_t decoded = 0;
  if (sodium_hex2bin(key.data(), key.size(), hex.data(), hex.size(), nullptr, &decoded, nullptr) != 0 ||
      decoded != kPublicKeySize) {
    return std::nullopt;
  }
  return key;
}

std::string to_hex(const PublicKey& public_key) {
  ensure_sodium_init();
  std::string hex(kPublicKeySize * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), public_key.data(), public_key.size());
  hex.pop_back();
  return hex;
}

KeyRegistry::KeyRegistry() {
  ensure_sodium_init();
}

void KeyRegistry::register_account(common::AccountId account, const PublicKey& public_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_[account] = public_key;
}

void KeyRegistry::unregister_account(common::AccountId account) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.erase(account);
}

bool KeyRegistry::has_account(common::AccountId account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.contains(account);
}

std::optional<PublicKey> KeyRegistry::public_key(common::AccountId account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(account);
  if (it == keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool KeyRegistry::verify(common::AccountId account,
                         std::span<const std::byte> message,
                         const Signature& signature) const {
  const auto key = public_key(account);
  if (!key) {
    return false;
  }
  return auth::verify(*key, message, signature);
}

std::size_t KeyRegistry::account_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}

CommandSigner::CommandSigner() {
  ensure_sodium_init();
  if (crypto_sign_keypair(public_key_.data(), secret_key_.data()) != 0) {
    throw std::runtime_error("crypto_sign_keypair failed");
  }
}

CommandSigner::CommandSigner(const SecretKey& secret_key) : secret_key_(secret_key) {
  ensure_sodium_init();
  if (crypto_sign_ed25519_sk_to_pk(public_key_.data(), secret_key_.data()) != 0) {
    throw std::invalid_argument("malformed ed25519 secret key");
  }
}

Signature CommandSigner::sign(std::span<const std::byte> message) const {
  Signature signature{};
  if (crypto_sign_detached(signature.data(),
                           nullptr,
                           reinterpret_cast<const unsigned char*>(message.data()),
                           message.size(),
                           secret_key_.data()) != 0) {
    throw std::runtime_error("crypto_sign_detached failed");
  }
  return signature;
}

}  // namespace auth
}  // namespace perpcore
