#include "flashvault/auth/authenticator.hpp"

#include <sodium.h>

#include <cstring>
#include <stdexcept>
#include <string_view>

namespace flashvault {
namespace auth {

namespace {

constexpr std::string_view kRegistrationDomain = "flashvault:register-app:";

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

void append_address(std::vector<std::byte>& out, const common::Address& address) {
  for (const auto b : address.bytes) {
    out.push_back(static_cast<std::byte>(b));
  }
}

}  // namespace

common::Address derive_address(const PublicKey& public_key) {
  ensure_sodium_init();

  std::array<std::uint8_t, crypto_generichash_BYTES> digest{};
  if (crypto_generichash(digest.data(), digest.size(), public_key.data(), public_key.size(),
                         nullptr, 0) != 0) {
    throw std::runtime_error("crypto_generichash failed");
  }

  common::Address address;
  std::memcpy(address.bytes.data(), digest.data() + digest.size() - common::kAddressSize,
              common::kAddressSize);
  return address;
}

std::vector<std::byte> registration_message(const common::Address& vault, const common::Address& app) {
  std::vector<std::byte> message;
  message.reserve(kRegistrationDomain.size() + 2 * common::kAddressSize);
  for (const char c : kRegistrationDomain) {
    message.push_back(static_cast<std::byte>(c));
  }
  append_address(message, vault);
  append_address(message, app);
  return message;
}

Authenticator::Authenticator() {
  ensure_sodium_init();
}

Authenticator::~Authenticator() = default;

common::Address Authenticator::register_key(const PublicKey& public_key) {
  const common::Address address = derive_address(public_key);
  std::lock_guard<std::mutex> lock(mutex_);
  keys_[address] = public_key;
  return address;
}

bool Authenticator::has_key(const common::Address& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.find(address) != keys_.end();
}

const PublicKey* Authenticator::get_public_key(const common::Address& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(address);
  if (it == keys_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool Authenticator::verify(const common::Address& address,
                           std::span<const std::byte> message,
                           const Signature& signature) const {
  const PublicKey* key = get_public_key(address);
  if (!key) {
    return false;
  }
  return verify_with_key(*key, message, signature);
}

bool Authenticator::verify_registration(const common::Address& owner,
                                        const common::Address& vault,
                                        const common::Address& app,
                                        const Signature& signature) const {
  const auto message = registration_message(vault, app);
  return verify(owner, message, signature);
}

bool Authenticator::verify_with_key(const PublicKey& public_key,
                                    std::span<const std::byte> message,
                                    const Signature& signature) {
  ensure_sodium_init();

  return crypto_sign_verify_detached(
             signature.data(),
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             public_key.data()) == 0;
}

bool Authenticator::sign(const SecretKey& secret_key,
                         std::span<const std::byte> message,
                         Signature& out_signature) {
  ensure_sodium_init();

  return crypto_sign_detached(
             out_signature.data(),
             nullptr,
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             secret_key.data()) == 0;
}

void Authenticator::keypair_from_seed(const Seed& seed, PublicKey& out_public, SecretKey& out_secret) {
  ensure_sodium_init();
  if (crypto_sign_seed_keypair(out_public.data(), out_secret.data(), seed.data()) != 0) {
    throw std::runtime_error("crypto_sign_seed_keypair failed");
  }
}

std::size_t Authenticator::key_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}

}  // namespace auth
}  // namespace flashvault
