#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <span>
#include <unordered_map>
#include <vector>

#include "flashvault/common/types.hpp"

namespace flashvault {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSeedSize = 32;
constexpr std::size_t kSignatureSize = 64;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Seed = std::array<std::uint8_t, kSeedSize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;

// Address of a key holder: the last 20 bytes of BLAKE2b-256(public key).
common::Address derive_address(const PublicKey& public_key);

// Bytes the vault owner signs to authorise registering `app`:
// "flashvault:register-app:" || vault address || app address
std::vector<std::byte> registration_message(const common::Address& vault, const common::Address& app);

// Directory of ed25519 keys by address, used to check administrative requests
// before they reach the vault.
class Authenticator {
 public:
  Authenticator();
  ~Authenticator();

  // Registers the key under its derived address and returns that address.
  common::Address register_key(const PublicKey& public_key);

  bool has_key(const common::Address& address) const;

  // Returns nullptr if not found
  const PublicKey* get_public_key(const common::Address& address) const;

  // Verify a signature against a message using the key registered for address
  bool verify(const common::Address& address,
              std::span<const std::byte> message,
              const Signature& signature) const;

  bool verify_registration(const common::Address& owner,
                           const common::Address& vault,
                           const common::Address& app,
                           const Signature& signature) const;

  static bool verify_with_key(const PublicKey& public_key,
                              std::span<const std::byte> message,
                              const Signature& signature);

  static bool sign(const SecretKey& secret_key,
                   std::span<const std::byte> message,
                   Signature& out_signature);

  // Deterministic keypair, for development configurations
  static void keypair_from_seed(const Seed& seed, PublicKey& out_public, SecretKey& out_secret);

  std::size_t key_count() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::Address, PublicKey, common::AddressHash> keys_;
};

}  // namespace auth
}  // namespace flashvault
