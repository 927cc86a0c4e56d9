#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "flashvault/common/types.hpp"

namespace flashvault {
namespace vault {

// Custody of real assets. Implementations throw common::VaultError on failure.
class CurrencyBank {
 public:
  virtual ~CurrencyBank() = default;

  // Moves amount of currency out of the vault to `to`.
  virtual void transfer(const common::Currency& currency, const common::Address& to,
                        common::Amount amount) = 0;
  // On-hand balance of the vault.
  [[nodiscard]] virtual common::Amount balance_of_self(const common::Currency& currency) const = 0;
};

// Receipt tokens representing claims on vault assets.
class ShareToken {
 public:
  virtual ~ShareToken() = default;

  virtual void issue(const common::Address& to, const common::Currency& currency,
                     common::Amount amount) = 0;
  virtual void redeem(const common::Address& from, const common::Currency& currency,
                      common::Amount amount) = 0;
};

// Entry point of a session holder. Invoked synchronously by Vault::lock; the
// holder may call back into the vault any number of times before returning.
class LockCallback {
 public:
  virtual ~LockCallback() = default;

  virtual std::vector<std::byte> on_lock_acquired(std::span<const std::byte> data) = 0;
};

}  // namespace vault
}  // namespace flashvault
