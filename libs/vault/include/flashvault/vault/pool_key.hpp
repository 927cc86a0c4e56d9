#pragma once

#include <cstdint>

#include "flashvault/common/types.hpp"

namespace flashvault {
namespace vault {

struct PoolKey {
  common::Currency currency0{};
  common::Currency currency1{};
  common::Address app{};
  std::uint32_t fee{0};
};

// Signed per-currency change reported by an app for a pool, in the app-side
// convention of AppReserveLedger::adjust_app_reserve.
struct BalanceDelta {
  common::SignedAmount amount0{0};
  common::SignedAmount amount1{0};
};

}  // namespace vault
}  // namespace flashvault
