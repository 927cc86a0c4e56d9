#pragma once

namespace flashvault::tests {

void test_in_memory_bank();
void test_share_ledger();

}  // namespace flashvault::tests
