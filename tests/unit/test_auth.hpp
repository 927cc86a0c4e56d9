#pragma once

namespace flashvault::tests {

void test_authenticator();
void test_registration_signature();

}  // namespace flashvault::tests
