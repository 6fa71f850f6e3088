// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

//TESTDEP gtest
//TESTDEP hmac
//TESTDEP sha
//TESTDEP util
//TESTDEP libsodium

#include <array>
#include <string>

#include <gtest/gtest.h>

#include "hmac/hmac.h"
#include "util/hex.h"

namespace ocw::hmac {

class HmacTest : public ::testing::Test {
};

TEST_F(HmacTest, DeriveKeyMatchesHmac) {
  HmacSha256Key secret;
  secret.fill(7);
  HmacSha256Key derived;
  DeriveKey(secret, "worker_key_handover", &derived);
  // Python3:
  //   >>> hmac.digest(b'\x07'*32, b'worker_key_handover', hashlib.sha256).hex()
  EXPECT_EQ(util::ToHex(derived),
            "6d0c5a5f8b106c82d60da664d367c61e88cdf56cbe748b5f9e4f67e0aeaa5440");
  std::string label("worker_key_handover");
  EXPECT_EQ(derived, HmacSha256(secret, reinterpret_cast<const uint8_t*>(label.data()), label.size()));
}

TEST_F(HmacTest, LabelsSeparateKeys) {
  HmacSha256Key secret;
  secret.fill(7);
  HmacSha256Key a, b;
  DeriveKey(secret, "worker_key_handover", &a);
  DeriveKey(secret, "other", &b);
  EXPECT_NE(a, b);
}

}  // namespace ocw::hmac
