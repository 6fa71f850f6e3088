// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

//TESTDEP gtest
//TESTDEP util
//TESTDEP proto
//TESTDEP protobuf-lite
#include <gtest/gtest.h>
#include "util/bytes.h"
#include <string>

namespace ocw::util {

class BytesTest : public ::testing::Test {};

TEST_F(BytesTest, StringToByteArrayRequiresExactSize) {
  auto [arr, err] = StringToByteArray<4>("abcd");
  ASSERT_EQ(err, error::OK);
  EXPECT_EQ(ByteArrayToString(arr), "abcd");
  EXPECT_EQ(StringToByteArray<4>("abc").second, error::Util_ArraySizeMismatch);
  EXPECT_EQ(StringToByteArray<4>("abcde").second, error::Util_ArraySizeMismatch);
}

TEST_F(BytesTest, ZeroString) {
  std::string secret("secret");
  const char* p = secret.data();
  ZeroString(&secret);
  EXPECT_TRUE(secret.empty());
  // Clearing a std::string keeps its buffer, so the old bytes are observable.
  EXPECT_EQ(p[3], '\0');
}

TEST_F(BytesTest, ZeroOnExit) {
  std::string secret("secret seed");
  const char* p = secret.data();
  {
    ZeroOnExit zero(&secret);
    EXPECT_EQ("secret seed", secret);
  }
  EXPECT_TRUE(secret.empty());
  EXPECT_EQ(p[5], '\0');
}

}  // namespace ocw::util
