// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

//TESTDEP gtest
//TESTDEP util
#include <gtest/gtest.h>
#include "util/endian.h"
#include <string>
#include <string.h>

namespace ocw::util {

class EndianTest : public ::testing::Test {};

TEST_F(EndianTest, BigEndian64) {
  uint8_t buf[8] = {0};
  BigEndian64Bytes(0xfedcba9876543210ULL, buf);
  uint8_t expected[8] = {0xfe, 0xdc, 0xba, 0x98, 0x76, 0x54, 0x32, 0x10};
  ASSERT_EQ(0, memcmp(buf, expected, 8));
  ASSERT_EQ(BigEndian64FromBytes(buf), 0xfedcba9876543210ULL);
}

TEST_F(EndianTest, LengthPrefixed) {
  std::string out;
  AppendLengthPrefixed("ab", &out);
  AppendLengthPrefixed("", &out);
  ASSERT_EQ(out, std::string("\0\0\0\0\0\0\0\x02" "ab" "\0\0\0\0\0\0\0\0", 18));
}

}  // namespace ocw::util
