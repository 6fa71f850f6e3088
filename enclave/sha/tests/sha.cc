// Copyright 2024 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

//TESTDEP gtest
//TESTDEP sha
//TESTDEP util
//TESTDEP libsodium

#include <gtest/gtest.h>
#include <string>
#include "sha/sha.h"
#include "util/hex.h"

namespace ocw::sha {

class ShaTest : public ::testing::Test {};

TEST_F(ShaTest, Sha256) {
  // Python3: hashlib.sha256(b'abc').hexdigest()
  EXPECT_EQ(util::ToHex(Sha256(std::string("abc"))),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(Sha256(std::string("abc")), Sha256(std::string("a"), std::string("bc")));
}

TEST_F(ShaTest, Blake2b256) {
  // Python3: hashlib.blake2b(b'abc', digest_size=32).hexdigest()
  EXPECT_EQ(util::ToHex(Blake2b256(std::string("abc"))),
            "bddd813c634239723171ef3fee98579b94964e3bb1cb3e427262c8c068d52319");
  EXPECT_EQ(Blake2b256(std::string("abc")), Blake2b256(std::string("ab"), std::string("c")));
  EXPECT_EQ(Blake2b256String(std::string("abc")).size(), 32);
}

}  // namespace ocw::sha
