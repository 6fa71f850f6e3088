// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

//TESTDEP gtest
//TESTDEP identity
//TESTDEP env
//TESTDEP env/test
//TESTDEP util
//TESTDEP metrics
//TESTDEP proto
//TESTDEP protobuf-lite
//TESTDEP libsodium

#include <gtest/gtest.h>
#include "identity/identity.h"
#include "env/env.h"

namespace ocw::identity {

class IdentityTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    env::Init(env::SIMULATED);
  }
};

TEST_F(IdentityTest, SeedDeterminesKeys) {
  std::string seed(kSeedSize, '\x05');
  auto [a, err] = WorkerIdentity::FromSeed(seed);
  ASSERT_EQ(err, error::OK);
  auto [b, err2] = WorkerIdentity::FromSeed(seed);
  ASSERT_EQ(err2, error::OK);
  EXPECT_EQ(a->public_key(), b->public_key());
  EXPECT_EQ(a->ecdh_public_key(), b->ecdh_public_key());
  EXPECT_NE(a->PublicKeyString(), a->EcdhPublicKeyString());
  EXPECT_EQ(a->SeedString(), seed);
}

TEST_F(IdentityTest, RejectsBadSeed) {
  EXPECT_EQ(WorkerIdentity::FromSeed("short").second, error::Identity_InvalidSeed);
}

TEST_F(IdentityTest, SignVerify) {
  auto [id, err] = WorkerIdentity::Generate();
  ASSERT_EQ(err, error::OK);
  std::string sig = id->SignString("hello");
  EXPECT_TRUE(VerifySignature(id->PublicKeyString(), "hello", sig));
  EXPECT_FALSE(VerifySignature(id->PublicKeyString(), "hellO", sig));
  EXPECT_FALSE(VerifySignature(id->PublicKeyString(), "hello", sig.substr(1)));
}

TEST_F(IdentityTest, AgreementIsSymmetric) {
  auto [id, err] = WorkerIdentity::Generate();
  ASSERT_EQ(err, error::OK);
  auto [eph, err2] = EphemeralKey::Generate();
  ASSERT_EQ(err2, error::OK);
  SharedSecret s1, s2;
  ASSERT_EQ(error::OK, id->Agree(eph->PublicKeyString(), &s1));
  ASSERT_EQ(error::OK, eph->Agree(id->EcdhPublicKeyString(), &s2));
  EXPECT_EQ(s1.array(), s2.array());
  EXPECT_EQ(id->Agree("short", &s1), error::Identity_InvalidPublicKey);
  EXPECT_EQ(id->Agree(std::string(32, '\0'), &s1), error::Identity_KeyAgreement);
}

}  // namespace ocw::identity
