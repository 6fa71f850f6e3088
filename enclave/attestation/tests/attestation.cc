// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

//TESTDEP gtest
//TESTDEP attestation
//TESTDEP context
//TESTDEP metrics
//TESTDEP sha
//TESTDEP env
//TESTDEP env/test
//TESTDEP util
//TESTDEP proto
//TESTDEP protobuf-lite
//TESTDEP libsodium

#include <gtest/gtest.h>
#include "attestation/attestation.h"
#include "env/env.h"
#include "env/test/test.h"
#include "metrics/metrics.h"

namespace ocw::attestation {

class AttestationTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    env::Init(env::SIMULATED);
  }
  void SetUp() override {
    env::test::Reset();
  }

  const std::string hash = std::string(32, 'h');
  const util::UnixSecs now = 1700000000;
  context::Context ctx;
};

TEST_F(AttestationTest, CreateAndValidate) {
  auto [report, err] = Create(&ctx, PROVIDER_DCAP, hash, 1000, 3);
  ASSERT_EQ(error::OK, err);
  EXPECT_EQ(PROVIDER_DCAP, report.provider());
  EXPECT_EQ(now, report.timestamp());

  auto [data, err2] = Validate(&ctx, report, hash, now, nullptr);
  ASSERT_EQ(error::OK, err2);
  EXPECT_EQ(hash, data.payload_hash());
  EXPECT_EQ(env::test::TestMeasurement(1).mr_enclave(), data.measurement().mr_enclave());
}

TEST_F(AttestationTest, RetryBackoff) {
  env::test::FailNextEvidence(5);
  auto [report, err] = Create(&ctx, PROVIDER_EPID, hash, 1000, 5);
  ASSERT_EQ(error::OK, err);
  EXPECT_EQ(std::vector<uint32_t>({1, 2, 4, 8, 8}), env::test::Sleeps());
  EXPECT_EQ(6, env::test::EvidenceCalls());
}

TEST_F(AttestationTest, RetryGivesUp) {
  env::test::FailNextEvidence(10);
  auto [report, err] = Create(&ctx, PROVIDER_EPID, hash, 1000, 3);
  EXPECT_EQ(error::Attestation_CreateFailed, err);
  EXPECT_EQ(std::vector<uint32_t>({1, 2, 4}), env::test::Sleeps());
  EXPECT_EQ(4, env::test::EvidenceCalls());
}

TEST_F(AttestationTest, ProviderNoneSkipsPlatform) {
  auto [report, err] = Create(&ctx, PROVIDER_NONE, hash, 1000, 3);
  ASSERT_EQ(error::OK, err);
  EXPECT_TRUE(report.encoded_report().empty());
  EXPECT_EQ(0, env::test::EvidenceCalls());
  EXPECT_EQ(error::Attestation_Missing, Validate(&ctx, report, hash, now, nullptr).second);
}

TEST_F(AttestationTest, PayloadMismatch) {
  auto [report, err] = Create(&ctx, PROVIDER_DCAP, hash, 1000, 0);
  ASSERT_EQ(error::OK, err);
  EXPECT_EQ(error::Attestation_PayloadMismatch,
            Validate(&ctx, report, std::string(32, 'x'), now, nullptr).second);
}

TEST_F(AttestationTest, Freshness) {
  auto [report, err] = Create(&ctx, PROVIDER_DCAP, hash, 1000, 0);
  ASSERT_EQ(error::OK, err);
  EXPECT_EQ(error::OK, Validate(&ctx, report, hash, now + kMaxReportAgeSecs, nullptr).second);
  EXPECT_EQ(error::Attestation_Stale, Validate(&ctx, report, hash, now + kMaxReportAgeSecs + 1, nullptr).second);
  EXPECT_EQ(error::OK, Validate(&ctx, report, hash, now - kMaxReportSkewSecs, nullptr).second);
  EXPECT_EQ(error::Attestation_Stale, Validate(&ctx, report, hash, now - kMaxReportSkewSecs - 1, nullptr).second);
}

TEST_F(AttestationTest, MeasurementAllowList) {
  auto [report, err] = Create(&ctx, PROVIDER_DCAP, hash, 1000, 0);
  ASSERT_EQ(error::OK, err);
  std::set<std::string> allowed = {MeasurementHash(env::test::TestMeasurement(2))};
  EXPECT_EQ(error::Attestation_MeasurementNotAllowed, Validate(&ctx, report, hash, now, &allowed).second);
  allowed.insert(MeasurementHash(env::test::TestMeasurement(1)));
  EXPECT_EQ(error::OK, Validate(&ctx, report, hash, now, &allowed).second);
}

TEST_F(AttestationTest, ProviderMustMatch) {
  auto [report, err] = Create(&ctx, PROVIDER_DCAP, hash, 1000, 0);
  ASSERT_EQ(error::OK, err);
  report.set_provider(PROVIDER_EPID);
  EXPECT_EQ(error::Env_AttestationFailure, Validate(&ctx, report, hash, now, nullptr).second);
}

TEST_F(AttestationTest, MeasurementHashCoversAllFields) {
  auto m = env::test::TestMeasurement(1);
  auto base = MeasurementHash(m);
  EXPECT_EQ(32, base.size());
  m.set_isv_svn(2);
  EXPECT_NE(base, MeasurementHash(m));
  EXPECT_NE(base, MeasurementHash(env::test::TestMeasurement(2)));
}

TEST_F(AttestationTest, Providers) {
  EXPECT_EQ(PROVIDER_EPID, ProviderFromString("epid").first);
  EXPECT_EQ(PROVIDER_DCAP, ProviderFromString("dcap").first);
  EXPECT_EQ(PROVIDER_NONE, ProviderFromString("none").first);
  EXPECT_EQ(error::Config_RaType, ProviderFromString("tpm").second);
}

TEST_F(AttestationTest, CachedReportLifetime) {
  CachedReport cache;
  EXPECT_EQ(nullptr, cache.Get(now));
  Attestation a;
  a.set_encoded_report("r");
  cache.Set(a, now);
  ASSERT_NE(nullptr, cache.Get(now + CachedReport::kLifetimeSecs - 1));
  EXPECT_EQ("r", cache.Get(now)->encoded_report());
  EXPECT_EQ(nullptr, cache.Get(now + CachedReport::kLifetimeSecs));
  cache.Invalidate();
  EXPECT_EQ(nullptr, cache.Get(now));
}

}  // namespace ocw::attestation
