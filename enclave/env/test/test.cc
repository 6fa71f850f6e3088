// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "env/test/test.h"
#include "env/env.h"
#include "metrics/metrics.h"
#include "util/mutex.h"
#include <string.h>
#include <atomic>

namespace ocw::env {
namespace test {

static const char* evidence_prefix = "EVIDENCE:";
static const char* target_prefix = "TARGET:";
static const char* local_report_prefix = "LOCALREPORT:";
static const char* sealed_prefix = "SEALED:";
static const util::UnixSecs default_now = 1700000000;
static volatile std::atomic<uint32_t> random_gen;

attestation::Measurement TestMeasurement(uint8_t tag) {
  attestation::Measurement m;
  m.set_mr_enclave(std::string(32, static_cast<char>(tag)));
  m.set_mr_signer(std::string(32, static_cast<char>(0xee)));
  m.set_isv_prod_id(tag);
  m.set_isv_svn(1);
  return m;
}

class Environment : public ::ocw::env::Environment {
 public:
  DELETE_COPY_AND_ASSIGN(Environment);
  Environment() : ::ocw::env::Environment() { Reset(); }
  virtual ~Environment() {}

  void Reset() {
    util::unique_lock lock(mu_);
    measurement_ = TestMeasurement(1);
    machine_ = "machine-1";
    now_ = default_now;
    fail_evidence_ = 0;
    evidence_calls_ = 0;
    sleeps_.clear();
    terminated_ = false;
  }

  virtual std::pair<std::string, error::Error> Evidence(
      context::Context* ctx,
      attestation::Provider provider,
      const std::string& payload_hash,
      uint32_t timeout_millis) const {
    MEASURE_CPU(ctx, cpu_env_evidence);
    ACQUIRE_LOCK(mu_, ctx, lock_testenv);
    evidence_calls_++;
    if (fail_evidence_ > 0) {
      fail_evidence_--;
      return std::make_pair("", COUNTED_ERROR(Env_EvidenceFailure));
    }
    attestation::AttestationData data;
    data.set_payload_hash(payload_hash);
    *data.mutable_measurement() = measurement_;
    data.set_timestamp(now_);
    data.set_provider(provider);
    return std::make_pair(evidence_prefix + data.SerializeAsString(), error::OK);
  }

  virtual std::pair<attestation::AttestationData, error::Error> Attest(
      context::Context* ctx,
      util::UnixSecs now,
      attestation::Provider provider,
      const std::string& encoded_report) const {
    MEASURE_CPU(ctx, cpu_env_attest);
    attestation::AttestationData out;
    const size_t prefix_len = strlen(evidence_prefix);
    if (encoded_report.size() < prefix_len ||
        encoded_report.compare(0, prefix_len, evidence_prefix) != 0 ||
        !out.ParseFromArray(encoded_report.data() + prefix_len, encoded_report.size() - prefix_len)) {
      return std::make_pair(out, COUNTED_ERROR(Env_AttestationFailure));
    }
    if (out.provider() != provider) {
      return std::make_pair(out, COUNTED_ERROR(Env_AttestationFailure));
    }
    return std::make_pair(out, error::OK);
  }

  virtual std::pair<std::string, error::Error> LocalTargetInfo(context::Context* ctx) const {
    ACQUIRE_LOCK(mu_, ctx, lock_testenv);
    return std::make_pair(TargetInfoLocked(), error::OK);
  }

  virtual std::pair<std::string, error::Error> LocalReport(
      context::Context* ctx,
      const std::string& target_info,
      const std::string& report_data) const {
    ACQUIRE_LOCK(mu_, ctx, lock_testenv);
    return std::make_pair(
        local_report_prefix + machine_ + ";" + target_info + ";" + report_data,
        error::OK);
  }

  virtual error::Error VerifyLocalReport(context::Context* ctx, const std::string& report) const {
    ACQUIRE_LOCK(mu_, ctx, lock_testenv);
    std::string expected = local_report_prefix + machine_ + ";" + TargetInfoLocked() + ";";
    if (report.compare(0, expected.size(), expected) != 0) {
      return COUNTED_ERROR(Env_LocalReportInvalid);
    }
    return error::OK;
  }

  virtual std::pair<attestation::Measurement, error::Error> SelfMeasurement(context::Context* ctx) const {
    ACQUIRE_LOCK(mu_, ctx, lock_testenv);
    return std::make_pair(measurement_, error::OK);
  }

  virtual std::pair<std::string, error::Error> Seal(context::Context* ctx, const std::string& plaintext) const {
    MEASURE_CPU(ctx, cpu_env_seal);
    return std::make_pair(sealed_prefix + plaintext, error::OK);
  }

  virtual std::pair<std::string, error::Error> Unseal(context::Context* ctx, const std::string& sealed) const {
    MEASURE_CPU(ctx, cpu_env_seal);
    const size_t prefix_len = strlen(sealed_prefix);
    if (sealed.size() < prefix_len || sealed.compare(0, prefix_len, sealed_prefix) != 0) {
      return std::make_pair("", COUNTED_ERROR(Env_UnsealFailure));
    }
    return std::make_pair(sealed.substr(prefix_len), error::OK);
  }

  virtual error::Error RandomBytes(void* bytes, size_t size) const {
    uint8_t* ptr = reinterpret_cast<uint8_t*>(bytes);
    for (size_t i = 0; i < size; i++) {
      uint32_t next = std::atomic_fetch_add(&random_gen, 1U);
      // This keeps the sequence of bytes relatively non-repeating for the first 4GB.
      *ptr++ = (uint8_t)(next ^ (next >> 8) ^ (next >> 16) ^ (next >> 24));
    }
    return error::OK;
  }

  virtual void Sleep(uint32_t secs) const {
    util::unique_lock lock(mu_);
    sleeps_.push_back(secs);
  }

  virtual util::UnixSecs Now() const {
    util::unique_lock lock(mu_);
    return now_;
  }

  virtual void Terminate(int code) const {
    util::unique_lock lock(mu_);
    terminated_ = true;
  }

  virtual void Log(int level, const std::string& msg) const {
    fprintf(stderr, "%s\n", msg.c_str());
  }

  virtual void FlushAllLogsIfAble() const {
    fflush(stderr);
  }

  void SetMeasurement(const attestation::Measurement& m) {
    util::unique_lock lock(mu_);
    measurement_ = m;
  }
  void SetMachine(const std::string& machine) {
    util::unique_lock lock(mu_);
    machine_ = machine;
  }
  void SetNow(util::UnixSecs now) {
    util::unique_lock lock(mu_);
    now_ = now;
  }
  void FailNextEvidence(int n) {
    util::unique_lock lock(mu_);
    fail_evidence_ = n;
  }
  std::vector<uint32_t> Sleeps() {
    util::unique_lock lock(mu_);
    std::vector<uint32_t> out;
    out.swap(sleeps_);
    return out;
  }
  int EvidenceCalls() {
    util::unique_lock lock(mu_);
    return evidence_calls_;
  }
  bool Terminated() {
    util::unique_lock lock(mu_);
    return terminated_;
  }

 private:
  std::string TargetInfoLocked() const REQUIRES(mu_) {
    return target_prefix + machine_ + ";" + measurement_.mr_enclave();
  }

  mutable util::mutex mu_;
  attestation::Measurement measurement_ GUARDED_BY(mu_);
  std::string machine_ GUARDED_BY(mu_);
  util::UnixSecs now_ GUARDED_BY(mu_);
  mutable int fail_evidence_ GUARDED_BY(mu_);
  mutable int evidence_calls_ GUARDED_BY(mu_);
  mutable std::vector<uint32_t> sleeps_ GUARDED_BY(mu_);
  mutable bool terminated_ GUARDED_BY(mu_);
};

namespace {
Environment* TestEnv() {
  Environment* e = dynamic_cast<Environment*>(::ocw::env::environment.get());
  CHECK(e != nullptr);
  return e;
}
}  // namespace

void Reset() { TestEnv()->Reset(); }
void SetMeasurement(const attestation::Measurement& m) { TestEnv()->SetMeasurement(m); }
void SetMachine(const std::string& machine) { TestEnv()->SetMachine(machine); }
void SetNow(util::UnixSecs now) { TestEnv()->SetNow(now); }
void FailNextEvidence(int n) { TestEnv()->FailNextEvidence(n); }
std::vector<uint32_t> Sleeps() { return TestEnv()->Sleeps(); }
int EvidenceCalls() { return TestEnv()->EvidenceCalls(); }
bool Terminated() { return TestEnv()->Terminated(); }

}  // namespace test

void Init(bool is_simulated) {
  environment = std::make_unique<::ocw::env::test::Environment>();
  environment->Init();
}

}  // namespace ocw::env
