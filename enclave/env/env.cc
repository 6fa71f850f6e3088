// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "env/env.h"
#include "util/macros.h"
#include <sodium/core.h>
#include <sodium/randombytes.h>
#include <stdio.h>

namespace ocw::env {

namespace {

#define UNSET_ENV() CHECK(nullptr == "env::Init not called, environment not initiated")

class UnsetEnvironment : public Environment {
 public:
  virtual ~UnsetEnvironment() {}
  virtual std::pair<std::string, error::Error> Evidence(
      context::Context* ctx,
      attestation::Provider provider,
      const std::string& payload_hash,
      uint32_t timeout_millis) const {
    UNSET_ENV();
    return std::make_pair("", error::General_Unimplemented);
  }
  virtual std::pair<attestation::AttestationData, error::Error> Attest(
      context::Context* ctx,
      util::UnixSecs now,
      attestation::Provider provider,
      const std::string& encoded_report) const {
    UNSET_ENV();
    return std::make_pair(attestation::AttestationData(), error::General_Unimplemented);
  }
  virtual std::pair<std::string, error::Error> LocalTargetInfo(context::Context* ctx) const {
    UNSET_ENV();
    return std::make_pair("", error::General_Unimplemented);
  }
  virtual std::pair<std::string, error::Error> LocalReport(
      context::Context* ctx,
      const std::string& target_info,
      const std::string& report_data) const {
    UNSET_ENV();
    return std::make_pair("", error::General_Unimplemented);
  }
  virtual error::Error VerifyLocalReport(context::Context* ctx, const std::string& report) const {
    UNSET_ENV();
    return error::General_Unimplemented;
  }
  virtual std::pair<attestation::Measurement, error::Error> SelfMeasurement(context::Context* ctx) const {
    UNSET_ENV();
    return std::make_pair(attestation::Measurement(), error::General_Unimplemented);
  }
  virtual std::pair<std::string, error::Error> Seal(context::Context* ctx, const std::string& plaintext) const {
    UNSET_ENV();
    return std::make_pair("", error::General_Unimplemented);
  }
  virtual std::pair<std::string, error::Error> Unseal(context::Context* ctx, const std::string& sealed) const {
    UNSET_ENV();
    return std::make_pair("", error::General_Unimplemented);
  }
  virtual error::Error RandomBytes(void* bytes, size_t size) const {
    UNSET_ENV();
    return error::General_Unimplemented;
  }
  virtual void Sleep(uint32_t secs) const {
    UNSET_ENV();
  }
  virtual util::UnixSecs Now() const {
    UNSET_ENV();
    return 0;
  }
  virtual void Terminate(int code) const {
    UNSET_ENV();
  }
  virtual void Log(int level, const std::string& msg) const {
    // We allow logging to be called before Init.
    fprintf(stderr, "Pre-env::Init LOG(%d): %s\n", level, msg.c_str());
  }
  virtual void FlushAllLogsIfAble() const {
  }
};

#undef UNSET_ENV

// libsodium draws all of its randomness through the installed environment.
const char* env_randombytes_name() { return "env"; }
uint32_t env_randombytes_uint32() {
  uint32_t out;
  CHECK(error::OK == environment->RandomBytes(&out, sizeof(out)));
  return out;
}
void env_randombytes_bytes(void* const buf, const size_t size) {
  CHECK(error::OK == environment->RandomBytes(buf, size));
}
randombytes_implementation sodium_randombytes_impl = {
  .implementation_name = env_randombytes_name,
  .random = env_randombytes_uint32,
  .buf = env_randombytes_bytes,
};

}  // namespace

std::unique_ptr<Environment> environment(new UnsetEnvironment());

Environment::Environment() {
}

void Environment::Init() {
  // sodium_init returns 0 or 1 on success, -1 on failure.
  CHECK(0 == randombytes_set_implementation(&sodium_randombytes_impl));
  CHECK(sodium_init() >= 0);
}

}  // namespace ocw::env
