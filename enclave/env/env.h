// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_ENV_ENV_H__
#define __OCW_ENV_ENV_H__

#include <memory>
#include <string>
#include <utility>
#include "proto/error.pb.h"
#include "proto/attestation.pb.h"
#include "util/macros.h"
#include "util/ticks.h"
#include "context/context.h"

namespace ocw::env {

// Environment is the platform the worker core runs on: the enclave's
// attestation and sealing primitives, its randomness and clock, and the
// host-side log sink.  Exactly one is installed, in `environment`.
class Environment {
 public:
  DELETE_COPY_AND_ASSIGN(Environment);
  Environment();
  virtual ~Environment() {}
  virtual void Init();

  // Produces a remote attestation report from `provider` binding the
  // 32-byte `payload_hash`.
  virtual std::pair<std::string, error::Error> Evidence(
      context::Context* ctx,
      attestation::Provider provider,
      const std::string& payload_hash,
      uint32_t timeout_millis) const = 0;
  // Verifies a remote attestation report as of `now`, returning what it
  // attests to.
  virtual std::pair<attestation::AttestationData, error::Error> Attest(
      context::Context* ctx,
      util::UnixSecs now,
      attestation::Provider provider,
      const std::string& encoded_report) const = 0;

  // Local attestation: a report targeted at another enclave on the same
  // machine, verifiable only by that enclave.
  virtual std::pair<std::string, error::Error> LocalTargetInfo(
      context::Context* ctx) const = 0;
  virtual std::pair<std::string, error::Error> LocalReport(
      context::Context* ctx,
      const std::string& target_info,
      const std::string& report_data) const = 0;
  virtual error::Error VerifyLocalReport(
      context::Context* ctx,
      const std::string& report) const = 0;

  // Measurement of the code running in this enclave.
  virtual std::pair<attestation::Measurement, error::Error> SelfMeasurement(
      context::Context* ctx) const = 0;

  // Seal data so only this enclave (on this machine) can unseal it.
  virtual std::pair<std::string, error::Error> Seal(
      context::Context* ctx,
      const std::string& plaintext) const = 0;
  virtual std::pair<std::string, error::Error> Unseal(
      context::Context* ctx,
      const std::string& sealed) const = 0;

  // Given a buffer of size N, rewrite all bytes in it with random bytes.
  virtual error::Error RandomBytes(
      void* bytes,
      size_t size) const = 0;
  virtual void Sleep(uint32_t secs) const = 0;
  // Current wall-clock time.
  virtual util::UnixSecs Now() const = 0;
  // Terminates the process.  Only `stop` calls this.
  virtual void Terminate(int code) const = 0;

  // Log a message to a logging framework.
  virtual void Log(int level, const std::string& msg) const = 0;
  // FlushAllLogsIfAble attempts to log everything that's been seen by
  // Log() up to a place where operators can see it.
  virtual void FlushAllLogsIfAble() const = 0;
};

extern std::unique_ptr<Environment> environment;

static const bool SIMULATED = true;
static const bool NOT_SIMULATED = false;
void Init(bool is_simulated);

}  // namespace ocw::env

#endif  // __OCW_ENV_ENV_H__
