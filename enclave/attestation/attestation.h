// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_ATTESTATION_ATTESTATION_H__
#define __OCW_ATTESTATION_ATTESTATION_H__

#include <set>
#include <string>
#include <utility>
#include "context/context.h"
#include "proto/attestation.pb.h"
#include "proto/error.pb.h"
#include "util/macros.h"
#include "util/ticks.h"

namespace ocw::attestation {

// Reports attested more than this long before the reference time are stale.
static const util::UnixSecs kMaxReportAgeSecs = 10 * 60 * 60;
// Reports may be timestamped at most this far past the reference time.
static const util::UnixSecs kMaxReportSkewSecs = 60 * 60;
// Longest back-off between attempts in Create.
static const uint32_t kMaxRetrySleepSecs = 8;

// Parses the `ra_type` configuration value.
std::pair<Provider, error::Error> ProviderFromString(const std::string& s);

// Creates a remote attestation report binding `payload_hash`.  Platform
// failures are retried up to `max_retries` times, sleeping 1, 2, 4, then 8
// seconds between attempts.  PROVIDER_NONE produces an empty report.
std::pair<Attestation, error::Error> Create(
    context::Context* ctx,
    Provider provider,
    const std::string& payload_hash,
    uint32_t timeout_millis,
    uint32_t max_retries);

// Verifies `report` binds `expected_payload_hash` and was produced close to
// `reference_time`.  If `allowed_measurements` is non-null, the attested
// measurement's hash must be in it.
std::pair<AttestationData, error::Error> Validate(
    context::Context* ctx,
    const Attestation& report,
    const std::string& expected_payload_hash,
    util::UnixSecs reference_time,
    const std::set<std::string>* allowed_measurements);

// blake2b-256 over the measurement fields.  This is the key the chain
// registers binaries under.
std::string MeasurementHash(const Measurement& m);

// CachedReport holds the report attached to the worker's registration info,
// reused until it's an hour old or explicitly invalidated.
class CachedReport {
 public:
  static const util::UnixSecs kLifetimeSecs = 60 * 60;

  DELETE_COPY_AND_ASSIGN(CachedReport);
  CachedReport() : valid_(false), created_(0) {}

  // Returns the cached report if it's still fresh at `now`.
  const Attestation* Get(util::UnixSecs now) const;
  void Set(const Attestation& report, util::UnixSecs now);
  void Invalidate() { valid_ = false; }
  bool valid() const { return valid_; }

 private:
  Attestation report_;
  bool valid_;
  util::UnixSecs created_;
};

}  // namespace ocw::attestation

#endif  // __OCW_ATTESTATION_ATTESTATION_H__
