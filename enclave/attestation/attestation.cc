// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "attestation/attestation.h"

#include <algorithm>

#include "env/env.h"
#include "metrics/metrics.h"
#include "sha/sha.h"
#include "util/constant.h"
#include "util/endian.h"
#include "util/log.h"

namespace ocw::attestation {

std::pair<Provider, error::Error> ProviderFromString(const std::string& s) {
  if (s == "epid") return std::make_pair(PROVIDER_EPID, error::OK);
  if (s == "dcap") return std::make_pair(PROVIDER_DCAP, error::OK);
  if (s == "none" || s.empty()) return std::make_pair(PROVIDER_NONE, error::OK);
  return std::make_pair(PROVIDER_NONE, COUNTED_ERROR(Config_RaType));
}

std::pair<Attestation, error::Error> Create(
    context::Context* ctx,
    Provider provider,
    const std::string& payload_hash,
    uint32_t timeout_millis,
    uint32_t max_retries) {
  MEASURE_CPU(ctx, cpu_attestation_create);
  Attestation out;
  out.set_provider(provider);
  out.set_timestamp(env::environment->Now());
  if (provider == PROVIDER_NONE) {
    return std::make_pair(out, error::OK);
  }
  for (uint32_t tried = 0;; tried++) {
    auto [report, err] = env::environment->Evidence(ctx, provider, payload_hash, timeout_millis);
    if (err == error::OK) {
      out.set_encoded_report(report);
      out.set_timestamp(env::environment->Now());
      COUNTER(attestation, create_success)->Increment();
      return std::make_pair(out, error::OK);
    }
    if (tried >= max_retries) {
      LOG(ERROR) << "Remote attestation failed after " << tried << " retries: " << err;
      COUNTER(attestation, create_failure)->Increment();
      return std::make_pair(out, COUNTED_ERROR(Attestation_CreateFailed));
    }
    uint32_t sleep_secs = std::min<uint32_t>(1U << std::min<uint32_t>(tried, 3), kMaxRetrySleepSecs);
    LOG(WARNING) << "Remote attestation failed (" << err << "), retrying in " << sleep_secs << "s";
    COUNTER(attestation, create_retry)->Increment();
    IGNORE_CPU(ctx);
    env::environment->Sleep(sleep_secs);
  }
}

std::pair<AttestationData, error::Error> Validate(
    context::Context* ctx,
    const Attestation& report,
    const std::string& expected_payload_hash,
    util::UnixSecs reference_time,
    const std::set<std::string>* allowed_measurements) {
  MEASURE_CPU(ctx, cpu_attestation_validate);
  if (report.provider() == PROVIDER_NONE || report.encoded_report().empty()) {
    COUNTER(attestation, validate_failure)->Increment();
    return std::make_pair(AttestationData(), COUNTED_ERROR(Attestation_Missing));
  }
  auto [data, err] = env::environment->Attest(ctx, reference_time, report.provider(), report.encoded_report());
  if (err != error::OK) {
    LOG(WARNING) << "Attestation report rejected by platform: " << err;
    COUNTER(attestation, validate_failure)->Increment();
    return std::make_pair(data, err);
  }
  if (data.provider() != report.provider()) {
    COUNTER(attestation, validate_failure)->Increment();
    return std::make_pair(data, COUNTED_ERROR(Attestation_ProviderMismatch));
  }
  if (!util::ConstantTimeEquals(data.payload_hash(), expected_payload_hash)) {
    COUNTER(attestation, validate_failure)->Increment();
    return std::make_pair(data, COUNTED_ERROR(Attestation_PayloadMismatch));
  }
  util::UnixSecs ts = data.timestamp();
  if (ts + kMaxReportAgeSecs < reference_time || ts > reference_time + kMaxReportSkewSecs) {
    LOG(WARNING) << "Attestation report from " << ts << " outside window around " << reference_time;
    COUNTER(attestation, validate_failure)->Increment();
    return std::make_pair(data, COUNTED_ERROR(Attestation_Stale));
  }
  if (allowed_measurements != nullptr &&
      allowed_measurements->count(MeasurementHash(data.measurement())) == 0) {
    COUNTER(attestation, validate_failure)->Increment();
    return std::make_pair(data, COUNTED_ERROR(Attestation_MeasurementNotAllowed));
  }
  COUNTER(attestation, validate_success)->Increment();
  return std::make_pair(data, error::OK);
}

std::string MeasurementHash(const Measurement& m) {
  std::string encoded;
  util::AppendLengthPrefixed(m.mr_enclave(), &encoded);
  util::AppendLengthPrefixed(m.mr_signer(), &encoded);
  util::AppendBigEndian64(m.isv_prod_id(), &encoded);
  util::AppendBigEndian64(m.isv_svn(), &encoded);
  return sha::Blake2b256String(encoded);
}

const Attestation* CachedReport::Get(util::UnixSecs now) const {
  if (!valid_ || now >= created_ + kLifetimeSecs || now < created_) {
    return nullptr;
  }
  return &report_;
}

void CachedReport::Set(const Attestation& report, util::UnixSecs now) {
  report_ = report;
  created_ = now;
  valid_ = true;
}

}  // namespace ocw::attestation
