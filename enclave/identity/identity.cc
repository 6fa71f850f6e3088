// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "identity/identity.h"

#include <sodium/crypto_scalarmult_curve25519.h>
#include <sodium/crypto_sign_ed25519.h>

#include "env/env.h"
#include "metrics/metrics.h"
#include "util/log.h"

namespace ocw::identity {

namespace {

error::Error X25519(const std::array<uint8_t, 32>& secret, const std::string& remote, SharedSecret* out) {
  if (remote.size() != crypto_scalarmult_curve25519_BYTES) {
    return COUNTED_ERROR(Identity_InvalidPublicKey);
  }
  // Fails on low-order points, which would yield an all-zero secret.
  if (0 != crypto_scalarmult_curve25519(
      out->data(), secret.data(), reinterpret_cast<const uint8_t*>(remote.data()))) {
    return COUNTED_ERROR(Identity_KeyAgreement);
  }
  return error::OK;
}

}  // namespace

WorkerIdentity::WorkerIdentity() {}

WorkerIdentity::~WorkerIdentity() {
  util::MemZeroS(seed_.data(), seed_.size());
  util::MemZeroS(signing_secret_.data(), signing_secret_.size());
  util::MemZeroS(ecdh_secret_.data(), ecdh_secret_.size());
}

std::pair<std::unique_ptr<WorkerIdentity>, error::Error> WorkerIdentity::Generate() {
  std::string seed(kSeedSize, '\0');
  if (auto err = env::environment->RandomBytes(seed.data(), seed.size()); err != error::OK) {
    return std::make_pair(nullptr, err);
  }
  auto out = FromSeed(seed);
  util::ZeroString(&seed);
  return out;
}

std::pair<std::unique_ptr<WorkerIdentity>, error::Error> WorkerIdentity::FromSeed(const std::string& seed) {
  if (seed.size() != kSeedSize) {
    return std::make_pair(nullptr, COUNTED_ERROR(Identity_InvalidSeed));
  }
  std::unique_ptr<WorkerIdentity> id(new WorkerIdentity());
  std::copy(seed.begin(), seed.end(), id->seed_.begin());
  crypto_sign_ed25519_seed_keypair(id->public_key_.data(), id->signing_secret_.data(), id->seed_.data());
  if (0 != crypto_sign_ed25519_sk_to_curve25519(id->ecdh_secret_.data(), id->signing_secret_.data())) {
    return std::make_pair(nullptr, COUNTED_ERROR(Identity_InvalidSeed));
  }
  crypto_scalarmult_curve25519_base(id->ecdh_public_key_.data(), id->ecdh_secret_.data());
  return std::make_pair(std::move(id), error::OK);
}

std::string WorkerIdentity::SeedString() const {
  return util::ByteArrayToString(seed_);
}

Signature WorkerIdentity::Sign(const std::string& msg) const {
  Signature sig;
  crypto_sign_ed25519_detached(
      sig.data(), nullptr,
      reinterpret_cast<const uint8_t*>(msg.data()), msg.size(),
      signing_secret_.data());
  return sig;
}

std::string WorkerIdentity::SignString(const std::string& msg) const {
  return util::ByteArrayToString(Sign(msg));
}

error::Error WorkerIdentity::Agree(const std::string& remote, SharedSecret* out) const {
  return X25519(ecdh_secret_, remote, out);
}

EphemeralKey::EphemeralKey() {}

EphemeralKey::~EphemeralKey() {
  util::MemZeroS(secret_.data(), secret_.size());
}

std::pair<std::unique_ptr<EphemeralKey>, error::Error> EphemeralKey::Generate() {
  std::unique_ptr<EphemeralKey> key(new EphemeralKey());
  if (auto err = env::environment->RandomBytes(key->secret_.data(), key->secret_.size()); err != error::OK) {
    return std::make_pair(nullptr, err);
  }
  crypto_scalarmult_curve25519_base(key->public_key_.data(), key->secret_.data());
  return std::make_pair(std::move(key), error::OK);
}

error::Error EphemeralKey::Agree(const std::string& remote, SharedSecret* out) const {
  return X25519(secret_, remote, out);
}

bool VerifySignature(const std::string& signer, const std::string& msg, const std::string& signature) {
  if (signer.size() != crypto_sign_ed25519_PUBLICKEYBYTES ||
      signature.size() != crypto_sign_ed25519_BYTES) {
    return false;
  }
  return 0 == crypto_sign_ed25519_verify_detached(
      reinterpret_cast<const uint8_t*>(signature.data()),
      reinterpret_cast<const uint8_t*>(msg.data()), msg.size(),
      reinterpret_cast<const uint8_t*>(signer.data()));
}

}  // namespace ocw::identity
