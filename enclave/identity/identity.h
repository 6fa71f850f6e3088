// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_IDENTITY_IDENTITY_H__
#define __OCW_IDENTITY_IDENTITY_H__

#include <array>
#include <memory>
#include <string>
#include <utility>
#include "proto/error.pb.h"
#include "util/bytes.h"
#include "util/macros.h"

namespace ocw::identity {

typedef std::array<uint8_t, 32> PublicKey;
typedef std::array<uint8_t, 32> EcdhPublicKey;
typedef std::array<uint8_t, 64> Signature;
typedef util::SecretArray<32> SharedSecret;

const size_t kSeedSize = 32;

// WorkerIdentity is the worker's long-term key material.  A single 32-byte
// secret seed determines an Ed25519 signing keypair and an X25519
// key-agreement keypair.  All secret bytes are zeroed on destruction.
class WorkerIdentity {
 public:
  DELETE_COPY_AND_ASSIGN(WorkerIdentity);
  ~WorkerIdentity();

  // Generates a fresh identity from environment randomness.
  static std::pair<std::unique_ptr<WorkerIdentity>, error::Error> Generate();
  // Recreates an identity from its seed.  Fails if `seed` is not kSeedSize bytes.
  static std::pair<std::unique_ptr<WorkerIdentity>, error::Error> FromSeed(const std::string& seed);

  const PublicKey& public_key() const { return public_key_; }
  const EcdhPublicKey& ecdh_public_key() const { return ecdh_public_key_; }
  std::string PublicKeyString() const { return util::ByteArrayToString(public_key_); }
  std::string EcdhPublicKeyString() const { return util::ByteArrayToString(ecdh_public_key_); }

  // A copy of the secret seed.  The caller zeroes it (util::ZeroString).
  std::string SeedString() const;

  Signature Sign(const std::string& msg) const;
  std::string SignString(const std::string& msg) const;

  // X25519 agreement between our key-agreement secret and `remote`.
  error::Error Agree(const std::string& remote, SharedSecret* out) const;

 private:
  WorkerIdentity();
  std::array<uint8_t, kSeedSize> seed_;
  std::array<uint8_t, 64> signing_secret_;
  std::array<uint8_t, 32> ecdh_secret_;
  PublicKey public_key_;
  EcdhPublicKey ecdh_public_key_;
};

// A single-use X25519 keypair.
class EphemeralKey {
 public:
  DELETE_COPY_AND_ASSIGN(EphemeralKey);
  ~EphemeralKey();
  static std::pair<std::unique_ptr<EphemeralKey>, error::Error> Generate();

  const EcdhPublicKey& public_key() const { return public_key_; }
  std::string PublicKeyString() const { return util::ByteArrayToString(public_key_); }
  error::Error Agree(const std::string& remote, SharedSecret* out) const;

 private:
  EphemeralKey();
  std::array<uint8_t, 32> secret_;
  EcdhPublicKey public_key_;
};

// Verifies an Ed25519 signature by `signer` (a 32-byte public key).
bool VerifySignature(const std::string& signer, const std::string& msg, const std::string& signature);

}  // namespace ocw::identity

#endif  // __OCW_IDENTITY_IDENTITY_H__
