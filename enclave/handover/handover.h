// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_HANDOVER_HANDOVER_H__
#define __OCW_HANDOVER_HANDOVER_H__

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include "chainstorage/chainstorage.h"
#include "context/context.h"
#include "identity/identity.h"
#include "proto/attestation.pb.h"
#include "proto/error.pb.h"
#include "proto/handover.pb.h"
#include "util/macros.h"
#include "util/ticks.h"

// Key handover moves a worker's secret seed from an enclave holding it (the
// server) to a newer enclave on the same machine (the client):
//
//   server: CreateChallenge            -> HandoverChallenge
//   client: AcceptChallenge(challenge) -> HandoverChallengeResponse
//   server: Start(response)            -> HandoverWorkerKey
//   client: Receive(worker_key)        -> seed
//
// The client proves it's a genuine enclave (remote attestation), on this
// machine (local report), answering our latest challenge, and registered on
// chain later than the server's binary.  The seed is then encrypted to the
// client's ephemeral key agreement key.
namespace ocw::handover {

// Challenges issued more than this many blocks ago are refused.
static const uint64_t kMaxChallengeAgeBlocks = 150;
// Label of the symmetric key derived from the X25519 secret.
extern const char* kKeyLabel;

// TrustPolicy gathers the attestation settings both sides use.  Attestation
// and local report checks are skipped only if `dev_mode` is set.
struct TrustPolicy {
  bool dev_mode = false;
  attestation::Provider provider = attestation::PROVIDER_NONE;
  uint32_t ra_timeout_millis = 0;
  uint32_t ra_max_retries = 0;
};

// Encrypts `seed` to `recipient_ecdh_pubkey` under a key agreed with
// `sender`, with a fresh random IV.
std::pair<EncryptedKey, error::Error> EncryptSeed(
    const identity::WorkerIdentity& sender,
    const std::string& recipient_ecdh_pubkey,
    const std::string& seed);
// Reverses EncryptSeed using the recipient's ephemeral key.
std::pair<std::string, error::Error> DecryptSeed(
    const identity::EphemeralKey& recipient,
    const EncryptedKey& encrypted);

class Server {
 public:
  DELETE_COPY_AND_ASSIGN(Server);
  explicit Server(const TrustPolicy& policy) : policy_(policy) {}

  // Issues a challenge at `block_number` (with block time `now_ms`),
  // replacing any outstanding one.
  std::pair<HandoverChallenge, error::Error> CreateChallenge(
      context::Context* ctx, uint64_t block_number, uint64_t now_ms);

  // Consumes the outstanding challenge, returning true if it equals
  // `challenge`.  Whatever the outcome, the challenge can't be used again.
  bool VerifyChallenge(const HandoverChallenge& challenge);

  // Checks the client's response and, if it passes every gate, returns
  // `identity`'s seed encrypted to the client.  `storage` is the chain state
  // as of `current_block`.
  std::pair<HandoverWorkerKey, error::Error> Start(
      context::Context* ctx,
      const HandoverChallengeResponse& response,
      const identity::WorkerIdentity& identity,
      const std::string& genesis_block_hash,
      const chainstorage::ChainStorage& storage,
      uint64_t current_block);

  bool has_challenge() const { return challenge_.has_value(); }

 private:
  error::Error CheckNotRollback(
      context::Context* ctx,
      const attestation::Measurement& client,
      const chainstorage::ChainStorage& storage) const;

  TrustPolicy policy_;
  std::optional<HandoverChallenge> challenge_;
};

class Client {
 public:
  DELETE_COPY_AND_ASSIGN(Client);
  explicit Client(const TrustPolicy& policy) : policy_(policy) {}

  // Responds to a server's challenge with a fresh ephemeral key, replacing
  // any previous one.
  std::pair<HandoverChallengeResponse, error::Error> AcceptChallenge(
      context::Context* ctx, const HandoverChallenge& challenge);

  struct ReceivedKey {
    std::string seed;
    std::string genesis_block_hash;
    bool dev_mode;
  };
  // Decrypts the worker key sent by the server.  The ephemeral key is
  // consumed whether or not this succeeds.
  std::pair<ReceivedKey, error::Error> Receive(
      context::Context* ctx, const HandoverWorkerKey& worker_key);

  bool has_ephemeral_key() const { return ephemeral_ != nullptr; }

 private:
  TrustPolicy policy_;
  std::unique_ptr<identity::EphemeralKey> ephemeral_;
};

}  // namespace ocw::handover

#endif  // __OCW_HANDOVER_HANDOVER_H__
