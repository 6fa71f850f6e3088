// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "handover/handover.h"

#include <sodium/crypto_aead_chacha20poly1305.h>

#include "attestation/attestation.h"
#include "env/env.h"
#include "hmac/hmac.h"
#include "metrics/metrics.h"
#include "sha/sha.h"
#include "util/bytes.h"
#include "util/constant.h"
#include "util/log.h"

namespace ocw::handover {

const char* kKeyLabel = "worker_key_handover";

namespace {

// Local reports bind no data of their own; only their origin matters.
const std::string kLocalReportData(64, '\0');

}  // namespace

std::pair<EncryptedKey, error::Error> EncryptSeed(
    const identity::WorkerIdentity& sender,
    const std::string& recipient_ecdh_pubkey,
    const std::string& seed) {
  EncryptedKey out;
  identity::SharedSecret shared;
  if (auto err = sender.Agree(recipient_ecdh_pubkey, &shared); err != error::OK) {
    return std::make_pair(out, err);
  }
  util::SecretArray<32> key;
  hmac::DeriveKey(shared.array(), kKeyLabel, &key.array());

  std::string iv(crypto_aead_chacha20poly1305_IETF_NPUBBYTES, '\0');
  if (auto err = env::environment->RandomBytes(iv.data(), iv.size()); err != error::OK) {
    return std::make_pair(out, err);
  }
  std::string ciphertext(seed.size() + crypto_aead_chacha20poly1305_IETF_ABYTES, '\0');
  unsigned long long ciphertext_size = 0;
  if (0 != crypto_aead_chacha20poly1305_ietf_encrypt(
      reinterpret_cast<uint8_t*>(ciphertext.data()), &ciphertext_size,
      reinterpret_cast<const uint8_t*>(seed.data()), seed.size(),
      nullptr, 0,  // no additional data
      nullptr,
      reinterpret_cast<const uint8_t*>(iv.data()),
      key.data())) {
    return std::make_pair(out, COUNTED_ERROR(Handover_EncryptFailed));
  }
  ciphertext.resize(ciphertext_size);
  out.set_ecdh_pubkey(sender.EcdhPublicKeyString());
  out.set_encrypted_key(std::move(ciphertext));
  out.set_iv(std::move(iv));
  return std::make_pair(out, error::OK);
}

std::pair<std::string, error::Error> DecryptSeed(
    const identity::EphemeralKey& recipient,
    const EncryptedKey& encrypted) {
  identity::SharedSecret shared;
  if (auto err = recipient.Agree(encrypted.ecdh_pubkey(), &shared); err != error::OK) {
    return std::make_pair("", err);
  }
  if (encrypted.iv().size() != crypto_aead_chacha20poly1305_IETF_NPUBBYTES ||
      encrypted.encrypted_key().size() < crypto_aead_chacha20poly1305_IETF_ABYTES) {
    return std::make_pair("", COUNTED_ERROR(Handover_DecryptFailed));
  }
  util::SecretArray<32> key;
  hmac::DeriveKey(shared.array(), kKeyLabel, &key.array());

  std::string plaintext(encrypted.encrypted_key().size() - crypto_aead_chacha20poly1305_IETF_ABYTES, '\0');
  unsigned long long plaintext_size = 0;
  if (0 != crypto_aead_chacha20poly1305_ietf_decrypt(
      reinterpret_cast<uint8_t*>(plaintext.data()), &plaintext_size,
      nullptr,
      reinterpret_cast<const uint8_t*>(encrypted.encrypted_key().data()), encrypted.encrypted_key().size(),
      nullptr, 0,
      reinterpret_cast<const uint8_t*>(encrypted.iv().data()),
      key.data())) {
    util::ZeroString(&plaintext);
    return std::make_pair("", COUNTED_ERROR(Handover_DecryptFailed));
  }
  plaintext.resize(plaintext_size);
  return std::make_pair(std::move(plaintext), error::OK);
}

std::pair<HandoverChallenge, error::Error> Server::CreateChallenge(
    context::Context* ctx, uint64_t block_number, uint64_t now_ms) {
  HandoverChallenge challenge;
  std::string nonce(32, '\0');
  if (auto err = env::environment->RandomBytes(nonce.data(), nonce.size()); err != error::OK) {
    return std::make_pair(challenge, err);
  }
  if (!policy_.dev_mode) {
    auto [target_info, err] = env::environment->LocalTargetInfo(ctx);
    if (err != error::OK) {
      return std::make_pair(challenge, err);
    }
    challenge.set_sgx_target_info(target_info);
  }
  challenge.set_block_number(block_number);
  challenge.set_now(now_ms);
  challenge.set_dev_mode(policy_.dev_mode);
  challenge.set_nonce(nonce);
  challenge_ = challenge;
  COUNTER(handover, challenges_created)->Increment();
  LOG(INFO) << "Issued handover challenge at block " << block_number;
  return std::make_pair(challenge, error::OK);
}

bool Server::VerifyChallenge(const HandoverChallenge& challenge) {
  std::optional<HandoverChallenge> issued;
  issued.swap(challenge_);
  if (!issued.has_value()) return false;
  COUNTER(handover, challenges_consumed)->Increment();
  return util::ConstantTimeEquals(issued->SerializeAsString(), challenge.SerializeAsString());
}

error::Error Server::CheckNotRollback(
    context::Context* ctx,
    const attestation::Measurement& client,
    const chainstorage::ChainStorage& storage) const {
  auto [self, err] = env::environment->SelfMeasurement(ctx);
  RETURN_IF_ERROR(err);
  auto server_added = storage.BinAddedAt(attestation::MeasurementHash(self));
  if (!server_added.has_value()) {
    return COUNTED_ERROR(Handover_ServerNotAllowed);
  }
  auto client_added = storage.BinAddedAt(attestation::MeasurementHash(client));
  if (!client_added.has_value()) {
    return COUNTED_ERROR(Handover_ClientNotAllowed);
  }
  if (*server_added >= *client_added) {
    LOG(WARNING) << "Refusing handover to a binary registered at " << *client_added
                 << ", ours was registered at " << *server_added;
    return COUNTED_ERROR(Handover_Rollback);
  }
  return error::OK;
}

std::pair<HandoverWorkerKey, error::Error> Server::Start(
    context::Context* ctx,
    const HandoverChallengeResponse& response,
    const identity::WorkerIdentity& identity,
    const std::string& genesis_block_hash,
    const chainstorage::ChainStorage& storage,
    uint64_t current_block) {
  MEASURE_CPU(ctx, cpu_handover_start);
  HandoverWorkerKey out;
  ChallengeHandlerInfo handler;
  if (!handler.ParseFromString(response.encoded_challenge_handler())) {
    return std::make_pair(out, COUNTED_ERROR(Decode_ChallengeHandler));
  }

  // The client is a genuine enclave, and the handler is what it attested to.
  attestation::Measurement client_measurement;
  if (!policy_.dev_mode) {
    if (!response.has_attestation()) {
      return std::make_pair(out, COUNTED_ERROR(Handover_ClientAttestationInvalid));
    }
    util::UnixSecs block_secs = storage.TimestampNowMillis() / 1000;
    auto [data, err] = attestation::Validate(
        ctx, response.attestation(), sha::Blake2b256String(response.encoded_challenge_handler()),
        block_secs, nullptr);
    if (err != error::OK) {
      LOG(WARNING) << "Client attestation invalid: " << err;
      return std::make_pair(out, COUNTED_ERROR(Handover_ClientAttestationInvalid));
    }
    client_measurement = data.measurement();
  } else {
    LOG(INFO) << "Dev mode, skipping client attestation";
  }

  // It answers the challenge we issued.
  if (!VerifyChallenge(handler.challenge())) {
    return std::make_pair(out, COUNTED_ERROR(Handover_InvalidChallenge));
  }

  // It runs on this machine.
  if (!policy_.dev_mode) {
    if (auto err = env::environment->VerifyLocalReport(ctx, handler.sgx_local_report()); err != error::OK) {
      LOG(WARNING) << "Client local report invalid: " << err;
      return std::make_pair(out, COUNTED_ERROR(Handover_NotSameMachine));
    }
  }

  // The challenge is recent.
  uint64_t challenge_block = handler.challenge().block_number();
  if (challenge_block > current_block || current_block - challenge_block > kMaxChallengeAgeBlocks) {
    LOG(WARNING) << "Challenge from block " << challenge_block << " outdated at block " << current_block;
    return std::make_pair(out, COUNTED_ERROR(Handover_ChallengeOutdated));
  }

  // It's newer than us.
  if (!policy_.dev_mode) {
    if (auto err = CheckNotRollback(ctx, client_measurement, storage); err != error::OK) {
      return std::make_pair(out, err);
    }
  }

  EncryptedWorkerKey worker_key;
  worker_key.set_genesis_block_hash(genesis_block_hash);
  worker_key.set_dev_mode(policy_.dev_mode);
  {
    std::string seed = identity.SeedString();
    auto [encrypted, err] = EncryptSeed(identity, handler.ecdh_pubkey(), seed);
    util::ZeroString(&seed);
    if (err != error::OK) {
      return std::make_pair(out, err);
    }
    *worker_key.mutable_encrypted_key() = std::move(encrypted);
  }
  out.set_encoded_worker_key(worker_key.SerializeAsString());
  if (!policy_.dev_mode) {
    auto [report, err] = attestation::Create(
        ctx, policy_.provider, sha::Blake2b256String(out.encoded_worker_key()),
        policy_.ra_timeout_millis, policy_.ra_max_retries);
    if (err != error::OK) {
      return std::make_pair(out, err);
    }
    *out.mutable_attestation() = std::move(report);
  }
  COUNTER(handover, keys_sent)->Increment();
  LOG(INFO) << "Worker key handed over at block " << current_block;
  return std::make_pair(out, error::OK);
}

std::pair<HandoverChallengeResponse, error::Error> Client::AcceptChallenge(
    context::Context* ctx, const HandoverChallenge& challenge) {
  HandoverChallengeResponse out;
  if (challenge.dev_mode() != policy_.dev_mode) {
    return std::make_pair(out, COUNTED_ERROR(Handover_DevModeMismatch));
  }
  auto [key, err] = identity::EphemeralKey::Generate();
  if (err != error::OK) {
    return std::make_pair(out, err);
  }
  ChallengeHandlerInfo handler;
  *handler.mutable_challenge() = challenge;
  handler.set_ecdh_pubkey(key->PublicKeyString());
  if (!policy_.dev_mode) {
    auto [report, err] = env::environment->LocalReport(ctx, challenge.sgx_target_info(), kLocalReportData);
    if (err != error::OK) {
      return std::make_pair(out, err);
    }
    handler.set_sgx_local_report(report);
  }
  out.set_encoded_challenge_handler(handler.SerializeAsString());
  if (!policy_.dev_mode) {
    auto [report, err] = attestation::Create(
        ctx, policy_.provider, sha::Blake2b256String(out.encoded_challenge_handler()),
        policy_.ra_timeout_millis, policy_.ra_max_retries);
    if (err != error::OK) {
      return std::make_pair(out, err);
    }
    *out.mutable_attestation() = std::move(report);
  }
  ephemeral_ = std::move(key);
  return std::make_pair(out, error::OK);
}

std::pair<Client::ReceivedKey, error::Error> Client::Receive(
    context::Context* ctx, const HandoverWorkerKey& worker_key) {
  MEASURE_CPU(ctx, cpu_handover_receive);
  ReceivedKey out{"", "", false};
  std::unique_ptr<identity::EphemeralKey> key = std::move(ephemeral_);
  if (key == nullptr) {
    return std::make_pair(out, COUNTED_ERROR(Handover_NoEphemeralKey));
  }
  EncryptedWorkerKey encrypted;
  if (!encrypted.ParseFromString(worker_key.encoded_worker_key())) {
    return std::make_pair(out, COUNTED_ERROR(Decode_WorkerKey));
  }
  if (encrypted.dev_mode() != policy_.dev_mode) {
    return std::make_pair(out, COUNTED_ERROR(Handover_DevModeMismatch));
  }
  if (!policy_.dev_mode) {
    if (!worker_key.has_attestation()) {
      return std::make_pair(out, COUNTED_ERROR(Handover_ServerAttestationInvalid));
    }
    auto [data, err] = attestation::Validate(
        ctx, worker_key.attestation(), sha::Blake2b256String(worker_key.encoded_worker_key()),
        env::environment->Now(), nullptr);
    if (err != error::OK) {
      LOG(WARNING) << "Server attestation invalid: " << err;
      return std::make_pair(out, COUNTED_ERROR(Handover_ServerAttestationInvalid));
    }
  }
  auto [seed, err] = DecryptSeed(*key, encrypted.encrypted_key());
  if (err != error::OK) {
    return std::make_pair(out, err);
  }
  out.seed = std::move(seed);
  out.genesis_block_hash = encrypted.genesis_block_hash();
  out.dev_mode = encrypted.dev_mode();
  COUNTER(handover, keys_received)->Increment();
  return std::make_pair(std::move(out), error::OK);
}

}  // namespace ocw::handover
