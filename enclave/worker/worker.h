// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_WORKER_WORKER_H__
#define __OCW_WORKER_WORKER_H__

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include "attestation/attestation.h"
#include "chainstorage/chainstorage.h"
#include "checkpoint/checkpoint.h"
#include "context/context.h"
#include "handover/handover.h"
#include "identity/identity.h"
#include "mq/mq.h"
#include "proto/enclaveconfig.pb.h"
#include "proto/error.pb.h"
#include "proto/msgs.pb.h"
#include "sync/sync.h"
#include "system/system.h"
#include "util/macros.h"

namespace ocw::worker {

// Name of the sealed RuntimeData file within the sealing path.
extern const char* kRuntimeDataFile;
// Signatures over endpoint and master key payloads are made over the
// payload prefixed by its content type.
extern const char* kEndpointContentType;
extern const char* kMasterKeyApplyContentType;
static const size_t kMaxEndpointPayloadSize = 512;

// RuntimeState is everything derived from the chain once the runtime is
// initialized.
struct RuntimeState {
  DELETE_COPY_AND_ASSIGN(RuntimeState);
  RuntimeState() : storage(std::make_shared<chainstorage::SharedChainStorage>()) {}

  std::string genesis_block_hash;
  std::shared_ptr<chainstorage::SharedChainStorage> storage;
  sync::Synchronizer synchronizer;
  mq::SendQueue send_mq;
  mq::Dispatcher recv_mq;
  // Subscribes to recv_mq, so it's destroyed first.
  std::unique_ptr<system::System> system;
};

// Worker is the off-chain worker runtime.  It is not thread-safe: every
// call is made with the runtime guard held.  The only state shared beyond
// the guard is chain storage, which has its own reader/writer lock.
class Worker {
 public:
  DELETE_COPY_AND_ASSIGN(Worker);
  // `config` has already been merged with defaults and validated.
  Worker(const enclaveconfig::WorkerConfig& config, system::Factory system_factory);

  void GetInfo(context::Context* ctx, WorkerInfo* info) const;

  // Returns the number of the last known header.
  std::pair<uint64_t, error::Error> SyncHeader(context::Context* ctx, const chain::HeadersToSync& req);
  // Applies blocks in order, skipping those already applied, and returns
  // the number of the last one.
  std::pair<uint64_t, error::Error> DispatchBlocks(context::Context* ctx, const Blocks& req);

  error::Error InitRuntime(context::Context* ctx, const InitRuntimeRequest& req, InitRuntimeResponse* resp);
  error::Error GetRuntimeInfo(context::Context* ctx, const GetRuntimeInfoRequest& req, InitRuntimeResponse* resp);
  error::Error GetEgressMessages(context::Context* ctx, EgressMessages* resp) const;

  error::Error SetEndpoint(context::Context* ctx, const std::string& endpoint, SignedEndpoint* resp);
  error::Error RefreshEndpointSigningTime(context::Context* ctx, SignedEndpoint* resp);
  // Leaves `resp` empty if no endpoint has been set.
  error::Error GetEndpointInfo(context::Context* ctx, SignedEndpoint* resp);
  error::Error GetMasterKeyApply(context::Context* ctx, SignedMasterKeyApply* resp) const;

  std::pair<handover::HandoverChallenge, error::Error> HandoverCreateChallenge(context::Context* ctx);
  std::pair<handover::HandoverWorkerKey, error::Error> HandoverStart(
      context::Context* ctx, const handover::HandoverChallengeResponse& response);
  std::pair<handover::HandoverChallengeResponse, error::Error> HandoverAcceptChallenge(
      context::Context* ctx, const handover::HandoverChallenge& challenge);
  // Adopts the received seed as this worker's identity and seals it, to be
  // picked up by InitRuntime.
  error::Error HandoverReceive(context::Context* ctx, const handover::HandoverWorkerKey& worker_key);

  error::Error LoadChainState(context::Context* ctx, const LoadChainStateRequest& req);
  error::Error LoadStorageProof(context::Context* ctx, const StorageProof& proof);
  // Terminates the process.
  error::Error Stop(context::Context* ctx, const StopRequest& req);

  std::pair<uint64_t, error::Error> TakeCheckpoint(context::Context* ctx);
  // Rebuilds the runtime from the newest checkpoint on disk.  Finding none
  // is not an error.
  error::Error RestoreLatestCheckpoint(context::Context* ctx);
  error::Error Restore(context::Context* ctx, const Checkpoint& checkpoint);

  bool initialized() const { return runtime_ != nullptr; }
  bool dev_mode() const { return dev_mode_; }
  uint32_t safe_mode_level() const { return config_.safe_mode_level(); }
  // Chain storage, for status readers.  Null until initialized.
  std::shared_ptr<chainstorage::SharedChainStorage> chain_storage() const;

 private:
  std::string RuntimeDataPath() const;
  error::Error SaveRuntimeData(context::Context* ctx, const RuntimeData& data) const;
  std::pair<RuntimeData, error::Error> LoadRuntimeData(context::Context* ctx) const;
  // Loads the sealed runtime data of `genesis_block_hash`, creating it if
  // there's none.  A `debug_seed` replaces whatever was sealed.
  std::pair<RuntimeData, error::Error> InitRuntimeData(
      context::Context* ctx,
      const std::string& genesis_block_hash,
      const std::string* debug_seed) const;

  // Takes ownership of a fully built runtime.
  void Install(
      std::unique_ptr<identity::WorkerIdentity> identity,
      std::unique_ptr<RuntimeState> runtime,
      const RuntimeData& data,
      attestation::Provider provider);
  void BuildRegistrationInfo();
  void FillRuntimeInfo(InitRuntimeResponse* resp, const attestation::Attestation* report) const;

  // Block number and time (ms) of the last applied block.
  std::pair<uint64_t, uint64_t> CurrentBlock() const;
  void ProcessBlock(context::Context* ctx, uint64_t block_number);
  void MaybeTakeCheckpoint(context::Context* ctx);
  void BuildCheckpoint(context::Context* ctx, Checkpoint* out) const;

  error::Error SignEndpoint(context::Context* ctx);

  const enclaveconfig::WorkerConfig config_;
  const system::Factory system_factory_;
  checkpoint::Checkpointer checkpointer_;

  bool dev_mode_;
  attestation::Provider attestation_provider_;
  RuntimeData runtime_data_;
  std::optional<std::string> operator_;
  WorkerRegistrationInfo registration_info_;
  std::string encoded_runtime_info_;
  attestation::CachedReport cached_report_;

  std::optional<std::string> endpoint_;
  std::optional<SignedEndpoint> signed_endpoint_;

  std::unique_ptr<handover::Server> handover_server_;
  handover::Client handover_client_;

  // The system holds a pointer to the identity, so the runtime is declared
  // after it.
  std::unique_ptr<identity::WorkerIdentity> identity_;
  std::unique_ptr<RuntimeState> runtime_;
};

}  // namespace ocw::worker

#endif  // __OCW_WORKER_WORKER_H__
