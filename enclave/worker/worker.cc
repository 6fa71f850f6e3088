// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "worker/worker.h"

#include "env/env.h"
#include "fs/fs.h"
#include "metrics/metrics.h"
#include "sha/sha.h"
#include "util/bytes.h"
#include "util/hex.h"
#include "util/log.h"
#include "util/mutex.h"

namespace ocw::worker {

const char* kRuntimeDataFile = "runtime-data.seal";
const char* kEndpointContentType = "ocw:endpoint:";
const char* kMasterKeyApplyContentType = "ocw:master_key_apply:";

namespace {

handover::TrustPolicy ClientPolicy(const enclaveconfig::WorkerConfig& config) {
  handover::TrustPolicy policy;
  auto [provider, err] = attestation::ProviderFromString(config.ra_type());
  // Validated when the config was loaded.
  CHECK(err == error::OK);
  policy.dev_mode = config.dev_mode();
  policy.provider = provider;
  policy.ra_timeout_millis = config.ra_timeout_millis();
  policy.ra_max_retries = config.ra_max_retries();
  return policy;
}

}  // namespace

Worker::Worker(const enclaveconfig::WorkerConfig& config, system::Factory system_factory)
    : config_(config),
      system_factory_(system_factory),
      checkpointer_(
          config.storage_path(),
          config.enable_checkpoint(),
          config.checkpoint_interval_secs(),
          config.max_checkpoint_files(),
          env::environment->Now()),
      dev_mode_(config.dev_mode()),
      attestation_provider_(attestation::PROVIDER_NONE),
      handover_client_(ClientPolicy(config)) {
  GAUGE(worker, safe_mode_level)->Set(config.safe_mode_level());
  GAUGE(worker, initialized)->Set(0);
}

std::shared_ptr<chainstorage::SharedChainStorage> Worker::chain_storage() const {
  if (!initialized()) return nullptr;
  return runtime_->storage;
}

std::pair<uint64_t, uint64_t> Worker::CurrentBlock() const {
  uint64_t next = runtime_->synchronizer.counters().next_block_number;
  util::shared_lock lock(runtime_->storage->mu);
  return std::make_pair(next > 0 ? next - 1 : 0, runtime_->storage->storage->TimestampNowMillis());
}

void Worker::GetInfo(context::Context* ctx, WorkerInfo* info) const {
  info->set_initialized(initialized());
  info->set_dev_mode(dev_mode_);
  info->set_version(config_.version());
  info->set_git_revision(config_.git_revision());
  info->set_safe_mode_level(config_.safe_mode_level());
  if (!initialized()) return;

  auto counters = runtime_->synchronizer.counters();
  info->set_genesis_block_hash(util::ToHex(runtime_->genesis_block_hash));
  info->set_headernum(counters.next_header_number);
  info->set_blocknum(counters.next_block_number);
  info->set_pending_messages(runtime_->send_mq.CountMessages(ctx));
  info->set_public_key(util::ToHex(identity_->public_key()));
  info->set_ecdh_public_key(util::ToHex(identity_->ecdh_public_key()));
  runtime_->system->GetInfo(info->mutable_system());
  info->set_can_load_chain_state(!runtime_->system->IsRegistered());
  {
    util::shared_lock lock(runtime_->storage->mu);
    const auto& storage = *runtime_->storage->storage;
    info->set_state_root(util::ToHex(storage.ComputeRoot()));
    switch (config_.safe_mode_level()) {
      case 0:
        info->set_current_block_time(runtime_->system->NowMillis());
        break;
      case 1:
        info->set_current_block_time(storage.TimestampNowMillis());
        break;
      default:
        info->set_current_block_time(0);
    }
  }
}

std::pair<uint64_t, error::Error> Worker::SyncHeader(context::Context* ctx, const chain::HeadersToSync& req) {
  if (!initialized()) {
    return std::make_pair(0, COUNTED_ERROR(State_NotInitialized));
  }
  const chain::AuthoritySetChange* change = req.has_authority_set_change() ? &req.authority_set_change() : nullptr;
  return runtime_->synchronizer.SyncHeader(ctx, req.headers(), change);
}

std::pair<uint64_t, error::Error> Worker::DispatchBlocks(context::Context* ctx, const Blocks& req) {
  MEASURE_CPU(ctx, cpu_worker_dispatch);
  if (!initialized()) {
    return std::make_pair(0, COUNTED_ERROR(State_NotInitialized));
  }
  uint64_t next = runtime_->synchronizer.counters().next_block_number;
  std::vector<const chain::BlockHeaderWithChanges*> blocks;
  for (const auto& block : req.blocks()) {
    if (block.block_header().number() >= next) {
      blocks.push_back(&block);
    }
  }
  if (size_t ignored = req.blocks_size() - blocks.size(); ignored > 0) {
    LOG(DEBUG) << "Ignoring " << ignored << " blocks below " << next;
    COUNTER(worker, blocks_ignored)->IncrementBy(ignored);
  }
  uint64_t last = blocks.empty() ? (next > 0 ? next - 1 : 0) : blocks.back()->block_header().number();

  bool drop_proofs = config_.safe_mode_level() > 1;
  for (auto block : blocks) {
    uint64_t number = block->block_header().number();
    {
      util::unique_lock<util::shared_mutex> lock(runtime_->storage->mu);
      auto err = runtime_->synchronizer.FeedBlock(ctx, *block, runtime_->storage->storage.get(), drop_proofs);
      if (err != error::OK) {
        LOG(WARNING) << "Failed to apply block " << number << ": " << err;
        return std::make_pair(0, err);
      }
    }
    COUNTER(worker, blocks_dispatched)->Increment();
    if (config_.safe_mode_level() > 0) continue;
    ProcessBlock(ctx, number);
    MaybeTakeCheckpoint(ctx);
  }
  return std::make_pair(last, error::OK);
}

void Worker::ProcessBlock(context::Context* ctx, uint64_t block_number) {
  util::shared_lock lock(runtime_->storage->mu);
  const chainstorage::ChainStorage* storage = runtime_->storage->storage.get();
  runtime_->send_mq.PurgeConfirmed(ctx, [storage](const std::string& origin) {
    return storage->MqNextSequence(origin);
  });

  runtime_->recv_mq.ResetLocalIndex();
  system::BlockDispatchContext block{
      block_number, storage->TimestampNowMillis(), storage, &runtime_->send_mq, &runtime_->recv_mq};
  system::System* sys = runtime_->system.get();
  sys->WillProcessBlock(ctx, block);
  if (auto err = sys->ProcessMessages(ctx, block); err != error::OK) {
    LOG(WARNING) << "Dropping inbound messages of block " << block_number << ": " << err;
  }
  sys->DidProcessBlock(ctx, block);
  if (size_t unhandled = runtime_->recv_mq.Clear(); unhandled > 0) {
    LOG(WARNING) << unhandled << " unhandled messages at block " << block_number;
  }
}

void Worker::MaybeTakeCheckpoint(context::Context* ctx) {
  if (!checkpointer_.Due(env::environment->Now())) return;
  auto [block, err] = TakeCheckpoint(ctx);
  if (err != error::OK) {
    LOG(ERROR) << "Failed to take checkpoint: " << err;
    COUNTER(worker, checkpoint_failures)->Increment();
    return;
  }
  LOG(INFO) << "Took checkpoint at block " << block;
}

std::string Worker::RuntimeDataPath() const {
  return config_.sealing_path() + "/" + kRuntimeDataFile;
}

error::Error Worker::SaveRuntimeData(context::Context* ctx, const RuntimeData& data) const {
  RETURN_IF_ERROR(fs::MkdirAll(config_.sealing_path()));
  std::string plaintext = data.SerializeAsString();
  auto [sealed, err] = env::environment->Seal(ctx, plaintext);
  util::ZeroString(&plaintext);
  RETURN_IF_ERROR(err);
  return fs::WriteFileAtomic(RuntimeDataPath(), sealed);
}

std::pair<RuntimeData, error::Error> Worker::LoadRuntimeData(context::Context* ctx) const {
  RuntimeData data;
  auto [sealed, err] = fs::FileContents(RuntimeDataPath());
  if (err != error::OK) {
    return std::make_pair(data, err);
  }
  auto [plaintext, err2] = env::environment->Unseal(ctx, sealed);
  if (err2 != error::OK) {
    return std::make_pair(data, err2);
  }
  bool parsed = data.ParseFromString(plaintext);
  util::ZeroString(&plaintext);
  if (!parsed) {
    return std::make_pair(data, COUNTED_ERROR(Decode_RuntimeData));
  }
  return std::make_pair(data, error::OK);
}

std::pair<RuntimeData, error::Error> Worker::InitRuntimeData(
    context::Context* ctx,
    const std::string& genesis_block_hash,
    const std::string* debug_seed) const {
  RuntimeData data;
  data.set_genesis_block_hash(genesis_block_hash);
  if (debug_seed != nullptr) {
    if (debug_seed->size() != identity::kSeedSize) {
      return std::make_pair(data, COUNTED_ERROR(Decode_SecretSeed));
    }
    LOG(WARNING) << "Using debug identity key, entering dev mode";
    data.set_secret_seed(*debug_seed);
    data.set_trusted_sk(false);
    data.set_dev_mode(true);
    return std::make_pair(data, SaveRuntimeData(ctx, data));
  }

  auto [loaded, err] = LoadRuntimeData(ctx);
  if (err == error::OK) {
    if (loaded.genesis_block_hash() != genesis_block_hash) {
      LOG(ERROR) << "Sealed runtime data belongs to genesis " << util::PrefixToHex(loaded.genesis_block_hash(), 8);
      return std::make_pair(data, COUNTED_ERROR(State_GenesisMismatch));
    }
    LOG(INFO) << "Loaded sealed runtime data";
    return std::make_pair(loaded, error::OK);
  }
  if (err != error::FS_FileNotFound) {
    return std::make_pair(data, err);
  }

  LOG(INFO) << "No sealed runtime data, generating a new identity";
  auto [identity, err2] = identity::WorkerIdentity::Generate();
  if (err2 != error::OK) {
    return std::make_pair(data, err2);
  }
  std::string seed = identity->SeedString();
  data.set_secret_seed(seed);
  util::ZeroString(&seed);
  data.set_trusted_sk(true);
  data.set_dev_mode(false);
  return std::make_pair(data, SaveRuntimeData(ctx, data));
}

error::Error Worker::InitRuntime(context::Context* ctx, const InitRuntimeRequest& req, InitRuntimeResponse* resp) {
  MEASURE_CPU(ctx, cpu_worker_init);
  if (initialized()) {
    return COUNTED_ERROR(State_AlreadyInitialized);
  }
  const auto& genesis = req.genesis_info();
  auto root = chainstorage::ChainStorage::ComputeRoot(req.genesis_state());
  if (util::ByteArrayToString(root) != genesis.block_header().state_root()) {
    LOG(ERROR) << "Genesis state root " << util::ToHex(root) << " does not match header";
    return COUNTED_ERROR(Storage_GenesisRootMismatch);
  }

  // Refused before InitRuntimeData, which would seal the debug seed over
  // the existing identity.
  if (req.has_debug_set_key() && req.attestation_provider() != attestation::PROVIDER_NONE) {
    return COUNTED_ERROR(Init_RADisallowedWithDebugKey);
  }

  std::string genesis_block_hash = sync::HeaderHash(genesis.block_header());
  auto [data, err] = InitRuntimeData(ctx, genesis_block_hash, req.has_debug_set_key() ? &req.debug_set_key() : nullptr);
  util::ZeroOnExit zero_seed(data.mutable_secret_seed());
  RETURN_IF_ERROR(err);
  if (data.dev_mode() && req.attestation_provider() != attestation::PROVIDER_NONE) {
    return COUNTED_ERROR(Init_RADisallowedWithDebugKey);
  }
  auto [identity, err2] = identity::WorkerIdentity::FromSeed(data.secret_seed());
  RETURN_IF_ERROR(err2);

  auto runtime = std::make_unique<RuntimeState>();
  runtime->genesis_block_hash = genesis_block_hash;
  {
    util::unique_lock<util::shared_mutex> lock(runtime->storage->mu);
    runtime->storage->storage = chainstorage::ChainStorage::FromPairs(req.genesis_state());
  }
  RETURN_IF_ERROR(runtime->synchronizer.Init(genesis.block_header(), genesis.authority_set()));
  runtime->system = system_factory_(system::Params{
      identity.get(), &runtime->recv_mq, genesis.block_header().number()});

  if (req.has_operator_()) {
    operator_ = req.operator_();
  } else {
    operator_.reset();
  }
  Install(std::move(identity), std::move(runtime), data, req.attestation_provider());
  COUNTER(worker, runtime_initialized)->Increment();
  LOG(INFO) << "Runtime initialized at genesis " << util::PrefixToHex(genesis_block_hash, 8)
            << " with public key " << util::PrefixToHex(identity_->PublicKeyString(), 8)
            << (dev_mode_ ? " (dev mode)" : "");
  FillRuntimeInfo(resp, nullptr);
  return error::OK;
}

void Worker::Install(
    std::unique_ptr<identity::WorkerIdentity> identity,
    std::unique_ptr<RuntimeState> runtime,
    const RuntimeData& data,
    attestation::Provider provider) {
  runtime_.reset();
  identity_ = std::move(identity);
  runtime_ = std::move(runtime);
  runtime_data_ = data;
  dev_mode_ = data.dev_mode() || config_.dev_mode();
  attestation_provider_ = provider;

  handover::TrustPolicy policy;
  policy.dev_mode = dev_mode_;
  policy.provider = provider;
  policy.ra_timeout_millis = config_.ra_timeout_millis();
  policy.ra_max_retries = config_.ra_max_retries();
  handover_server_ = std::make_unique<handover::Server>(policy);

  BuildRegistrationInfo();
  GAUGE(worker, initialized)->Set(1);
}

void Worker::BuildRegistrationInfo() {
  registration_info_.Clear();
  registration_info_.set_version(config_.version());
  registration_info_.set_machine_id(config_.machine_id());
  registration_info_.set_pubkey(identity_->PublicKeyString());
  registration_info_.set_ecdh_pubkey(identity_->EcdhPublicKeyString());
  registration_info_.set_genesis_block_hash(runtime_->genesis_block_hash);
  registration_info_.add_features(config_.cpu_cores());
  registration_info_.add_features(config_.cpu_feature_level());
  if (operator_.has_value()) {
    registration_info_.set_operator_(*operator_);
  }
  encoded_runtime_info_ = registration_info_.SerializeAsString();
  cached_report_.Invalidate();
}

void Worker::FillRuntimeInfo(InitRuntimeResponse* resp, const attestation::Attestation* report) const {
  resp->set_encoded_runtime_info(encoded_runtime_info_);
  resp->set_genesis_block_hash(runtime_->genesis_block_hash);
  resp->set_public_key(identity_->PublicKeyString());
  resp->set_ecdh_public_key(identity_->EcdhPublicKeyString());
  if (report != nullptr) {
    *resp->mutable_attestation() = *report;
  }
}

error::Error Worker::GetRuntimeInfo(context::Context* ctx, const GetRuntimeInfoRequest& req, InitRuntimeResponse* resp) {
  if (!initialized()) {
    return COUNTED_ERROR(State_NotInitialized);
  }
  if (req.has_operator_()) {
    operator_ = req.operator_();
    BuildRegistrationInfo();
  }
  if (req.force_refresh_ra()) {
    cached_report_.Invalidate();
  }

  // An identity key we generated ourselves, or one the chain has since
  // registered, may be attested.  One injected by handover may not until then.
  bool validated_identity = runtime_data_.trusted_sk() || runtime_->system->IsRegistered();
  bool validated_state = runtime_->synchronizer.StateValidated();
  bool allow_attestation = validated_state &&
      (validated_identity || attestation_provider_ == attestation::PROVIDER_NONE);

  util::UnixSecs now = env::environment->Now();
  if (allow_attestation && cached_report_.Get(now) == nullptr) {
    auto [report, err] = attestation::Create(
        ctx, attestation_provider_, sha::Blake2b256String(encoded_runtime_info_),
        config_.ra_timeout_millis(), config_.ra_max_retries());
    RETURN_IF_ERROR(err);
    cached_report_.Set(report, now);
    COUNTER(worker, runtime_info_refreshed)->Increment();
  } else if (!allow_attestation) {
    LOG(INFO) << "Not attesting runtime info (identity validated: " << validated_identity
              << ", state validated: " << validated_state << ")";
  }
  FillRuntimeInfo(resp, cached_report_.Get(now));
  return error::OK;
}

error::Error Worker::GetEgressMessages(context::Context* ctx, EgressMessages* resp) const {
  if (!initialized()) {
    return COUNTED_ERROR(State_NotInitialized);
  }
  runtime_->send_mq.AllMessagesGrouped(ctx, resp->mutable_channels());
  return error::OK;
}

error::Error Worker::SignEndpoint(context::Context* ctx) {
  WorkerEndpointPayload payload;
  payload.set_pubkey(identity_->PublicKeyString());
  payload.set_endpoint(*endpoint_);
  payload.set_signing_time(runtime_->system->NowMillis());
  std::string encoded = payload.SerializeAsString();
  if (encoded.size() > kMaxEndpointPayloadSize) {
    return COUNTED_ERROR(State_EndpointTooLarge);
  }
  SignedEndpoint signed_endpoint;
  signed_endpoint.set_signature(identity_->SignString(kEndpointContentType + encoded));
  signed_endpoint.set_encoded_endpoint_payload(std::move(encoded));
  signed_endpoint_ = std::move(signed_endpoint);
  return error::OK;
}

error::Error Worker::SetEndpoint(context::Context* ctx, const std::string& endpoint, SignedEndpoint* resp) {
  if (!initialized()) {
    return COUNTED_ERROR(State_NotInitialized);
  }
  auto previous = std::move(endpoint_);
  endpoint_ = endpoint;
  if (auto err = SignEndpoint(ctx); err != error::OK) {
    endpoint_ = std::move(previous);
    return err;
  }
  LOG(INFO) << "Endpoint set to " << endpoint;
  *resp = *signed_endpoint_;
  return error::OK;
}

error::Error Worker::RefreshEndpointSigningTime(context::Context* ctx, SignedEndpoint* resp) {
  if (!initialized()) {
    return COUNTED_ERROR(State_NotInitialized);
  }
  if (!endpoint_.has_value()) {
    return COUNTED_ERROR(State_EndpointNotSet);
  }
  RETURN_IF_ERROR(SignEndpoint(ctx));
  *resp = *signed_endpoint_;
  return error::OK;
}

error::Error Worker::GetEndpointInfo(context::Context* ctx, SignedEndpoint* resp) {
  if (!initialized()) {
    return COUNTED_ERROR(State_NotInitialized);
  }
  if (!endpoint_.has_value()) return error::OK;
  if (!signed_endpoint_.has_value()) {
    RETURN_IF_ERROR(SignEndpoint(ctx));
  }
  *resp = *signed_endpoint_;
  return error::OK;
}

error::Error Worker::GetMasterKeyApply(context::Context* ctx, SignedMasterKeyApply* resp) const {
  if (!initialized()) {
    return COUNTED_ERROR(State_NotInitialized);
  }
  MasterKeyApply payload;
  payload.set_pubkey(identity_->PublicKeyString());
  payload.set_ecdh_pubkey(identity_->EcdhPublicKeyString());
  payload.set_signing_time(runtime_->system->NowMillis());
  std::string encoded = payload.SerializeAsString();
  resp->set_signature(identity_->SignString(kMasterKeyApplyContentType + encoded));
  resp->set_encoded_payload(std::move(encoded));
  return error::OK;
}

std::pair<handover::HandoverChallenge, error::Error> Worker::HandoverCreateChallenge(context::Context* ctx) {
  if (!initialized()) {
    return std::make_pair(handover::HandoverChallenge(), COUNTED_ERROR(State_NotInitialized));
  }
  auto [block, now_ms] = CurrentBlock();
  return handover_server_->CreateChallenge(ctx, block, now_ms);
}

std::pair<handover::HandoverWorkerKey, error::Error> Worker::HandoverStart(
    context::Context* ctx, const handover::HandoverChallengeResponse& response) {
  if (!initialized()) {
    return std::make_pair(handover::HandoverWorkerKey(), COUNTED_ERROR(State_NotInitialized));
  }
  auto [block, now_ms] = CurrentBlock();
  util::shared_lock lock(runtime_->storage->mu);
  return handover_server_->Start(
      ctx, response, *identity_, runtime_->genesis_block_hash, *runtime_->storage->storage, block);
}

std::pair<handover::HandoverChallengeResponse, error::Error> Worker::HandoverAcceptChallenge(
    context::Context* ctx, const handover::HandoverChallenge& challenge) {
  return handover_client_.AcceptChallenge(ctx, challenge);
}

error::Error Worker::HandoverReceive(context::Context* ctx, const handover::HandoverWorkerKey& worker_key) {
  if (initialized()) {
    return COUNTED_ERROR(State_AlreadyInitialized);
  }
  auto [received, err] = handover_client_.Receive(ctx, worker_key);
  RETURN_IF_ERROR(err);
  auto [identity, err2] = identity::WorkerIdentity::FromSeed(received.seed);
  if (err2 != error::OK) {
    util::ZeroString(&received.seed);
    return err2;
  }

  RuntimeData data;
  data.set_genesis_block_hash(received.genesis_block_hash);
  data.set_secret_seed(received.seed);
  data.set_trusted_sk(false);
  data.set_dev_mode(received.dev_mode);
  util::ZeroString(&received.seed);
  auto save_err = SaveRuntimeData(ctx, data);
  util::ZeroString(data.mutable_secret_seed());
  RETURN_IF_ERROR(save_err);

  identity_ = std::move(identity);
  encoded_runtime_info_.clear();
  cached_report_.Invalidate();
  LOG(INFO) << "Received worker key " << util::PrefixToHex(identity_->PublicKeyString(), 8) << " by handover";
  return error::OK;
}

error::Error Worker::LoadChainState(context::Context* ctx, const LoadChainStateRequest& req) {
  if (!initialized()) {
    return COUNTED_ERROR(State_NotInitialized);
  }
  if (runtime_->system->IsRegistered()) {
    return COUNTED_ERROR(State_CannotLoadChainState);
  }
  if (req.block_number() == 0) {
    return COUNTED_ERROR(State_InvalidBlockNumber);
  }
  auto storage = chainstorage::ChainStorage::FromPairs(req.storage());
  if (storage->IsWorkerRegistered(identity_->PublicKeyString())) {
    return COUNTED_ERROR(State_WorkerAlreadyRegistered);
  }
  RETURN_IF_ERROR(runtime_->synchronizer.AssumeAtBlock(req.block_number()));
  {
    util::unique_lock<util::shared_mutex> lock(runtime_->storage->mu);
    runtime_->storage->storage = std::move(storage);
  }
  runtime_->recv_mq.ResetLocalIndex();
  runtime_->system->SetGenesisBlock(req.block_number());
  LOG(INFO) << "Loaded chain state at block " << req.block_number();
  return error::OK;
}

error::Error Worker::LoadStorageProof(context::Context* ctx, const StorageProof& proof) {
  if (config_.safe_mode_level() < 2) {
    return COUNTED_ERROR(State_SafeModeRequired);
  }
  if (!initialized()) {
    return COUNTED_ERROR(State_NotInitialized);
  }
  std::vector<std::string> nodes(proof.nodes().begin(), proof.nodes().end());
  util::unique_lock<util::shared_mutex> lock(runtime_->storage->mu);
  return runtime_->storage->storage->LoadProof(nodes);
}

error::Error Worker::Stop(context::Context* ctx, const StopRequest& req) {
  if (req.remove_checkpoints() || config_.remove_checkpoints_on_stop()) {
    LOG(WARNING) << "Removing checkpoints";
    if (auto err = checkpointer_.RemoveAll(); err != error::OK) {
      LOG(ERROR) << "Failed to remove checkpoints: " << err;
    }
  }
  LOG(WARNING) << "Stopping";
  env::environment->FlushAllLogsIfAble();
  env::environment->Terminate(0);
  return error::OK;
}

void Worker::BuildCheckpoint(context::Context* ctx, Checkpoint* out) const {
  auto counters = runtime_->synchronizer.counters();
  out->set_block_number(counters.next_block_number > 0 ? counters.next_block_number - 1 : 0);
  *out->mutable_runtime_data() = runtime_data_;
  {
    util::shared_lock lock(runtime_->storage->mu);
    runtime_->storage->storage->ToState(out->mutable_chain_storage());
  }
  runtime_->synchronizer.ToProto(out->mutable_synchronizer());
  runtime_->send_mq.ToProto(ctx, out->mutable_send_mq());
  runtime_->recv_mq.ToProto(out->mutable_recv_mq());
  out->set_system_state(runtime_->system->Checkpoint());
  if (endpoint_.has_value()) {
    out->set_endpoint(*endpoint_);
  }
  out->set_attestation_provider(attestation_provider_);
}

std::pair<uint64_t, error::Error> Worker::TakeCheckpoint(context::Context* ctx) {
  if (!initialized()) {
    return std::make_pair(0, COUNTED_ERROR(State_NotInitialized));
  }
  Checkpoint checkpoint;
  BuildCheckpoint(ctx, &checkpoint);
  auto err = checkpointer_.Write(ctx, checkpoint, env::environment->Now());
  util::ZeroString(checkpoint.mutable_runtime_data()->mutable_secret_seed());
  return std::make_pair(checkpoint.block_number(), err);
}

error::Error Worker::RestoreLatestCheckpoint(context::Context* ctx) {
  if (!checkpointer_.enabled()) return error::OK;
  auto [checkpoint, err] = checkpointer_.LoadLatest(ctx);
  if (err == error::Checkpoint_NotFound) {
    LOG(INFO) << "No checkpoint to restore";
    return error::OK;
  }
  RETURN_IF_ERROR(err);
  err = Restore(ctx, *checkpoint);
  util::ZeroString(checkpoint->mutable_runtime_data()->mutable_secret_seed());
  return err;
}

error::Error Worker::Restore(context::Context* ctx, const Checkpoint& checkpoint) {
  if (initialized()) {
    return COUNTED_ERROR(State_AlreadyInitialized);
  }
  // Sealed runtime data, if any, must agree with the checkpoint.
  auto [sealed, load_err] = LoadRuntimeData(ctx);
  if (load_err == error::OK &&
      sealed.genesis_block_hash() != checkpoint.runtime_data().genesis_block_hash()) {
    util::ZeroString(sealed.mutable_secret_seed());
    return COUNTED_ERROR(Checkpoint_GenesisMismatch);
  }
  util::ZeroString(sealed.mutable_secret_seed());

  auto [identity, err] = identity::WorkerIdentity::FromSeed(checkpoint.runtime_data().secret_seed());
  RETURN_IF_ERROR(err);
  auto runtime = std::make_unique<RuntimeState>();
  runtime->genesis_block_hash = checkpoint.runtime_data().genesis_block_hash();
  {
    util::unique_lock<util::shared_mutex> lock(runtime->storage->mu);
    runtime->storage->storage = chainstorage::ChainStorage::FromPairs(checkpoint.chain_storage());
  }
  RETURN_IF_ERROR(runtime->synchronizer.FromProto(checkpoint.synchronizer()));
  auto counters = runtime->synchronizer.counters();
  if (counters.next_block_number != checkpoint.block_number() + 1) {
    return COUNTED_ERROR(Decode_Checkpoint);
  }
  runtime->send_mq.FromProto(ctx, checkpoint.send_mq());
  runtime->recv_mq.FromProto(checkpoint.recv_mq());
  runtime->system = system_factory_(system::Params{identity.get(), &runtime->recv_mq, 0});
  RETURN_IF_ERROR(runtime->system->Restore(checkpoint.system_state()));

  operator_.reset();
  if (checkpoint.endpoint().empty()) {
    endpoint_.reset();
  } else {
    endpoint_ = checkpoint.endpoint();
  }
  signed_endpoint_.reset();
  Install(std::move(identity), std::move(runtime), checkpoint.runtime_data(), checkpoint.attestation_provider());
  LOG(INFO) << "Restored runtime from checkpoint at block " << checkpoint.block_number();
  return error::OK;
}

}  // namespace ocw::worker
