// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "service/service.h"

#include "attestation/attestation.h"
#include "metrics/metrics.h"
#include "util/log.h"

namespace ocw::service {

enclaveconfig::WorkerConfig DefaultWorkerConfig() {
  enclaveconfig::WorkerConfig config;
  config.set_checkpoint_interval_secs(15 * 60);
  config.set_max_checkpoint_files(5);
  config.set_storage_path("/data/storage_files");
  config.set_sealing_path("/data/protected_files");
  config.set_ra_timeout_millis(10 * 1000);
  config.set_ra_max_retries(5);
  config.set_ra_type("dcap");
  config.set_guard_warn_millis(10 * 1000);
  config.set_version(1);
  config.set_cpu_cores(1);
  config.set_initial_log_level(enclaveconfig::LOG_LEVEL_INFO);
  config.set_request_threads(4);
  return config;
}

error::Error ValidateConfig(const enclaveconfig::WorkerConfig& config) {
  if (config.safe_mode_level() > 2) { return COUNTED_ERROR(Config_SafeModeLevel); }
  if (config.checkpoint_interval_secs() == 0) { return COUNTED_ERROR(Config_CheckpointInterval); }
  if (config.max_checkpoint_files() < 1) { return COUNTED_ERROR(Config_MaxCheckpointFiles); }
  if (config.storage_path().empty()) { return COUNTED_ERROR(Config_StoragePath); }
  if (config.sealing_path().empty()) { return COUNTED_ERROR(Config_SealingPath); }
  if (config.initial_log_level() >= enclaveconfig::LOG_LEVEL_MAX) { return COUNTED_ERROR(General_InvalidArgument); }
  return attestation::ProviderFromString(config.ra_type()).second;
}

Service::Service(const enclaveconfig::WorkerConfig& config, std::unique_ptr<worker::Worker> worker)
    : config_(config),
      box_(std::move(worker), config.safe_mode_level(), config.guard_warn_millis()) {}

std::pair<std::unique_ptr<Service>, error::Error> Service::Create(
    context::Context* ctx,
    const enclaveconfig::WorkerConfig& provided,
    system::Factory system_factory) {
  LOG(INFO) << "Creating service";
  auto config = DefaultWorkerConfig();
  config.MergeFrom(provided);
  error::Error err = error::OK;
  if (error::OK != (err = ValidateConfig(config))) {
    LOG(ERROR) << "Config validation error: " << err;
    return std::make_pair(nullptr, err);
  }
  util::SetLogLevel(config.initial_log_level());
  if (config.safe_mode_level() > 0) {
    LOG(WARNING) << "Running in safe mode " << config.safe_mode_level();
  }

  auto worker = std::make_unique<worker::Worker>(config, system_factory);
  std::unique_ptr<Service> service(new Service(config, std::move(worker)));
  if (error::OK != (err = service->RestoreCheckpoint(ctx))) {
    LOG(ERROR) << "Failed to restore checkpoint: " << err;
    return std::make_pair(nullptr, err);
  }
  return std::make_pair(std::move(service), error::OK);
}

error::Error Service::RestoreCheckpoint(context::Context* ctx) {
  // Requests that need a consistent runtime are refused until this returns.
  auto replacement = box_.BeginStateReplacement();
  auto [w, err] = box_.Lock(ctx, true, true);
  RETURN_IF_ERROR(err);
  return w->RestoreLatestCheckpoint(ctx);
}

std::string Service::HandleSerialized(context::Context* ctx, const std::string& req) {
  auto request = ctx->Protobuf<WorkerRequest>();
  auto response = ctx->Protobuf<WorkerResponse>();
  if (!request->ParseFromString(req)) {
    response->set_status(COUNTED_ERROR(Decode_Request));
    COUNTER(service, requests_failed)->Increment();
  } else {
    Handle(ctx, *request, response);
  }
  return response->SerializeAsString();
}

void Service::Handle(context::Context* ctx, const WorkerRequest& req, WorkerResponse* resp) {
  MEASURE_CPU(ctx, cpu_service_handle);
  LOG(VERBOSE) << "request " << req.request_id() << " is " << req.inner_case();
  resp->set_request_id(req.request_id());
  error::Error err = HandleRequest(ctx, req, resp);
  resp->set_status(err);
  if (err != error::OK) {
    LOG(DEBUG) << "request " << req.request_id() << " (" << req.inner_case() << ") failed: " << err;
    resp->clear_inner();
    COUNTER(service, requests_failed)->Increment();
    return;
  }
  COUNTER(service, requests_handled)->Increment();
}

error::Error Service::HandleRequest(context::Context* ctx, const WorkerRequest& req, WorkerResponse* resp) {
  switch (req.inner_case()) {
    case WorkerRequest::kGetInfo: {
      auto [w, err] = box_.Lock(ctx, true, true);
      RETURN_IF_ERROR(err);
      w->GetInfo(ctx, resp->mutable_info());
    } return error::OK;
    case WorkerRequest::kSyncHeader: {
      auto [w, err] = box_.Lock(ctx, false, true);
      RETURN_IF_ERROR(err);
      auto [synced_to, sync_err] = w->SyncHeader(ctx, req.sync_header());
      RETURN_IF_ERROR(sync_err);
      resp->mutable_synced_to()->set_synced_to(synced_to);
    } return error::OK;
    case WorkerRequest::kDispatchBlocks: {
      auto [w, err] = box_.Lock(ctx, false, true);
      RETURN_IF_ERROR(err);
      auto [synced_to, dispatch_err] = w->DispatchBlocks(ctx, req.dispatch_blocks());
      RETURN_IF_ERROR(dispatch_err);
      resp->mutable_synced_to()->set_synced_to(synced_to);
    } return error::OK;
    case WorkerRequest::kInitRuntime: {
      auto [w, err] = box_.Lock(ctx, false, false);
      RETURN_IF_ERROR(err);
      return w->InitRuntime(ctx, req.init_runtime(), resp->mutable_runtime_info());
    }
    case WorkerRequest::kGetRuntimeInfo: {
      auto [w, err] = box_.Lock(ctx, true, false);
      RETURN_IF_ERROR(err);
      return w->GetRuntimeInfo(ctx, req.get_runtime_info(), resp->mutable_runtime_info());
    }
    case WorkerRequest::kGetEgressMessages: {
      auto [w, err] = box_.Lock(ctx, true, false);
      RETURN_IF_ERROR(err);
      return w->GetEgressMessages(ctx, resp->mutable_egress_messages());
    }
    case WorkerRequest::kSetEndpoint: {
      auto [w, err] = box_.Lock(ctx, false, false);
      RETURN_IF_ERROR(err);
      return w->SetEndpoint(ctx, req.set_endpoint().endpoint(), resp->mutable_endpoint());
    }
    case WorkerRequest::kRefreshEndpointSigningTime: {
      auto [w, err] = box_.Lock(ctx, false, false);
      RETURN_IF_ERROR(err);
      return w->RefreshEndpointSigningTime(ctx, resp->mutable_endpoint());
    }
    case WorkerRequest::kGetEndpointInfo: {
      auto [w, err] = box_.Lock(ctx, true, false);
      RETURN_IF_ERROR(err);
      return w->GetEndpointInfo(ctx, resp->mutable_endpoint());
    }
    case WorkerRequest::kGetMasterKeyApply: {
      auto [w, err] = box_.Lock(ctx, true, false);
      RETURN_IF_ERROR(err);
      return w->GetMasterKeyApply(ctx, resp->mutable_master_key_apply());
    }
    case WorkerRequest::kEcho: {
      resp->set_echo(req.echo());
    } return error::OK;
    case WorkerRequest::kHandoverCreateChallenge: {
      auto [w, err] = box_.Lock(ctx, false, true);
      RETURN_IF_ERROR(err);
      auto [challenge, challenge_err] = w->HandoverCreateChallenge(ctx);
      RETURN_IF_ERROR(challenge_err);
      *resp->mutable_handover_challenge() = std::move(challenge);
    } return error::OK;
    case WorkerRequest::kHandoverStart: {
      auto [w, err] = box_.Lock(ctx, false, true);
      RETURN_IF_ERROR(err);
      auto [worker_key, start_err] = w->HandoverStart(ctx, req.handover_start());
      RETURN_IF_ERROR(start_err);
      *resp->mutable_handover_worker_key() = std::move(worker_key);
    } return error::OK;
    case WorkerRequest::kHandoverAcceptChallenge: {
      auto [w, err] = box_.Lock(ctx, false, true);
      RETURN_IF_ERROR(err);
      auto [response, accept_err] = w->HandoverAcceptChallenge(ctx, req.handover_accept_challenge());
      RETURN_IF_ERROR(accept_err);
      *resp->mutable_handover_challenge_response() = std::move(response);
    } return error::OK;
    case WorkerRequest::kHandoverReceive: {
      auto [w, err] = box_.Lock(ctx, false, true);
      RETURN_IF_ERROR(err);
      return w->HandoverReceive(ctx, req.handover_receive());
    }
    case WorkerRequest::kLoadChainState: {
      auto [w, err] = box_.Lock(ctx, false, false);
      RETURN_IF_ERROR(err);
      return w->LoadChainState(ctx, req.load_chain_state());
    }
    case WorkerRequest::kStop: {
      auto [w, err] = box_.Lock(ctx, true, true);
      RETURN_IF_ERROR(err);
      return w->Stop(ctx, req.stop());
    }
    case WorkerRequest::kLoadStorageProof: {
      auto [w, err] = box_.Lock(ctx, false, true);
      RETURN_IF_ERROR(err);
      return w->LoadStorageProof(ctx, req.load_storage_proof());
    }
    case WorkerRequest::kTakeCheckpoint: {
      auto [w, err] = box_.Lock(ctx, false, false);
      RETURN_IF_ERROR(err);
      auto [block, checkpoint_err] = w->TakeCheckpoint(ctx);
      RETURN_IF_ERROR(checkpoint_err);
      resp->mutable_checkpoint()->set_block_number(block);
    } return error::OK;
    case WorkerRequest::kGetMetrics: {
      *resp->mutable_metrics() = *metrics::AllAsPB(ctx);
    } return error::OK;
    case WorkerRequest::kSetLogLevel: {
      if (req.set_log_level() >= enclaveconfig::LOG_LEVEL_MAX) {
        return COUNTED_ERROR(General_InvalidArgument);
      }
      LOG(INFO) << "Setting log level to " << req.set_log_level();
      util::SetLogLevel(req.set_log_level());
    } return error::OK;
    case WorkerRequest::INNER_NOT_SET:
      return COUNTED_ERROR(Service_RequestNotSet);
    default:
      return error::General_Unimplemented;
  }
}

RequestPool::RequestPool(Service* service, size_t threads, size_t max_queued)
    : service_(service), queue_(max_queued) {
  for (size_t i = 0; i < threads; i++) {
    threads_.emplace_back([this]{ Run(); });
  }
}

RequestPool::~RequestPool() {
  queue_.Close();
  for (auto& t : threads_) {
    t.join();
  }
}

bool RequestPool::Submit(WorkerRequest req, Callback cb) {
  COUNTER(service, requests_queued)->Increment();
  return queue_.Push(Work{std::move(req), std::move(cb)});
}

void RequestPool::Run() {
  while (auto work = queue_.Pop()) {
    context::Context ctx;
    WorkerResponse resp;
    service_->Handle(&ctx, work->request, &resp);
    work->callback(resp);
  }
}

}  // namespace ocw::service
