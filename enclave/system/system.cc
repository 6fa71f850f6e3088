// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "system/system.h"

#include "metrics/metrics.h"
#include "proto/mq.pb.h"
#include "util/hex.h"
#include "util/log.h"

namespace ocw::system {

const char* kRegistryTopic = "worker/registry";
const char* kHeartbeatTopic = "worker/heartbeat";
const char* kHeartbeatResponseTopic = "worker/heartbeat_response";

std::pair<size_t, error::Error> DispatchInbound(context::Context* ctx, const BlockDispatchContext& block) {
  auto [messages, err] = block.storage->MqMessages();
  if (err != error::OK) {
    return std::make_pair(0, err);
  }
  for (const auto& msg : messages.messages()) {
    block.recv_mq->Dispatch(ctx, msg);
  }
  return std::make_pair(messages.messages_size(), error::OK);
}

RegistrySystem::RegistrySystem(const Params& params)
    : identity_(params.identity), send_mq_(nullptr) {
  info_.set_genesis_block(params.genesis_block_number);
  params.recv_mq->Subscribe(kRegistryTopic, [this](context::Context* ctx, const chain::Message& msg) {
    HandleRegistryEvent(ctx, msg);
  });
  params.recv_mq->Subscribe(kHeartbeatTopic, [this](context::Context* ctx, const chain::Message& msg) {
    HandleHeartbeat(ctx, msg);
  });
}

void RegistrySystem::WillProcessBlock(context::Context* ctx, const BlockDispatchContext& block) {
  info_.set_now_ms(block.now_ms);
}

error::Error RegistrySystem::ProcessMessages(context::Context* ctx, const BlockDispatchContext& block) {
  send_mq_ = block.send_mq;
  auto [n, err] = DispatchInbound(ctx, block);
  send_mq_ = nullptr;
  if (n > 0) {
    LOG(DEBUG) << "Dispatched " << n << " messages at block " << block.block_number;
  }
  return err;
}

void RegistrySystem::DidProcessBlock(context::Context* ctx, const BlockDispatchContext& block) {
  if (!info_.registered() && block.storage->IsWorkerRegistered(identity_->PublicKeyString())) {
    LOG(INFO) << "Worker registration found in storage at block " << block.block_number;
    info_.set_registered(true);
  }
}

void RegistrySystem::HandleRegistryEvent(context::Context* ctx, const chain::Message& msg) {
  mq::RegistryEvent event;
  if (!event.ParseFromString(msg.payload())) {
    LOG(WARNING) << "Dropping undecodable registry event " << msg.sequence() << " from " << msg.sender();
    return;
  }
  COUNTER(system, registry_events)->Increment();
  if (event.worker_pubkey() != identity_->PublicKeyString()) return;
  LOG(INFO) << "Worker " << util::PrefixToHex(event.worker_pubkey(), 8)
            << (event.registered() ? " registered" : " unregistered");
  info_.set_registered(event.registered());
}

void RegistrySystem::HandleHeartbeat(context::Context* ctx, const chain::Message& msg) {
  if (send_mq_ == nullptr) return;
  send_mq_->Enqueue(ctx, identity_->PublicKeyString(), kHeartbeatResponseTopic, msg.payload(), *identity_);
  COUNTER(system, heartbeats_answered)->Increment();
}

error::Error RegistrySystem::Restore(const std::string& state) {
  SystemInfo info;
  if (!info.ParseFromString(state)) {
    return COUNTED_ERROR(Decode_SystemState);
  }
  info_ = info;
  return error::OK;
}

std::unique_ptr<System> NewRegistrySystem(const Params& params) {
  return std::make_unique<RegistrySystem>(params);
}

}  // namespace ocw::system
