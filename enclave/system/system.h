// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_SYSTEM_SYSTEM_H__
#define __OCW_SYSTEM_SYSTEM_H__

#include <functional>
#include <memory>
#include <string>
#include "chainstorage/chainstorage.h"
#include "context/context.h"
#include "identity/identity.h"
#include "mq/mq.h"
#include "proto/error.pb.h"
#include "proto/msgs.pb.h"
#include "util/macros.h"

namespace ocw::system {

// Topic carrying mq::RegistryEvent messages.
extern const char* kRegistryTopic;
// Heartbeat challenges arrive on kHeartbeatTopic and are answered, with the
// same payload, on kHeartbeatResponseTopic.
extern const char* kHeartbeatTopic;
extern const char* kHeartbeatResponseTopic;

// Everything a System may touch while a block is processed.  Pointers are
// valid only for the duration of the call they're passed to.
struct BlockDispatchContext {
  uint64_t block_number;
  uint64_t now_ms;
  const chainstorage::ChainStorage* storage;
  mq::SendQueue* send_mq;
  mq::Dispatcher* recv_mq;
};

// Delivers the inbound messages of the block through `block.recv_mq`,
// returning how many there were.
std::pair<size_t, error::Error> DispatchInbound(context::Context* ctx, const BlockDispatchContext& block);

// System is the application logic driven by dispatched blocks.  Outside
// safe mode, the worker calls WillProcessBlock, ProcessMessages, then
// DidProcessBlock for each block it applies.
class System {
 public:
  DELETE_COPY_AND_ASSIGN(System);
  System() {}
  virtual ~System() {}

  virtual void WillProcessBlock(context::Context* ctx, const BlockDispatchContext& block) = 0;
  virtual error::Error ProcessMessages(context::Context* ctx, const BlockDispatchContext& block) = 0;
  virtual void DidProcessBlock(context::Context* ctx, const BlockDispatchContext& block) = 0;

  // Whether the chain has registered this worker.
  virtual bool IsRegistered() const = 0;
  // Time of the last processed block.
  virtual uint64_t NowMillis() const = 0;
  virtual void GetInfo(SystemInfo* info) const = 0;
  // Called when chain state is loaded out of band at `block`.
  virtual void SetGenesisBlock(uint64_t block) = 0;

  // Opaque state saved in and restored from checkpoints.
  virtual std::string Checkpoint() const = 0;
  virtual error::Error Restore(const std::string& state) = 0;
};

// What a System is built from.  `identity` and `recv_mq` outlive it.
struct Params {
  const identity::WorkerIdentity* identity;
  mq::Dispatcher* recv_mq;
  uint64_t genesis_block_number;
};

typedef std::function<std::unique_ptr<System>(const Params&)> Factory;

// RegistrySystem tracks this worker's on-chain registration and answers
// heartbeat challenges addressed to it.
class RegistrySystem : public System {
 public:
  DELETE_COPY_AND_ASSIGN(RegistrySystem);
  explicit RegistrySystem(const Params& params);
  virtual ~RegistrySystem() {}

  virtual void WillProcessBlock(context::Context* ctx, const BlockDispatchContext& block);
  virtual error::Error ProcessMessages(context::Context* ctx, const BlockDispatchContext& block);
  virtual void DidProcessBlock(context::Context* ctx, const BlockDispatchContext& block);
  virtual bool IsRegistered() const { return info_.registered(); }
  virtual uint64_t NowMillis() const { return info_.now_ms(); }
  virtual void GetInfo(SystemInfo* info) const { *info = info_; }
  virtual void SetGenesisBlock(uint64_t block) { info_.set_genesis_block(block); }
  virtual std::string Checkpoint() const { return info_.SerializeAsString(); }
  virtual error::Error Restore(const std::string& state);

 private:
  void HandleRegistryEvent(context::Context* ctx, const chain::Message& msg);
  void HandleHeartbeat(context::Context* ctx, const chain::Message& msg);

  const identity::WorkerIdentity* identity_;
  SystemInfo info_;
  // Send queue of the block being processed, while messages are dispatched.
  mq::SendQueue* send_mq_;
};

// Factory for RegistrySystem.
std::unique_ptr<System> NewRegistrySystem(const Params& params);

}  // namespace ocw::system

#endif  // __OCW_SYSTEM_SYSTEM_H__
