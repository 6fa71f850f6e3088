// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_CHAINSTORAGE_CHAINSTORAGE_H__
#define __OCW_CHAINSTORAGE_CHAINSTORAGE_H__

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <google/protobuf/repeated_ptr_field.h>
#include "proto/chain.pb.h"
#include "proto/error.pb.h"
#include "sha/sha.h"
#include "util/macros.h"
#include "util/mutex.h"

namespace ocw::chainstorage {

typedef sha::Blake2b256Sum Root;

// Keys the worker reads from chain storage.
namespace keys {
extern const char* kTimestampNow;
extern const char* kMqInbound;
std::string MqIngressSequence(const std::string& origin);
std::string BinAddedAt(const std::string& measurement_hash);
std::string RegisteredWorker(const std::string& pubkey);
}  // namespace keys

// Undo records the previous values of every key a change set touched, so
// the change set can be rolled back.
class Undo {
 public:
  Undo() {}
 private:
  friend class ChainStorage;
  std::vector<std::pair<std::string, std::optional<std::string>>> previous_;
};

// ChainStorage is the worker's view of selected on-chain storage: an ordered
// key/value map with a content root.
//
// The root is blake2b-256 over the concatenation, in key order, of each
// entry's length-prefixed key and length-prefixed value.  An empty storage
// has the root of the empty string.
class ChainStorage {
 public:
  DELETE_COPY_AND_ASSIGN(ChainStorage);
  ChainStorage() {}

  static std::unique_ptr<ChainStorage> FromPairs(const chain::StorageState& state);
  static Root ComputeRoot(const chain::StorageState& state);
  void ToState(chain::StorageState* state) const;

  // Applies writes and removals in order, returning what's needed to undo them.
  Undo ApplyChanges(const google::protobuf::RepeatedPtrField<chain::StorageChange>& changes);
  void Revert(Undo&& undo);

  Root ComputeRoot() const;
  std::optional<std::string> Get(const std::string& key) const;
  size_t size() const { return kv_.size(); }

  // Milliseconds since epoch of the last applied block, 0 if unknown.
  uint64_t TimestampNowMillis() const;
  // Inbound messages queued for the worker by the last applied block.
  std::pair<chain::MessageList, error::Error> MqMessages() const;
  // Next outbound sequence the chain expects from `origin`.
  uint64_t MqNextSequence(const std::string& origin) const;
  // Block time (seconds) at which the binary with this measurement hash was
  // registered on chain.
  std::optional<uint64_t> BinAddedAt(const std::string& measurement_hash) const;
  bool IsWorkerRegistered(const std::string& pubkey) const;

  // Materializes entries from proof nodes, each a serialized chain.KeyValue.
  // Either every node is loaded or none is.
  error::Error LoadProof(const std::vector<std::string>& nodes);

 private:
  std::map<std::string, std::string> kv_;
};

// SharedChainStorage is the chain storage handle held by the runtime and
// by status readers.  Writers (block application, proof loading, state
// replacement) take `mu` exclusively; readers take it shared.
struct SharedChainStorage {
  SharedChainStorage() : storage(new ChainStorage()) {}
  explicit SharedChainStorage(std::unique_ptr<ChainStorage> s) : storage(std::move(s)) {}
  mutable util::shared_mutex mu;
  std::unique_ptr<ChainStorage> storage GUARDED_BY(mu);
};

}  // namespace ocw::chainstorage

#endif  // __OCW_CHAINSTORAGE_CHAINSTORAGE_H__
