// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "chainstorage/chainstorage.h"

#include <sodium/crypto_generichash_blake2b.h>

#include "metrics/metrics.h"
#include "util/endian.h"
#include "util/log.h"

namespace ocw::chainstorage {

namespace keys {
const char* kTimestampNow = ":timestamp/now";
const char* kMqInbound = ":mq/inbound";
std::string MqIngressSequence(const std::string& origin) {
  return ":mq/ingress_seq/" + origin;
}
std::string BinAddedAt(const std::string& measurement_hash) {
  return ":registry/bin_added_at/" + measurement_hash;
}
std::string RegisteredWorker(const std::string& pubkey) {
  return ":registry/worker/" + pubkey;
}
}  // namespace keys

namespace {

class RootHasher {
 public:
  RootHasher() {
    crypto_generichash_blake2b_init(&state_, nullptr, 0, crypto_generichash_blake2b_BYTES);
  }
  void Add(const std::string& key, const std::string& value) {
    std::string entry;
    util::AppendLengthPrefixed(key, &entry);
    util::AppendLengthPrefixed(value, &entry);
    crypto_generichash_blake2b_update(
        &state_, reinterpret_cast<const uint8_t*>(entry.data()), entry.size());
  }
  Root Final() {
    Root out;
    crypto_generichash_blake2b_final(&state_, out.data(), out.size());
    return out;
  }
 private:
  crypto_generichash_blake2b_state state_;
};

uint64_t DecodeU64(const std::optional<std::string>& v) {
  if (!v.has_value() || v->size() != 8) return 0;
  return util::BigEndian64FromBytes(v->data());
}

}  // namespace

std::unique_ptr<ChainStorage> ChainStorage::FromPairs(const chain::StorageState& state) {
  auto out = std::make_unique<ChainStorage>();
  for (const auto& kv : state.pairs()) {
    out->kv_[kv.key()] = kv.value();
  }
  GAUGE(chainstorage, entries)->Set(out->kv_.size());
  return out;
}

Root ChainStorage::ComputeRoot(const chain::StorageState& state) {
  // Later duplicates win, as in FromPairs.
  std::map<std::string, std::string> sorted;
  for (const auto& kv : state.pairs()) {
    sorted[kv.key()] = kv.value();
  }
  RootHasher h;
  for (const auto& [k, v] : sorted) {
    h.Add(k, v);
  }
  return h.Final();
}

void ChainStorage::ToState(chain::StorageState* state) const {
  state->clear_pairs();
  for (const auto& [k, v] : kv_) {
    auto kv = state->add_pairs();
    kv->set_key(k);
    kv->set_value(v);
  }
}

Undo ChainStorage::ApplyChanges(const google::protobuf::RepeatedPtrField<chain::StorageChange>& changes) {
  Undo undo;
  undo.previous_.reserve(changes.size());
  for (const auto& change : changes) {
    auto it = kv_.find(change.key());
    if (it == kv_.end()) {
      undo.previous_.emplace_back(change.key(), std::nullopt);
    } else {
      undo.previous_.emplace_back(change.key(), it->second);
    }
    if (change.has_value()) {
      kv_[change.key()] = change.value();
    } else if (it != kv_.end()) {
      kv_.erase(it);
    }
  }
  COUNTER(chainstorage, changes_applied)->IncrementBy(changes.size());
  GAUGE(chainstorage, entries)->Set(kv_.size());
  return undo;
}

void ChainStorage::Revert(Undo&& undo) {
  // Walk backwards so a key touched twice ends at its original value.
  for (auto it = undo.previous_.rbegin(); it != undo.previous_.rend(); ++it) {
    if (it->second.has_value()) {
      kv_[it->first] = std::move(*it->second);
    } else {
      kv_.erase(it->first);
    }
  }
  undo.previous_.clear();
  GAUGE(chainstorage, entries)->Set(kv_.size());
}

Root ChainStorage::ComputeRoot() const {
  RootHasher h;
  for (const auto& [k, v] : kv_) {
    h.Add(k, v);
  }
  return h.Final();
}

std::optional<std::string> ChainStorage::Get(const std::string& key) const {
  auto it = kv_.find(key);
  if (it == kv_.end()) return std::nullopt;
  return it->second;
}

uint64_t ChainStorage::TimestampNowMillis() const {
  return DecodeU64(Get(keys::kTimestampNow));
}

std::pair<chain::MessageList, error::Error> ChainStorage::MqMessages() const {
  chain::MessageList out;
  auto v = Get(keys::kMqInbound);
  if (!v.has_value()) {
    return std::make_pair(std::move(out), error::OK);
  }
  if (!out.ParseFromString(*v)) {
    return std::make_pair(chain::MessageList(), COUNTED_ERROR(Decode_MessageList));
  }
  return std::make_pair(std::move(out), error::OK);
}

uint64_t ChainStorage::MqNextSequence(const std::string& origin) const {
  return DecodeU64(Get(keys::MqIngressSequence(origin)));
}

std::optional<uint64_t> ChainStorage::BinAddedAt(const std::string& measurement_hash) const {
  auto v = Get(keys::BinAddedAt(measurement_hash));
  if (!v.has_value() || v->size() != 8) return std::nullopt;
  return util::BigEndian64FromBytes(v->data());
}

bool ChainStorage::IsWorkerRegistered(const std::string& pubkey) const {
  return Get(keys::RegisteredWorker(pubkey)).has_value();
}

error::Error ChainStorage::LoadProof(const std::vector<std::string>& nodes) {
  std::vector<chain::KeyValue> parsed(nodes.size());
  for (size_t i = 0; i < nodes.size(); i++) {
    if (!parsed[i].ParseFromString(nodes[i])) {
      LOG(WARNING) << "Unable to decode storage proof node " << i;
      return COUNTED_ERROR(Decode_StorageProofNode);
    }
  }
  for (auto& kv : parsed) {
    kv_[kv.key()] = std::move(*kv.mutable_value());
  }
  COUNTER(chainstorage, proof_nodes_loaded)->IncrementBy(nodes.size());
  GAUGE(chainstorage, entries)->Set(kv_.size());
  return error::OK;
}

}  // namespace ocw::chainstorage
