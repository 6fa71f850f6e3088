// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "sync/synctest/testchain.h"

#include "sync/sync.h"
#include "util/endian.h"
#include "util/macros.h"

namespace ocw::sync::test {

static const uint64_t kGenesisMillis = 1700000000000ULL;
static const uint64_t kBlockMillis = 6000;

chain::StorageChange Put(const std::string& key, const std::string& value) {
  chain::StorageChange c;
  c.set_key(key);
  c.set_value(value);
  return c;
}

chain::StorageChange Del(const std::string& key) {
  chain::StorageChange c;
  c.set_key(key);
  return c;
}

std::string U64(uint64_t v) {
  std::string out;
  util::AppendBigEndian64(v, &out);
  return out;
}

TestChain::TestChain(int authorities) {
  authority_sets_.push_back(MakeAuthorities(0, authorities));
  set_starts_.push_back(0);
  google::protobuf::RepeatedPtrField<chain::StorageChange> genesis;
  *genesis.Add() = Put(chainstorage::keys::kTimestampNow, U64(kGenesisMillis));
  mirror_.ApplyChanges(genesis);
  chain::Header h;
  h.set_number(0);
  h.set_parent_hash(std::string(32, '\0'));
  h.set_extrinsics_root(std::string(32, '\0'));
  auto root = mirror_.ComputeRoot();
  h.set_state_root(std::string(root.begin(), root.end()));
  headers_.push_back(h);
  block_changes_.emplace_back();
  chain::StorageState state;
  mirror_.ToState(&state);
  states_.push_back(state);
  timestamps_.push_back(kGenesisMillis);
}

TestChain::AuthorityKeys TestChain::MakeAuthorities(uint64_t id, int n) {
  AuthorityKeys out;
  out.id = id;
  out.set.set_id(id);
  for (int i = 0; i < n; i++) {
    auto [key, err] = identity::WorkerIdentity::Generate();
    CHECK(err == error::OK);
    out.set.add_authorities(key->PublicKeyString());
    out.keys.push_back(std::move(key));
  }
  return out;
}

const TestChain::AuthorityKeys& TestChain::AuthoritiesFor(uint64_t n) const {
  size_t i = 0;
  while (i + 1 < set_starts_.size() && set_starts_[i + 1] <= n) i++;
  return authority_sets_[i];
}

void TestChain::SetGenesisEntry(const std::string& key, const std::string& value) {
  CHECK(headers_.size() == 1);
  google::protobuf::RepeatedPtrField<chain::StorageChange> changes;
  *changes.Add() = Put(key, value);
  mirror_.ApplyChanges(changes);
  auto root = mirror_.ComputeRoot();
  headers_[0].set_state_root(std::string(root.begin(), root.end()));
  mirror_.ToState(&states_[0]);
}

chain::GenesisBlockInfo TestChain::GenesisInfo() const {
  chain::GenesisBlockInfo out;
  *out.mutable_block_header() = headers_[0];
  *out.mutable_authority_set() = authority_sets_[0].set;
  return out;
}

chain::StorageState TestChain::GenesisState() const {
  return states_[0];
}

uint64_t TestChain::AddBlock(std::vector<chain::StorageChange> changes) {
  uint64_t n = headers_.size();
  uint64_t ts = timestamps_.back() + kBlockMillis;
  if (mirror_.Get(chainstorage::keys::kMqInbound).has_value()) {
    changes.insert(changes.begin(), Del(chainstorage::keys::kMqInbound));
  }
  changes.insert(changes.begin(), Put(chainstorage::keys::kTimestampNow, U64(ts)));
  google::protobuf::RepeatedPtrField<chain::StorageChange> pb(changes.begin(), changes.end());
  mirror_.ApplyChanges(pb);
  chain::Header h;
  h.set_number(n);
  h.set_parent_hash(HeaderHash(headers_.back()));
  auto root = mirror_.ComputeRoot();
  h.set_state_root(std::string(root.begin(), root.end()));
  h.set_extrinsics_root(std::string(32, static_cast<char>(n & 0xff)));
  headers_.push_back(h);
  block_changes_.push_back(std::move(changes));
  chain::StorageState state;
  mirror_.ToState(&state);
  states_.push_back(std::move(state));
  timestamps_.push_back(ts);
  return n;
}

uint64_t TestChain::AddBlockWithMessages(
    const std::vector<chain::Message>& messages,
    std::vector<chain::StorageChange> changes) {
  chain::MessageList list;
  for (const auto& m : messages) {
    *list.add_messages() = m;
  }
  changes.push_back(Put(chainstorage::keys::kMqInbound, list.SerializeAsString()));
  return AddBlock(std::move(changes));
}

chain::AuthoritySetChange TestChain::ScheduleAuthorityChange(uint64_t at_block, int authorities) {
  CHECK(at_block >= headers_.size());
  uint64_t id = authority_sets_.back().id + 1;
  authority_sets_.push_back(MakeAuthorities(id, authorities));
  set_starts_.push_back(at_block + 1);
  chain::AuthoritySetChange change;
  change.set_at_block(at_block);
  *change.mutable_authority_set() = authority_sets_.back().set;
  changes_[at_block] = change;
  return change;
}

chain::Justification TestChain::Justify(uint64_t n, int signers) const {
  const AuthorityKeys& auth = AuthoritiesFor(n);
  chain::Justification out;
  out.set_authority_set_id(auth.id);
  std::string payload = JustificationPayload(headers_[n], auth.id);
  for (int i = 0; i < signers && i < static_cast<int>(auth.keys.size()); i++) {
    auto sig = out.add_signatures();
    sig->set_authority_index(i);
    sig->set_signature(auth.keys[i]->SignString(payload));
  }
  return out;
}

chain::HeadersToSync TestChain::Headers(uint64_t from, uint64_t to) const {
  chain::HeadersToSync out;
  for (uint64_t n = from; n <= to; n++) {
    auto h = out.add_headers();
    *h->mutable_header() = headers_[n];
    *h->mutable_justification() = Justify(n, AuthoritiesFor(n).keys.size());
    auto change = changes_.find(n);
    if (change != changes_.end()) {
      *out.mutable_authority_set_change() = change->second;
    }
  }
  return out;
}

chain::BlockHeaderWithChanges TestChain::Block(uint64_t n) const {
  chain::BlockHeaderWithChanges out;
  *out.mutable_block_header() = headers_[n];
  for (const auto& c : block_changes_[n]) {
    *out.add_storage_changes() = c;
  }
  return out;
}

Blocks TestChain::BlockRange(uint64_t from, uint64_t to) const {
  Blocks out;
  for (uint64_t n = from; n <= to; n++) {
    *out.add_blocks() = Block(n);
  }
  return out;
}

chain::StorageState TestChain::StateAt(uint64_t n) const {
  return states_[n];
}

}  // namespace ocw::sync::test
