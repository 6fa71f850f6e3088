// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_SYNC_SYNCTEST_TESTCHAIN_H__
#define __OCW_SYNC_SYNCTEST_TESTCHAIN_H__

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "chainstorage/chainstorage.h"
#include "identity/identity.h"
#include "proto/chain.pb.h"
#include "proto/msgs.pb.h"

namespace ocw::sync::test {

chain::StorageChange Put(const std::string& key, const std::string& value);
chain::StorageChange Del(const std::string& key);
std::string U64(uint64_t v);

/*
TestChain plays the part of the blockchain in tests.  It keeps a storage
mirror, produces blocks whose headers carry the mirror's state root, and
justifies headers with its own Ed25519 authority keys.  Every block sets
`:timestamp/now` to 6 seconds past the previous block, and inbound messages
last only for the block that delivers them.
*/
class TestChain {
 public:
  explicit TestChain(int authorities = 4);

  // Storage entries present at genesis (block 0).
  void SetGenesisEntry(const std::string& key, const std::string& value);
  chain::GenesisBlockInfo GenesisInfo() const;
  chain::StorageState GenesisState() const;

  // Appends a block applying `changes` on top of the timestamp update, and
  // returns its number.
  uint64_t AddBlock(std::vector<chain::StorageChange> changes = {});
  // Appends a block delivering `messages` through the inbound queue.
  uint64_t AddBlockWithMessages(const std::vector<chain::Message>& messages,
                                std::vector<chain::StorageChange> changes = {});

  // Schedules an authority set change at block `at_block`; headers after it
  // are justified by the new set.  Call before adding `at_block`.
  chain::AuthoritySetChange ScheduleAuthorityChange(uint64_t at_block, int authorities = 4);

  uint64_t last_block() const { return headers_.size() - 1; }
  const chain::Header& header(uint64_t n) const { return headers_[n]; }
  uint64_t timestamp_millis(uint64_t n) const { return timestamps_[n]; }
  chain::BlockHeaderWithChanges Block(uint64_t n) const;

  // Justified headers [from, to].
  chain::HeadersToSync Headers(uint64_t from, uint64_t to) const;
  // Blocks [from, to].
  Blocks BlockRange(uint64_t from, uint64_t to) const;

  // Storage state as of block `n`.
  chain::StorageState StateAt(uint64_t n) const;

  // Justification for header `n` signed by only `signers` authorities.
  chain::Justification Justify(uint64_t n, int signers) const;

 private:
  struct AuthorityKeys {
    uint64_t id;
    std::vector<std::unique_ptr<identity::WorkerIdentity>> keys;
    chain::AuthoritySet set;
  };
  AuthorityKeys MakeAuthorities(uint64_t id, int n);
  const AuthorityKeys& AuthoritiesFor(uint64_t n) const;

  std::vector<AuthorityKeys> authority_sets_;
  // First block justified by authority_sets_[i].
  std::vector<uint64_t> set_starts_;
  std::map<uint64_t, chain::AuthoritySetChange> changes_;
  std::vector<chain::Header> headers_;
  std::vector<std::vector<chain::StorageChange>> block_changes_;
  std::vector<chain::StorageState> states_;
  std::vector<uint64_t> timestamps_;
  chainstorage::ChainStorage mirror_;
};

}  // namespace ocw::sync::test

#endif  // __OCW_SYNC_SYNCTEST_TESTCHAIN_H__
