// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_SYNC_SYNC_H__
#define __OCW_SYNC_SYNC_H__

#include <deque>
#include <string>
#include <utility>
#include "chainstorage/chainstorage.h"
#include "context/context.h"
#include "proto/chain.pb.h"
#include "proto/error.pb.h"
#include "sha/sha.h"
#include "util/macros.h"

namespace ocw::sync {

// Hash identifying a header: blake2b-256 over its number (8 bytes
// big-endian) followed by the length-prefixed parent hash, state root and
// extrinsics root.
std::string HeaderHash(const chain::Header& header);

// The bytes each authority signs to justify `header` under set `set_id`.
std::string JustificationPayload(const chain::Header& header, uint64_t set_id);

struct Counters {
  uint64_t next_header_number;
  uint64_t next_block_number;
};

// Synchronizer is a light client for the chain.  It follows finalized
// headers, checking each is linked to its predecessor and justified by the
// current authority set, then applies the storage changes of blocks whose
// headers it has accepted, checking each block's resulting state root.
//
// next_block_number <= next_header_number always holds: blocks are applied
// only once their header is known.
class Synchronizer {
 public:
  DELETE_COPY_AND_ASSIGN(Synchronizer);
  Synchronizer();

  // Starts tracking from `genesis`, justified by `authority_set`.
  error::Error Init(const chain::Header& genesis, const chain::AuthoritySet& authority_set);

  // Accepts a batch of justified headers, returning the number of the last
  // known header.  Headers already accepted are skipped.  If
  // `authority_set_change` is non-null, it's applied once its header is
  // accepted.  On any error, nothing changes.
  std::pair<uint64_t, error::Error> SyncHeader(
      context::Context* ctx,
      const google::protobuf::RepeatedPtrField<chain::HeaderToSync>& headers,
      const chain::AuthoritySetChange* authority_set_change);

  // Applies the next block's storage changes to `storage`.  Unless
  // `drop_proofs`, the resulting root must match the header's state root;
  // if not, the changes are rolled back.
  error::Error FeedBlock(
      context::Context* ctx,
      const chain::BlockHeaderWithChanges& block,
      chainstorage::ChainStorage* storage,
      bool drop_proofs);

  // Jumps to a storage state obtained out of band at block `n`.  The next
  // accepted header is `n + 1`, with no parent check.
  error::Error AssumeAtBlock(uint64_t n);

  Counters counters() const { return Counters{next_header_number_, next_block_number_}; }
  chain::SyncState state() const { return state_; }
  bool StateValidated() const { return state_ == chain::SYNC_STATE_VALIDATED; }
  const chain::AuthoritySet& authority_set() const { return authority_set_; }

  void ToProto(chain::SynchronizerState* out) const;
  error::Error FromProto(const chain::SynchronizerState& in);

 private:
  error::Error VerifyJustification(
      const chain::Header& header,
      const chain::Justification& justification,
      const chain::AuthoritySet& authority_set) const;
  void UpdateGauges() const;

  chain::SyncState state_;
  chain::AuthoritySet authority_set_;
  // Last accepted header, if any; its hash is the next header's parent.
  chain::Header last_header_;
  bool has_last_header_;
  // Accepted headers whose blocks have not been applied yet.
  std::deque<chain::Header> pending_headers_;
  uint64_t next_header_number_;
  uint64_t next_block_number_;
};

}  // namespace ocw::sync

#endif  // __OCW_SYNC_SYNC_H__
