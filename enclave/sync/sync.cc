// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "sync/sync.h"

#include <set>

#include "identity/identity.h"
#include "metrics/metrics.h"
#include "util/constant.h"
#include "util/endian.h"
#include "util/hex.h"
#include "util/log.h"

namespace ocw::sync {

std::string HeaderHash(const chain::Header& header) {
  std::string encoded;
  util::AppendBigEndian64(header.number(), &encoded);
  util::AppendLengthPrefixed(header.parent_hash(), &encoded);
  util::AppendLengthPrefixed(header.state_root(), &encoded);
  util::AppendLengthPrefixed(header.extrinsics_root(), &encoded);
  return sha::Blake2b256String(encoded);
}

std::string JustificationPayload(const chain::Header& header, uint64_t set_id) {
  std::string out("ocw:justification:");
  util::AppendBigEndian64(set_id, &out);
  out.append(HeaderHash(header));
  return out;
}

Synchronizer::Synchronizer()
    : state_(chain::SYNC_STATE_UNINITIALIZED),
      has_last_header_(false),
      next_header_number_(0),
      next_block_number_(0) {}

error::Error Synchronizer::Init(const chain::Header& genesis, const chain::AuthoritySet& authority_set) {
  if (state_ != chain::SYNC_STATE_UNINITIALIZED) {
    return COUNTED_ERROR(Sync_AlreadyInitialized);
  }
  if (authority_set.authorities_size() == 0) {
    return COUNTED_ERROR(Sync_EmptyAuthoritySet);
  }
  authority_set_ = authority_set;
  last_header_ = genesis;
  has_last_header_ = true;
  next_header_number_ = genesis.number() + 1;
  next_block_number_ = genesis.number() + 1;
  state_ = chain::SYNC_STATE_SYNCING;
  UpdateGauges();
  return error::OK;
}

error::Error Synchronizer::VerifyJustification(
    const chain::Header& header,
    const chain::Justification& justification,
    const chain::AuthoritySet& authority_set) const {
  if (justification.authority_set_id() != authority_set.id()) {
    LOG(WARNING) << "Header " << header.number() << " justified by set "
                 << justification.authority_set_id() << ", current set is " << authority_set.id();
    return COUNTED_ERROR(Sync_UnknownAuthoritySet);
  }
  std::string payload = JustificationPayload(header, authority_set.id());
  std::set<uint32_t> signers;
  for (const auto& sig : justification.signatures()) {
    if (sig.authority_index() >= static_cast<uint32_t>(authority_set.authorities_size()) ||
        signers.count(sig.authority_index())) {
      continue;
    }
    if (identity::VerifySignature(authority_set.authorities(sig.authority_index()), payload, sig.signature())) {
      signers.insert(sig.authority_index());
    }
  }
  // Strictly more than two thirds of the set.
  if (signers.size() * 3 <= static_cast<size_t>(authority_set.authorities_size()) * 2) {
    LOG(WARNING) << "Header " << header.number() << " justified by only " << signers.size()
                 << " of " << authority_set.authorities_size() << " authorities";
    return COUNTED_ERROR(Sync_JustificationInvalid);
  }
  return error::OK;
}

std::pair<uint64_t, error::Error> Synchronizer::SyncHeader(
    context::Context* ctx,
    const google::protobuf::RepeatedPtrField<chain::HeaderToSync>& headers,
    const chain::AuthoritySetChange* authority_set_change) {
  MEASURE_CPU(ctx, cpu_sync_header);
  if (state_ == chain::SYNC_STATE_UNINITIALIZED) {
    return std::make_pair(0, COUNTED_ERROR(Sync_NotInitialized));
  }
  // Work on copies, committing only if the whole batch is good.
  chain::AuthoritySet authority_set = authority_set_;
  chain::Header last_header = last_header_;
  bool has_last_header = has_last_header_;
  uint64_t next_header_number = next_header_number_;
  std::vector<const chain::Header*> accepted;
  bool change_applied = false;
  size_t skipped = 0;

  for (const auto& to_sync : headers) {
    const chain::Header& header = to_sync.header();
    if (header.number() < next_header_number) {
      skipped++;
      continue;
    }
    if (header.number() != next_header_number) {
      LOG(WARNING) << "Header " << header.number() << " received, expected " << next_header_number;
      return std::make_pair(0, COUNTED_ERROR(Sync_HeaderNotContiguous));
    }
    if (has_last_header && !util::ConstantTimeEquals(header.parent_hash(), HeaderHash(last_header))) {
      LOG(WARNING) << "Header " << header.number() << " does not link to its parent";
      return std::make_pair(0, COUNTED_ERROR(Sync_ParentHashMismatch));
    }
    if (auto err = VerifyJustification(header, to_sync.justification(), authority_set); err != error::OK) {
      return std::make_pair(0, err);
    }
    if (authority_set_change != nullptr && authority_set_change->at_block() == header.number()) {
      const auto& next_set = authority_set_change->authority_set();
      if (next_set.id() != authority_set.id() + 1 || next_set.authorities_size() == 0) {
        LOG(WARNING) << "Authority set change at " << header.number() << " to set " << next_set.id()
                     << " does not follow set " << authority_set.id();
        return std::make_pair(0, COUNTED_ERROR(Sync_AuthoritySetChangeInvalid));
      }
      authority_set = next_set;
      change_applied = true;
    }
    accepted.push_back(&header);
    last_header = header;
    has_last_header = true;
    next_header_number++;
  }
  if (authority_set_change != nullptr && !change_applied &&
      authority_set_change->authority_set().id() > authority_set.id()) {
    // The change names a header outside this batch.  A change at an already
    // accepted header was applied back then, so its id is already current.
    LOG(WARNING) << "Authority set change at " << authority_set_change->at_block()
                 << " was not applied by this batch";
    return std::make_pair(0, COUNTED_ERROR(Sync_AuthoritySetChangeNotApplied));
  }

  for (auto h : accepted) {
    pending_headers_.push_back(*h);
  }
  if (change_applied) {
    LOG(INFO) << "Authority set changed to " << authority_set.id();
    COUNTER(sync, authority_set_changes)->Increment();
  }
  authority_set_ = std::move(authority_set);
  last_header_ = std::move(last_header);
  has_last_header_ = has_last_header;
  next_header_number_ = next_header_number;
  COUNTER(sync, headers_synced)->IncrementBy(accepted.size());
  COUNTER(sync, headers_skipped)->IncrementBy(skipped);
  UpdateGauges();
  return std::make_pair(next_header_number_ - 1, error::OK);
}

error::Error Synchronizer::FeedBlock(
    context::Context* ctx,
    const chain::BlockHeaderWithChanges& block,
    chainstorage::ChainStorage* storage,
    bool drop_proofs) {
  MEASURE_CPU(ctx, cpu_sync_feed_block);
  if (state_ == chain::SYNC_STATE_UNINITIALIZED) {
    return COUNTED_ERROR(Sync_NotInitialized);
  }
  const chain::Header& header = block.block_header();
  if (header.number() != next_block_number_) {
    LOG(WARNING) << "Block " << header.number() << " fed, expected " << next_block_number_;
    return COUNTED_ERROR(Sync_BlockNotContiguous);
  }
  if (header.number() >= next_header_number_ || pending_headers_.empty()) {
    LOG(WARNING) << "Block " << header.number() << " fed before its header was synced";
    return COUNTED_ERROR(Sync_BlockAheadOfHeaders);
  }
  const chain::Header& synced = pending_headers_.front();
  if (synced.number() != header.number() ||
      !util::ConstantTimeEquals(HeaderHash(synced), HeaderHash(header))) {
    LOG(WARNING) << "Block " << header.number() << " does not match its synced header";
    return COUNTED_ERROR(Sync_BlockHeaderMismatch);
  }
  chainstorage::Undo undo = storage->ApplyChanges(block.storage_changes());
  if (!drop_proofs) {
    chainstorage::Root root = storage->ComputeRoot();
    if (!util::ConstantTimeEquals(root, header.state_root())) {
      LOG(ERROR) << "State root mismatch at block " << header.number()
                 << ": computed " << util::ToHex(root) << ", header has " << util::ToHex(header.state_root());
      storage->Revert(std::move(undo));
      COUNTER(sync, blocks_rolled_back)->Increment();
      return COUNTED_ERROR(Storage_StateRootMismatch);
    }
    state_ = chain::SYNC_STATE_VALIDATED;
  }
  pending_headers_.pop_front();
  next_block_number_++;
  COUNTER(sync, blocks_fed)->Increment();
  UpdateGauges();
  return error::OK;
}

error::Error Synchronizer::AssumeAtBlock(uint64_t n) {
  if (state_ == chain::SYNC_STATE_UNINITIALIZED) {
    return COUNTED_ERROR(Sync_NotInitialized);
  }
  LOG(WARNING) << "Assuming chain state at block " << n;
  pending_headers_.clear();
  has_last_header_ = false;
  last_header_.Clear();
  next_header_number_ = n + 1;
  next_block_number_ = n + 1;
  state_ = chain::SYNC_STATE_SYNCING;
  COUNTER(sync, assumed_at_block)->Increment();
  UpdateGauges();
  return error::OK;
}

void Synchronizer::ToProto(chain::SynchronizerState* out) const {
  out->set_state(state_);
  *out->mutable_authority_set() = authority_set_;
  *out->mutable_last_header() = last_header_;
  out->set_has_last_header(has_last_header_);
  out->clear_pending_headers();
  for (const auto& h : pending_headers_) {
    *out->add_pending_headers() = h;
  }
  out->set_next_header_number(next_header_number_);
  out->set_next_block_number(next_block_number_);
}

error::Error Synchronizer::FromProto(const chain::SynchronizerState& in) {
  if (in.next_block_number() > in.next_header_number() ||
      in.next_header_number() - in.next_block_number() != static_cast<uint64_t>(in.pending_headers_size())) {
    return COUNTED_ERROR(Decode_Checkpoint);
  }
  state_ = in.state();
  authority_set_ = in.authority_set();
  last_header_ = in.last_header();
  has_last_header_ = in.has_last_header();
  pending_headers_.assign(in.pending_headers().begin(), in.pending_headers().end());
  next_header_number_ = in.next_header_number();
  next_block_number_ = in.next_block_number();
  UpdateGauges();
  return error::OK;
}

void Synchronizer::UpdateGauges() const {
  GAUGE(sync, next_header_number)->Set(next_header_number_);
  GAUGE(sync, next_block_number)->Set(next_block_number_);
  GAUGE(sync, authority_set_id)->Set(authority_set_.id());
}

}  // namespace ocw::sync
