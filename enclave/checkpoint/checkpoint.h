// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_CHECKPOINT_CHECKPOINT_H__
#define __OCW_CHECKPOINT_CHECKPOINT_H__

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "context/context.h"
#include "proto/error.pb.h"
#include "proto/msgs.pb.h"
#include "util/macros.h"
#include "util/ticks.h"

namespace ocw::checkpoint {

// Path of the checkpoint of block `block_number` within `dir`.
std::string CheckpointPath(const std::string& dir, uint64_t block_number);

// Checkpointer persists sealed snapshots of the runtime in a directory, as
// files named "checkpoint.<block>", keeping the newest few.
class Checkpointer {
 public:
  DELETE_COPY_AND_ASSIGN(Checkpointer);
  Checkpointer(
      const std::string& dir,
      bool enabled,
      uint32_t interval_secs,
      uint32_t max_files,
      util::UnixSecs now);

  bool enabled() const { return enabled_; }
  // Whether the interval has elapsed since the last checkpoint (or since
  // construction).
  bool Due(util::UnixSecs now) const;

  // Seals `checkpoint`, writes it, and prunes older files.  Writes even when
  // disabled, which only stops Due from firing.
  error::Error Write(context::Context* ctx, const Checkpoint& checkpoint, util::UnixSecs now);

  // Returns the newest checkpoint that can be read and unsealed, or
  // Checkpoint_NotFound.  Unreadable files are skipped.
  std::pair<std::unique_ptr<Checkpoint>, error::Error> LoadLatest(context::Context* ctx) const;

  error::Error RemoveAll();

  // Block numbers of checkpoints on disk, newest first.
  std::pair<std::vector<uint64_t>, error::Error> List() const;

 private:
  error::Error Prune();

  const std::string dir_;
  const bool enabled_;
  const uint32_t interval_secs_;
  const uint32_t max_files_;
  util::UnixSecs last_;
};

}  // namespace ocw::checkpoint

#endif  // __OCW_CHECKPOINT_CHECKPOINT_H__
