// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "checkpoint/checkpoint.h"

#include <algorithm>
#include <stdlib.h>
#include <string.h>

#include "env/env.h"
#include "fs/fs.h"
#include "metrics/metrics.h"
#include "util/bytes.h"
#include "util/log.h"

namespace ocw::checkpoint {

static const char* kPrefix = "checkpoint.";

std::string CheckpointPath(const std::string& dir, uint64_t block_number) {
  return dir + "/" + kPrefix + std::to_string(block_number);
}

namespace {

// Parses "checkpoint.<digits>", returning false for anything else
// (including leftover ".tmp" files).
bool BlockFromName(const std::string& name, uint64_t* block) {
  const size_t prefix_len = strlen(kPrefix);
  if (name.size() <= prefix_len || name.compare(0, prefix_len, kPrefix) != 0) return false;
  const std::string digits = name.substr(prefix_len);
  if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) return false;
  *block = strtoull(digits.c_str(), nullptr, 10);
  return true;
}

}  // namespace

Checkpointer::Checkpointer(
    const std::string& dir,
    bool enabled,
    uint32_t interval_secs,
    uint32_t max_files,
    util::UnixSecs now)
    : dir_(dir),
      enabled_(enabled),
      interval_secs_(interval_secs),
      max_files_(max_files),
      last_(now) {}

bool Checkpointer::Due(util::UnixSecs now) const {
  return enabled_ && now >= last_ + static_cast<util::UnixSecs>(interval_secs_);
}

std::pair<std::vector<uint64_t>, error::Error> Checkpointer::List() const {
  std::vector<uint64_t> out;
  auto [names, err] = fs::ListDir(dir_);
  if (err != error::OK) {
    return std::make_pair(out, err);
  }
  for (const auto& name : names) {
    uint64_t block;
    if (BlockFromName(name, &block)) out.push_back(block);
  }
  std::sort(out.rbegin(), out.rend());
  return std::make_pair(out, error::OK);
}

error::Error Checkpointer::Write(context::Context* ctx, const Checkpoint& checkpoint, util::UnixSecs now) {
  MEASURE_CPU(ctx, cpu_checkpoint_write);
  RETURN_IF_ERROR(fs::MkdirAll(dir_));
  std::string plaintext = checkpoint.SerializeAsString();
  auto [sealed, err] = env::environment->Seal(ctx, plaintext);
  util::ZeroString(&plaintext);
  RETURN_IF_ERROR(err);
  RETURN_IF_ERROR(fs::WriteFileAtomic(CheckpointPath(dir_, checkpoint.block_number()), sealed));
  last_ = now;
  COUNTER(checkpoint, taken)->Increment();
  GAUGE(checkpoint, last_block)->Set(checkpoint.block_number());
  LOG(INFO) << "Checkpoint written at block " << checkpoint.block_number();
  return Prune();
}

error::Error Checkpointer::Prune() {
  auto [blocks, err] = List();
  RETURN_IF_ERROR(err);
  for (size_t i = max_files_; i < blocks.size(); i++) {
    RETURN_IF_ERROR(fs::RemoveFile(CheckpointPath(dir_, blocks[i])));
    COUNTER(checkpoint, pruned)->Increment();
    LOG(DEBUG) << "Pruned checkpoint " << blocks[i];
  }
  return error::OK;
}

std::pair<std::unique_ptr<Checkpoint>, error::Error> Checkpointer::LoadLatest(context::Context* ctx) const {
  MEASURE_CPU(ctx, cpu_checkpoint_load);
  auto [blocks, err] = List();
  if (err == error::FS_FileNotFound) {
    return std::make_pair(nullptr, COUNTED_ERROR(Checkpoint_NotFound));
  } else if (err != error::OK) {
    return std::make_pair(nullptr, err);
  }
  for (uint64_t block : blocks) {
    std::string path = CheckpointPath(dir_, block);
    auto [sealed, err] = fs::FileContents(path);
    if (err != error::OK) {
      LOG(WARNING) << "Skipping unreadable checkpoint " << path << ": " << err;
      COUNTER(checkpoint, unreadable)->Increment();
      continue;
    }
    auto [plaintext, unseal_err] = env::environment->Unseal(ctx, sealed);
    if (unseal_err != error::OK) {
      LOG(WARNING) << "Skipping checkpoint " << path << " that failed to unseal: " << unseal_err;
      COUNTER(checkpoint, unreadable)->Increment();
      continue;
    }
    auto out = std::make_unique<Checkpoint>();
    bool parsed = out->ParseFromString(plaintext);
    util::ZeroString(&plaintext);
    if (!parsed || out->block_number() != block) {
      LOG(WARNING) << "Skipping checkpoint " << path << " that failed to parse";
      COUNTER(checkpoint, unreadable)->Increment();
      continue;
    }
    COUNTER(checkpoint, loaded)->Increment();
    LOG(INFO) << "Loaded checkpoint at block " << block;
    return std::make_pair(std::move(out), error::OK);
  }
  return std::make_pair(nullptr, COUNTED_ERROR(Checkpoint_NotFound));
}

error::Error Checkpointer::RemoveAll() {
  auto [blocks, err] = List();
  if (err == error::FS_FileNotFound) return error::OK;
  RETURN_IF_ERROR(err);
  for (uint64_t block : blocks) {
    RETURN_IF_ERROR(fs::RemoveFile(CheckpointPath(dir_, block)));
  }
  LOG(INFO) << "Removed " << blocks.size() << " checkpoints";
  return error::OK;
}

}  // namespace ocw::checkpoint
