// Copyright 2024 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_FS_FS_H__
#define __OCW_FS_FS_H__

#include <string>
#include <utility>
#include <vector>
#include "proto/error.pb.h"
#include "util/macros.h"

namespace ocw::fs {

// Returns FS_FileNotFound if `filename` does not exist.
std::pair<std::string, error::Error> FileContents(const std::string& filename);

// Writes `contents` to `filename` by writing a sibling temporary file,
// syncing it, then renaming it into place.  Readers see either the old
// file or the complete new one.
error::Error WriteFileAtomic(const std::string& filename, const std::string& contents);

// Creates `dir` and any missing parents.
error::Error MkdirAll(const std::string& dir);

// Names (not paths) of the regular files in `dir`.
std::pair<std::vector<std::string>, error::Error> ListDir(const std::string& dir);

// Removing a file that does not exist is not an error.
error::Error RemoveFile(const std::string& filename);

class TmpDir {
 public:
  DELETE_COPY_AND_ASSIGN(TmpDir);
  TmpDir() : name_("") {}
  TmpDir(TmpDir&& other) {
    name_ = other.name_;
    other.name_ = "";
  }
  ~TmpDir();
  error::Error Init();
  const std::string& name() const { return name_; }
 private:
  std::string name_;
};

}  // namespace ocw::fs

#endif  // __OCW_FS_FS_H__
