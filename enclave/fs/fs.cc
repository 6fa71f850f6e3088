// Copyright 2024 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "fs/fs.h"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <stdlib.h>
#include <string.h>
#include <fts.h>

#include "metrics/metrics.h"
#include "util/log.h"
#include "env/env.h"
#include "util/hex.h"

namespace ocw::fs {

std::pair<std::string, error::Error> FileContents(const std::string& filename) {
  int fd = open(filename.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno == ENOENT) {
      return std::make_pair("", COUNTED_ERROR(FS_FileNotFound));
    }
    LOG(ERROR) << "Opening file '" << filename << "' for read: " << strerror(errno);
    return std::make_pair("", COUNTED_ERROR(FS_OpenFile));
  }
  char buf[4096];
  ssize_t ret = -1;
  std::string out;
  while (0 < (ret = read(fd, buf, sizeof(buf)))) {
    out.append(buf, static_cast<size_t>(ret));
  }
  if (ret < 0) {
    LOG(ERROR) << "Reading file '" << filename << "': " << strerror(errno);
    close(fd);
    return std::make_pair("", COUNTED_ERROR(FS_OpenFile));
  }
  close(fd);
  return std::make_pair(std::move(out), error::OK);
}

error::Error WriteFileAtomic(const std::string& filename, const std::string& contents) {
  std::string tmp = filename + ".tmp";
  int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) {
    LOG(ERROR) << "Opening file '" << tmp << "' for write: " << strerror(errno);
    return COUNTED_ERROR(FS_OpenFile);
  }
  size_t written = 0;
  while (written < contents.size()) {
    ssize_t ret = write(fd, contents.data() + written, contents.size() - written);
    if (ret < 0) {
      if (errno == EINTR) continue;
      LOG(ERROR) << "Writing file '" << tmp << "': " << strerror(errno);
      close(fd);
      unlink(tmp.c_str());
      return COUNTED_ERROR(FS_WriteFile);
    }
    written += static_cast<size_t>(ret);
  }
  if (fsync(fd) != 0) {
    LOG(ERROR) << "Syncing file '" << tmp << "': " << strerror(errno);
    close(fd);
    unlink(tmp.c_str());
    return COUNTED_ERROR(FS_WriteFile);
  }
  close(fd);
  if (rename(tmp.c_str(), filename.c_str()) != 0) {
    LOG(ERROR) << "Renaming '" << tmp << "' to '" << filename << "': " << strerror(errno);
    unlink(tmp.c_str());
    return COUNTED_ERROR(FS_Rename);
  }
  return error::OK;
}

error::Error MkdirAll(const std::string& dir) {
  if (dir.empty()) return error::OK;
  for (size_t pos = 1; pos <= dir.size(); pos++) {
    if (pos != dir.size() && dir[pos] != '/') continue;
    std::string prefix = dir.substr(0, pos);
    if (mkdir(prefix.c_str(), 0700) != 0 && errno != EEXIST) {
      LOG(ERROR) << "Making directory '" << prefix << "': " << strerror(errno);
      return COUNTED_ERROR(FS_Mkdir);
    }
  }
  return error::OK;
}

std::pair<std::vector<std::string>, error::Error> ListDir(const std::string& dir) {
  std::vector<std::string> out;
  DIR* d = opendir(dir.c_str());
  if (d == nullptr) {
    if (errno == ENOENT) {
      return std::make_pair(std::move(out), COUNTED_ERROR(FS_FileNotFound));
    }
    LOG(ERROR) << "Listing directory '" << dir << "': " << strerror(errno);
    return std::make_pair(std::move(out), COUNTED_ERROR(FS_ListDir));
  }
  struct dirent* ent;
  while (nullptr != (ent = readdir(d))) {
    if (ent->d_type == DT_REG) {
      out.emplace_back(ent->d_name);
    }
  }
  closedir(d);
  return std::make_pair(std::move(out), error::OK);
}

error::Error RemoveFile(const std::string& filename) {
  if (unlink(filename.c_str()) != 0 && errno != ENOENT) {
    LOG(ERROR) << "Removing '" << filename << "': " << strerror(errno);
    return COUNTED_ERROR(FS_RemoveFile);
  }
  return error::OK;
}

error::Error TmpDir::Init() {
  if (name_ != "") {
    return COUNTED_ERROR(FS_TmpDirAlreadyInitiated);
  }
  std::array<uint8_t, 8> bytes;
  RETURN_IF_ERROR(env::environment->RandomBytes(bytes.data(), bytes.size()));
  std::string name = "/tmp/ocw." + util::ToHex(bytes);
  if (int ret = mkdir(name.c_str(), 0700); ret != 0) {
    LOG(ERROR) << "Making temp directory failed: " << strerror(errno);
    return COUNTED_ERROR(FS_Mkdir);
  }
  LOG(DEBUG) << "New temp directory: " << name;
  name_ = name;
  return error::OK;
}

TmpDir::~TmpDir() {
  if (name_ == "") return;
  LOG(DEBUG) << "Recursively deleting directory " << name_;
  const char* files[] = {name_.c_str(), nullptr};
  FTS* fts = fts_open(const_cast<char *const *>(files), FTS_NOCHDIR | FTS_PHYSICAL | FTS_XDEV, NULL);
  if (!fts) {
    LOG(ERROR) << "Error recursively deleting '" << name_ << "'";
    return;
  }
  FTSENT* curr;
  while (nullptr != (curr = fts_read(fts))) {
    switch (curr->fts_info) {
      case FTS_D:  // directory, in pre-order
        break;
      case FTS_DP:  // directory, in post-order
      case FTS_F:   // normal file
        if (int ret = remove(curr->fts_accpath); ret != 0) {
          LOG(ERROR) << "Error deleting '" << curr->fts_accpath << "' in temp directory '" << name_ << "': " << strerror(errno);
        }
        break;
      default:
        LOG(ERROR) << "Unable to handle deletion of '" << curr->fts_accpath << "' in temp directory '" << name_ << "'";
    }
  }
  fts_close(fts);
}

}  // namespace ocw::fs
