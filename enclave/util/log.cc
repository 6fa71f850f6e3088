// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "util/log.h"
#include "env/env.h"
#include "util/macros.h"
#include <sys/time.h>
#include <stdlib.h>

namespace ocw::util {

::ocw::enclaveconfig::EnclaveLogLevel log_level_to_write = enclaveconfig::LOG_LEVEL_INFO;

std::hash<std::thread::id> thread_id_hasher;

Log::Log(::ocw::enclaveconfig::EnclaveLogLevel lvl) : lvl_(lvl) {}

Log::~Log() {
  env::environment->Log(lvl_, ss_.str());
  if (lvl_ == enclaveconfig::LOG_LEVEL_FATAL) {
    env::environment->FlushAllLogsIfAble();
    abort();
  }
}

void SetLogLevel(::ocw::enclaveconfig::EnclaveLogLevel level) {
  if (level == enclaveconfig::LOG_LEVEL_NONE) {
    // NONE would silence even FATAL; treat it as "only fatal".
    level = enclaveconfig::LOG_LEVEL_FATAL;
  }
  log_level_to_write = level;
}

uint64_t TimestampMicros() {
  struct timeval tv;
  if (0 != gettimeofday(&tv, NULL)) return -1;
  return tv.tv_usec + (1000000 * tv.tv_sec);
}

}  // namespace ocw::util

std::ostream& operator<<(std::ostream& os, ::ocw::error::Error err) {
  if (err == ::ocw::error::OK) {
    os << "OK";
  } else {
    os << "error::" << ::ocw::error::Error_Name(err);
  }
  return os;
}
