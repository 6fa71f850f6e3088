// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_UTIL_LOG_H__
#define __OCW_UTIL_LOG_H__

#include <ostream>
#include <sstream>
#include <thread>
#include "proto/error.pb.h"
#include "proto/enclaveconfig.pb.h"

std::ostream& operator<<(std::ostream& os, ::ocw::error::Error err);

namespace ocw::util {

// Log accumulates a single log line, handing it to the environment's log
// sink on destruction.  Use through the LOG(level) macro.
class Log {
 public:
  Log(::ocw::enclaveconfig::EnclaveLogLevel lvl);
  ~Log();

  template <class T>
  std::ostream& operator<<(T x) {
    ss_ << x;
    return ss_;
  }

 private:
  ::ocw::enclaveconfig::EnclaveLogLevel lvl_;
  std::stringstream ss_;
};

extern ::ocw::enclaveconfig::EnclaveLogLevel log_level_to_write;
extern std::hash<std::thread::id> thread_id_hasher;

void SetLogLevel(::ocw::enclaveconfig::EnclaveLogLevel level);

uint64_t TimestampMicros();

}  // namespace ocw::util

#define LOG(x) if (::ocw::enclaveconfig::LOG_LEVEL_##x <= ::ocw::util::log_level_to_write) ::ocw::util::Log(::ocw::enclaveconfig::LOG_LEVEL_##x) << #x << "\t" << __FILE__ << ":" << __LINE__ << "(" << __FUNCTION__ << ") @ " << ::ocw::util::TimestampMicros() << " T=" << (::ocw::util::thread_id_hasher(std::this_thread::get_id()) % 10000) << " - "

#endif  // __OCW_UTIL_LOG_H__
