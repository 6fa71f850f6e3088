// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_UTIL_TICKS_H__
#define __OCW_UTIL_TICKS_H__

#include <stdint.h>
#include <time.h>

namespace ocw::util {

typedef time_t UnixSecs;

// Milliseconds on the monotonic clock.  Only differences are meaningful.
inline uint64_t MonotonicMillis() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1000 + static_cast<uint64_t>(ts.tv_nsec) / 1000000;
}

}  // namespace ocw::util

#endif  // __OCW_UTIL_TICKS_H__
