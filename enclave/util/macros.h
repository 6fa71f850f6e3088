// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_UTIL_MACROS_H__
#define __OCW_UTIL_MACROS_H__

#include <stdlib.h>
#include "util/log.h"

// CHECK is reserved for programming invariants.  Anything a caller or the
// chain can trigger is returned as an error::Error instead.
#define CHECK(x) do { \
  if (!(x)) { \
    LOG(FATAL) << "CHECK FAIL: " << #x; \
    abort(); \
  } \
} while (0)

#define RETURN_IF_ERROR(x) do { \
  ::ocw::error::Error _err_ = (x); \
  if (_err_ != ::ocw::error::OK) return _err_; \
} while (0)

#define DELETE_COPY_AND_ASSIGN(x) \
  x(x& other) = delete; \
  void operator=(const x &) = delete

#endif  // __OCW_UTIL_MACROS_H__
