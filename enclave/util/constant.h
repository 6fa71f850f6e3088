// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_UTIL_CONSTANT_H__
#define __OCW_UTIL_CONSTANT_H__

#include <stddef.h>
#include <stdint.h>

namespace ocw::util {

static inline bool ConstantTimeEqualsBytes(const uint8_t* a, const uint8_t* b, size_t size) {
  uint8_t out = 0;
  while (size--) {
    out |= (*a++) ^ (*b++);
  }
  return out == 0;
}

// Compares two byte containers (std::array, std::string) without an
// early exit on the first differing byte.  Lengths are not secret.
template <class T1, class T2>
static bool ConstantTimeEquals(const T1& a, const T2& b) {
  if (a.size() != b.size()) return false;
  return ConstantTimeEqualsBytes(
      reinterpret_cast<const uint8_t*>(a.data()),
      reinterpret_cast<const uint8_t*>(b.data()),
      a.size());
}

}  // namespace ocw::util

#endif  // __OCW_UTIL_CONSTANT_H__
