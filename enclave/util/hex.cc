// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "util/hex.h"

namespace ocw::util {

std::string BytesToHex(const uint8_t* in, size_t size) {
  static const char* nibbles = "0123456789abcdef";
  std::string out(size * 2, ' ');
  for (size_t i = 0; i < size; i++) {
    out[i*2+0] = nibbles[(in[i] & 0xf0) >> 4];
    out[i*2+1] = nibbles[(in[i] & 0x0f) >> 0];
  }
  return out;
}

}  // namespace ocw::util
