// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_UTIL_ENDIAN_H__
#define __OCW_UTIL_ENDIAN_H__

#include <stdint.h>
#include <string>

namespace ocw::util {

inline uint64_t BigEndian64FromBytes(const uint8_t in[8]) {
  uint64_t out = 0;
  for (int i = 0; i < 8; i++) {
    out = (out << 8) | in[i];
  }
  return out;
}

inline uint64_t BigEndian64FromBytes(const char* in) {
  return BigEndian64FromBytes(reinterpret_cast<const uint8_t*>(in));
}

inline void BigEndian64Bytes(uint64_t v, uint8_t out[8]) {
  for (int i = 7; i >= 0; i--) {
    out[i] = v & 0xff;
    v >>= 8;
  }
}

// Appends the 8-byte big-endian encoding of `v` to `out`.
inline void AppendBigEndian64(uint64_t v, std::string* out) {
  uint8_t buf[8];
  BigEndian64Bytes(v, buf);
  out->append(reinterpret_cast<const char*>(buf), sizeof(buf));
}

// Appends `s` to `out`, preceded by its length as 8 big-endian bytes.
inline void AppendLengthPrefixed(const std::string& s, std::string* out) {
  AppendBigEndian64(s.size(), out);
  out->append(s);
}

}  // namespace ocw::util

#endif  // __OCW_UTIL_ENDIAN_H__
