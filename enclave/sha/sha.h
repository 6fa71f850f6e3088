// Copyright 2024 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_SHA_SHA_H__
#define __OCW_SHA_SHA_H__

#include <stddef.h>
#include <stdint.h>
#include <array>
#include <string>

namespace ocw::sha {

typedef std::array<uint8_t, 32> Sha256Sum;
typedef std::array<uint8_t, 32> Blake2b256Sum;

Sha256Sum Sha256(
    const uint8_t* d1, size_t s1,
    const uint8_t* d2, size_t s2);

// Blake2b with a 32-byte digest, the chain's hash for headers, storage roots
// and attested payloads.
Blake2b256Sum Blake2b256(
    const uint8_t* d1, size_t s1,
    const uint8_t* d2, size_t s2);

template <class T1>
Sha256Sum Sha256(const T1& t1) {
  return Sha256(
      reinterpret_cast<const uint8_t*>(t1.data()), t1.size(),
      nullptr, 0);
}
template <class T1, class T2>
Sha256Sum Sha256(const T1& t1, const T2& t2) {
  return Sha256(
      reinterpret_cast<const uint8_t*>(t1.data()), t1.size(),
      reinterpret_cast<const uint8_t*>(t2.data()), t2.size());
}

template <class T1>
Blake2b256Sum Blake2b256(const T1& t1) {
  return Blake2b256(
      reinterpret_cast<const uint8_t*>(t1.data()), t1.size(),
      nullptr, 0);
}
template <class T1, class T2>
Blake2b256Sum Blake2b256(const T1& t1, const T2& t2) {
  return Blake2b256(
      reinterpret_cast<const uint8_t*>(t1.data()), t1.size(),
      reinterpret_cast<const uint8_t*>(t2.data()), t2.size());
}

// Blake2b256 of `t1`, returned as a 32-byte string.
template <class T1>
std::string Blake2b256String(const T1& t1) {
  Blake2b256Sum h = Blake2b256(t1);
  return std::string(reinterpret_cast<const char*>(h.data()), h.size());
}

}  // namespace ocw::sha

#endif  // __OCW_SHA_SHA_H__
