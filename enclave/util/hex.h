// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_UTIL_HEX_H__
#define __OCW_UTIL_HEX_H__

#include <stdint.h>
#include <algorithm>
#include <string>

namespace ocw::util {

std::string BytesToHex(const uint8_t* in, size_t size);

// Turns the `s`-byte prefix of `in` into `s*2` hex characters and returns it as a string.
template <class T>
std::string PrefixToHex(const T& in, size_t s) {
  return BytesToHex(reinterpret_cast<const uint8_t*>(in.data()), std::min(s, in.size()));
}

// Turns the bytes of `in` into `in.size()*2` hex characters and returns it as a string.
template <class T>
std::string ToHex(const T& in) {
  return PrefixToHex(in, in.size());
}

}  // namespace ocw::util

#endif  // __OCW_UTIL_HEX_H__
