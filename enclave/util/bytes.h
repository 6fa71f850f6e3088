// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_UTIL_BYTES_H__
#define __OCW_UTIL_BYTES_H__

#include <cstddef>
#include <cstdint>
#include <utility>
#include <string>
#include <array>
#include "util/macros.h"
#include "proto/error.pb.h"

namespace ocw::util {

template<size_t N>
std::string ByteArrayToString(const std::array<uint8_t, N>& bytes) {
  return std::string(reinterpret_cast<const char*>(bytes.data()), N);
}

// Copies `str` into a fixed-size array.  `str` must be exactly N bytes.
template<size_t N>
error::Error StringIntoByteArray(const std::string& str, std::array<uint8_t, N>* result) {
  if (str.size() != N) {
    return error::Util_ArraySizeMismatch;
  }
  std::copy(str.begin(), str.end(), result->begin());
  return error::OK;
}

template<size_t N>
std::pair<std::array<uint8_t, N>, error::Error> StringToByteArray(const std::string& str) {
  std::array<uint8_t, N> result{0};
  error::Error err = StringIntoByteArray(str, &result);
  return std::make_pair(result, err);
}

// Attempt to clear a section of memory to zeros in a way that should
// be difficult for compilers to ignore.
// We avoid inlining so the compiler can't then decide to remove certain
// parts of this function at the call site.
void MemZeroS(void* v, size_t s) __attribute__((noinline));

// Zeroes the contents of a string holding secret material, then empties it.
void ZeroString(std::string* s);

// Zeroes a string holding secret material when it goes out of scope.
class ZeroOnExit {
 public:
  DELETE_COPY_AND_ASSIGN(ZeroOnExit);
  explicit ZeroOnExit(std::string* s) : s_(s) {}
  ~ZeroOnExit() { ZeroString(s_); }

 private:
  std::string* s_;
};

// Holds a secret fixed-size value and zeroes it on destruction.
template <size_t N>
class SecretArray {
 public:
  DELETE_COPY_AND_ASSIGN(SecretArray);
  SecretArray() : data_{0} {}
  ~SecretArray() { MemZeroS(data_.data(), N); }
  uint8_t* data() { return data_.data(); }
  const uint8_t* data() const { return data_.data(); }
  constexpr size_t size() const { return N; }
  std::array<uint8_t, N>& array() { return data_; }
  const std::array<uint8_t, N>& array() const { return data_; }

 private:
  std::array<uint8_t, N> data_;
};

}  // namespace ocw::util

#endif  // __OCW_UTIL_BYTES_H__
