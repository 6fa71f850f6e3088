// Copyright 2024 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "sha/sha.h"
#include <sodium/crypto_hash_sha256.h>
#include <sodium/crypto_generichash_blake2b.h>

namespace ocw::sha {

Sha256Sum Sha256(
    const uint8_t* d1, size_t s1,
    const uint8_t* d2, size_t s2) {
  Sha256Sum h;
  crypto_hash_sha256_state s;
  crypto_hash_sha256_init(&s);
  crypto_hash_sha256_update(&s, d1, s1);
  crypto_hash_sha256_update(&s, d2, s2);
  crypto_hash_sha256_final(&s, h.data());
  return h;
}

Blake2b256Sum Blake2b256(
    const uint8_t* d1, size_t s1,
    const uint8_t* d2, size_t s2) {
  Blake2b256Sum h;
  crypto_generichash_blake2b_state s;
  crypto_generichash_blake2b_init(&s, nullptr, 0, h.size());
  crypto_generichash_blake2b_update(&s, d1, s1);
  crypto_generichash_blake2b_update(&s, d2, s2);
  crypto_generichash_blake2b_final(&s, h.data(), h.size());
  return h;
}

}  // namespace ocw::sha
