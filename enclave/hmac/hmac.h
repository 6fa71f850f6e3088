// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_HMAC_HMAC_H__
#define __OCW_HMAC_HMAC_H__

#include <stddef.h>
#include <stdint.h>
#include <array>
#include "sha/sha.h"

namespace ocw::hmac {

typedef std::array<uint8_t, 32> HmacSha256Key;

sha::Sha256Sum HmacSha256(const HmacSha256Key& key, const uint8_t* data_start, size_t data_size);

// Derives a labelled 32-byte symmetric key from a shared secret, as
// HMAC-SHA256(secret, label).  The caller zeroes `*out` when done.
void DeriveKey(const HmacSha256Key& secret, const char* label, HmacSha256Key* out);

}  // namespace ocw::hmac

#endif  // __OCW_HMAC_HMAC_H__
