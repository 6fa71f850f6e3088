// Copyright 2025 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "util/bytes.h"

namespace ocw::util {

void MemZeroS(void* data, size_t size) {
  volatile uint8_t *d = reinterpret_cast<volatile uint8_t *>(data);
  while (size > 0) {
    *d++ = 0;
    --size;
  }
  // An opaque statement the compiler must assume has side effects, so the
  // stores above cannot be elided.
  asm("");
}

void ZeroString(std::string* s) {
  if (!s->empty()) {
    MemZeroS(s->data(), s->size());
  }
  s->clear();
}

}  // namespace ocw::util
