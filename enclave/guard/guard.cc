// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "guard/guard.h"

namespace ocw::guard {

StateReplacement::StateReplacement(std::atomic<int>* pending) : pending_(pending) {
  pending_->fetch_add(1);
  COUNTER(guard, state_replacements)->Increment();
  LOG(INFO) << "State replacement started";
}

StateReplacement::~StateReplacement() {
  pending_->fetch_sub(1);
  LOG(INFO) << "State replacement finished";
}

}  // namespace ocw::guard
