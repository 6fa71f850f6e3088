// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "context/context.h"
#include "metrics/metrics.h"

namespace ocw::context {

namespace {

// Current tick count of the executing CPU.
inline uint64_t CPUTicks() {
#if defined(__x86_64__) || defined(__i386__)
  uint64_t lo, hi;
  asm volatile("rdtsc" : "=a" (lo), "=d" (hi));
  return lo | (hi << 32);
#else
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL + ts.tv_nsec;
#endif
}

}  // namespace

Context::Context() : cpu_current_(nullptr), cpu_top_(nullptr, COUNTER(context, cpu_uncategorized)) {
  cpu_top_.SetContext(this);
}

CPUMeasurement::CPUMeasurement(Context* ctx, metrics::Counter* counter)
    : ctx_(nullptr), counter_(counter), parent_(nullptr), ticks_(CPUTicks()) {
  if (ctx != nullptr) {
    SetContext(ctx);
  }
}

CPUMeasurement::~CPUMeasurement() {
  uint64_t ticks = CPUTicks();
  if (counter_ != nullptr) {
    counter_->IncrementBy(ticks - ticks_);
  }
  if (parent_ != nullptr) {
    parent_->ticks_ = ticks;
  }
  if (ctx_ != nullptr) {
    ctx_->cpu_current_ = parent_;
  }
}

void CPUMeasurement::SetContext(Context* ctx) {
  CHECK(ctx_ == nullptr);
  ctx_ = ctx;
  parent_ = ctx_->cpu_current_;
  ctx_->cpu_current_ = this;
  if (parent_ != nullptr && parent_->counter_ != nullptr) {
    // Credit the parent with its ticks so far; our destructor moves its
    // start point forward past our own lifetime.
    parent_->counter_->IncrementBy(ticks_ - parent_->ticks_);
  }
}

CPUMeasurement Context::MeasureCPU(metrics::Counter* counter) {
  return CPUMeasurement(this, counter);
}

}  // namespace ocw::context
