// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_CONTEXT_CONTEXT_H__
#define __OCW_CONTEXT_CONTEXT_H__

#include <google/protobuf/arena.h>

#include "util/macros.h"
#include "metrics/metrics.h"
#include "util/mutex.h"

namespace ocw::context {

class Context;

// Class CPUMeasurement counts CPU ticks spent in a section of code.  On
// creation it records the current tick count, and on destruction it adds the
// elapsed ticks to a counter.  Nested measurements pause their parent, so
// ticks are never double-counted.  Create them through MEASURE_CPU.
//
// Usage:
//
//   void Foo(ctx) {
//     MEASURE_CPU(ctx, cpu_foo);
//     ... stuff #1 ...
//     Bar(ctx)
//     ... stuff #2 ...
//   }
//   void Bar(ctx) {
//     MEASURE_CPU(ctx, cpu_bar);
//     ... stuff #3 ...
//   }
//
// COUNTER(context, cpu_foo) receives stuff #1 and #2, and
// COUNTER(context, cpu_bar) receives stuff #3.
class CPUMeasurement {
 public:
  ~CPUMeasurement();
 private:
  friend class Context;
  CPUMeasurement(Context* ctx, metrics::Counter* counter);
  void SetContext(Context* ctx);

  Context* ctx_;
  metrics::Counter* counter_;
  CPUMeasurement* parent_;
  uint64_t ticks_;
};

// Context is created once per request and passed down through every call
// that handles it.
class Context {
 public:
  DELETE_COPY_AND_ASSIGN(Context);
  Context();

  // Protobuf<T> creates a protobuf whose lifetime is tied to this Context,
  // allocated on a protobuf Arena.  Never store the returned pointer in an
  // object that outlives the Context.
  template <class T>
  T* Protobuf() {
    return google::protobuf::Arena::CreateMessage<T>(&arena_);
  }

  CPUMeasurement MeasureCPU(metrics::Counter* counter);

 private:
  friend class CPUMeasurement;
  google::protobuf::Arena arena_;
  CPUMeasurement* cpu_current_;
  CPUMeasurement cpu_top_;
};

}  // namespace ocw::context

#define MEASURE_CPU(ctx, name) MEASURE_CPU_CTR1(ctx, name, __COUNTER__)
#define MEASURE_CPU_CTR1(ctx, name, ctr) MEASURE_CPU_CTR2(ctx, name, ctr)
#define MEASURE_CPU_CTR2(ctx, name, ctr) \
    ::ocw::context::CPUMeasurement __cpumeasure_ ## ctr = (ctx)->MeasureCPU(COUNTER(context, name))
#define IGNORE_CPU(ctx) IGNORE_CPU_CTR1(ctx, __COUNTER__)
#define IGNORE_CPU_CTR1(ctx, ctr) IGNORE_CPU_CTR2(ctx, ctr)
#define IGNORE_CPU_CTR2(ctx, ctr) \
    ::ocw::context::CPUMeasurement __cpuignore_ ## ctr = (ctx)->MeasureCPU(nullptr)

// Creates an RAII util::unique_lock named `lockname`, counting the time spent
// waiting for it in COUNTER(context, name).  Use this if you need to do
// things with the lock after you create it (e.g., explicitly calling
// `unlock()`).
#define ACQUIRE_NAMED_LOCK(lockname, mu, ctx, name) \
    ::ocw::util::unique_lock lockname(mu, std::defer_lock); \
    { \
      MEASURE_CPU(ctx, name); \
      lockname.lock(); \
    }
// Like ACQUIRE_NAMED_LOCK, with an arbitrary name, for when the lock is held
// until the end of the scope.
#define ACQUIRE_LOCK(mu, ctx, name) ACQUIRE_NAMED_LOCK(__lock_ ## __COUNTER__, mu, ctx, name)

#endif  // __OCW_CONTEXT_CONTEXT_H__
