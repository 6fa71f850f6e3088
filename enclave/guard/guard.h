// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_GUARD_GUARD_H__
#define __OCW_GUARD_GUARD_H__

#include <atomic>
#include <memory>
#include <utility>
#include "context/context.h"
#include "metrics/metrics.h"
#include "proto/error.pb.h"
#include "util/log.h"
#include "util/macros.h"
#include "util/mutex.h"
#include "util/ticks.h"

namespace ocw::guard {

template <class T> class SafeBox;

// StateReplacement marks a state rebuild in progress for its lifetime.
// While any exist, guards not allowing pending state are refused.
class StateReplacement {
 public:
  DELETE_COPY_AND_ASSIGN(StateReplacement);
  explicit StateReplacement(std::atomic<int>* pending);
  ~StateReplacement();

 private:
  std::atomic<int>* pending_;
};

// Guard grants exclusive access to the value in a SafeBox until it's
// destroyed or released.  A default-constructed Guard holds nothing.
template <class T>
class Guard {
 public:
  Guard() : box_(nullptr), acquired_millis_(0) {}
  Guard(Guard&& other) : box_(other.box_), acquired_millis_(other.acquired_millis_) { other.box_ = nullptr; }
  Guard& operator=(Guard&& other) {
    if (this != &other) {
      Release();
      box_ = other.box_;
      acquired_millis_ = other.acquired_millis_;
      other.box_ = nullptr;
    }
    return *this;
  }
  Guard(const Guard&) = delete;
  Guard& operator=(const Guard&) = delete;
  ~Guard() { Release(); }

  T* get() const { return box_->value_.get(); }
  T* operator->() const { return get(); }
  T& operator*() const { return *get(); }
  explicit operator bool() const { return box_ != nullptr; }

  void Release() NO_THREAD_SAFETY_ANALYSIS {
    if (box_ == nullptr) return;
    int64_t held = static_cast<int64_t>(util::MonotonicMillis() - acquired_millis_);
    SafeBox<T>* box = box_;
    box_ = nullptr;
    box->mu_.unlock();
    LOG(DEBUG) << "Guard released after " << held << "ms";
    if (held > box->warn_millis_) {
      LOG(WARNING) << "Guard held for " << held << "ms";
      COUNTER(guard, slow_release)->Increment();
    }
  }

 private:
  friend class SafeBox<T>;
  explicit Guard(SafeBox<T>* box) : box_(box), acquired_millis_(util::MonotonicMillis()) {}

  SafeBox<T>* box_;
  uint64_t acquired_millis_;
};

// SafeBox owns a value that only one caller at a time may touch, through a
// Guard.  Callers state whether they may proceed while the box is in safe
// mode, or while its state is being replaced.
template <class T>
class SafeBox {
 public:
  DELETE_COPY_AND_ASSIGN(SafeBox);
  SafeBox(std::unique_ptr<T> value, uint32_t safe_mode_level, int64_t warn_millis)
      : value_(std::move(value)), pending_(0), safe_mode_level_(safe_mode_level), warn_millis_(warn_millis) {}

  std::pair<Guard<T>, error::Error> Lock(
      context::Context* ctx,
      bool allow_while_state_pending,
      bool allow_while_safe_mode) NO_THREAD_SAFETY_ANALYSIS {
    if (!allow_while_safe_mode && safe_mode_level_.load() > 0) {
      COUNTER(guard, refused_safe_mode)->Increment();
      return std::make_pair(Guard<T>(), COUNTED_ERROR(Lock_SafeMode));
    }
    {
      MEASURE_CPU(ctx, lock_guard);
      mu_.lock();
    }
    Guard<T> guard(this);
    if (!allow_while_state_pending && pending_.load() > 0) {
      guard.Release();
      COUNTER(guard, refused_state_pending)->Increment();
      return std::make_pair(Guard<T>(), COUNTED_ERROR(Lock_StatePending));
    }
    COUNTER(guard, acquired)->Increment();
    return std::make_pair(std::move(guard), error::OK);
  }

  // Marks the state as being replaced until the returned marker is destroyed.
  std::unique_ptr<StateReplacement> BeginStateReplacement() {
    return std::make_unique<StateReplacement>(&pending_);
  }

  uint32_t safe_mode_level() const { return safe_mode_level_.load(); }
  void set_safe_mode_level(uint32_t level) { safe_mode_level_.store(level); }

 private:
  friend class Guard<T>;
  util::mutex mu_;
  std::unique_ptr<T> value_;
  std::atomic<int> pending_;
  std::atomic<uint32_t> safe_mode_level_;
  const int64_t warn_millis_;
};

}  // namespace ocw::guard

#endif  // __OCW_GUARD_GUARD_H__
