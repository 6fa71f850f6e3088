// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_UTIL_MUTEX_H__
#define __OCW_UTIL_MUTEX_H__

#include <mutex>
#include <shared_mutex>
#include "util/threadsafetyannotations.h"
#include "util/macros.h"

namespace ocw::util {

// Wrappers around std::mutex and std::shared_mutex carrying Clang thread
// safety annotations, so lock discipline is checked statically.

class CAPABILITY("mutex") mutex {
 public:
  DELETE_COPY_AND_ASSIGN(mutex);
  mutex() {}
  inline void lock() ACQUIRE() { mu_.lock(); }
  inline void unlock() RELEASE() { mu_.unlock(); }
  inline bool try_lock() TRY_ACQUIRE(true) { return mu_.try_lock(); }

 private:
  std::mutex mu_;
};

class CAPABILITY("shared_mutex") shared_mutex {
 public:
  DELETE_COPY_AND_ASSIGN(shared_mutex);
  shared_mutex() {}
  inline void lock() ACQUIRE() { mu_.lock(); }
  inline void unlock() RELEASE() { mu_.unlock(); }
  inline void lock_shared() ACQUIRE_SHARED() { mu_.lock_shared(); }
  inline void unlock_shared() RELEASE_SHARED() { mu_.unlock_shared(); }

 private:
  std::shared_mutex mu_;
};

template <class T>
class SCOPED_CAPABILITY unique_lock {
 public:
  DELETE_COPY_AND_ASSIGN(unique_lock);
  unique_lock(T& mu) ACQUIRE(mu) : mu_(mu), locked_(true) { mu_.lock(); }
  unique_lock(T& mu, std::defer_lock_t d) EXCLUDES(mu) : mu_(mu), locked_(false) {}
  ~unique_lock() RELEASE() { if (locked_) mu_.unlock(); }
  inline void lock() ACQUIRE() { mu_.lock(); locked_ = true; }
  inline void unlock() RELEASE() { mu_.unlock(); locked_ = false; }

 private:
  T& mu_;
  bool locked_;
};

// Holds a shared_mutex in reader mode for its lifetime.
class SCOPED_CAPABILITY shared_lock {
 public:
  DELETE_COPY_AND_ASSIGN(shared_lock);
  shared_lock(shared_mutex& mu) ACQUIRE_SHARED(mu) : mu_(mu) { mu_.lock_shared(); }
  ~shared_lock() RELEASE() { mu_.unlock_shared(); }

 private:
  shared_mutex& mu_;
};

}  // namespace ocw::util

#endif  // __OCW_UTIL_MUTEX_H__
