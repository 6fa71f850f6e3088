// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_QUEUE_QUEUE_H__
#define __OCW_QUEUE_QUEUE_H__

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include "util/macros.h"

namespace ocw::queue {

// Queue is a bounded multi-producer, multi-consumer queue.  Once closed,
// pushes are refused and pops drain what remains, then return nullopt.
template <class T>
class Queue {
 public:
  DELETE_COPY_AND_ASSIGN(Queue);
  explicit Queue(size_t max_size) : max_size_(max_size), popped_(0), closed_(false) {}

  // Blocks while full.  Returns false if the queue was closed.
  bool Push(T val) {
    std::unique_lock lock(mu_);
    notfull_.wait(lock, [this]{ return closed_ || d_.size() < max_size_; });
    if (closed_) return false;
    d_.emplace_back(std::move(val));
    lock.unlock();
    full_.notify_one();
    return true;
  }

  std::optional<T> Pop() {
    std::unique_lock lock(mu_);
    full_.wait(lock, [this]{ return closed_ || d_.size() > 0; });
    if (d_.empty()) return std::nullopt;
    T out = std::move(d_.front());
    d_.pop_front();
    popped_++;
    lock.unlock();
    notfull_.notify_all();
    return out;
  }

  void Close() {
    std::unique_lock lock(mu_);
    closed_ = true;
    lock.unlock();
    full_.notify_all();
    notfull_.notify_all();
  }

  size_t size() {
    std::unique_lock lock(mu_);
    return d_.size();
  }

  // Waits up to `millis` for everything currently queued to be popped.
  bool Flush(uint32_t millis) {
    std::unique_lock lock(mu_);
    auto wait_for = popped_ + d_.size();
    return notfull_.wait_for(lock, std::chrono::milliseconds(millis), [this, wait_for]{ return popped_ >= wait_for; });
  }

 private:
  std::mutex mu_;
  std::condition_variable full_;
  std::condition_variable notfull_;
  std::deque<T> d_;
  size_t max_size_;
  size_t popped_;
  bool closed_;
};

}  // namespace ocw::queue

#endif  // __OCW_QUEUE_QUEUE_H__
