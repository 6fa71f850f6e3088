// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#ifndef __OCW_MQ_MQ_H__
#define __OCW_MQ_MQ_H__

#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "context/context.h"
#include "identity/identity.h"
#include "proto/chain.pb.h"
#include "proto/mq.pb.h"
#include "util/macros.h"
#include "util/mutex.h"

namespace ocw::mq {

// The bytes signed for an outbound message.
std::string SignedContent(const chain::Message& message);

// SendQueue holds outbound messages per origin until the chain confirms
// them.  Each message is signed by the worker identity when enqueued.
class SendQueue {
 public:
  DELETE_COPY_AND_ASSIGN(SendQueue);
  SendQueue() {}

  // Appends a message from `origin`, returning its sequence.
  uint64_t Enqueue(
      context::Context* ctx,
      const std::string& origin,
      const std::string& destination,
      const std::string& payload,
      const identity::WorkerIdentity& signer) EXCLUDES(mu_);
  // Copies every pending channel into `out`, ordered by origin.
  void AllMessagesGrouped(context::Context* ctx, google::protobuf::RepeatedPtrField<SendChannel>* out) const EXCLUDES(mu_);
  size_t CountMessages(context::Context* ctx) const EXCLUDES(mu_);
  // Drops messages from `origin` with sequence below `next_sequence`.
  void Purge(context::Context* ctx, const std::string& origin, uint64_t next_sequence) EXCLUDES(mu_);
  // Purges every origin up to the sequence `next_sequence` returns for it.
  void PurgeConfirmed(context::Context* ctx, const std::function<uint64_t(const std::string&)>& next_sequence) EXCLUDES(mu_);

  void ToProto(context::Context* ctx, SendQueueState* out) const EXCLUDES(mu_);
  void FromProto(context::Context* ctx, const SendQueueState& in) EXCLUDES(mu_);

 private:
  struct Channel {
    uint64_t next_sequence = 0;
    std::deque<chain::SignedMessage> messages;
  };
  size_t PurgeLocked(Channel* channel, uint64_t next_sequence) REQUIRES(mu_);
  void UpdateGauges() const REQUIRES(mu_);

  mutable util::mutex mu_;
  std::map<std::string, Channel> channels_ GUARDED_BY(mu_);
};

// Dispatcher hands inbound messages to subscribers by destination topic.
// It's only used under the runtime guard, so it has no lock of its own.
class Dispatcher {
 public:
  typedef std::function<void(context::Context*, const chain::Message&)> Callback;

  DELETE_COPY_AND_ASSIGN(Dispatcher);
  Dispatcher() : unhandled_(0) {}

  void Subscribe(const std::string& topic, Callback cb);
  // Forgets the per-origin sequences seen so far, so a replayed stream
  // (after loading chain state out of band) is accepted again.
  void ResetLocalIndex() { next_sequence_.clear(); }

  // Delivers `message` to each subscriber of its destination, returning the
  // number of deliveries.  A message whose sequence is below the next one
  // expected from its sender is dropped.
  size_t Dispatch(context::Context* ctx, const chain::Message& message);
  // Returns the number of messages no one subscribed to since the last call.
  size_t Clear();

  void ToProto(DispatcherState* out) const;
  void FromProto(const DispatcherState& in);

 private:
  std::multimap<std::string, Callback> subscribers_;
  std::map<std::string, uint64_t> next_sequence_;
  size_t unhandled_;
};

}  // namespace ocw::mq

#endif  // __OCW_MQ_MQ_H__
