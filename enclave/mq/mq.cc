// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

#include "mq/mq.h"

#include "metrics/metrics.h"
#include "util/endian.h"
#include "util/log.h"

namespace ocw::mq {

std::string SignedContent(const chain::Message& message) {
  std::string out("ocw:mq:");
  util::AppendLengthPrefixed(message.sender(), &out);
  util::AppendLengthPrefixed(message.destination(), &out);
  util::AppendLengthPrefixed(message.payload(), &out);
  util::AppendBigEndian64(message.sequence(), &out);
  return out;
}

uint64_t SendQueue::Enqueue(
    context::Context* ctx,
    const std::string& origin,
    const std::string& destination,
    const std::string& payload,
    const identity::WorkerIdentity& signer) {
  chain::SignedMessage signed_message;
  auto msg = signed_message.mutable_message();
  msg->set_sender(origin);
  msg->set_destination(destination);
  msg->set_payload(payload);

  ACQUIRE_LOCK(mu_, ctx, lock_send_queue);
  Channel& channel = channels_[origin];
  uint64_t seq = channel.next_sequence++;
  msg->set_sequence(seq);
  {
    MEASURE_CPU(ctx, cpu_mq_sign);
    signed_message.set_signature(signer.SignString(SignedContent(*msg)));
  }
  channel.messages.push_back(std::move(signed_message));
  COUNTER(mq, messages_enqueued)->Increment();
  UpdateGauges();
  LOG(VERBOSE) << "Enqueued message " << seq << " from " << origin << " to " << destination;
  return seq;
}

void SendQueue::AllMessagesGrouped(context::Context* ctx, google::protobuf::RepeatedPtrField<SendChannel>* out) const {
  ACQUIRE_LOCK(mu_, ctx, lock_send_queue);
  for (const auto& [origin, channel] : channels_) {
    if (channel.messages.empty()) continue;
    auto c = out->Add();
    c->set_origin(origin);
    c->set_next_sequence(channel.next_sequence);
    for (const auto& m : channel.messages) {
      *c->add_messages() = m;
    }
  }
}

size_t SendQueue::CountMessages(context::Context* ctx) const {
  ACQUIRE_LOCK(mu_, ctx, lock_send_queue);
  size_t n = 0;
  for (const auto& [origin, channel] : channels_) {
    n += channel.messages.size();
  }
  return n;
}

size_t SendQueue::PurgeLocked(Channel* channel, uint64_t next_sequence) {
  size_t purged = 0;
  while (!channel->messages.empty() && channel->messages.front().message().sequence() < next_sequence) {
    channel->messages.pop_front();
    purged++;
  }
  return purged;
}

void SendQueue::Purge(context::Context* ctx, const std::string& origin, uint64_t next_sequence) {
  ACQUIRE_LOCK(mu_, ctx, lock_send_queue);
  auto find = channels_.find(origin);
  if (find == channels_.end()) return;
  if (size_t purged = PurgeLocked(&find->second, next_sequence); purged) {
    LOG(DEBUG) << "Purged " << purged << " messages from " << origin << " below " << next_sequence;
    COUNTER(mq, messages_purged)->IncrementBy(purged);
    UpdateGauges();
  }
}

void SendQueue::PurgeConfirmed(context::Context* ctx, const std::function<uint64_t(const std::string&)>& next_sequence) {
  ACQUIRE_LOCK(mu_, ctx, lock_send_queue);
  size_t purged = 0;
  for (auto& [origin, channel] : channels_) {
    purged += PurgeLocked(&channel, next_sequence(origin));
  }
  if (purged) {
    COUNTER(mq, messages_purged)->IncrementBy(purged);
    UpdateGauges();
  }
}

void SendQueue::ToProto(context::Context* ctx, SendQueueState* out) const {
  ACQUIRE_LOCK(mu_, ctx, lock_send_queue);
  out->clear_channels();
  for (const auto& [origin, channel] : channels_) {
    auto c = out->add_channels();
    c->set_origin(origin);
    c->set_next_sequence(channel.next_sequence);
    for (const auto& m : channel.messages) {
      *c->add_messages() = m;
    }
  }
}

void SendQueue::FromProto(context::Context* ctx, const SendQueueState& in) {
  ACQUIRE_LOCK(mu_, ctx, lock_send_queue);
  channels_.clear();
  for (const auto& c : in.channels()) {
    Channel& channel = channels_[c.origin()];
    channel.next_sequence = c.next_sequence();
    channel.messages.assign(c.messages().begin(), c.messages().end());
  }
  UpdateGauges();
}

void SendQueue::UpdateGauges() const {
  size_t n = 0;
  for (const auto& [origin, channel] : channels_) {
    n += channel.messages.size();
  }
  GAUGE(mq, pending_messages)->Set(n);
}

void Dispatcher::Subscribe(const std::string& topic, Callback cb) {
  subscribers_.emplace(topic, std::move(cb));
}

size_t Dispatcher::Dispatch(context::Context* ctx, const chain::Message& message) {
  auto expected = next_sequence_.find(message.sender());
  if (expected != next_sequence_.end() && message.sequence() < expected->second) {
    LOG(WARNING) << "Dropping replayed message " << message.sequence() << " from " << message.sender()
                 << ", expected " << expected->second;
    COUNTER(mq, messages_replayed)->Increment();
    return 0;
  }
  next_sequence_[message.sender()] = message.sequence() + 1;

  size_t delivered = 0;
  auto range = subscribers_.equal_range(message.destination());
  for (auto it = range.first; it != range.second; ++it) {
    it->second(ctx, message);
    delivered++;
  }
  if (delivered == 0) {
    unhandled_++;
    COUNTER(mq, messages_unhandled)->Increment();
  } else {
    COUNTER(mq, messages_dispatched)->Increment();
  }
  return delivered;
}

size_t Dispatcher::Clear() {
  size_t out = unhandled_;
  unhandled_ = 0;
  return out;
}

void Dispatcher::ToProto(DispatcherState* out) const {
  out->clear_next_sequence();
  for (const auto& [sender, seq] : next_sequence_) {
    (*out->mutable_next_sequence())[sender] = seq;
  }
}

void Dispatcher::FromProto(const DispatcherState& in) {
  next_sequence_.clear();
  for (const auto& [sender, seq] : in.next_sequence()) {
    next_sequence_[sender] = seq;
  }
}

}  // namespace ocw::mq
