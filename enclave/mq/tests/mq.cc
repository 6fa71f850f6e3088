// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

//TESTDEP gtest
//TESTDEP mq
//TESTDEP identity
//TESTDEP context
//TESTDEP metrics
//TESTDEP env
//TESTDEP env/test
//TESTDEP util
//TESTDEP proto
//TESTDEP protobuf-lite
//TESTDEP libsodium

#include <gtest/gtest.h>
#include "mq/mq.h"
#include "env/env.h"
#include "metrics/metrics.h"

namespace ocw::mq {

class MqTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    env::Init(env::SIMULATED);
  }
  void SetUp() override {
    auto [id, err] = identity::WorkerIdentity::Generate();
    ASSERT_EQ(error::OK, err);
    signer = std::move(id);
    metrics::ClearAllForTest();
  }

  static chain::Message Msg(const std::string& sender, const std::string& dest, uint64_t seq) {
    chain::Message m;
    m.set_sender(sender);
    m.set_destination(dest);
    m.set_payload("p");
    m.set_sequence(seq);
    return m;
  }

  std::unique_ptr<identity::WorkerIdentity> signer;
  context::Context ctx;
};

TEST_F(MqTest, EnqueueAssignsSequencesPerOrigin) {
  SendQueue q;
  EXPECT_EQ(0, q.Enqueue(&ctx, "a", "dest", "1", *signer));
  EXPECT_EQ(1, q.Enqueue(&ctx, "a", "dest", "2", *signer));
  EXPECT_EQ(0, q.Enqueue(&ctx, "b", "dest", "3", *signer));
  EXPECT_EQ(3, q.CountMessages(&ctx));
  EXPECT_EQ(3, GAUGE(mq, pending_messages)->Value());

  google::protobuf::RepeatedPtrField<SendChannel> channels;
  q.AllMessagesGrouped(&ctx, &channels);
  ASSERT_EQ(2, channels.size());
  EXPECT_EQ("a", channels[0].origin());
  EXPECT_EQ(2, channels[0].messages_size());
  EXPECT_EQ(2, channels[0].next_sequence());
  EXPECT_EQ("b", channels[1].origin());
}

TEST_F(MqTest, MessagesAreSigned) {
  SendQueue q;
  q.Enqueue(&ctx, "a", "dest", "payload", *signer);
  google::protobuf::RepeatedPtrField<SendChannel> channels;
  q.AllMessagesGrouped(&ctx, &channels);
  const auto& sm = channels[0].messages(0);
  EXPECT_TRUE(identity::VerifySignature(signer->PublicKeyString(), SignedContent(sm.message()), sm.signature()));

  chain::Message altered = sm.message();
  altered.set_payload("other");
  EXPECT_FALSE(identity::VerifySignature(signer->PublicKeyString(), SignedContent(altered), sm.signature()));
}

TEST_F(MqTest, PurgeConfirmed) {
  SendQueue q;
  for (int i = 0; i < 5; i++) q.Enqueue(&ctx, "a", "dest", "x", *signer);
  q.Purge(&ctx, "a", 3);
  EXPECT_EQ(2, q.CountMessages(&ctx));
  EXPECT_EQ(3, COUNTER(mq, messages_purged)->Value());
  q.Purge(&ctx, "a", 1);
  q.Purge(&ctx, "unknown", 10);
  EXPECT_EQ(2, q.CountMessages(&ctx));

  // Sequences keep counting after a purge.
  q.Purge(&ctx, "a", 5);
  EXPECT_EQ(0, q.CountMessages(&ctx));
  EXPECT_EQ(5, q.Enqueue(&ctx, "a", "dest", "x", *signer));
}

TEST_F(MqTest, PurgeConfirmedByChain) {
  SendQueue q;
  for (int i = 0; i < 3; i++) q.Enqueue(&ctx, "a", "dest", "x", *signer);
  for (int i = 0; i < 3; i++) q.Enqueue(&ctx, "b", "dest", "x", *signer);
  q.PurgeConfirmed(&ctx, [](const std::string& origin) -> uint64_t { return origin == "a" ? 2 : 0; });
  EXPECT_EQ(4, q.CountMessages(&ctx));
  EXPECT_EQ(2, COUNTER(mq, messages_purged)->Value());
}

TEST_F(MqTest, SendQueueProto) {
  SendQueue q;
  q.Enqueue(&ctx, "a", "dest", "x", *signer);
  q.Enqueue(&ctx, "a", "dest", "y", *signer);
  SendQueueState pb;
  q.ToProto(&ctx, &pb);
  SendQueue restored;
  restored.FromProto(&ctx, pb);
  EXPECT_EQ(2, restored.CountMessages(&ctx));
  EXPECT_EQ(2, restored.Enqueue(&ctx, "a", "dest", "z", *signer));
}

TEST_F(MqTest, DispatchToSubscribers) {
  Dispatcher d;
  int a = 0, b = 0;
  d.Subscribe("topic/a", [&a](context::Context*, const chain::Message&) { a++; });
  d.Subscribe("topic/a", [&a](context::Context*, const chain::Message&) { a++; });
  d.Subscribe("topic/b", [&b](context::Context*, const chain::Message&) { b++; });
  EXPECT_EQ(2, d.Dispatch(&ctx, Msg("s", "topic/a", 0)));
  EXPECT_EQ(1, d.Dispatch(&ctx, Msg("s", "topic/b", 1)));
  EXPECT_EQ(0, d.Dispatch(&ctx, Msg("s", "topic/c", 2)));
  EXPECT_EQ(2, a);
  EXPECT_EQ(1, b);
  EXPECT_EQ(1, d.Clear());
  EXPECT_EQ(0, d.Clear());
}

TEST_F(MqTest, ReplayedMessagesDropped) {
  Dispatcher d;
  int n = 0;
  d.Subscribe("t", [&n](context::Context*, const chain::Message&) { n++; });
  d.Dispatch(&ctx, Msg("s", "t", 4));
  EXPECT_EQ(0, d.Dispatch(&ctx, Msg("s", "t", 4)));
  EXPECT_EQ(0, d.Dispatch(&ctx, Msg("s", "t", 2)));
  EXPECT_EQ(1, d.Dispatch(&ctx, Msg("other", "t", 0)));
  EXPECT_EQ(2, COUNTER(mq, messages_replayed)->Value());
  EXPECT_EQ(2, n);
  // Replays aren't counted as unhandled.
  EXPECT_EQ(0, d.Clear());

  DispatcherState pb;
  d.ToProto(&pb);
  Dispatcher restored;
  restored.FromProto(pb);
  restored.Subscribe("t", [&n](context::Context*, const chain::Message&) { n++; });
  EXPECT_EQ(0, restored.Dispatch(&ctx, Msg("s", "t", 4)));

  restored.ResetLocalIndex();
  EXPECT_EQ(1, restored.Dispatch(&ctx, Msg("s", "t", 4)));
}

}  // namespace ocw::mq
