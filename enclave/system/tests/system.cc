// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

//TESTDEP gtest
//TESTDEP system
//TESTDEP mq
//TESTDEP identity
//TESTDEP chainstorage
//TESTDEP context
//TESTDEP metrics
//TESTDEP sha
//TESTDEP env
//TESTDEP env/test
//TESTDEP util
//TESTDEP proto
//TESTDEP protobuf-lite
//TESTDEP libsodium

#include <gtest/gtest.h>
#include "system/system.h"
#include "env/env.h"
#include "metrics/metrics.h"

namespace ocw::system {

class SystemTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    env::Init(env::SIMULATED);
  }

  void SetUp() override {
    auto [id, err] = identity::WorkerIdentity::Generate();
    ASSERT_EQ(error::OK, err);
    identity = std::move(id);
    sys = NewRegistrySystem(Params{identity.get(), &recv_mq, 0});
  }

  void SetInbound(const std::vector<chain::Message>& messages) {
    chain::MessageList list;
    for (const auto& m : messages) *list.add_messages() = m;
    google::protobuf::RepeatedPtrField<chain::StorageChange> changes;
    auto c = changes.Add();
    c->set_key(chainstorage::keys::kMqInbound);
    c->set_value(list.SerializeAsString());
    storage.ApplyChanges(changes);
  }

  chain::Message Registration(const std::string& pubkey, bool registered, uint64_t seq) {
    mq::RegistryEvent event;
    event.set_worker_pubkey(pubkey);
    event.set_registered(registered);
    chain::Message m;
    m.set_sender("pallet/registry");
    m.set_destination(kRegistryTopic);
    m.set_payload(event.SerializeAsString());
    m.set_sequence(seq);
    return m;
  }

  void Process(uint64_t block) {
    BlockDispatchContext b{block, block * 6000, &storage, &send_mq, &recv_mq};
    sys->WillProcessBlock(&ctx, b);
    ASSERT_EQ(error::OK, sys->ProcessMessages(&ctx, b));
    sys->DidProcessBlock(&ctx, b);
  }

  std::unique_ptr<identity::WorkerIdentity> identity;
  chainstorage::ChainStorage storage;
  mq::SendQueue send_mq;
  mq::Dispatcher recv_mq;
  std::unique_ptr<System> sys;
  context::Context ctx;
};

TEST_F(SystemTest, RegistrationByEvent) {
  SetInbound({Registration(std::string(32, 'x'), true, 0)});
  Process(1);
  EXPECT_FALSE(sys->IsRegistered());
  EXPECT_EQ(6000, sys->NowMillis());

  SetInbound({Registration(identity->PublicKeyString(), true, 1)});
  Process(2);
  EXPECT_TRUE(sys->IsRegistered());

  SetInbound({Registration(identity->PublicKeyString(), false, 2)});
  Process(3);
  EXPECT_FALSE(sys->IsRegistered());
}

TEST_F(SystemTest, RegistrationInStorage) {
  google::protobuf::RepeatedPtrField<chain::StorageChange> changes;
  auto c = changes.Add();
  c->set_key(chainstorage::keys::RegisteredWorker(identity->PublicKeyString()));
  c->set_value("1");
  storage.ApplyChanges(changes);
  Process(1);
  EXPECT_TRUE(sys->IsRegistered());
}

TEST_F(SystemTest, HeartbeatAnswered) {
  chain::Message hb;
  hb.set_sender("pallet/heartbeat");
  hb.set_destination(kHeartbeatTopic);
  hb.set_payload("challenge");
  SetInbound({hb});
  Process(1);
  google::protobuf::RepeatedPtrField<mq::SendChannel> channels;
  send_mq.AllMessagesGrouped(&ctx, &channels);
  ASSERT_EQ(1, channels.size());
  EXPECT_EQ(identity->PublicKeyString(), channels[0].origin());
  EXPECT_EQ(kHeartbeatResponseTopic, channels[0].messages(0).message().destination());
  EXPECT_EQ("challenge", channels[0].messages(0).message().payload());
}

TEST_F(SystemTest, UndecodableInbound) {
  google::protobuf::RepeatedPtrField<chain::StorageChange> changes;
  auto c = changes.Add();
  c->set_key(chainstorage::keys::kMqInbound);
  c->set_value("\xff\xff\xff");
  storage.ApplyChanges(changes);
  BlockDispatchContext b{1, 6000, &storage, &send_mq, &recv_mq};
  EXPECT_EQ(error::Decode_MessageList, sys->ProcessMessages(&ctx, b));
}

TEST_F(SystemTest, CheckpointRestore) {
  SetInbound({Registration(identity->PublicKeyString(), true, 0)});
  Process(4);
  std::string state = sys->Checkpoint();

  mq::Dispatcher other_mq;
  auto restored = NewRegistrySystem(Params{identity.get(), &other_mq, 0});
  ASSERT_EQ(error::OK, restored->Restore(state));
  EXPECT_TRUE(restored->IsRegistered());
  EXPECT_EQ(24000, restored->NowMillis());
  SystemInfo info;
  restored->GetInfo(&info);
  EXPECT_EQ(0, info.genesis_block());
  EXPECT_EQ(error::Decode_SystemState, restored->Restore("\xff"));
}

}  // namespace ocw::system
