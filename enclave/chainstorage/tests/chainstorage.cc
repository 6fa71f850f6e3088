// Copyright 2023 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

//TESTDEP gtest
//TESTDEP chainstorage
//TESTDEP sha
//TESTDEP env
//TESTDEP env/test
//TESTDEP util
//TESTDEP metrics
//TESTDEP proto
//TESTDEP protobuf-lite
//TESTDEP libsodium

#include <gtest/gtest.h>
#include "chainstorage/chainstorage.h"
#include "env/env.h"
#include "util/endian.h"
#include "util/hex.h"

namespace ocw::chainstorage {

class ChainStorageTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    env::Init(env::SIMULATED);
  }

  static chain::StorageChange Put(const std::string& k, const std::string& v) {
    chain::StorageChange c;
    c.set_key(k);
    c.set_value(v);
    return c;
  }
  static chain::StorageChange Del(const std::string& k) {
    chain::StorageChange c;
    c.set_key(k);
    return c;
  }
  static std::string U64(uint64_t v) {
    std::string out;
    util::AppendBigEndian64(v, &out);
    return out;
  }
};

TEST_F(ChainStorageTest, RootOfEmptyStorage) {
  ChainStorage s;
  // Python3: hashlib.blake2b(b'', digest_size=32).hexdigest()
  EXPECT_EQ(util::ToHex(s.ComputeRoot()),
            "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
}

TEST_F(ChainStorageTest, RootIndependentOfInsertionOrder) {
  chain::StorageState a, b;
  auto kv = a.add_pairs(); kv->set_key("x"); kv->set_value("1");
  kv = a.add_pairs(); kv->set_key("y"); kv->set_value("2");
  kv = b.add_pairs(); kv->set_key("y"); kv->set_value("2");
  kv = b.add_pairs(); kv->set_key("x"); kv->set_value("1");
  EXPECT_EQ(ChainStorage::ComputeRoot(a), ChainStorage::ComputeRoot(b));
  EXPECT_EQ(ChainStorage::FromPairs(a)->ComputeRoot(), ChainStorage::ComputeRoot(a));
}

TEST_F(ChainStorageTest, RootDistinguishesKeyValueBoundaries) {
  chain::StorageState a, b;
  auto kv = a.add_pairs(); kv->set_key("ab"); kv->set_value("c");
  kv = b.add_pairs(); kv->set_key("a"); kv->set_value("bc");
  EXPECT_NE(ChainStorage::ComputeRoot(a), ChainStorage::ComputeRoot(b));
}

TEST_F(ChainStorageTest, ApplyAndRevert) {
  ChainStorage s;
  google::protobuf::RepeatedPtrField<chain::StorageChange> first;
  *first.Add() = Put("a", "1");
  *first.Add() = Put("b", "2");
  s.ApplyChanges(first);
  Root before = s.ComputeRoot();

  google::protobuf::RepeatedPtrField<chain::StorageChange> second;
  *second.Add() = Put("a", "3");
  *second.Add() = Del("b");
  *second.Add() = Put("c", "4");
  *second.Add() = Put("a", "5");
  Undo undo = s.ApplyChanges(second);
  EXPECT_EQ(*s.Get("a"), "5");
  EXPECT_FALSE(s.Get("b").has_value());
  EXPECT_EQ(*s.Get("c"), "4");

  s.Revert(std::move(undo));
  EXPECT_EQ(*s.Get("a"), "1");
  EXPECT_EQ(*s.Get("b"), "2");
  EXPECT_FALSE(s.Get("c").has_value());
  EXPECT_EQ(s.ComputeRoot(), before);
}

TEST_F(ChainStorageTest, WellKnownKeys) {
  ChainStorage s;
  EXPECT_EQ(s.TimestampNowMillis(), 0);
  EXPECT_EQ(s.MqNextSequence("worker/registry"), 0);
  EXPECT_FALSE(s.BinAddedAt("hash").has_value());
  EXPECT_FALSE(s.IsWorkerRegistered("pk"));

  chain::MessageList msgs;
  auto m = msgs.add_messages();
  m->set_sender("chain");
  m->set_destination("worker/registry");
  m->set_payload("p");

  google::protobuf::RepeatedPtrField<chain::StorageChange> changes;
  *changes.Add() = Put(keys::kTimestampNow, U64(1234));
  *changes.Add() = Put(keys::kMqInbound, msgs.SerializeAsString());
  *changes.Add() = Put(keys::MqIngressSequence("worker/registry"), U64(7));
  *changes.Add() = Put(keys::BinAddedAt("hash"), U64(99));
  *changes.Add() = Put(keys::RegisteredWorker("pk"), "");
  s.ApplyChanges(changes);

  EXPECT_EQ(s.TimestampNowMillis(), 1234);
  auto [got, err] = s.MqMessages();
  ASSERT_EQ(err, error::OK);
  ASSERT_EQ(got.messages_size(), 1);
  EXPECT_EQ(got.messages(0).payload(), "p");
  EXPECT_EQ(s.MqNextSequence("worker/registry"), 7);
  EXPECT_EQ(*s.BinAddedAt("hash"), 99);
  EXPECT_TRUE(s.IsWorkerRegistered("pk"));
}

TEST_F(ChainStorageTest, BadInboundQueue) {
  ChainStorage s;
  google::protobuf::RepeatedPtrField<chain::StorageChange> changes;
  *changes.Add() = Put(keys::kMqInbound, "\xff\xff\xff");
  s.ApplyChanges(changes);
  EXPECT_EQ(s.MqMessages().second, error::Decode_MessageList);
}

TEST_F(ChainStorageTest, LoadProofIsAllOrNothing) {
  ChainStorage s;
  chain::KeyValue kv;
  kv.set_key("k");
  kv.set_value("v");
  std::vector<std::string> nodes{kv.SerializeAsString(), "\xff\xff\xff"};
  EXPECT_EQ(s.LoadProof(nodes), error::Decode_StorageProofNode);
  EXPECT_EQ(s.size(), 0);
  nodes.pop_back();
  EXPECT_EQ(s.LoadProof(nodes), error::OK);
  EXPECT_EQ(*s.Get("k"), "v");
}

}  // namespace ocw::chainstorage
