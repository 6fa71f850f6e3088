// Copyright 2024 Signal Messenger, LLC
// SPDX-License-Identifier: AGPL-3.0-only

//TESTDEP gtest
//TESTDEP fs
//TESTDEP env
//TESTDEP env/test
//TESTDEP util
//TESTDEP metrics
//TESTDEP proto
//TESTDEP protobuf-lite
//TESTDEP libsodium

#include <gtest/gtest.h>
#include <algorithm>
#include "fs/fs.h"
#include "env/env.h"

namespace ocw::fs {

class FsTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    env::Init(env::SIMULATED);
  }
  void SetUp() {
    ASSERT_EQ(error::OK, dir.Init());
  }
  TmpDir dir;
};

TEST_F(FsTest, WriteReadAtomic) {
  std::string f = dir.name() + "/a";
  ASSERT_EQ(error::OK, WriteFileAtomic(f, "hello"));
  ASSERT_EQ(error::OK, WriteFileAtomic(f, "world"));
  auto [contents, err] = FileContents(f);
  ASSERT_EQ(err, error::OK);
  EXPECT_EQ(contents, "world");
  auto [names, err2] = ListDir(dir.name());
  ASSERT_EQ(err2, error::OK);
  // No temporary file left behind.
  EXPECT_EQ(names, std::vector<std::string>({"a"}));
}

TEST_F(FsTest, MissingFile) {
  EXPECT_EQ(FileContents(dir.name() + "/nope").second, error::FS_FileNotFound);
  EXPECT_EQ(ListDir(dir.name() + "/nope").second, error::FS_FileNotFound);
  EXPECT_EQ(RemoveFile(dir.name() + "/nope"), error::OK);
}

TEST_F(FsTest, MkdirAllAndRemove) {
  std::string sub = dir.name() + "/x/y/z";
  ASSERT_EQ(error::OK, MkdirAll(sub));
  ASSERT_EQ(error::OK, MkdirAll(sub));
  ASSERT_EQ(error::OK, WriteFileAtomic(sub + "/f", "1"));
  ASSERT_EQ(error::OK, WriteFileAtomic(sub + "/g", "2"));
  ASSERT_EQ(error::OK, RemoveFile(sub + "/f"));
  auto [names, err] = ListDir(sub);
  ASSERT_EQ(err, error::OK);
  EXPECT_EQ(names, std::vector<std::string>({"g"}));
}

}  // namespace ocw::fs
