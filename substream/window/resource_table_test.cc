//
// Copyright (C) 2026 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "substream/window/resource_table.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <optional>
#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "substream/fs/shared_fd.h"
#include "substream/io/in_memory.h"
#include "substream/result/result_matchers.h"
#include "substream/window/resource_registry.h"

namespace substream {
namespace {

using ::testing::HasSubstr;
using ::testing::Optional;

TEST(ResourceTableTest, AssignsIncreasingIds) {
  ResourceTable table;

  EXPECT_EQ(table.Register(InMemoryIo(), ResourceMetadata{}), "1");
  EXPECT_EQ(table.Register(InMemoryIo(), ResourceMetadata{}), "2");
  ASSERT_TRUE(table.Unregister("2"));
  EXPECT_EQ(table.Register(InMemoryIo(), ResourceMetadata{}), "3");
}

TEST(ResourceTableTest, LookupReturnsRegisteredHandle) {
  ResourceTable table;
  std::unique_ptr<ReaderWriterSeeker> io = InMemoryIo({'a'});
  ReaderSeeker* handle = io.get();
  ResourceMetadata metadata{true, BackingKind::kFileBacked, "/data"};

  std::string id = table.Register(std::move(io), metadata);
  std::optional<LiveResource> resource = table.Lookup(id);

  ASSERT_TRUE(resource.has_value());
  EXPECT_EQ(resource->handle, handle);
  EXPECT_TRUE(resource->metadata.seekable);
  EXPECT_EQ(resource->metadata.backing_kind, BackingKind::kFileBacked);
  EXPECT_THAT(resource->metadata.backing_address, Optional(std::string("/data")));
}

TEST(ResourceTableTest, LookupMissing) {
  ResourceTable table;

  EXPECT_EQ(table.Lookup("1"), std::nullopt);
  EXPECT_FALSE(table.Unregister("1"));

  std::string id = table.Register(InMemoryIo(), ResourceMetadata{});
  ASSERT_TRUE(table.Unregister(id));
  EXPECT_EQ(table.Lookup(id), std::nullopt);
}

TEST(ResourceTableTest, RegisterRegularFile) {
  TemporaryFile file;
  ASSERT_TRUE(android::base::WriteStringToFile("data", file.path));
  SharedFD fd = SharedFD::Open(file.path, O_RDONLY);
  ASSERT_TRUE(fd->IsOpen());

  ResourceTable table;
  Result<std::string> id = table.RegisterFd(fd);
  ASSERT_THAT(id, IsOk());

  std::optional<LiveResource> resource = table.Lookup(*id);
  ASSERT_TRUE(resource.has_value());
  EXPECT_TRUE(resource->metadata.seekable);
  EXPECT_EQ(resource->metadata.backing_kind, BackingKind::kFileBacked);
  ASSERT_TRUE(resource->metadata.backing_address.has_value());

  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(
      *resource->metadata.backing_address, &contents));
  EXPECT_EQ(contents, "data");
}

TEST(ResourceTableTest, RegisterMemfd) {
  ResourceTable table;
  Result<std::string> id =
      table.RegisterFd(SharedFD::MemfdCreate("resource_table_test"));
  ASSERT_THAT(id, IsOk());

  std::optional<LiveResource> resource = table.Lookup(*id);
  ASSERT_TRUE(resource.has_value());
  EXPECT_TRUE(resource->metadata.seekable);
  EXPECT_EQ(resource->metadata.backing_kind, BackingKind::kMemoryBacked);
  EXPECT_EQ(resource->metadata.backing_address, std::nullopt);
}

TEST(ResourceTableTest, RegisterUnlinkedFile) {
  TemporaryFile file;
  SharedFD fd = SharedFD::Open(file.path, O_RDONLY);
  ASSERT_TRUE(fd->IsOpen());
  ASSERT_EQ(unlink(file.path), 0);

  ResourceTable table;
  Result<std::string> id = table.RegisterFd(fd);
  ASSERT_THAT(id, IsOk());

  std::optional<LiveResource> resource = table.Lookup(*id);
  ASSERT_TRUE(resource.has_value());
  EXPECT_EQ(resource->metadata.backing_kind, BackingKind::kMemoryBacked);
}

TEST(ResourceTableTest, RegisterPipe) {
  SharedFD read_end, write_end;
  ASSERT_TRUE(SharedFD::Pipe(&read_end, &write_end));

  ResourceTable table;
  Result<std::string> id = table.RegisterFd(read_end);
  ASSERT_THAT(id, IsOk());

  std::optional<LiveResource> resource = table.Lookup(*id);
  ASSERT_TRUE(resource.has_value());
  EXPECT_FALSE(resource->metadata.seekable);
  EXPECT_EQ(resource->metadata.backing_kind, BackingKind::kOther);
}

TEST(ResourceTableTest, RegisterClosedFd) {
  ResourceTable table;

  EXPECT_THAT(table.RegisterFd(SharedFD()), IsError());
}

TEST(ResourceTableTest, RegisterPath) {
  TemporaryFile file;
  ResourceTable table;

  Result<std::string> id = table.RegisterPath(file.path);
  ASSERT_THAT(id, IsOk());

  std::optional<LiveResource> resource = table.Lookup(*id);
  ASSERT_TRUE(resource.has_value());
  EXPECT_EQ(resource->metadata.backing_kind, BackingKind::kFileBacked);
  EXPECT_THAT(resource->metadata.backing_address,
              Optional(std::string(file.path)));
}

TEST(ResourceTableTest, RegisterMissingPath) {
  TemporaryDir dir;
  ResourceTable table;

  EXPECT_THAT(table.RegisterPath(std::string(dir.path) + "/missing"),
              IsErrorAndMessage(HasSubstr("Failed to open")));
}

TEST(ResourceTableTest, RegisterDirectoryPath) {
  TemporaryDir dir;
  ResourceTable table;

  EXPECT_THAT(table.RegisterPath(dir.path),
              IsErrorAndMessage(HasSubstr("is not a regular file")));
}

TEST(ResourceTableTest, RegisterFifoPath) {
  TemporaryDir dir;
  std::string fifo = std::string(dir.path) + "/fifo";
  ASSERT_EQ(mkfifo(fifo.c_str(), 0600), 0);
  ResourceTable table;

  // No writer is attached; registering must fail instead of blocking.
  EXPECT_THAT(table.RegisterPath(fifo),
              IsErrorAndMessage(HasSubstr("is not a regular file")));

  unlink(fifo.c_str());
}

}  // namespace
}  // namespace substream
