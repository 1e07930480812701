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


#include "substream/io/native_filesystem.h"

#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "substream/io/io.h"
#include "substream/io/string.h"
#include "substream/result/result_matchers.h"

namespace substream {
namespace {

using ::testing::HasSubstr;

TEST(NativeFilesystemTest, OpensRegularFile) {
  TemporaryFile file;
  ASSERT_TRUE(android::base::WriteStringToFile("contents", file.path));

  NativeFilesystem fs;
  Result<std::unique_ptr<ReaderSeeker>> reader = fs.OpenReadOnly(file.path);
  ASSERT_THAT(reader, IsOk());

  EXPECT_THAT((*reader)->SeekSet(3), IsOkAndValue(3));
  EXPECT_THAT(ReadToString(**reader), IsOkAndValue("tents"));
}

TEST(NativeFilesystemTest, HandlesHaveIndependentPositions) {
  TemporaryFile file;
  ASSERT_TRUE(android::base::WriteStringToFile("contents", file.path));

  NativeFilesystem fs;
  std::unique_ptr<ReaderSeeker> first = fs.OpenReadOnly(file.path).value();
  std::unique_ptr<ReaderSeeker> second = fs.OpenReadOnly(file.path).value();

  ASSERT_THAT(first->SeekSet(5), IsOk());
  EXPECT_THAT(second->SeekCur(0), IsOkAndValue(0));
  EXPECT_THAT(ReadToString(*second), IsOkAndValue("contents"));
}

TEST(NativeFilesystemTest, MissingFile) {
  TemporaryDir dir;
  NativeFilesystem fs;

  EXPECT_THAT(fs.OpenReadOnly(std::string(dir.path) + "/missing"),
              IsErrorAndMessage(HasSubstr("Failed to open")));
}

TEST(NativeFilesystemTest, RefusesDirectory) {
  TemporaryDir dir;
  NativeFilesystem fs;

  EXPECT_THAT(fs.OpenReadOnly(dir.path),
              IsErrorAndMessage(HasSubstr("is not a regular file")));
}

TEST(NativeFilesystemTest, RefusesFifoWithoutBlocking) {
  TemporaryDir dir;
  std::string fifo = std::string(dir.path) + "/fifo";
  ASSERT_EQ(mkfifo(fifo.c_str(), 0600), 0);
  NativeFilesystem fs;

  EXPECT_THAT(fs.OpenReadOnly(fifo),
              IsErrorAndMessage(HasSubstr("is not a regular file")));
  unlink(fifo.c_str());
}

}  // namespace
}  // namespace substream
