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

#include "substream/io/shared_fd.h"

#include <string>
#include <string_view>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "substream/fs/shared_fd.h"
#include "substream/io/string.h"
#include "substream/result/result_matchers.h"

namespace substream {
namespace {

TEST(SharedFdIoTest, WriteSeekRead) {
  SharedFdIo io(SharedFD::MemfdCreate("shared_fd_io_test"));

  constexpr std::string_view str = "hello world";
  ASSERT_THAT(io.Write(str.data(), str.size()), IsOkAndValue(str.size()));
  EXPECT_THAT(io.SeekEnd(0), IsOkAndValue(str.size()));

  EXPECT_THAT(io.SeekEnd(-5), IsOkAndValue(6));
  EXPECT_THAT(ReadToString(io), IsOkAndValue("world"));
  EXPECT_THAT(io.SeekSet(0), IsOkAndValue(0));
  EXPECT_THAT(io.SeekCur(6), IsOkAndValue(6));
}

TEST(SharedFdIoTest, ClosedDescriptorFails) {
  SharedFdIo io{SharedFD()};

  char c;
  EXPECT_THAT(io.Read(&c, 1), IsError());
  EXPECT_THAT(io.SeekSet(0), IsError());
}

TEST(SharedFdIoTest, PipeCannotSeek) {
  SharedFD read_end, write_end;
  ASSERT_TRUE(SharedFD::Pipe(&read_end, &write_end));
  SharedFdIo io(read_end);

  EXPECT_THAT(io.SeekCur(0), IsError());
}

}  // namespace
}  // namespace substream
