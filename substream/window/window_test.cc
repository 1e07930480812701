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

#include "substream/window/window.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <limits>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <fmt/core.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "substream/fs/shared_fd.h"
#include "substream/io/io.h"
#include "substream/io/native_filesystem.h"
#include "substream/result/result_matchers.h"
#include "substream/window/errors.h"
#include "substream/window/resolver.h"
#include "substream/window/resource_table.h"
#include "substream/window/window_bounds.h"

namespace substream {
namespace {

using ::testing::Optional;

enum class Backing {
  kFile,
  kMemory,
};

std::string PrintBacking(const ::testing::TestParamInfo<Backing>& info) {
  return info.param == Backing::kFile ? "FileBacked" : "MemoryBacked";
}

// Windows opened over every backing strategy must behave the same.
class WindowTest : public ::testing::TestWithParam<Backing> {
 protected:
  // Registers `contents` and returns its resource id.
  std::string RegisterContents(const std::string& contents) {
    if (GetParam() == Backing::kFile) {
      files_.emplace_back(std::make_unique<TemporaryFile>());
      const char* path = files_.back()->path;
      EXPECT_TRUE(android::base::WriteStringToFile(contents, path));
      return resources_.RegisterPath(path).value();
    }
    SharedFD memfd = SharedFD::MemfdCreate("window_test");
    EXPECT_TRUE(memfd->IsOpen()) << memfd->StrError();
    EXPECT_EQ(memfd->Write(contents.data(), contents.size()),
              static_cast<ssize_t>(contents.size()));
    return resources_.RegisterFd(memfd).value();
  }

  std::unique_ptr<Window> OpenWindow(const std::string& id, uint64_t offset,
                                     uint64_t length) {
    Result<std::unique_ptr<Window>> window = Window::Open(
        resolver_, fmt::format("substream://{}:{}/{}", offset, length, id));
    EXPECT_THAT(window, IsOk());
    return window.ok() ? std::move(*window) : nullptr;
  }

  std::string ReadAll(Window& window, uint64_t chunk_size = 3) {
    std::string data;
    while (true) {
      Result<std::optional<std::string>> chunk = window.Read(chunk_size);
      EXPECT_THAT(chunk, IsOk());
      if (!chunk.ok() || !chunk->has_value()) {
        return data;
      }
      data += **chunk;
    }
  }

  std::vector<std::unique_ptr<TemporaryFile>> files_;
  ResourceTable resources_;
  NativeFilesystem filesystem_;
  WindowResolver resolver_{resources_, filesystem_};
};

TEST_P(WindowTest, ReadsOnlyTheWindow) {
  std::string id = RegisterContents("0123456789abcdef");
  std::unique_ptr<Window> window = OpenWindow(id, 10, 4);
  ASSERT_NE(window, nullptr);

  EXPECT_EQ(window->Stat().size, 4);
  EXPECT_EQ(ReadAll(*window), "abcd");
  EXPECT_TRUE(window->Eof());
  EXPECT_EQ(window->Tell(), std::nullopt);
}

TEST_P(WindowTest, ReadAtEndReturnsNothing) {
  std::string id = RegisterContents("0123456789");
  std::unique_ptr<Window> window = OpenWindow(id, 2, 2);
  ASSERT_NE(window, nullptr);

  EXPECT_THAT(window->Read(100), IsOkAndValue(Optional(std::string("23"))));
  EXPECT_THAT(window->Read(1), IsOkAndValue(std::nullopt));
  EXPECT_THAT(window->Read(0), IsOkAndValue(std::nullopt));
}

TEST_P(WindowTest, ReadZeroBytes) {
  std::string id = RegisterContents("0123456789");
  std::unique_ptr<Window> window = OpenWindow(id, 2, 2);
  ASSERT_NE(window, nullptr);

  EXPECT_THAT(window->Read(0), IsOkAndValue(Optional(std::string())));
  EXPECT_THAT(window->Tell(), Optional(0));
}

TEST_P(WindowTest, ReadWithLargestCount) {
  std::string id = RegisterContents("0123456789");
  std::unique_ptr<Window> window = OpenWindow(id, 3, 5);
  ASSERT_NE(window, nullptr);

  EXPECT_THAT(window->Read(std::numeric_limits<uint64_t>::max()),
              IsOkAndValue(Optional(std::string("34567"))));
  EXPECT_TRUE(window->Eof());
}

TEST_P(WindowTest, SeekAndTell) {
  std::string id = RegisterContents("0123456789abcdef");
  std::unique_ptr<Window> window = OpenWindow(id, 4, 8);
  ASSERT_NE(window, nullptr);

  EXPECT_THAT(window->Tell(), Optional(0));
  ASSERT_TRUE(window->Seek(5, Whence::kFromStart));
  EXPECT_THAT(window->Tell(), Optional(5));
  EXPECT_THAT(window->Read(1), IsOkAndValue(Optional(std::string("9"))));

  ASSERT_TRUE(window->Seek(-3, Whence::kFromCurrent));
  EXPECT_THAT(window->Tell(), Optional(3));
  ASSERT_TRUE(window->Seek(-1, Whence::kFromEnd));
  EXPECT_THAT(window->Tell(), Optional(7));
  EXPECT_THAT(window->Read(10), IsOkAndValue(Optional(std::string("b"))));
}

TEST_P(WindowTest, RejectedSeekKeepsCursor) {
  std::string id = RegisterContents("0123456789abcdef");
  std::unique_ptr<Window> window = OpenWindow(id, 4, 8);
  ASSERT_NE(window, nullptr);
  ASSERT_TRUE(window->Seek(2, Whence::kFromStart));

  EXPECT_FALSE(window->Seek(-1, Whence::kFromStart));
  EXPECT_FALSE(window->Seek(8, Whence::kFromStart));
  EXPECT_FALSE(window->Seek(100, Whence::kFromStart));
  EXPECT_FALSE(window->Seek(-3, Whence::kFromCurrent));
  EXPECT_FALSE(window->Seek(0, Whence::kFromEnd));
  EXPECT_FALSE(window->Seek(-9, Whence::kFromEnd));

  EXPECT_THAT(window->Tell(), Optional(2));
  EXPECT_THAT(window->Read(1), IsOkAndValue(Optional(std::string("6"))));
}

TEST_P(WindowTest, SeekBackFromEof) {
  std::string id = RegisterContents("0123456789");
  std::unique_ptr<Window> window = OpenWindow(id, 0, 4);
  ASSERT_NE(window, nullptr);
  ASSERT_EQ(ReadAll(*window), "0123");

  ASSERT_TRUE(window->Seek(0, Whence::kFromStart));
  EXPECT_FALSE(window->Eof());
  EXPECT_EQ(ReadAll(*window), "0123");
}

TEST_P(WindowTest, WindowsHaveIndependentCursors) {
  std::string id = RegisterContents("0123456789abcdef");
  std::unique_ptr<Window> first = OpenWindow(id, 0, 8);
  std::unique_ptr<Window> second = OpenWindow(id, 4, 8);
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);

  EXPECT_THAT(first->Read(2), IsOkAndValue(Optional(std::string("01"))));
  EXPECT_THAT(second->Read(2), IsOkAndValue(Optional(std::string("45"))));
  EXPECT_THAT(first->Read(2), IsOkAndValue(Optional(std::string("23"))));
  EXPECT_THAT(second->Read(2), IsOkAndValue(Optional(std::string("67"))));
}

TEST_P(WindowTest, DoesNotMoveTheSourceCursor) {
  std::string id = RegisterContents("0123456789abcdef");
  ReaderSeeker* source = resources_.Lookup(id)->handle;
  ASSERT_THAT(source->SeekSet(6), IsOk());

  std::unique_ptr<Window> window = OpenWindow(id, 1, 3);
  ASSERT_NE(window, nullptr);
  EXPECT_EQ(ReadAll(*window), "123");

  EXPECT_THAT(source->SeekCur(0), IsOkAndValue(6));
}

TEST_P(WindowTest, RandomWindowMatchesSource) {
  std::mt19937 generator(1234);
  std::uniform_int_distribution<int> byte(0, 255);
  std::string contents(4096, '\0');
  for (char& c : contents) {
    c = static_cast<char>(byte(generator));
  }
  std::string id = RegisterContents(contents);

  std::uniform_int_distribution<uint64_t> offset_dist(0, contents.size() - 1);
  for (int i = 0; i < 8; i++) {
    uint64_t offset = offset_dist(generator);
    std::uniform_int_distribution<uint64_t> length_dist(
        1, contents.size() - offset);
    uint64_t length = length_dist(generator);

    std::unique_ptr<Window> window = OpenWindow(id, offset, length);
    ASSERT_NE(window, nullptr);
    EXPECT_EQ(window->Stat().size, length);
    EXPECT_EQ(ReadAll(*window, 500), contents.substr(offset, length))
        << "Window at " << offset << " of length " << length;
  }
}

TEST_P(WindowTest, CloseReleasesTheHandle) {
  std::string id = RegisterContents("0123456789");
  std::unique_ptr<Window> window = OpenWindow(id, 0, 4);
  ASSERT_NE(window, nullptr);

  window->Close();
  EXPECT_TRUE(window->IsClosed());
  EXPECT_THAT(window->Read(1), IsErrorWithCode(WindowErrorKind::kIo));
  EXPECT_FALSE(window->Seek(0, Whence::kFromStart));
  window->Close();
  EXPECT_TRUE(window->IsClosed());
}

TEST_P(WindowTest, OpenFailuresAreClassified) {
  std::string id = RegisterContents("0123456789");

  EXPECT_THAT(Window::Open(resolver_, "substream://0/" + id),
              IsErrorWithCode(WindowErrorKind::kParse));
  EXPECT_THAT(Window::Open(resolver_, "file://0:4/" + id),
              IsErrorWithCode(WindowErrorKind::kInvalidScheme));
  EXPECT_THAT(Window::Open(resolver_, "substream://0:4/999"),
              IsErrorWithCode(WindowErrorKind::kResourceNotFound));
}

INSTANTIATE_TEST_SUITE_P(WindowBackings, WindowTest,
                         ::testing::Values(Backing::kFile, Backing::kMemory),
                         PrintBacking);

TEST(WindowFileBackedTest, ShrunkFileIsAnIoError) {
  TemporaryFile file;
  ASSERT_TRUE(android::base::WriteStringToFile("0123456789", file.path));
  ResourceTable resources;
  NativeFilesystem filesystem;
  WindowResolver resolver(resources, filesystem);
  std::string id = resources.RegisterPath(file.path).value();

  Result<std::unique_ptr<Window>> window =
      Window::Open(resolver, "substream://4:6/" + id);
  ASSERT_THAT(window, IsOk());
  ASSERT_EQ(truncate(file.path, 6), 0);

  EXPECT_THAT((*window)->Read(2), IsOkAndValue(Optional(std::string("45"))));
  EXPECT_THAT((*window)->Read(2), IsErrorWithCode(WindowErrorKind::kIo));
}

TEST(WindowFileBackedTest, LargeReadsAreChunked) {
  constexpr uint64_t kSize = uint64_t{1} << 40;
  TemporaryFile file;
  ASSERT_EQ(truncate(file.path, kSize), 0) << strerror(errno);
  ResourceTable resources;
  NativeFilesystem filesystem;
  WindowResolver resolver(resources, filesystem);
  std::string id = resources.RegisterPath(file.path).value();

  Result<std::unique_ptr<Window>> window =
      Window::Open(resolver, fmt::format("substream://0:{}/{}", kSize, id));
  ASSERT_THAT(window, IsOk());

  EXPECT_THAT((*window)->Read(std::numeric_limits<uint64_t>::max()),
              IsOkAndValue(Optional(std::string(kMaxReadChunk, '\0'))));
  EXPECT_THAT((*window)->Tell(), Optional(kMaxReadChunk));

  ASSERT_TRUE((*window)->Seek(-3, Whence::kFromEnd));
  EXPECT_THAT((*window)->Read(std::numeric_limits<uint64_t>::max()),
              IsOkAndValue(Optional(std::string(3, '\0'))));
  EXPECT_TRUE((*window)->Eof());
}

TEST(WindowMemoryBackedTest, WindowPastTheEndIsAnIoError) {
  ResourceTable resources;
  NativeFilesystem filesystem;
  WindowResolver resolver(resources, filesystem);
  SharedFD memfd = SharedFD::MemfdCreate("window_test");
  ASSERT_EQ(memfd->Write("0123", 4), 4);
  std::string id = resources.RegisterFd(memfd).value();

  EXPECT_THAT(Window::Open(resolver, "substream://2:4/" + id),
              IsErrorWithCode(WindowErrorKind::kIo));
}

}  // namespace
}  // namespace substream
