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


#include "substream/io/in_memory.h"

#include <stdint.h>
#include <string.h>

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "substream/io/filesystem.h"
#include "substream/io/io.h"
#include "substream/result/expect.h"
#include "substream/result/result_type.h"

namespace substream {

struct InMemoryFile {
  std::shared_mutex mutex;
  std::vector<char> contents;
};

namespace {

// A cursor over an `InMemoryFile`. Several handles may share one file.
class InMemoryHandle : public ReaderWriterSeeker {
 public:
  explicit InMemoryHandle(std::shared_ptr<InMemoryFile> file)
      : file_(std::move(file)) {}

  Result<uint64_t> Read(void* buf, uint64_t count) override {
    std::shared_lock lock(file_->mutex);
    const std::vector<char>& contents = file_->contents;
    if (position_ >= contents.size()) {
      return 0;
    }
    uint64_t available = std::min<uint64_t>(count, contents.size() - position_);
    memcpy(buf, contents.data() + position_, available);
    position_ += available;
    return available;
  }

  Result<uint64_t> Write(const void* buf, uint64_t count) override {
    if (count == 0) {
      return 0;
    }
    std::unique_lock lock(file_->mutex);
    std::vector<char>& contents = file_->contents;
    if (contents.size() < position_ + count) {
      contents.resize(position_ + count, '\0');
    }
    memcpy(contents.data() + position_, buf, count);
    position_ += count;
    return count;
  }

  // As with lseek(2), the position may go past the end. Reads there return 0
  // and a write there zero-fills the gap.
  Result<uint64_t> SeekSet(uint64_t offset) override {
    position_ = offset;
    return position_;
  }

  Result<uint64_t> SeekCur(int64_t offset) override {
    return SUBSTREAM_EXPECT(MoveFrom(position_, offset));
  }

  Result<uint64_t> SeekEnd(int64_t offset) override {
    uint64_t size;
    {
      std::shared_lock lock(file_->mutex);
      size = file_->contents.size();
    }
    return SUBSTREAM_EXPECT(MoveFrom(size, offset));
  }

 private:
  Result<uint64_t> MoveFrom(uint64_t base, int64_t offset) {
    if (offset < 0) {
      uint64_t magnitude = static_cast<uint64_t>(-(offset + 1)) + 1;
      SUBSTREAM_EXPECTF(magnitude <= base,
                        "Seek to {} from {} is before the start", offset,
                        base);
    }
    position_ = base + offset;
    return position_;
  }

  std::shared_ptr<InMemoryFile> file_;
  uint64_t position_ = 0;
};

}  // namespace

std::unique_ptr<ReaderWriterSeeker> InMemoryIo() {
  return InMemoryIo(std::vector<char>());
}

std::unique_ptr<ReaderWriterSeeker> InMemoryIo(std::vector<char> contents) {
  auto file = std::make_shared<InMemoryFile>();
  file->contents = std::move(contents);
  return std::make_unique<InMemoryHandle>(std::move(file));
}

void InMemoryFilesystem::SetFile(std::string_view address,
                                 std::string contents) {
  std::shared_ptr<InMemoryFile> file;
  {
    std::lock_guard lock(mutex_);
    std::shared_ptr<InMemoryFile>& slot = files_[std::string(address)];
    if (!slot) {
      slot = std::make_shared<InMemoryFile>();
    }
    file = slot;
  }
  std::unique_lock lock(file->mutex);
  file->contents.assign(contents.begin(), contents.end());
}

bool InMemoryFilesystem::RemoveFile(std::string_view address) {
  std::lock_guard lock(mutex_);
  auto it = files_.find(address);
  if (it == files_.end()) {
    return false;
  }
  files_.erase(it);
  return true;
}

Result<std::unique_ptr<ReaderSeeker>> InMemoryFilesystem::OpenReadOnly(
    std::string_view address) {
  std::lock_guard lock(mutex_);
  auto it = files_.find(address);
  SUBSTREAM_EXPECTF(it != files_.end(), "Nothing stored at '{}'", address);
  return std::make_unique<InMemoryHandle>(it->second);
}

}  // namespace substream
