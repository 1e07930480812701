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
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/strings.h>

#include "substream/fs/shared_fd.h"
#include "substream/io/shared_fd.h"
#include "substream/result/expect.h"
#include "substream/result/result_type.h"
#include "substream/window/resource_registry.h"

namespace substream {

Result<ResourceMetadata> ClassifyFd(const SharedFD& fd) {
  SUBSTREAM_EXPECT(fd->IsOpen(), "Descriptor is not open: " << fd->StrError());

  ResourceMetadata metadata;
  metadata.seekable = fd->LSeek(0, SEEK_CUR) >= 0;

  struct stat st;
  SUBSTREAM_EXPECT_EQ(fd->Fstat(&st), 0, fd->StrError());
  if (!S_ISREG(st.st_mode)) {
    metadata.backing_kind = BackingKind::kOther;
    return metadata;
  }

  std::string target;
  SUBSTREAM_EXPECT(android::base::Readlink(fd->ProcFdPath(), &target),
                   "Failed to resolve " << fd->ProcFdPath());
  if (android::base::StartsWith(target, "/memfd:") ||
      android::base::EndsWith(target, " (deleted)") || st.st_nlink == 0) {
    metadata.backing_kind = BackingKind::kMemoryBacked;
  } else {
    metadata.backing_kind = BackingKind::kFileBacked;
    metadata.backing_address = target;
  }
  return metadata;
}

std::string ResourceTable::Register(std::unique_ptr<ReaderSeeker> handle,
                                    ResourceMetadata metadata) {
  std::lock_guard lock(mutex_);
  std::string id = std::to_string(next_id_++);
  resources_.emplace(id, Entry{std::move(handle), std::move(metadata)});
  return id;
}

Result<std::string> ResourceTable::RegisterFd(SharedFD fd) {
  ResourceMetadata metadata = SUBSTREAM_EXPECT(ClassifyFd(fd));
  std::string id =
      Register(std::make_unique<SharedFdIo>(std::move(fd)), metadata);
  LOG(DEBUG) << "Registered descriptor as resource " << id;
  return id;
}

Result<std::string> ResourceTable::RegisterPath(const std::string& path) {
  // O_NONBLOCK keeps open(2) from waiting for a writer on a FIFO.
  SharedFD fd = SharedFD::Open(path, O_RDONLY | O_NONBLOCK);
  SUBSTREAM_EXPECTF(fd->IsOpen(), "Failed to open '{}': {}", path,
                    fd->StrError());
  ResourceMetadata metadata = SUBSTREAM_EXPECT(ClassifyFd(fd));
  SUBSTREAM_EXPECTF(metadata.backing_kind != BackingKind::kOther,
                    "'{}' is not a regular file", path);
  if (metadata.backing_kind == BackingKind::kFileBacked) {
    metadata.backing_address = path;
  }
  return Register(std::make_unique<SharedFdIo>(std::move(fd)),
                  std::move(metadata));
}

bool ResourceTable::Unregister(std::string_view resource_id) {
  std::lock_guard lock(mutex_);
  auto it = resources_.find(resource_id);
  if (it == resources_.end()) {
    return false;
  }
  resources_.erase(it);
  return true;
}

std::optional<LiveResource> ResourceTable::Lookup(
    std::string_view resource_id) {
  std::lock_guard lock(mutex_);
  auto it = resources_.find(resource_id);
  if (it == resources_.end()) {
    return std::nullopt;
  }
  return LiveResource{it->second.handle.get(), it->second.metadata};
}

}  // namespace substream
