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

#pragma once

#include <stdint.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "substream/fs/shared_fd.h"
#include "substream/io/io.h"
#include "substream/result/result_type.h"
#include "substream/window/resource_registry.h"

namespace substream {

// Describes an open descriptor. Seekability is probed with lseek(2); memfds
// and unlinked files are memory backed; other regular files are file backed at
// their current path.
Result<ResourceMetadata> ClassifyFd(const SharedFD&);

/**
 * In-process `ResourceRegistry` that owns its resources.
 *
 * Resource ids are decimal numbers assigned in registration order, starting at
 * 1. Ids are never reused by the same table.
 */
class ResourceTable : public ResourceRegistry {
 public:
  std::string Register(std::unique_ptr<ReaderSeeker>, ResourceMetadata);
  Result<std::string> RegisterFd(SharedFD);
  // Refuses anything but a regular file without blocking on FIFOs.
  Result<std::string> RegisterPath(const std::string& path);

  // Returns false if no resource has that id.
  bool Unregister(std::string_view resource_id);

  std::optional<LiveResource> Lookup(std::string_view resource_id) override;

 private:
  struct Entry {
    std::unique_ptr<ReaderSeeker> handle;
    ResourceMetadata metadata;
  };

  std::mutex mutex_;
  uint64_t next_id_ = 1;
  std::map<std::string, Entry, std::less<void>> resources_;
};

}  // namespace substream
