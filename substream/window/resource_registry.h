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

#include <optional>
#include <string>
#include <string_view>

#include "substream/io/io.h"

namespace substream {

enum class BackingKind {
  // A regular file with a path that can be opened again.
  kFileBacked,
  // Anonymous memory, such as a memfd, that has no reopenable address.
  kMemoryBacked,
  kOther,
};

struct ResourceMetadata {
  bool seekable = false;
  BackingKind backing_kind = BackingKind::kOther;
  // Where an independent handle to the same data can be opened, if anywhere.
  std::optional<std::string> backing_address;
};

// A live resource as seen through the registry. `handle` is owned by the
// registry and stays valid until the resource is unregistered.
struct LiveResource {
  ReaderSeeker* handle;
  ResourceMetadata metadata;
};

/**
 * Maps resource ids to already-open resources.
 *
 * Implementations serialize their own access; lookups may come from any
 * thread.
 */
class ResourceRegistry {
 public:
  virtual ~ResourceRegistry() = default;

  virtual std::optional<LiveResource> Lookup(std::string_view resource_id) = 0;
};

}  // namespace substream
