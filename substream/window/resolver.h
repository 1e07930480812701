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

#include <stddef.h>

#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "substream/io/filesystem.h"
#include "substream/io/io.h"
#include "substream/result/result_type.h"
#include "substream/window/identifier.h"
#include "substream/window/resource_registry.h"
#include "substream/window/window_bounds.h"

namespace substream {

inline constexpr std::string_view kDefaultScheme = "substream";

// A second handle on the same file, positioned independently of the
// registered one. Window bounds are in the coordinates of the file.
struct FileBackedView {
  std::unique_ptr<ReaderSeeker> handle;
};

// A private copy of the requested range. Window bounds start at zero.
struct MaterializedCopy {
  std::unique_ptr<ReaderWriterSeeker> copy;
};

using WindowBacking = std::variant<FileBackedView, MaterializedCopy>;

ReaderSeeker& BackingHandle(WindowBacking&);

struct ResolvedWindow {
  WindowBacking backing;
  WindowBounds bounds;
};

struct ResolverOptions {
  // Identifiers with any other scheme are rejected.
  std::string scheme = std::string(kDefaultScheme);
  // Chunk size used while copying a range out of a memory backed resource.
  size_t copy_buffer_size = 1 << 16;
};

/**
 * Turns an `Identifier` into an owned handle plus the bounds to enforce on it.
 *
 * Resources registered as file backed with a backing address are opened again
 * through `filesystem`, so windows never move the registered handle. Any
 * other resource has the requested range copied into a new memfd; the
 * registered handle's seek position is restored afterwards.
 *
 * Failures carry a `WindowErrorKind` code.
 */
class WindowResolver {
 public:
  WindowResolver(ResourceRegistry& registry, ReadFilesystem& filesystem,
                 ResolverOptions options = {});

  Result<ResolvedWindow> Resolve(const Identifier&);

  const ResolverOptions& Options() const { return options_; }

 private:
  Result<ResolvedWindow> OpenIndependentHandle(const Identifier&,
                                               const std::string& address);
  Result<ResolvedWindow> Materialize(const Identifier&, ReaderSeeker& source);

  ResourceRegistry* registry_;
  ReadFilesystem* filesystem_;
  ResolverOptions options_;
};

}  // namespace substream
