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

#include "substream/window/resolver.h"

#include <stdint.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <android-base/logging.h>
#include <android-base/scopeguard.h>
#include <fmt/core.h>

#include "substream/fs/shared_fd.h"
#include "substream/io/copy.h"
#include "substream/io/io.h"
#include "substream/io/shared_fd.h"
#include "substream/result/expect.h"
#include "substream/result/result_type.h"
#include "substream/window/errors.h"
#include "substream/window/identifier.h"
#include "substream/window/resource_registry.h"
#include "substream/window/window_bounds.h"

namespace substream {

ReaderSeeker& BackingHandle(WindowBacking& backing) {
  if (auto view = std::get_if<FileBackedView>(&backing); view) {
    return *view->handle;
  }
  return *std::get<MaterializedCopy>(backing).copy;
}

WindowResolver::WindowResolver(ResourceRegistry& registry,
                               ReadFilesystem& filesystem,
                               ResolverOptions options)
    : registry_(&registry),
      filesystem_(&filesystem),
      options_(std::move(options)) {}

Result<ResolvedWindow> WindowResolver::Resolve(const Identifier& identifier) {
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kInvalidScheme,
                        identifier.scheme == options_.scheme,
                        "Invalid URL scheme '" << identifier.scheme
                                               << "', expected '"
                                               << options_.scheme << "'");

  std::optional<LiveResource> resource =
      registry_->Lookup(identifier.resource_id);
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kResourceNotFound,
                        resource.has_value() && resource->handle != nullptr,
                        "Resource " << identifier.resource_id
                                    << " not available");

  const ResourceMetadata& metadata = resource->metadata;
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kNotSeekable, !!metadata.seekable,
                        "Can only wrap seekable resources, resource "
                            << identifier.resource_id << " is not seekable");

  if (metadata.backing_kind == BackingKind::kFileBacked &&
      metadata.backing_address.has_value()) {
    LOG(DEBUG) << "Reopening '" << *metadata.backing_address << "' for "
               << FormatIdentifier(identifier);
    return SUBSTREAM_EXPECT(
        OpenIndependentHandle(identifier, *metadata.backing_address));
  }
  LOG(DEBUG) << "Copying " << identifier.length << " bytes of resource "
             << identifier.resource_id << " for "
             << FormatIdentifier(identifier);
  return SUBSTREAM_EXPECT(Materialize(identifier, *resource->handle));
}

Result<ResolvedWindow> WindowResolver::OpenIndependentHandle(
    const Identifier& identifier, const std::string& address) {
  std::unique_ptr<ReaderSeeker> handle = SUBSTREAM_EXPECT_KIND(
      WindowErrorKind::kIo, filesystem_->OpenReadOnly(address),
      "Failed to open an independent handle on '" << address << "'");
  return ResolvedWindow{FileBackedView{std::move(handle)},
                        WindowBounds(identifier.offset, identifier.length)};
}

Result<ResolvedWindow> WindowResolver::Materialize(const Identifier& identifier,
                                                   ReaderSeeker& source) {
  uint64_t saved_position =
      SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo, source.SeekCur(0),
                            "Failed to get the source position");
  auto restore_position = android::base::make_scope_guard([&]() {
    Result<uint64_t> restored = source.SeekSet(saved_position);
    if (!restored.ok()) {
      LOG(ERROR) << "Failed to restore the position of resource "
                 << identifier.resource_id << ": "
                 << restored.error().FormatForEnv();
    }
  });

  // Moves the position; the guard restores it.
  uint64_t source_size =
      SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo, source.SeekEnd(0),
                            "Failed to get the source size");
  uint64_t end = identifier.offset + identifier.length;
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo, end <= source_size,
                        "Window [" << identifier.offset << ", " << end
                                   << ") exceeds resource "
                                   << identifier.resource_id << " of size "
                                   << source_size);

  SharedFD memfd = SharedFD::MemfdCreate(
      fmt::format("substream:{}", identifier.resource_id));
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo, memfd->IsOpen(),
                        "memfd_create failed: " << memfd->StrError());
  std::unique_ptr<ReaderWriterSeeker> copy =
      std::make_unique<SharedFdIo>(std::move(memfd));

  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo,
                        CopyRange(source, identifier.offset, identifier.length,
                                  *copy, options_.copy_buffer_size),
                        "Failed to copy " << identifier.length << " bytes");
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo, copy->SeekSet(0),
                        "Failed to rewind the copy");

  restore_position.Disable();
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo, source.SeekSet(saved_position),
                        "Failed to restore the source position");

  return ResolvedWindow{MaterializedCopy{std::move(copy)},
                        WindowBounds(0, identifier.length)};
}

}  // namespace substream
