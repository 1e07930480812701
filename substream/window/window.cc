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

#include <stdint.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "substream/io/io.h"
#include "substream/result/expect.h"
#include "substream/result/result_type.h"
#include "substream/window/errors.h"
#include "substream/window/identifier.h"
#include "substream/window/resolver.h"
#include "substream/window/window_bounds.h"

namespace substream {

Window::Window(ResolvedWindow resolved)
    : backing_(std::move(resolved.backing)), bounds_(resolved.bounds) {}

Result<std::unique_ptr<Window>> Window::Open(WindowResolver& resolver,
                                             std::string_view path) {
  Identifier identifier = SUBSTREAM_EXPECT(ParseIdentifier(path));
  ResolvedWindow resolved = SUBSTREAM_EXPECT(resolver.Resolve(identifier));
  return std::make_unique<Window>(std::move(resolved));
}

Result<std::optional<std::string>> Window::Read(uint64_t count) {
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo, backing_.has_value(),
                        "Read from a closed window");
  if (bounds_.IsEof()) {
    return std::optional<std::string>();
  }
  uint64_t to_read = std::min({count, bounds_.Remaining(), kMaxReadChunk});
  if (to_read == 0) {
    return std::optional<std::string>(std::string());
  }

  ReaderSeeker& handle = BackingHandle(*backing_);
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo, handle.SeekSet(bounds_.Offset()),
                        "Failed to seek to " << bounds_.Offset());
  std::string data(to_read, '\0');
  uint64_t data_read =
      SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo,
                            handle.Read(data.data(), to_read),
                            "Failed to read at " << bounds_.Offset());
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo, data_read > 0,
                        "Resource ended at " << bounds_.Offset()
                                             << ", before the window end "
                                             << bounds_.EnforceMax());
  data.resize(data_read);
  bounds_.Advance(data_read);
  return std::optional<std::string>(std::move(data));
}

bool Window::Seek(int64_t offset, Whence whence) {
  if (!backing_.has_value()) {
    return false;
  }
  return bounds_.ResolveSeek(offset, whence).has_value();
}

std::optional<uint64_t> Window::Tell() const {
  return bounds_.RelativePosition();
}

bool Window::Eof() const { return bounds_.IsEof(); }

WindowStat Window::Stat() const { return WindowStat{bounds_.Size()}; }

void Window::Close() { backing_.reset(); }

}  // namespace substream
