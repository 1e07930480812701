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

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "substream/result/result_type.h"
#include "substream/window/resolver.h"
#include "substream/window/window_bounds.h"

namespace substream {

// Most bytes one `Window::Read` returns, whatever count is asked for.
inline constexpr uint64_t kMaxReadChunk = 1 << 16;

struct WindowStat {
  uint64_t size;
};

/**
 * A read-only view of `length` bytes of another resource, addressed as
 * positions [0, length).
 *
 * The window owns its handle: closing or destroying it closes the independent
 * file handle or releases the private copy. Not safe for concurrent use.
 */
class Window {
 public:
  explicit Window(ResolvedWindow);

  // Parses `path` and resolves it. Failures carry a `WindowErrorKind` code.
  static Result<std::unique_ptr<Window>> Open(WindowResolver&,
                                              std::string_view path);

  /**
   * Reads up to `count` bytes at the cursor and advances past them.
   *
   * Returns nullopt once the cursor is at the end of the window. Fewer than
   * `count` bytes may be returned before the end, and never more than
   * `kMaxReadChunk`; callers loop. A request for
   * zero bytes inside the window returns an empty string.
   */
  Result<std::optional<std::string>> Read(uint64_t count);

  // Returns false, leaving the cursor in place, when the target is outside
  // [0, length).
  bool Seek(int64_t offset, Whence whence);
  // nullopt when the cursor is at the end of the window.
  std::optional<uint64_t> Tell() const;
  bool Eof() const;
  WindowStat Stat() const;

  // Releases the handle. Safe to call more than once.
  void Close();
  bool IsClosed() const { return !backing_.has_value(); }

 private:
  std::optional<WindowBacking> backing_;
  WindowBounds bounds_;
};

}  // namespace substream
