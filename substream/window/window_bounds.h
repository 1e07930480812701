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

#include <optional>

namespace substream {

enum class Whence {
  kFromStart,
  kFromCurrent,
  kFromEnd,
};

/**
 * Cursor over the absolute range [enforce_min, enforce_max) of an underlying
 * resource. Pure arithmetic: no I/O happens here.
 *
 * The cursor stays within [enforce_min, enforce_max]. It only reaches
 * enforce_max by reading the last byte; seeking there is rejected.
 */
class WindowBounds {
 public:
  // `begin + length` must not overflow.
  WindowBounds(uint64_t begin, uint64_t length);

  uint64_t EnforceMin() const { return enforce_min_; }
  uint64_t EnforceMax() const { return enforce_max_; }
  // Absolute cursor in the coordinates of the underlying resource.
  uint64_t Offset() const { return offset_; }

  uint64_t Size() const { return enforce_max_ - enforce_min_; }
  uint64_t Remaining() const { return enforce_max_ - offset_; }
  bool IsEof() const { return offset_ >= enforce_max_; }

  // Cursor relative to the start of the window, or nullopt when the cursor
  // is at the end.
  std::optional<uint64_t> RelativePosition() const;

  // Moves the cursor and returns the new absolute offset, or returns nullopt
  // without moving it if the target is outside [enforce_min, enforce_max).
  std::optional<uint64_t> ResolveSeek(int64_t requested, Whence whence);

  // Moves the cursor forward by `count` bytes, stopping at the end.
  void Advance(uint64_t count);

 private:
  uint64_t enforce_min_;
  uint64_t enforce_max_;
  uint64_t offset_;
};

}  // namespace substream
