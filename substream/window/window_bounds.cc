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

#include "substream/window/window_bounds.h"

#include <stdint.h>

#include <optional>

namespace substream {

WindowBounds::WindowBounds(uint64_t begin, uint64_t length)
    : enforce_min_(begin), enforce_max_(begin + length), offset_(begin) {}

std::optional<uint64_t> WindowBounds::RelativePosition() const {
  if (offset_ < enforce_min_ || offset_ >= enforce_max_) {
    return std::nullopt;
  }
  return offset_ - enforce_min_;
}

std::optional<uint64_t> WindowBounds::ResolveSeek(int64_t requested,
                                                  Whence whence) {
  // Work relative to enforce_min_ so that nothing can overflow: every base is
  // in [0, Size()].
  uint64_t base;
  switch (whence) {
    case Whence::kFromStart:
      base = 0;
      break;
    case Whence::kFromCurrent:
      base = offset_ - enforce_min_;
      break;
    case Whence::kFromEnd:
      base = Size();
      break;
    default:
      return std::nullopt;
  }

  uint64_t relative;
  if (requested < 0) {
    // -(requested + 1) + 1 is the magnitude, valid even for INT64_MIN.
    uint64_t magnitude = static_cast<uint64_t>(-(requested + 1)) + 1;
    if (magnitude > base) {
      return std::nullopt;
    }
    relative = base - magnitude;
  } else {
    uint64_t magnitude = static_cast<uint64_t>(requested);
    if (magnitude >= Size() - base) {
      return std::nullopt;
    }
    relative = base + magnitude;
  }
  if (relative >= Size()) {
    return std::nullopt;
  }
  offset_ = enforce_min_ + relative;
  return offset_;
}

void WindowBounds::Advance(uint64_t count) {
  offset_ += count < Remaining() ? count : Remaining();
}

}  // namespace substream
