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
#include <stdint.h>

#include "substream/io/io.h"
#include "substream/result/result_type.h"

namespace substream {

/**
 * Writes bytes [offset, offset + length) of `source` to `destination` at its
 * current position, `buffer_size` bytes at a time.
 *
 * Fails if `source` ends before `offset + length`. On return, successful or
 * not, the position of `source` is wherever the copy left it.
 */
Result<void> CopyRange(ReaderSeeker& source, uint64_t offset, uint64_t length,
                       Writer& destination, size_t buffer_size = 1 << 16);

}  // namespace substream
