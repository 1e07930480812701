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

#include <string_view>

#include "substream/result/expect.h"
#include "substream/result/result_type.h"

namespace substream {

// Classification of window failures, stored as the code of a StackTraceError.
enum class WindowErrorKind : int {
  kUnknown = 0,
  // The identifier does not match scheme://offset:length/resourceId
  kParse = 1,
  kInvalidScheme = 2,
  kResourceNotFound = 3,
  // The underlying resource cannot be seeked, so no window can be enforced.
  kNotSeekable = 4,
  // Copy, seek or read against an underlying handle failed.
  kIo = 5,
};

WindowErrorKind ErrorKindOf(const StackTraceError&);

std::string_view ErrorKindName(WindowErrorKind);

/**
 * Same as SUBSTREAM_EXPECT, but the returned error is classified as `KIND`.
 * Any code carried by the inner error is replaced.
 *
 *     uint64_t size = SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo,
 *                                           source.SeekEnd(0), "No size");
 *
 * Like SUBSTREAM_EXPECT, `RESULT` must not be a named variable: write
 * `!!flag` for a plain bool.
 */
#define SUBSTREAM_EXPECT_KIND(KIND, RESULT, MSG)                 \
  ({                                                             \
    decltype(RESULT)&& macro_intermediate_result = RESULT;       \
    if (!TypeIsSuccess(macro_intermediate_result)) {             \
      auto current_entry = SUBSTREAM_STACK_TRACE_ENTRY(#RESULT); \
      current_entry << MSG;                                      \
      auto error = ErrorFromType(macro_intermediate_result);     \
      error.PushEntry(std::move(current_entry));                 \
      error.WithCode(static_cast<int>(KIND));                    \
      return std::move(error);                                   \
    };                                                           \
    OutcomeDereference(std::move(macro_intermediate_result));    \
  })

}  // namespace substream
