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

#include <string>

#include "substream/io/io.h"
#include "substream/result/result_type.h"

namespace substream {

struct CatOptions {
  std::string file;
  uint64_t offset = 0;
  uint64_t length = 0;
  // Register an anonymous copy of `file` instead of the file itself.
  bool memory = false;
  std::string scheme = "substream";
  // Write the window size instead of its contents.
  bool stat = false;
  uint64_t chunk_size = 1 << 16;
  bool report_errors = true;
};

/* Writes the `[offset, offset + length)` window of `options.file` to `out`. */
Result<void> CatWindow(const CatOptions& options, Writer& out);

}  // namespace substream
