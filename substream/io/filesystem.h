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

#include <memory>
#include <string_view>

#include "substream/io/io.h"
#include "substream/result/result_type.h"

namespace substream {

/**
 * Source of independent read-only handles, keyed by the backing address of a
 * file backed resource.
 *
 * Every successful call returns a new handle positioned at 0 whose position
 * is not shared with any other handle on the same address.
 */
class ReadFilesystem {
 public:
  virtual ~ReadFilesystem() = default;

  virtual Result<std::unique_ptr<ReaderSeeker>> OpenReadOnly(
      std::string_view address) = 0;
};

}  // namespace substream
