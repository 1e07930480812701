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

#include "substream/io/filesystem.h"
#include "substream/io/io.h"
#include "substream/result/result_type.h"

namespace substream {

// Treats addresses as host paths. Only regular files can be opened: a path
// that names a FIFO, device or directory is refused without blocking.
class NativeFilesystem : public ReadFilesystem {
 public:
  Result<std::unique_ptr<ReaderSeeker>> OpenReadOnly(
      std::string_view address) override;
};

}  // namespace substream
