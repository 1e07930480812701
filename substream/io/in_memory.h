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

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "substream/io/filesystem.h"
#include "substream/io/io.h"
#include "substream/result/result_type.h"

namespace substream {

// A handle on a private byte vector. Seeking past the end is allowed, as with
// lseek(2); a write there zero-fills the gap.
std::unique_ptr<ReaderWriterSeeker> InMemoryIo();
std::unique_ptr<ReaderWriterSeeker> InMemoryIo(std::vector<char> contents);

struct InMemoryFile;

/**
 * `ReadFilesystem` over files held in memory, for exercising file backed
 * windows without touching the host.
 *
 * Handles opened on an address share its contents: `SetFile` on an address
 * that is already open is seen by every handle, which lets a test shrink a
 * file under a window.
 */
class InMemoryFilesystem : public ReadFilesystem {
 public:
  void SetFile(std::string_view address, std::string contents);
  // Returns false if nothing was stored at `address`. Open handles keep the
  // contents they had.
  bool RemoveFile(std::string_view address);

  Result<std::unique_ptr<ReaderSeeker>> OpenReadOnly(
      std::string_view address) override;

 private:
  std::mutex mutex_;
  std::map<std::string, std::shared_ptr<InMemoryFile>, std::less<void>> files_;
};

}  // namespace substream
