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


#include "substream/io/native_filesystem.h"

#include <fcntl.h>
#include <sys/stat.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "substream/fs/shared_fd.h"
#include "substream/io/shared_fd.h"
#include "substream/result/expect.h"
#include "substream/result/result_type.h"

namespace substream {

Result<std::unique_ptr<ReaderSeeker>> NativeFilesystem::OpenReadOnly(
    std::string_view address) {
  // O_NONBLOCK keeps open(2) from waiting for a writer on a FIFO. It has no
  // effect on reads from regular files.
  SharedFD fd = SharedFD::Open(std::string(address), O_RDONLY | O_NONBLOCK);
  SUBSTREAM_EXPECTF(fd->IsOpen(), "Failed to open '{}': {}", address,
                    fd->StrError());

  struct stat st;
  SUBSTREAM_EXPECTF(fd->Fstat(&st) == 0, "Failed to stat '{}': {}", address,
                    fd->StrError());
  SUBSTREAM_EXPECTF(S_ISREG(st.st_mode), "'{}' is not a regular file",
                    address);
  return std::make_unique<SharedFdIo>(std::move(fd));
}

}  // namespace substream
