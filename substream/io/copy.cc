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


#include "substream/io/copy.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <vector>

#include "substream/io/io.h"
#include "substream/result/expect.h"
#include "substream/result/result_type.h"

namespace substream {
namespace {

Result<void> WriteFully(Writer& destination, const char* data, uint64_t size) {
  while (size > 0) {
    uint64_t written = SUBSTREAM_EXPECT(destination.Write(data, size));
    SUBSTREAM_EXPECT(written > 0, "Destination accepted no data");
    data += written;
    size -= written;
  }
  return {};
}

}  // namespace

Result<void> CopyRange(ReaderSeeker& source, uint64_t offset, uint64_t length,
                       Writer& destination, size_t buffer_size) {
  SUBSTREAM_EXPECT(buffer_size > 0, "Empty copy buffer");
  SUBSTREAM_EXPECTF(source.SeekSet(offset), "Failed to seek the source to {}",
                    offset);

  std::vector<char> buf(std::min<uint64_t>(buffer_size, length));
  uint64_t copied = 0;
  while (copied < length) {
    uint64_t want = std::min<uint64_t>(buf.size(), length - copied);
    uint64_t got = SUBSTREAM_EXPECT(source.Read(buf.data(), want));
    SUBSTREAM_EXPECTF(got > 0, "Source ended at {}, {} bytes short of {}",
                      offset + copied, length - copied, offset + length);
    SUBSTREAM_EXPECT(WriteFully(destination, buf.data(), got));
    copied += got;
  }
  return {};
}

}  // namespace substream
