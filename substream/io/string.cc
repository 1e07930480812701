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

#include "substream/io/string.h"

#include <stddef.h>
#include <stdint.h>

#include <sstream>
#include <string>
#include <vector>

#include "substream/io/io.h"
#include "substream/result/expect.h"
#include "substream/result/result_type.h"

namespace substream {

Result<std::string> ReadToString(Reader& reader, size_t buffer_size) {
  std::stringstream out;

  std::vector<char> buf(buffer_size);
  uint64_t data_read;
  while ((data_read = SUBSTREAM_EXPECT(reader.Read(buf.data(), buf.size()))) >
         0) {
    out.write(buf.data(), data_read);
  }
  return out.str();
}

}  // namespace substream
