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


#include "substream/tools/substream_cat/cat_window.h"

#include <fcntl.h>
#include <stddef.h>
#include <stdint.h>
#include <sys/stat.h>

#include <optional>
#include <string>

#include "substream/fs/shared_fd.h"
#include "substream/io/copy.h"
#include "substream/io/io.h"
#include "substream/io/native_filesystem.h"
#include "substream/io/shared_fd.h"
#include "substream/result/expect.h"
#include "substream/result/result_type.h"
#include "substream/window/identifier.h"
#include "substream/window/resolver.h"
#include "substream/window/resource_table.h"
#include "substream/window/substream.h"

namespace substream {
namespace {

Result<std::string> RegisterFile(ResourceTable& resources,
                                 const CatOptions& options) {
  if (!options.memory) {
    return SUBSTREAM_EXPECT(resources.RegisterPath(options.file));
  }
  SharedFD file = SharedFD::Open(options.file, O_RDONLY | O_NONBLOCK);
  SUBSTREAM_EXPECTF(file->IsOpen(), "Failed to open '{}': {}", options.file,
                    file->StrError());
  struct stat st;
  SUBSTREAM_EXPECTF(file->Fstat(&st) == 0, "Failed to stat '{}': {}",
                    options.file, file->StrError());
  SUBSTREAM_EXPECTF(S_ISREG(st.st_mode), "'{}' is not a regular file",
                    options.file);
  SharedFdIo source(file);

  SharedFD memfd = SharedFD::MemfdCreate("substream_cat");
  SUBSTREAM_EXPECT(memfd->IsOpen(),
                   "memfd_create failed: " << memfd->StrError());
  SharedFdIo copy(memfd);

  SUBSTREAM_EXPECT(
      CopyRange(source, 0, static_cast<uint64_t>(st.st_size), copy));
  return SUBSTREAM_EXPECT(resources.RegisterFd(memfd));
}

Result<void> WriteAll(Writer& out, const std::string& data) {
  size_t written = 0;
  while (written < data.size()) {
    uint64_t count = SUBSTREAM_EXPECT(
        out.Write(data.data() + written, data.size() - written));
    SUBSTREAM_EXPECT(count > 0, "Output accepted no bytes");
    written += count;
  }
  return {};
}

}  // namespace

Result<void> CatWindow(const CatOptions& options, Writer& out) {
  SUBSTREAM_EXPECT(!options.file.empty(), "--file is required");
  SUBSTREAM_EXPECT(options.length > 0, "--length must be positive");
  SUBSTREAM_EXPECT(options.chunk_size > 0, "--chunk_size must be positive");

  ResourceTable resources;
  std::string id = SUBSTREAM_EXPECT(RegisterFile(resources, options));

  NativeFilesystem filesystem;
  ResolverOptions resolver_options;
  resolver_options.scheme = options.scheme;
  WindowResolver resolver(resources, filesystem, resolver_options);

  std::string path = FormatIdentifier(
      Identifier{options.scheme, options.offset, options.length, id});
  SubStream stream(resolver);
  if (!stream.Open(path, "rb", OpenOptions{options.report_errors})) {
    return SUBSTREAM_ERRF("Failed to open '{}'", path);
  }

  if (options.stat) {
    std::optional<WindowStat> stat = stream.Stat();
    SUBSTREAM_EXPECT(stat.has_value(), "No stat for '" << path << "'");
    SUBSTREAM_EXPECT(WriteAll(out, std::to_string(stat->size) + "\n"));
    return {};
  }

  while (true) {
    std::optional<std::string> chunk =
        SUBSTREAM_EXPECT(stream.Read(options.chunk_size));
    if (!chunk.has_value()) {
      break;
    }
    SUBSTREAM_EXPECT(WriteAll(out, *chunk));
  }
  stream.Close();
  return {};
}

}  // namespace substream
