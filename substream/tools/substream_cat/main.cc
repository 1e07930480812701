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


#include <unistd.h>

#include <android-base/logging.h>
#include <gflags/gflags.h>

#include "substream/fs/shared_fd.h"
#include "substream/io/shared_fd.h"
#include "substream/result/expect.h"
#include "substream/result/result_type.h"
#include "substream/tools/substream_cat/cat_window.h"

DEFINE_string(file, "", "File to expose through the window.");
DEFINE_uint64(offset, 0, "Offset of the window in the file.");
DEFINE_uint64(length, 0, "Number of bytes in the window.");
DEFINE_bool(memory, false,
            "Register an anonymous in-memory copy of the file instead of the "
            "file itself.");
DEFINE_string(scheme, "substream", "Scheme of the window identifier.");
DEFINE_bool(stat, false, "Print the window size instead of its contents.");
DEFINE_uint64(chunk_size, 1 << 16, "Bytes requested per read.");
DEFINE_bool(report_errors, true, "Log open failures at ERROR severity.");

namespace substream {
namespace {

Result<void> CatMain() {
  CatOptions options;
  options.file = FLAGS_file;
  options.offset = FLAGS_offset;
  options.length = FLAGS_length;
  options.memory = FLAGS_memory;
  options.scheme = FLAGS_scheme;
  options.stat = FLAGS_stat;
  options.chunk_size = FLAGS_chunk_size;
  options.report_errors = FLAGS_report_errors;

  SharedFdIo out(SharedFD::Dup(STDOUT_FILENO));
  SUBSTREAM_EXPECT(out.Fd()->IsOpen(), out.Fd()->StrError());
  return CatWindow(options, out);
}

}  // namespace
}  // namespace substream

int main(int argc, char** argv) {
  ::android::base::InitLogging(argv, android::base::StderrLogger);
  gflags::SetUsageMessage(
      "Prints --length bytes of --file starting at --offset.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  substream::Result<void> result = substream::CatMain();
  if (!result.ok()) {
    LOG(ERROR) << result.error().FormatForEnv();
    LOG(DEBUG) << result.error().Trace();
    return 1;
  }
  return 0;
}
