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

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "substream/result/result_type.h"
#include "substream/window/errors.h"
#include "substream/window/resolver.h"
#include "substream/window/window.h"
#include "substream/window/window_bounds.h"

namespace substream {

struct OpenOptions {
  // Log open failures at ERROR severity instead of DEBUG.
  bool report_errors = false;
};

struct OpenError {
  WindowErrorKind kind;
  std::string message;
};

/**
 * Stream-style front end for `Window`, for hosts that dispatch paths such as
 * "substream://512:64/3" to a handler object.
 *
 * An instance is opened at most once. Failures while opening are returned as
 * `false` and recorded in `LastError()`; `report_errors` only decides how
 * loudly they are logged. Every operation other than `Open` fails on an
 * instance that is not open, without touching any handle.
 */
class SubStream {
 public:
  enum class State {
    kUnopened,
    kOpen,
    kClosed,
  };

  explicit SubStream(WindowResolver& resolver);

  // `mode` is accepted for compatibility with fopen(3) style callers; the
  // window is always read-only.
  bool Open(std::string_view path, std::string_view mode,
            OpenOptions options = {});

  Result<std::optional<std::string>> Read(uint64_t count);
  bool Seek(int64_t offset, Whence whence = Whence::kFromStart);
  std::optional<uint64_t> Tell() const;
  bool Eof() const;
  std::optional<WindowStat> Stat() const;
  void Close();

  State GetState() const { return state_; }
  const std::optional<OpenError>& LastError() const { return last_error_; }

 private:
  void ReportOpenFailure(std::string_view path, const StackTraceError& error,
                         const OpenOptions& options);

  WindowResolver* resolver_;
  State state_ = State::kUnopened;
  std::unique_ptr<Window> window_;
  std::optional<OpenError> last_error_;
};

}  // namespace substream
