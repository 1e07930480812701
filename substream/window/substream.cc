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

#include "substream/window/substream.h"

#include <stdint.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <android-base/logging.h>

#include "substream/result/expect.h"
#include "substream/result/result_type.h"
#include "substream/window/errors.h"
#include "substream/window/resolver.h"
#include "substream/window/window.h"
#include "substream/window/window_bounds.h"

namespace substream {
namespace {

bool RequestsWriteAccess(std::string_view mode) {
  return mode.find_first_of("wax+c") != std::string_view::npos;
}

}  // namespace

SubStream::SubStream(WindowResolver& resolver) : resolver_(&resolver) {}

bool SubStream::Open(std::string_view path, std::string_view mode,
                     OpenOptions options) {
  if (state_ != State::kUnopened) {
    StackTraceError error =
        StackTraceError(SUBSTREAM_ERR("Stream was already opened"));
    ReportOpenFailure(path, error, options);
    return false;
  }
  if (RequestsWriteAccess(mode)) {
    LOG(WARNING) << "Mode '" << mode << "' requested for '" << path
                 << "', opening read-only";
  }

  Result<std::unique_ptr<Window>> window = Window::Open(*resolver_, path);
  if (!window.ok()) {
    ReportOpenFailure(path, window.error(), options);
    return false;
  }
  window_ = std::move(*window);
  state_ = State::kOpen;
  last_error_.reset();
  return true;
}

void SubStream::ReportOpenFailure(std::string_view path,
                                  const StackTraceError& error,
                                  const OpenOptions& options) {
  WindowErrorKind kind = ErrorKindOf(error);
  last_error_ = OpenError{kind, error.FormatForEnv()};
  if (options.report_errors) {
    LOG(ERROR) << "Failed to open '" << path << "': " << ErrorKindName(kind)
               << ": " << last_error_->message;
  } else {
    LOG(DEBUG) << "Failed to open '" << path << "': " << ErrorKindName(kind)
               << ": " << error.Trace();
  }
}

Result<std::optional<std::string>> SubStream::Read(uint64_t count) {
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kIo, state_ == State::kOpen,
                        "Stream is not open");
  return SUBSTREAM_EXPECT(window_->Read(count));
}

bool SubStream::Seek(int64_t offset, Whence whence) {
  return state_ == State::kOpen && window_->Seek(offset, whence);
}

std::optional<uint64_t> SubStream::Tell() const {
  if (state_ != State::kOpen) {
    return std::nullopt;
  }
  return window_->Tell();
}

bool SubStream::Eof() const {
  return state_ != State::kOpen || window_->Eof();
}

std::optional<WindowStat> SubStream::Stat() const {
  if (state_ != State::kOpen) {
    return std::nullopt;
  }
  return window_->Stat();
}

void SubStream::Close() {
  if (state_ != State::kOpen) {
    return;
  }
  window_->Close();
  window_.reset();
  state_ = State::kClosed;
}

}  // namespace substream
