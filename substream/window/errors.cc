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

#include "substream/window/errors.h"

#include <string_view>

#include "substream/result/error_type.h"

namespace substream {

WindowErrorKind ErrorKindOf(const StackTraceError& error) {
  switch (error.Code()) {
    case static_cast<int>(WindowErrorKind::kParse):
    case static_cast<int>(WindowErrorKind::kInvalidScheme):
    case static_cast<int>(WindowErrorKind::kResourceNotFound):
    case static_cast<int>(WindowErrorKind::kNotSeekable):
    case static_cast<int>(WindowErrorKind::kIo):
      return static_cast<WindowErrorKind>(error.Code());
    default:
      return WindowErrorKind::kUnknown;
  }
}

std::string_view ErrorKindName(WindowErrorKind kind) {
  switch (kind) {
    case WindowErrorKind::kParse:
      return "ParseError";
    case WindowErrorKind::kInvalidScheme:
      return "InvalidSchemeError";
    case WindowErrorKind::kResourceNotFound:
      return "ResourceNotFoundError";
    case WindowErrorKind::kNotSeekable:
      return "NotSeekableError";
    case WindowErrorKind::kIo:
      return "IoError";
    case WindowErrorKind::kUnknown:
      break;
  }
  return "UnknownError";
}

}  // namespace substream
