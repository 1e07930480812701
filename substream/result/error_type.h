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

#include <stddef.h>

#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <android-base/expected.h>  // IWYU pragma: export

namespace substream {

class StackTraceError;

class StackTraceEntry {
 public:
  StackTraceEntry(std::string file, size_t line, std::string pretty_function);

  StackTraceEntry(std::string file, size_t line, std::string pretty_function,
                  std::string expression);

  StackTraceEntry(const StackTraceEntry& other);

  StackTraceEntry(StackTraceEntry&&) = default;
  StackTraceEntry& operator=(const StackTraceEntry& other);
  StackTraceEntry& operator=(StackTraceEntry&&) = default;

  template <typename T>
  StackTraceEntry& operator<<(T&& message_ext) & {
    message_ << std::forward<T>(message_ext);
    return *this;
  }
  template <typename T>
  StackTraceEntry operator<<(T&& message_ext) && {
    message_ << std::forward<T>(message_ext);
    return std::move(*this);
  }

  operator StackTraceError() &&;
  template <typename T>
  operator android::base::expected<T, StackTraceError>() &&;

  bool HasMessage() const;
  std::string Message() const { return message_.str(); }

  // Only the user-provided message.
  void Write(std::ostream& stream) const;
  // Message plus location, function and the failing expression, if any.
  void WriteVerbose(std::ostream& stream) const;

 private:
  std::string file_;
  size_t line_;
  std::string pretty_function_;
  std::string expression_;
  std::stringstream message_;
};

#define SUBSTREAM_STACK_TRACE_ENTRY(expression) \
  StackTraceEntry(__FILE__, __LINE__, __PRETTY_FUNCTION__, expression)

/**
 * Chain of `StackTraceEntry` values, innermost first.
 *
 * An error may carry an integer code. The code is opaque at this level; layers
 * above use it to classify failures without parsing messages. Zero means no
 * code was assigned.
 */
class StackTraceError {
 public:
  StackTraceError& PushEntry(StackTraceEntry entry) & {
    stack_.emplace_back(std::move(entry));
    return *this;
  }
  StackTraceError PushEntry(StackTraceEntry entry) && {
    stack_.emplace_back(std::move(entry));
    return std::move(*this);
  }
  const std::vector<StackTraceEntry>& Stack() const { return stack_; }

  StackTraceError& WithCode(int code) & {
    code_ = code;
    return *this;
  }
  StackTraceError WithCode(int code) && {
    code_ = code;
    return std::move(*this);
  }
  int Code() const { return code_; }

  std::string Message() const;
  std::string Trace() const;
  // One line per entry with a message, outermost first. Suitable for logs.
  std::string FormatForEnv() const;

  template <typename T>
  operator android::base::expected<T, StackTraceError>() && {
    return android::base::unexpected(std::move(*this));
  }

 private:
  std::vector<StackTraceEntry> stack_;
  int code_ = 0;
};

inline StackTraceEntry::operator StackTraceError() && {
  return StackTraceError().PushEntry(std::move(*this));
}

template <typename T>
inline StackTraceEntry::operator android::base::expected<T,
                                                         StackTraceError>() && {
  return android::base::unexpected(std::move(*this));
}

std::ostream& operator<<(std::ostream&, const StackTraceError&);

}  // namespace substream
