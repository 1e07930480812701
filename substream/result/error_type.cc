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

#include "substream/result/error_type.h"

#include <stddef.h>

#include <ostream>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace substream {

StackTraceEntry::StackTraceEntry(std::string file, size_t line,
                                 std::string pretty_function)
    : file_(std::move(file)),
      line_(line),
      pretty_function_(std::move(pretty_function)) {}

StackTraceEntry::StackTraceEntry(std::string file, size_t line,
                                 std::string pretty_function,
                                 std::string expression)
    : file_(std::move(file)),
      line_(line),
      pretty_function_(std::move(pretty_function)),
      expression_(std::move(expression)) {}

StackTraceEntry::StackTraceEntry(const StackTraceEntry& other)
    : file_(other.file_),
      line_(other.line_),
      pretty_function_(other.pretty_function_),
      expression_(other.expression_),
      message_(other.message_.str()) {}

StackTraceEntry& StackTraceEntry::operator=(const StackTraceEntry& other) {
  file_ = other.file_;
  line_ = other.line_;
  pretty_function_ = other.pretty_function_;
  expression_ = other.expression_;
  message_.str(other.message_.str());
  return *this;
}

bool StackTraceEntry::HasMessage() const { return !message_.str().empty(); }

void StackTraceEntry::Write(std::ostream& stream) const {
  stream << message_.str();
}

void StackTraceEntry::WriteVerbose(std::ostream& stream) const {
  std::string message = message_.str();
  stream << (message.empty() ? "Failure" : message) << "\n";
  stream << fmt::format(" at {}:{}\n in {}", file_, line_, pretty_function_);
  if (!expression_.empty()) {
    stream << " for SUBSTREAM_EXPECT(" << expression_ << ")";
  }
  stream << "\n";
}

std::string StackTraceError::Message() const {
  std::stringstream writer;
  for (const auto& entry : stack_) {
    entry.Write(writer);
  }
  return writer.str();
}

std::string StackTraceError::Trace() const {
  std::stringstream writer;
  for (const auto& entry : stack_) {
    entry.WriteVerbose(writer);
  }
  return writer.str();
}

std::string StackTraceError::FormatForEnv() const {
  std::string out;
  for (auto it = stack_.rbegin(); it != stack_.rend(); it++) {
    if (!it->HasMessage()) {
      continue;
    }
    if (!out.empty()) {
      out += "\n  ";
    }
    out += it->Message();
  }
  if (out.empty()) {
    out = "Unknown failure";
  }
  if (code_ != 0) {
    out += fmt::format(" (code {})", code_);
  }
  return out;
}

std::ostream& operator<<(std::ostream& out, const StackTraceError& error) {
  return out << error.Trace();
}

}  // namespace substream
