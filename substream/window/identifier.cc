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

#include "substream/window/identifier.h"

#include <stdint.h>

#include <algorithm>
#include <limits>
#include <string>
#include <string_view>

#include <android-base/parseint.h>
#include <fmt/core.h>

#include "substream/result/expect.h"
#include "substream/result/result_type.h"
#include "substream/window/errors.h"

namespace substream {
namespace {

constexpr std::string_view kSchemeSeparator = "://";

bool IsSchemeChar(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '.' || c == '-';
}

bool IsDigits(std::string_view str) {
  return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) {
    return c >= '0' && c <= '9';
  });
}

Result<uint64_t> ParseField(std::string_view name, std::string_view value) {
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kParse, IsDigits(value),
                        "The " << name << " '" << value
                               << "' is not a decimal number");
  uint64_t parsed;
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kParse,
                        android::base::ParseUint(std::string(value), &parsed),
                        "The " << name << " '" << value << "' is too large");
  return parsed;
}

}  // namespace

Result<Identifier> ParseIdentifier(std::string_view path) {
  size_t scheme_end = path.find(kSchemeSeparator);
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kParse,
                        scheme_end != std::string_view::npos,
                        "Missing '" << kSchemeSeparator << "' in '" << path
                                    << "'");

  std::string_view scheme = path.substr(0, scheme_end);
  SUBSTREAM_EXPECT_KIND(
      WindowErrorKind::kParse,
      !scheme.empty() && std::all_of(scheme.begin(), scheme.end(), IsSchemeChar),
      "Invalid scheme '" << scheme << "' in '" << path << "'");

  std::string_view rest = path.substr(scheme_end + kSchemeSeparator.size());
  size_t colon = rest.find(':');
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kParse,
                        colon != std::string_view::npos,
                        "Missing ':' between offset and length in '" << path
                                                                      << "'");
  size_t slash = rest.find('/', colon + 1);
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kParse,
                        slash != std::string_view::npos,
                        "Missing '/' before the resource id in '" << path
                                                                  << "'");

  Identifier identifier;
  identifier.scheme = std::string(scheme);
  identifier.offset =
      SUBSTREAM_EXPECT(ParseField("offset", rest.substr(0, colon)));
  identifier.length = SUBSTREAM_EXPECT(
      ParseField("length", rest.substr(colon + 1, slash - colon - 1)));

  std::string_view resource_id = rest.substr(slash + 1);
  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kParse, IsDigits(resource_id),
                        "The resource id '" << resource_id
                                            << "' is not a decimal number");
  identifier.resource_id = std::string(resource_id);

  SUBSTREAM_EXPECT_KIND(WindowErrorKind::kParse, identifier.length > 0,
                        "Zero length window in '" << path << "'");
  constexpr uint64_t kMaxEnd = std::numeric_limits<int64_t>::max();
  SUBSTREAM_EXPECT_KIND(
      WindowErrorKind::kParse,
      identifier.offset <= kMaxEnd &&
          identifier.length <= kMaxEnd - identifier.offset,
      "Window end " << identifier.offset << " + " << identifier.length
                    << " does not fit in a file offset");
  return identifier;
}

std::string FormatIdentifier(const Identifier& identifier) {
  return fmt::format("{}://{}:{}/{}", identifier.scheme, identifier.offset,
                     identifier.length, identifier.resource_id);
}

}  // namespace substream
