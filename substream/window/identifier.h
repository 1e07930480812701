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

#include <string>
#include <string_view>

#include "substream/result/result_type.h"

namespace substream {

/**
 * A window request: `length` bytes starting at absolute `offset` of the
 * resource registered as `resource_id`.
 *
 * The textual form is `<scheme>://<offset>:<length>/<resource_id>`, where the
 * scheme is made of [A-Za-z0-9.-] and the three other fields are decimal
 * digits. No escaping is defined.
 */
struct Identifier {
  std::string scheme;
  uint64_t offset = 0;
  uint64_t length = 0;
  std::string resource_id;

  bool operator==(const Identifier& other) const {
    return scheme == other.scheme && offset == other.offset &&
           length == other.length && resource_id == other.resource_id;
  }
};

/**
 * Parses the textual form of an identifier. Fails with
 * `WindowErrorKind::kParse` when the text does not match the grammar, when a
 * number does not fit, when `length` is zero, or when the window end does not
 * fit in a signed 64-bit file offset.
 *
 * The scheme is not compared with anything here.
 */
Result<Identifier> ParseIdentifier(std::string_view path);

std::string FormatIdentifier(const Identifier&);

}  // namespace substream
