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

#include "substream/result/result_type.h"

namespace substream {

// Returns the number of bytes placed in `buf`, which is 0 only at the end of
// the data or when `count` is 0.
class Reader {
 public:
  virtual ~Reader() = default;

  virtual Result<uint64_t> Read(void* buf, uint64_t count) = 0;
};

// Returns the number of bytes taken from `buf`. May be fewer than `count`.
class Writer {
 public:
  virtual ~Writer() = default;

  virtual Result<uint64_t> Write(const void* buf, uint64_t count) = 0;
};

// Moves the position used by the next Read or Write. Every call returns the
// new absolute position, so `SeekCur(0)` reports the position and `SeekEnd(0)`
// the size of the data. Positions before the start are errors.
class Seeker {
 public:
  virtual ~Seeker() = default;

  virtual Result<uint64_t> SeekSet(uint64_t offset) = 0;
  virtual Result<uint64_t> SeekCur(int64_t offset) = 0;
  virtual Result<uint64_t> SeekEnd(int64_t offset) = 0;
};

// Anything a window can be placed over.
class ReaderSeeker : public Reader, public Seeker {};

// Storage for a materialized range: filled once, then read back.
class ReaderWriterSeeker : public ReaderSeeker, public Writer {};

}  // namespace substream
