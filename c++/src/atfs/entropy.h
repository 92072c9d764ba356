// Copyright (c) 2026 atfs contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef ATFS_ENTROPY_H_
#define ATFS_ENTROPY_H_

#include <kj/common.h>
#include <kj/string.h>

namespace atfs {

class EntropySource {
  // Interface for an object that generates entropy.  Typically, cryptographically-random entropy
  // is expected.

public:
  virtual void generate(kj::ArrayPtr<kj::byte> buffer) = 0;
};

EntropySource& systemCsprng();
// Returns the process-wide cryptographically-secure entropy source.  Safe to use from any thread.

static constexpr size_t TEMP_NAME_RANDOM_CHARS = 8;

kj::String generateTempName(kj::StringPtr prefix, kj::StringPtr suffix, EntropySource& entropy);
// Returns `prefix` followed by TEMP_NAME_RANDOM_CHARS characters drawn uniformly from
// [0-9A-Za-z], followed by `suffix`.

}  // namespace atfs

#endif  // ATFS_ENTROPY_H_
