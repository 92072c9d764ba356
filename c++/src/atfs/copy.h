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

#ifndef ATFS_COPY_H_
#define ATFS_COPY_H_

#include <sys/types.h>
#include <inttypes.h>
#include <kj/common.h>
#include "filesystem.h"

namespace atfs {

class CopyCapability {
  // Whether the kernel's range-copy call (copy_file_range()) is usable.  Starts out assuming it
  // is and only ever goes from supported to unsupported, the first time the kernel reports that
  // the call is not implemented or not permitted.  Never reset.
  //
  // Reads and writes are relaxed atomics and may be done from any thread without a lock.  A stale
  // read costs at most one more failed call, which the copy engine recovers from.

public:
  CopyCapability() = default;
  KJ_DISALLOW_COPY(CopyCapability);

  inline bool isSupported() const { return __atomic_load_n(&supported, __ATOMIC_RELAXED); }
  inline void markUnsupported() { __atomic_store_n(&supported, false, __ATOMIC_RELAXED); }

  static CopyCapability& process();
  // The instance shared by everything in this process that does not pass its own.

private:
  bool supported = true;
};

struct CopyOptions {
  static constexpr size_t DEFAULT_FALLBACK_CHUNK_SIZE = 8192;

  size_t fallbackChunkSize = DEFAULT_FALLBACK_CHUNK_SIZE;
  // Bytes per pread()/pwrite() when the range-copy call can't be used.  Must be non-zero.
};

typedef ssize_t RangeCopyFunc(int fdIn, int fdOut, size_t length);
// Copies up to `length` bytes from fdIn's current position to fdOut's current position,
// advancing both.  Returns the number of bytes copied, or -1 with errno set, like a syscall.

ssize_t copyFileRange(int fdIn, int fdOut, size_t length);
// copy_file_range(fdIn, NULL, fdOut, NULL, length, 0) issued directly as a syscall.  Sets errno
// to ENOSYS where the system has no such call.

class CopyEngine {
  // Copies the whole content of one open file to another, in-kernel when possible.
  //
  // The range-copy call is tried first as long as `capability` says it is supported.  If it fails
  // before copying anything with ENOSYS, EPERM, EINVAL or EXDEV, the copy is redone with
  // fallbackCopy().  ENOSYS and EPERM also mark `capability` unsupported, so later copies skip
  // straight to the fallback.  Any other failure, or any failure after bytes were copied, is
  // thrown with the original errno.

public:
  explicit CopyEngine(CopyCapability& capability = CopyCapability::process(),
                      CopyOptions options = CopyOptions(),
                      RangeCopyFunc* rangeCopy = &copyFileRange);

  uint64_t copy(const File& from, const File& to) const;
  // Copies from.stat().size bytes.  Returns the number of bytes copied.
  //
  // The range-copy call works at the files' current positions, so both should be at offset zero,
  // as they are when freshly opened.

private:
  CopyCapability& capability;
  CopyOptions options;
  RangeCopyFunc* rangeCopy;
};

uint64_t fallbackCopy(const File& from, const File& to,
                      size_t chunkSize = CopyOptions::DEFAULT_FALLBACK_CHUNK_SIZE);
// Copies `from` to `to` by positioned reads and writes starting at offset zero, until a read
// returns nothing.  Returns the number of bytes copied.  Does not use or move the descriptors'
// positions.

uint64_t copyFile(const File& from, const File& to);
// Same as CopyEngine().copy(from, to), using the process-wide capability.

}  // namespace atfs

#endif  // ATFS_COPY_H_
