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

#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include "copy.h"
#include "os-error.h"
#include <kj/debug.h>
#include <errno.h>
#include <limits.h>
#include <unistd.h>

#if __linux__
#include <syscall.h>
#endif

namespace atfs {

CopyCapability& CopyCapability::process() {
  static CopyCapability instance;
  return instance;
}

ssize_t copyFileRange(int fdIn, int fdOut, size_t length) {
#if __linux__ && defined(SYS_copy_file_range)
  // Use syscall() directly since some glibc versions emulate copy_file_range() in userspace
  // when the kernel lacks it, which hides the ENOSYS we rely on.
  return syscall(SYS_copy_file_range, fdIn, nullptr, fdOut, nullptr, length, 0u);
#else
  errno = ENOSYS;
  return -1;
#endif
}

CopyEngine::CopyEngine(CopyCapability& capability, CopyOptions options, RangeCopyFunc* rangeCopy)
    : capability(capability), options(options), rangeCopy(rangeCopy) {
  KJ_REQUIRE(options.fallbackChunkSize > 0, "fallback copy chunk size must be non-zero");
  KJ_REQUIRE(rangeCopy != nullptr);
}

uint64_t CopyEngine::copy(const File& from, const File& to) const {
#if __linux__
  if (!capability.isSupported()) {
    return fallbackCopy(from, to, options.fallbackChunkSize);
  }

  uint64_t length = from.stat().size;
  uint64_t written = 0;
  while (written < length) {
    size_t n = kj::min(length - written, kj::implicitCast<uint64_t>(SSIZE_MAX));
    ssize_t result = rangeCopy(from.getFd(), to.getFd(), n);
    if (result < 0) {
      int error = errno;
      if (error == EINTR) continue;

      if (error == ENOSYS || error == EPERM) {
        capability.markUnsupported();
      }

      if (written == 0 &&
          (error == ENOSYS || error == EPERM || error == EINVAL || error == EXDEV)) {
        return fallbackCopy(from, to, options.fallbackChunkSize);
      }

      ATFS_FAIL_SYSCALL("copy_file_range(from, NULL, to, NULL, n, 0)", error, written);
    }

    if (result == 0) {
      // Source shrank since stat().
      break;
    }
    written += result;
  }
  return written;
#else
  return fallbackCopy(from, to, options.fallbackChunkSize);
#endif
}

uint64_t fallbackCopy(const File& from, const File& to, size_t chunkSize) {
  KJ_REQUIRE(chunkSize > 0, "fallback copy chunk size must be non-zero");

  auto buffer = kj::heapArray<kj::byte>(chunkSize);
  uint64_t offset = 0;
  for (;;) {
    size_t n = from.read(offset, buffer);
    if (n == 0) break;
    to.write(offset, buffer.slice(0, n));
    offset += n;
  }
  return offset;
}

uint64_t copyFile(const File& from, const File& to) {
  return CopyEngine().copy(from, to);
}

}  // namespace atfs
