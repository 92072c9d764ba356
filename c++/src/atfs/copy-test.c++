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
#include "test-util.h"
#include <kj/debug.h>
#include <kj/test.h>
#include <errno.h>
#include <string.h>
#include <unistd.h>

namespace atfs {
namespace {

kj::Array<kj::byte> makeContent(size_t size) {
  auto result = kj::heapArray<kj::byte>(size);
  for (size_t i = 0; i < size; i++) {
    result[i] = (i * 7 + i / 251) % 256;
  }
  return result;
}

kj::Own<File> makeSource(const Directory& dir, kj::StringPtr name, kj::ArrayPtr<const kj::byte> content) {
  dir.writeFileContents(name, 0644, content);
  return dir.openFile(name);
}

bool sameContent(const File& file, kj::ArrayPtr<const kj::byte> expected) {
  auto actual = file.readAllBytes();
  return actual.size() == expected.size() &&
         memcmp(actual.begin(), expected.begin(), expected.size()) == 0;
}

// Fake range-copy primitives. Each counts its calls so tests can tell whether the fast path was
// attempted.

uint rangeCopyCalls = 0;

ssize_t failWithEnosys(int, int, size_t) {
  ++rangeCopyCalls;
  errno = ENOSYS;
  return -1;
}

ssize_t failWithEperm(int, int, size_t) {
  ++rangeCopyCalls;
  errno = EPERM;
  return -1;
}

ssize_t failWithExdev(int, int, size_t) {
  ++rangeCopyCalls;
  errno = EXDEV;
  return -1;
}

ssize_t failWithEinval(int, int, size_t) {
  ++rangeCopyCalls;
  errno = EINVAL;
  return -1;
}

ssize_t failWithEio(int, int, size_t) {
  ++rangeCopyCalls;
  errno = EIO;
  return -1;
}

ssize_t copyInSmallPieces(int fdIn, int fdOut, size_t length) {
  // Copies at most 1000 bytes per call, at the descriptors' current positions like the real
  // thing.
  ++rangeCopyCalls;
  kj::byte buffer[1000];
  ssize_t n = read(fdIn, buffer, kj::min(length, sizeof(buffer)));
  if (n <= 0) return n;
  ssize_t written = 0;
  while (written < n) {
    ssize_t m = write(fdOut, buffer + written, n - written);
    if (m < 0) return -1;
    written += m;
  }
  return n;
}

ssize_t interruptedOnce(int fdIn, int fdOut, size_t length) {
  if (rangeCopyCalls++ == 0) {
    errno = EINTR;
    return -1;
  }
  return copyInSmallPieces(fdIn, fdOut, length);
}

ssize_t failAfterProgress(int fdIn, int fdOut, size_t length) {
  // Pretends to copy one kj::byte, then reports cross-device.
  if (rangeCopyCalls++ == 0) {
    return 1;
  }
  errno = EXDEV;
  return -1;
}

KJ_TEST("copyFile()") {
  TempDir tempDir;
  auto dir = tempDir.get();

  size_t sizes[] = { 0, 1, 4096, 8192, 8193, 100000 };
  for (size_t size: sizes) {
    KJ_CONTEXT(size);
    auto content = makeContent(size);
    auto from = makeSource(*dir, "from", content);
    auto to = dir->createUnnamedTemporary(0600);

    KJ_EXPECT(copyFile(*from, *to) == size);
    KJ_EXPECT(sameContent(*to, content));
  }
}

KJ_TEST("CopyEngine with its own capability") {
  TempDir tempDir;
  auto dir = tempDir.get();

  CopyCapability capability;
  KJ_EXPECT(capability.isSupported());
  CopyEngine engine(capability);

  auto content = makeContent(50000);
  auto from = makeSource(*dir, "from", content);
  auto to = dir->createFile("to", 0600);

  KJ_EXPECT(engine.copy(*from, *to) == content.size());
  KJ_EXPECT(sameContent(*to, content));
}

KJ_TEST("fallbackCopy()") {
  TempDir tempDir;
  auto dir = tempDir.get();

  size_t sizes[] = { 0, 1, 8191, 8192, 8193, 70000 };
  size_t chunkSizes[] = { 1, 7, 8192, 65536 };
  for (size_t size: sizes) {
    auto content = makeContent(size);
    auto from = makeSource(*dir, "from", content);

    for (size_t chunkSize: chunkSizes) {
      if (size > 10000 && chunkSize < 100) continue;
      KJ_CONTEXT(size, chunkSize);
      auto to = dir->createUnnamedTemporary(0600);
      KJ_EXPECT(fallbackCopy(*from, *to, chunkSize) == size);
      KJ_EXPECT(sameContent(*to, content));
    }
  }

  auto from = makeSource(*dir, "from", makeContent(10));
  auto to = dir->createUnnamedTemporary(0600);
  KJ_EXPECT_THROW_MESSAGE("chunk size must be non-zero", fallbackCopy(*from, *to, 0));
}

KJ_TEST("fallbackCopy() doesn't use the file position") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto content = makeContent(20000);
  auto from = makeSource(*dir, "from", content);
  auto to = dir->createUnnamedTemporary(0600);

  kj::byte scratch[100];
  KJ_SYSCALL(read(from->getFd(), scratch, sizeof(scratch)));

  KJ_EXPECT(fallbackCopy(*from, *to) == content.size());
  KJ_EXPECT(sameContent(*to, content));
}

KJ_TEST("CopyEngine falls back and remembers when range copy is not implemented") {
  TempDir tempDir;
  auto dir = tempDir.get();

  RangeCopyFunc* funcs[] = { &failWithEnosys, &failWithEperm };
  for (RangeCopyFunc* func: funcs) {
    CopyCapability capability;
    CopyEngine engine(capability, CopyOptions(), func);

    auto content = makeContent(30000);
    auto from = makeSource(*dir, "from", content);
    auto to = dir->createUnnamedTemporary(0600);

    rangeCopyCalls = 0;
    {
      LogRecorder log;
      KJ_EXPECT(engine.copy(*from, *to) == content.size());
      // The downgrade is silent.
      KJ_EXPECT(log.messages.size() == 0, log.messages.size());
    }
    KJ_EXPECT(sameContent(*to, content));
    KJ_EXPECT(rangeCopyCalls == 1);
    KJ_EXPECT(!capability.isSupported());

    // Later copies go straight to the fallback.
    auto to2 = dir->createUnnamedTemporary(0600);
    KJ_EXPECT(engine.copy(*from, *to2) == content.size());
    KJ_EXPECT(sameContent(*to2, content));
    KJ_EXPECT(rangeCopyCalls == 1);

    // So do other engines sharing the capability.
    CopyEngine other(capability, CopyOptions(), &failWithEnosys);
    auto to3 = dir->createUnnamedTemporary(0600);
    KJ_EXPECT(other.copy(*from, *to3) == content.size());
    KJ_EXPECT(rangeCopyCalls == 1);
  }
}

KJ_TEST("CopyEngine falls back without downgrading on EXDEV and EINVAL") {
  TempDir tempDir;
  auto dir = tempDir.get();

  RangeCopyFunc* funcs[] = { &failWithExdev, &failWithEinval };
  for (RangeCopyFunc* func: funcs) {
    CopyCapability capability;
    CopyOptions options;
    options.fallbackChunkSize = 100;
    CopyEngine engine(capability, options, func);

    auto content = makeContent(5000);
    auto from = makeSource(*dir, "from", content);

    for (uint i = 0; i < 2; i++) {
      auto to = dir->createUnnamedTemporary(0600);
      rangeCopyCalls = 0;
      KJ_EXPECT(engine.copy(*from, *to) == content.size());
      KJ_EXPECT(sameContent(*to, content));
      KJ_EXPECT(rangeCopyCalls == 1);
      KJ_EXPECT(capability.isSupported());
    }
  }
}

KJ_TEST("CopyEngine fallback matches fast path") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto content = makeContent(123456);
  auto from = makeSource(*dir, "from", content);

  CopyCapability fastCapability;
  CopyEngine fast(fastCapability, CopyOptions(), &copyInSmallPieces);
  auto fastTo = dir->createUnnamedTemporary(0600);
  rangeCopyCalls = 0;
  KJ_EXPECT(fast.copy(*from, *fastTo) == content.size());
  KJ_EXPECT(rangeCopyCalls == (content.size() + 999) / 1000, rangeCopyCalls);

  CopyCapability slowCapability;
  CopyEngine slow(slowCapability, CopyOptions(), &failWithEnosys);
  auto from2 = dir->openFile("from");
  auto slowTo = dir->createUnnamedTemporary(0600);
  KJ_EXPECT(slow.copy(*from2, *slowTo) == content.size());

  KJ_EXPECT(sameContent(*fastTo, content));
  KJ_EXPECT(sameContent(*slowTo, content));
}

KJ_TEST("CopyEngine retries interrupted range copy") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto content = makeContent(2500);
  auto from = makeSource(*dir, "from", content);
  auto to = dir->createUnnamedTemporary(0600);

  CopyCapability capability;
  CopyEngine engine(capability, CopyOptions(), &interruptedOnce);
  rangeCopyCalls = 0;
  KJ_EXPECT(engine.copy(*from, *to) == content.size());
  KJ_EXPECT(sameContent(*to, content));
  KJ_EXPECT(capability.isSupported());
}

KJ_TEST("CopyEngine surfaces other errors with their errno") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto from = makeSource(*dir, "from", makeContent(1000));

  {
    CopyCapability capability;
    CopyEngine engine(capability, CopyOptions(), &failWithEio);
    auto to = dir->createUnnamedTemporary(0600);
    ATFS_EXPECT_THROW_ERRNO(EIO, engine.copy(*from, *to));
    KJ_EXPECT(capability.isSupported());
  }

  {
    // Once bytes were copied, even a "fallback" error is surfaced.
    CopyCapability capability;
    CopyEngine engine(capability, CopyOptions(), &failAfterProgress);
    auto to = dir->createUnnamedTemporary(0600);
    rangeCopyCalls = 0;
    ATFS_EXPECT_THROW_ERRNO(EXDEV, engine.copy(*from, *to));
    KJ_EXPECT(rangeCopyCalls == 2);
  }
}

KJ_TEST("CopyEngine skips range copy when already known unsupported") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto content = makeContent(3000);
  auto from = makeSource(*dir, "from", content);
  auto to = dir->createUnnamedTemporary(0600);

  CopyCapability capability;
  capability.markUnsupported();
  CopyEngine engine(capability, CopyOptions(), &failWithEio);
  rangeCopyCalls = 0;
  KJ_EXPECT(engine.copy(*from, *to) == content.size());
  KJ_EXPECT(rangeCopyCalls == 0);
  KJ_EXPECT(sameContent(*to, content));
}

KJ_TEST("CopyEngine options are validated") {
  CopyOptions options;
  KJ_EXPECT(options.fallbackChunkSize == 8192);
  options.fallbackChunkSize = 0;
  KJ_EXPECT_THROW_MESSAGE("chunk size must be non-zero", {
    CopyEngine engine(CopyCapability::process(), options);
  });
}

KJ_TEST("CopyCapability::process() is shared") {
  KJ_EXPECT(&CopyCapability::process() == &CopyCapability::process());
}

}  // namespace
}  // namespace atfs
