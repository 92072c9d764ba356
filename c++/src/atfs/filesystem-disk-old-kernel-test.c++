// Copyright (c) 2015 Sandstorm Development Group, Inc. and contributors
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

#if __linux__ && __x86_64__ && defined(__has_include)
#if __has_include(<linux/seccomp.h>) && \
    __has_include(<linux/filter.h>) && \
    __has_include(<sys/prctl.h>)
// This test re-runs filesystem-disk-test.c++ on a kernel that pretends to predate O_TMPFILE and
// copy_file_range().
//
// This test must be compiled as a separate program, since it alters the calling process by
// enabling seccomp to disable the kernel features.

#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include <syscall.h>
#include <unistd.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/prctl.h>
#include <linux/seccomp.h>
#include <linux/filter.h>
#include <kj/debug.h>

#ifdef SECCOMP_SET_MODE_FILTER

namespace {

#if 0
// Source code of the seccomp filter:

  ld [0]                  /* offsetof(struct seccomp_data, nr) */
  jeq #257, openat        /* __NR_openat */
  jeq #326, nosys         /* __NR_copy_file_range */
  jmp good

openat:
  ld [32]                 /* offsetof(struct seccomp_data, args[2]), aka flags */
  and #4259840            /* O_TMPFILE */
  jeq #4259840, notsup
  jmp good

nosys:  ret #0x00050026  /* SECCOMP_RET_ERRNO | ENOSYS */
notsup: ret #0x0005005f  /* SECCOMP_RET_ERRNO | EOPNOTSUPP */
good:   ret #0x7fff0000  /* SECCOMP_RET_ALLOW */

#endif

struct SetupSeccompForFilesystemTest {
  SetupSeccompForFilesystemTest() {
    struct sock_filter filter[] {
      { 0x20,  0,  0, 0000000000 },
      { 0x15,  2,  0, 0x00000101 },
      { 0x15,  5,  0, 0x00000146 },
      { 0x05,  0,  0, 0x00000006 },
      { 0x20,  0,  0, 0x00000020 },
      { 0x54,  0,  0, 0x00410000 },
      { 0x15,  2,  0, 0x00410000 },
      { 0x05,  0,  0, 0x00000002 },
      { 0x06,  0,  0, 0x00050026 },
      { 0x06,  0,  0, 0x0005005f },
      { 0x06,  0,  0, 0x7fff0000 },
    };

    struct sock_fprog prog { sizeof(filter) / sizeof(filter[0]), filter };

    KJ_SYSCALL(prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0));
    KJ_SYSCALL(syscall(__NR_seccomp, SECCOMP_SET_MODE_FILTER, 0, &prog));
  }
};

SetupSeccompForFilesystemTest setupSeccompForFilesystemTest;

}  // namespace

// OK, now run all the regular filesystem tests!
#include "filesystem-disk-test.c++"

#include "copy.h"
#include <string.h>

namespace atfs {
namespace old_kernel {
namespace {

KJ_TEST("old kernel: features are really disabled") {
  TempDir tempDir;
  auto dir = tempDir.get();
  KJ_EXPECT(!tmpfileSupported(*dir));

  auto from = dir->createFile("from", 0600);
  auto to = dir->createFile("to", 0600);
  errno = 0;
  KJ_EXPECT(copyFileRange(from->getFd(), to->getFd(), 1) < 0);
  KJ_EXPECT(errno == ENOSYS, errno);
}

KJ_TEST("old kernel: copyFile() falls back to read/write") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto content = kj::heapArray<kj::byte>(100000);
  for (size_t i = 0; i < content.size(); i++) {
    content[i] = i % 253;
  }
  dir->writeFileContents("from", 0644, content);

  for (uint i = 0; i < 2; i++) {
    auto from = dir->openFile("from");
    auto to = dir->createUnnamedTemporary(0600);
    KJ_EXPECT(copyFile(*from, *to) == content.size());
    KJ_EXPECT(!CopyCapability::process().isSupported());

    auto copied = to->readAllBytes();
    KJ_EXPECT(copied.size() == content.size() &&
              memcmp(copied.begin(), content.begin(), content.size()) == 0);
  }
}

KJ_TEST("old kernel: writer stages under a temporary name") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto writer = dir->newFileWriter("target", 0644);
  writer->getStream().write("staged", 6);

  // The file already exists under a ".tmp." name, but not under the target.
  KJ_EXPECT(!dir->exists("target"));
  bool sawStaged = false;
  for (auto& entry: dir->listEntries()) {
    if (entry.name.startsWith(".tmp.")) sawStaged = true;
  }
  KJ_EXPECT(sawStaged);

  writer->complete();
  KJ_EXPECT(dir->openFile("target")->readAllText() == "staged");
  KJ_EXPECT(dir->listEntries().size() == 1);
}

KJ_TEST("old kernel: staged name uses the writer's prefix and suffix") {
  TempDir tempDir;
  auto dir = tempDir.get();

  FileWriterOptions options;
  options.tempPrefix = ".custom.";
  options.tempSuffix = ".part";
  auto writer = dir->newFileWriter("target", 0644, options);
  writer->getStream().write("staged", 6);

  auto entries = dir->listEntries();
  KJ_ASSERT(entries.size() == 1);
  KJ_EXPECT(entries[0].name.startsWith(".custom."), entries[0].name);
  KJ_EXPECT(entries[0].name.endsWith(".part"), entries[0].name);
  KJ_EXPECT(entries[0].name.size() == 8 + TEMP_NAME_RANDOM_CHARS + 5, entries[0].name);

  writer->abandon();
  KJ_EXPECT(dir->listEntries().size() == 0);
}

}  // namespace
}  // namespace old_kernel
}  // namespace atfs

#endif
#endif
#endif
