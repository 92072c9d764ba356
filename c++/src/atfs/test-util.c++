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

#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include "test-util.h"
#include <kj/debug.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <dirent.h>
#include <errno.h>
#include <stdlib.h>

#if __linux__
#include <syscall.h>
#endif

#if __ANDROID__
#define VAR_TMP "/data/local/tmp"
#else
#define VAR_TMP "/var/tmp"
#endif

namespace atfs {

TempDir::TempDir(): filename(kj::heapString(VAR_TMP "/atfs-filesystem-test.XXXXXX")) {
  if (mkdtemp(filename.begin()) == nullptr) {
    KJ_FAIL_SYSCALL("mkdtemp", errno, filename);
  }
}

TempDir::~TempDir() noexcept(false) {
  recursiveDelete(filename);
}

kj::Own<Directory> TempDir::get() {
  return openDirectory(filename);
}

void TempDir::recursiveDelete(kj::StringPtr path) {
  {
    DIR* dir = opendir(path.cStr());
    KJ_ASSERT(dir != nullptr);
    KJ_DEFER(closedir(dir));

    for (;;) {
      auto entry = readdir(dir);
      if (entry == nullptr) break;

      kj::StringPtr name = entry->d_name;
      if (name == "." || name == "..") continue;

      auto subPath = kj::str(path, '/', entry->d_name);

      if (checkLeftovers) {
        KJ_EXPECT(!name.startsWith(".tmp."), "temp file not cleaned up", subPath);
      }

      struct stat stats;
      KJ_SYSCALL(lstat(subPath.cStr(), &stats));

      if (S_ISDIR(stats.st_mode)) {
        recursiveDelete(subPath);
      } else {
        KJ_SYSCALL(unlink(subPath.cStr()));
      }
    }
  }

  KJ_SYSCALL(rmdir(path.cStr()));
}

bool tmpfileSupported(const Directory& dir) {
#if __linux__ && defined(O_TMPFILE)
  int fd = syscall(SYS_openat, dir.getFd(), ".", O_RDWR | O_TMPFILE | O_CLOEXEC, 0600);
  if (fd < 0) return false;
  close(fd);
  return true;
#else
  return false;
#endif
}

}  // namespace atfs
