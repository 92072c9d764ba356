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

#include "os-error.h"
#include "test-util.h"
#include <kj/test.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

namespace atfs {
namespace {

KJ_TEST("ATFS_SYSCALL keeps errno") {
  try {
    int fd;
    ATFS_SYSCALL(fd = open("/nonexistent/atfs-test", O_RDONLY), "/nonexistent/atfs-test");
    close(fd);
    KJ_FAIL_EXPECT("open() should have failed");
  } catch (const OsError& e) {
    KJ_EXPECT(e.getErrorNumber() == ENOENT, e.getErrorNumber());
    KJ_EXPECT(e.getType() == kj::Exception::Type::FAILED);
    KJ_EXPECT(kj::_::hasSubstring(e.getDescription(), "open("), e.getDescription());
    KJ_EXPECT(kj::_::hasSubstring(e.getDescription(), "/nonexistent/atfs-test"),
              e.getDescription());
    KJ_EXPECT(kj::_::hasSubstring(e.what(), "/nonexistent/atfs-test"), e.what());
  }
}

KJ_TEST("ATFS_SYSCALL retries EINTR") {
  uint calls = 0;
  int result;
  ATFS_SYSCALL(result = [&]() {
    if (calls++ < 2) {
      errno = EINTR;
      return -1;
    }
    return 5;
  }());
  KJ_EXPECT(result == 5);
  KJ_EXPECT(calls == 3);
}

KJ_TEST("ATFS_FAIL_SYSCALL maps errno to an exception type") {
  struct {
    int error;
    kj::Exception::Type type;
  } cases[] = {
    { ENOSPC, kj::Exception::Type::OVERLOADED },
    { EMFILE, kj::Exception::Type::OVERLOADED },
    { EDQUOT, kj::Exception::Type::OVERLOADED },
    { EPIPE, kj::Exception::Type::DISCONNECTED },
    { ENOSYS, kj::Exception::Type::UNIMPLEMENTED },
    { EOPNOTSUPP, kj::Exception::Type::UNIMPLEMENTED },
    { EACCES, kj::Exception::Type::FAILED },
    { EXDEV, kj::Exception::Type::FAILED },
  };

  for (auto& c: cases) {
    KJ_CONTEXT(c.error);
    ATFS_EXPECT_THROW_ERRNO(c.error, ATFS_FAIL_SYSCALL("fake", c.error));
    KJ_EXPECT(_::typeOfErrno(c.error) == c.type);
  }
}

KJ_TEST("OsError is a kj::Exception") {
  KJ_IF_MAYBE(e, kj::runCatchingExceptions([]() {
    ATFS_FAIL_SYSCALL("rename(from, to)", EXDEV, "a", "b");
  })) {
    KJ_EXPECT(e->getType() == kj::Exception::Type::FAILED);
    KJ_EXPECT(kj::_::hasSubstring(e->getDescription(), "rename(from, to)"), e->getDescription());
    KJ_EXPECT(kj::_::hasSubstring(e->getDescription(), "a, b"), e->getDescription());
  } else {
    KJ_FAIL_EXPECT("should have thrown");
  }
}

KJ_TEST("OsError survives a copy") {
  try {
    ATFS_FAIL_SYSCALL("write", ENOSPC);
  } catch (const OsError& e) {
    OsError copy = e;
    KJ_EXPECT(copy.getErrorNumber() == ENOSPC);
    KJ_EXPECT(copy.getType() == kj::Exception::Type::OVERLOADED);
    KJ_EXPECT(copy.getDescription() == e.getDescription());
  }
}

}  // namespace
}  // namespace atfs
