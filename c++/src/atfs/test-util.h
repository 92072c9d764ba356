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

#ifndef ATFS_TEST_UTIL_H_
#define ATFS_TEST_UTIL_H_

#include "filesystem.h"
#include "os-error.h"
#include <kj/exception.h>
#include <kj/test.h>
#include <kj/vector.h>

namespace atfs {

class TempDir {
  // A fresh directory under /var/tmp, deleted recursively on destruction.  Deletion also checks
  // that no ".tmp." files were left behind.

public:
  TempDir();
  KJ_DISALLOW_COPY(TempDir);
  ~TempDir() noexcept(false);

  kj::Own<Directory> get();
  inline kj::StringPtr getPath() { return filename; }

  inline void allowLeftovers() { checkLeftovers = false; }
  // For tests that deliberately leave temporary files, e.g. in a child process that dies
  // mid-write.

private:
  kj::String filename;
  bool checkLeftovers = true;

  void recursiveDelete(kj::StringPtr path);
};

bool tmpfileSupported(const Directory& dir);
// Whether this kernel and filesystem give us unnamed temporaries. Without them, writers stage
// their content under a temporary name from the start.

class LogRecorder final: public kj::ExceptionCallback {
  // While in scope, captures every KJ_LOG line on this thread instead of printing it.

public:
  void logMessage(kj::LogSeverity severity, const char* file, int line, int contextDepth,
                  kj::String&& text) override {
    messages.add(kj::mv(text));
  }

  kj::Vector<kj::String> messages;
};

#define ATFS_EXPECT_THROW_ERRNO(errorNumber, code) \
  do { \
    try { \
      code; \
      KJ_FAIL_EXPECT("code did not throw: " #code); \
    } catch (const ::atfs::OsError& _atfsError) { \
      KJ_EXPECT(_atfsError.getErrorNumber() == (errorNumber), \
                _atfsError.getErrorNumber(), _atfsError.getDescription()); \
    } \
  } while (false)
// Expects `code` to fail with an OsError whose errno is `errorNumber`.

}  // namespace atfs

#endif  // ATFS_TEST_UTIL_H_
