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

#ifndef ATFS_OS_ERROR_H_
#define ATFS_OS_ERROR_H_

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/string.h>
#include <exception>

namespace atfs {

class OsError final: public kj::Exception, public std::exception {
  // A kj::Exception raised because a system call failed.  Keeps the call's errno so that callers
  // can tell e.g. ENOSPC from EACCES without parsing the description.  The exception type is
  // derived from the errno the same way KJ_SYSCALL does it.
  //
  // Catch it as `const atfs::OsError&` to get at the errno; catching kj::Exception works too.

public:
  OsError(int errorNumber, const char* file, int line, kj::String description);
  OsError(const OsError& other) noexcept;

  inline int getErrorNumber() const { return errorNumber; }

  const char* what() const noexcept override;

private:
  int errorNumber;
  mutable kj::String whatBuffer;
};

// ATFS_SYSCALL(call, ...) works like KJ_SYSCALL(): it retries `call` on EINTR and throws if it
// returns -1.  What it throws is an OsError carrying errno.
//
// ATFS_FAIL_SYSCALL(code, errorNumber, ...) throws an OsError for a failure already detected, e.g.
// inside KJ_SYSCALL_HANDLE_ERRORS(), where `error` holds the errno.
//
// Extra arguments are appended to the description like KJ_LOG does.

#define ATFS_SYSCALL(call, ...) \
  KJ_SYSCALL_HANDLE_ERRORS(call) { \
    default: \
      ATFS_FAIL_SYSCALL(#call, error, ##__VA_ARGS__); \
  }

#define ATFS_FAIL_SYSCALL(code, errorNumber, ...) \
  ::atfs::_::failSyscall(__FILE__, __LINE__, code, errorNumber, #__VA_ARGS__, ##__VA_ARGS__)

namespace _ {  // private

kj::Exception::Type typeOfErrno(int error);

[[noreturn]] void failSyscall(const char* file, int line, const char* code, int errorNumber,
                              const char* macroArgs);
[[noreturn]] void failSyscall(const char* file, int line, const char* code, int errorNumber,
                              const char* macroArgs, kj::ArrayPtr<kj::String> argValues);

template <typename... Params>
[[noreturn]] void failSyscall(const char* file, int line, const char* code, int errorNumber,
                              const char* macroArgs, Params&&... params) {
  kj::String argValues[sizeof...(Params)] = { kj::str(params)... };
  failSyscall(file, line, code, errorNumber, macroArgs,
              kj::arrayPtr(argValues, sizeof...(Params)));
}

}  // namespace _ (private)
}  // namespace atfs

#endif  // ATFS_OS_ERROR_H_
