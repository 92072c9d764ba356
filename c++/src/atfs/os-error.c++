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

#include "os-error.h"
#include <errno.h>
#include <string.h>

namespace atfs {

OsError::OsError(int errorNumber, const char* file, int line, kj::String description)
    : kj::Exception(_::typeOfErrno(errorNumber), file, line, kj::mv(description)),
      errorNumber(errorNumber) {}

OsError::OsError(const OsError& other) noexcept
    : kj::Exception(other), std::exception(other), errorNumber(other.errorNumber) {}

const char* OsError::what() const noexcept {
  whatBuffer = kj::str(static_cast<const kj::Exception&>(*this));
  return whatBuffer.cStr();
}

namespace _ {  // private

kj::Exception::Type typeOfErrno(int error) {
  switch (error) {
#ifdef EDQUOT
    case EDQUOT:
#endif
#ifdef EMFILE
    case EMFILE:
#endif
#ifdef ENFILE
    case ENFILE:
#endif
#ifdef ENOBUFS
    case ENOBUFS:
#endif
#ifdef ENOLCK
    case ENOLCK:
#endif
#ifdef ENOMEM
    case ENOMEM:
#endif
#ifdef ENOSPC
    case ENOSPC:
#endif
#ifdef ETIMEDOUT
    case ETIMEDOUT:
#endif
#ifdef EUSERS
    case EUSERS:
#endif
      return kj::Exception::Type::OVERLOADED;

#ifdef ENOTCONN
    case ENOTCONN:
#endif
#ifdef ECONNABORTED
    case ECONNABORTED:
#endif
#ifdef ECONNREFUSED
    case ECONNREFUSED:
#endif
#ifdef ECONNRESET
    case ECONNRESET:
#endif
#ifdef EHOSTDOWN
    case EHOSTDOWN:
#endif
#ifdef EHOSTUNREACH
    case EHOSTUNREACH:
#endif
#ifdef ENETDOWN
    case ENETDOWN:
#endif
#ifdef ENETRESET
    case ENETRESET:
#endif
#ifdef ENETUNREACH
    case ENETUNREACH:
#endif
#ifdef EPIPE
    case EPIPE:
#endif
      return kj::Exception::Type::DISCONNECTED;

#ifdef ENOSYS
    case ENOSYS:
#endif
#ifdef ENOTSUP
    case ENOTSUP:
#endif
#if defined(EOPNOTSUPP) && EOPNOTSUPP != ENOTSUP
    case EOPNOTSUPP:
#endif
      return kj::Exception::Type::UNIMPLEMENTED;

    default:
      return kj::Exception::Type::FAILED;
  }
}

void failSyscall(const char* file, int line, const char* code, int errorNumber,
                 const char* macroArgs) {
  failSyscall(file, line, code, errorNumber, macroArgs, kj::ArrayPtr<kj::String>());
}

void failSyscall(const char* file, int line, const char* code, int errorNumber,
                 const char* macroArgs, kj::ArrayPtr<kj::String> argValues) {
  kj::String description;
  if (argValues.size() == 0) {
    description = kj::str(code, ": ", strerror(errorNumber));
  } else {
    description = kj::str(code, ": ", strerror(errorNumber), "; ", macroArgs, " = ",
                          kj::strArray(argValues, ", "));
  }
  throw OsError(errorNumber, file, line, kj::mv(description));
}

}  // namespace _ (private)
}  // namespace atfs
