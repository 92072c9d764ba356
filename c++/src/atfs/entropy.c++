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

#include "entropy.h"
#include "os-error.h"
#include <kj/io.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#if __linux__
#include <sys/syscall.h>
#endif

namespace atfs {
namespace {

void readUrandom(kj::byte* buffer, size_t length) {
  int fd;
  ATFS_SYSCALL(fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC));
  kj::AutoCloseFd ownFd(fd);

  while (length > 0) {
    ssize_t n;
    ATFS_SYSCALL(n = read(fd, buffer, length));
    KJ_ASSERT(n > 0, "/dev/urandom returned EOF");
    buffer += n;
    length -= n;
  }
}

#if __linux__ && defined(SYS_getrandom)
void getSecureRandom(kj::byte* buffer, size_t length) {
  // The glibc wrapper for getrandom() appeared long after the syscall.
  while (length > 0) {
    long n;
    KJ_SYSCALL_HANDLE_ERRORS(n = syscall(SYS_getrandom, buffer, length, 0)) {
      case ENOSYS:
      case EPERM:
        // Kernel too old, or a seccomp filter forbids it.
        return readUrandom(buffer, length);
      default:
        ATFS_FAIL_SYSCALL("getrandom", error);
    }
    buffer += n;
    length -= n;
  }
}
#else
void getSecureRandom(kj::byte* buffer, size_t length) {
  readUrandom(buffer, length);
}
#endif

class SystemCsprng final: public EntropySource {
public:
  void generate(kj::ArrayPtr<kj::byte> buffer) override {
    getSecureRandom(buffer.begin(), buffer.size());
  }
};

const char TEMP_NAME_ALPHABET[] =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
constexpr size_t ALPHABET_SIZE = sizeof(TEMP_NAME_ALPHABET) - 1;
constexpr uint REJECT_THRESHOLD = 256 - (256 % ALPHABET_SIZE);
// Bytes at or above this value are discarded so that `byte % ALPHABET_SIZE` is uniform.

}  // namespace

EntropySource& systemCsprng() {
  static SystemCsprng instance;
  return instance;
}

kj::String generateTempName(kj::StringPtr prefix, kj::StringPtr suffix, EntropySource& entropy) {
  char random[TEMP_NAME_RANDOM_CHARS];
  size_t filled = 0;

  kj::byte bytes[TEMP_NAME_RANDOM_CHARS * 2];
  while (filled < TEMP_NAME_RANDOM_CHARS) {
    entropy.generate(bytes);
    for (kj::byte b: bytes) {
      if (b < REJECT_THRESHOLD) {
        random[filled++] = TEMP_NAME_ALPHABET[b % ALPHABET_SIZE];
        if (filled == TEMP_NAME_RANDOM_CHARS) break;
      }
    }
  }

  return kj::str(prefix, kj::ArrayPtr<const char>(random, TEMP_NAME_RANDOM_CHARS), suffix);
}

}  // namespace atfs
