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

#ifndef _FILE_OFFSET_BITS
#define _FILE_OFFSET_BITS 64
// Request 64-bit off_t. (The code will still work if we get 32-bit off_t as long as actual files
// are under 4GB.)
#endif

#include "filesystem.h"
#include "os-error.h"
#include <kj/debug.h>
#include <kj/vector.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <dirent.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <algorithm>

#if __linux__
#include <syscall.h>
#endif

namespace atfs {

namespace {

FileType modeToType(mode_t mode) {
  switch (mode & S_IFMT) {
    case S_IFREG : return FileType::FILE;
    case S_IFDIR : return FileType::DIRECTORY;
    case S_IFLNK : return FileType::SYMLINK;
    case S_IFBLK : return FileType::BLOCK_DEVICE;
    case S_IFCHR : return FileType::CHARACTER_DEVICE;
    case S_IFIFO : return FileType::NAMED_PIPE;
    case S_IFSOCK: return FileType::SOCKET;
    default: return FileType::OTHER;
  }
}

Metadata statToMetadata(struct stat& stats) {
  // Probably st_ino and st_dev are usually under 32 bits, so mix by rotating st_dev left 32 bits
  // and XOR.
  uint64_t d = stats.st_dev;
  uint64_t hash = ((d << 32) | (d >> 32)) ^ stats.st_ino;

  Metadata result;
  result.type = modeToType(stats.st_mode);
  result.permissions = stats.st_mode & 07777;
  result.size = stats.st_size;
  result.spaceUsed = stats.st_blocks * 512u;
  result.linkCount = stats.st_nlink;
#if __APPLE__
  result.lastModified = stats.st_mtimespec.tv_sec * 1000000000ll + stats.st_mtimespec.tv_nsec;
#else
  result.lastModified = stats.st_mtim.tv_sec * 1000000000ll + stats.st_mtim.tv_nsec;
#endif
  result.hashCode = hash;
  return result;
}

int openFlags(OpenMode mode) {
  return (mode == OpenMode::READ_WRITE ? O_RDWR : O_RDONLY) | O_CLOEXEC;
}

void ensureDirAllPessimistic(const Directory& dir, kj::StringPtr path, mode_t mode) {
  // Assumes no component of `path` exists and creates them root-ward first.
  const char* slash = strrchr(path.cStr(), '/');
  if (slash != nullptr && slash > path.begin()) {
    ensureDirAllPessimistic(dir, kj::heapString(path.begin(), slash - path.begin()), mode);
  }
  dir.ensureDir(path, mode);
}

}  // namespace

kj::StringPtr KJ_STRINGIFY(FileType type) {
  switch (type) {
    case FileType::FILE: return "file";
    case FileType::DIRECTORY: return "directory";
    case FileType::SYMLINK: return "symlink";
    case FileType::BLOCK_DEVICE: return "block device";
    case FileType::CHARACTER_DEVICE: return "character device";
    case FileType::NAMED_PIPE: return "named pipe";
    case FileType::SOCKET: return "socket";
    case FileType::OTHER: return "other";
  }
  return "unknown";
}

constexpr size_t FileWriterOptions::DEFAULT_BUFFER_SIZE;

// =======================================================================================

FsNode::FsNode(kj::AutoCloseFd fd): fd(kj::mv(fd)) {}

Metadata FsNode::stat() const {
  struct stat stats;
  ATFS_SYSCALL(::fstat(fd.get(), &stats));
  return statToMetadata(stats);
}

void FsNode::sync() const {
#if __APPLE__
  // fsync() on OSX only flushes kernel buffers; F_FULLFSYNC also flushes the disk's.
  ATFS_SYSCALL(fcntl(fd.get(), F_FULLFSYNC));
#else
  ATFS_SYSCALL(fsync(fd.get()));
#endif
}

void FsNode::datasync() const {
  // Apple defines _POSIX_SYNCHRONIZED_IO yet doesn't offer fdatasync().
#if _POSIX_SYNCHRONIZED_IO && !__APPLE__
  ATFS_SYSCALL(fdatasync(fd.get()));
#else
  this->sync();
#endif
}

// =======================================================================================

size_t File::read(uint64_t offset, kj::ArrayPtr<kj::byte> buffer) const {
  // pread() probably never returns short reads unless it hits EOF, but we are not allowed to
  // assume this.

  size_t total = 0;
  while (buffer.size() > 0) {
    ssize_t n;
    ATFS_SYSCALL(n = pread(fd.get(), buffer.begin(), buffer.size(), offset));
    if (n == 0) break;
    total += n;
    offset += n;
    buffer = buffer.slice(n, buffer.size());
  }
  return total;
}

kj::Array<kj::byte> File::readAllBytes() const {
  auto result = kj::heapArray<kj::byte>(stat().size);
  size_t n = read(0, result);
  if (n < result.size()) {
    // Truncated since stat().
    return kj::heapArray<kj::byte>(result.slice(0, n));
  }
  return result;
}

kj::String File::readAllText() const {
  kj::String result = kj::heapString(stat().size);
  size_t n = read(0, kj::arrayPtr(reinterpret_cast<kj::byte*>(result.begin()), result.size()));
  if (n < result.size()) {
    return kj::heapString(result.begin(), n);
  }
  return result;
}

void File::write(uint64_t offset, kj::ArrayPtr<const kj::byte> data) const {
  // pwrite() probably never returns short writes unless there's no space left on disk, but we are
  // not allowed to assume this.

  while (data.size() > 0) {
    ssize_t n;
    ATFS_SYSCALL(n = pwrite(fd.get(), data.begin(), data.size(), offset));
    KJ_ASSERT(n > 0, "pwrite() returned zero?");
    offset += n;
    data = data.slice(n, data.size());
  }
}

void File::truncate(uint64_t size) const {
  ATFS_SYSCALL(ftruncate(fd.get(), size));
}

void File::chmod(mode_t mode) const {
  ATFS_SYSCALL(fchmod(fd.get(), mode));
}

// =======================================================================================

kj::Own<File> Directory::openFile(kj::StringPtr name, OpenMode mode) const {
  int newFd;
  ATFS_SYSCALL(newFd = openat(fd.get(), name.cStr(), openFlags(mode)), name);
  return kj::heap<File>(kj::AutoCloseFd(newFd));
}

kj::Maybe<kj::Own<File>> Directory::tryOpenFile(kj::StringPtr name, OpenMode mode) const {
  int newFd;
  KJ_SYSCALL_HANDLE_ERRORS(newFd = openat(fd.get(), name.cStr(), openFlags(mode))) {
    case ENOENT:
    case ENOTDIR:
      return nullptr;
    default:
      ATFS_FAIL_SYSCALL("openat(fd, name)", error, name);
  }

  return kj::heap<File>(kj::AutoCloseFd(newFd));
}

kj::Own<File> Directory::createFile(kj::StringPtr name, mode_t mode) const {
  int newFd;
  ATFS_SYSCALL(newFd = openat(fd.get(), name.cStr(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, mode),
               name);
  return kj::heap<File>(kj::AutoCloseFd(newFd));
}

kj::Maybe<kj::Own<File>> Directory::tryCreateTmpfile(mode_t mode) const {
#if __linux__ && defined(O_TMPFILE)
  // Use syscall() to work around glibc bug with O_TMPFILE:
  //     https://sourceware.org/bugzilla/show_bug.cgi?id=17523
  int newFd;
  KJ_SYSCALL_HANDLE_ERRORS(newFd = syscall(
      SYS_openat, fd.get(), ".", O_RDWR | O_TMPFILE | O_CLOEXEC, mode)) {
    case EOPNOTSUPP:
    case EINVAL:
    case EISDIR:
      // Maybe not supported by this kernel / filesystem.
      return nullptr;
    default:
      ATFS_FAIL_SYSCALL("open(O_TMPFILE)", error);
  }

  auto result = kj::heap<File>(kj::AutoCloseFd(newFd));
  // The mode passed to open() was filtered through the umask.
  result->chmod(mode);
  return kj::mv(result);
#else
  return nullptr;
#endif
}

kj::Own<File> Directory::createNamedTemporary(mode_t mode, kj::StringPtr prefix,
                                              kj::StringPtr suffix, EntropySource& entropy,
                                              kj::String& nameOut) const {
  for (uint attempt = 0; attempt < FileWriter::MAX_TEMP_NAME_ATTEMPTS; attempt++) {
    auto candidate = generateTempName(prefix, suffix, entropy);
    int newFd;
    KJ_SYSCALL_HANDLE_ERRORS(newFd = openat(
        fd.get(), candidate.cStr(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, mode)) {
      case EEXIST:
        continue;
      default:
        ATFS_FAIL_SYSCALL("openat(fd, tempName, O_CREAT | O_EXCL)", error, candidate);
    }

    auto result = kj::heap<File>(kj::AutoCloseFd(newFd));
    KJ_ON_SCOPE_FAILURE(unlinkat(fd.get(), candidate.cStr(), 0));
    result->chmod(mode);
    nameOut = kj::mv(candidate);
    return kj::mv(result);
  }

  KJ_FAIL_ASSERT("too many temporary name collisions", prefix, suffix);
}

kj::Own<File> Directory::createUnnamedTemporary(mode_t mode) const {
  KJ_IF_MAYBE(file, tryCreateTmpfile(mode)) {
    return kj::mv(*file);
  }

  kj::String tempName;
  auto result = createNamedTemporary(mode, ".tmp.", ".tmp", systemCsprng(), tempName);
  ATFS_SYSCALL(unlinkat(fd.get(), tempName.cStr(), 0), tempName);
  return result;
}

void Directory::linkFile(const File& file, kj::StringPtr name) const {
  if (!tryLinkFile(file, name)) {
    ATFS_FAIL_SYSCALL("linkat(file, name)", EEXIST, name);
  }
}

bool Directory::tryLinkFile(const File& file, kj::StringPtr name) const {
#if __linux__
  KJ_SYSCALL_HANDLE_ERRORS(linkat(file.getFd(), "", fd.get(), name.cStr(), AT_EMPTY_PATH)) {
    case EEXIST:
      return false;
    case ENOENT:
    case EPERM:
      // Without CAP_DAC_READ_SEARCH, AT_EMPTY_PATH is refused. Linking through procfs is
      // equivalent and unprivileged.
      break;
    default:
      ATFS_FAIL_SYSCALL("linkat(file, \"\", fd, name, AT_EMPTY_PATH)", error, name);
  } else {
    return true;
  }

  auto procPath = kj::str("/proc/self/fd/", file.getFd());
  KJ_SYSCALL_HANDLE_ERRORS(linkat(
      AT_FDCWD, procPath.cStr(), fd.get(), name.cStr(), AT_SYMLINK_FOLLOW)) {
    case EEXIST:
      return false;
    default:
      ATFS_FAIL_SYSCALL("linkat(procPath, fd, name, AT_SYMLINK_FOLLOW)", error, name);
  }
  return true;
#else
  ATFS_FAIL_SYSCALL("linkat(file, name)", ENOTSUP, name);
#endif
}

void Directory::rename(kj::StringPtr from, kj::StringPtr to) const {
  ATFS_SYSCALL(renameat(fd.get(), from.cStr(), fd.get(), to.cStr()), from, to);
}

void Directory::removeFile(kj::StringPtr name) const {
  ATFS_SYSCALL(unlinkat(fd.get(), name.cStr(), 0), name);
}

bool Directory::tryRemoveFile(kj::StringPtr name) const {
  KJ_SYSCALL_HANDLE_ERRORS(unlinkat(fd.get(), name.cStr(), 0)) {
    case ENOENT:
    case ENOTDIR:
      return false;
    default:
      ATFS_FAIL_SYSCALL("unlinkat(fd, name)", error, name);
  }
  return true;
}

void Directory::mkdir(kj::StringPtr name, mode_t mode) const {
  ATFS_SYSCALL(mkdirat(fd.get(), name.cStr(), mode), name);
}

void Directory::ensureDir(kj::StringPtr name, mode_t mode) const {
  KJ_SYSCALL_HANDLE_ERRORS(mkdirat(fd.get(), name.cStr(), mode)) {
    case EEXIST:
      break;
    default:
      ATFS_FAIL_SYSCALL("mkdirat(fd, name)", error, name);
  }
}

void Directory::ensureDirAll(kj::StringPtr path, mode_t mode) const {
  // Try the leaf first. If the parent exists (or the leaf already does) we're done in one call.
  KJ_SYSCALL_HANDLE_ERRORS(mkdirat(fd.get(), path.cStr(), mode)) {
    case EEXIST:
      return;
    case ENOENT:
      break;
    default:
      ATFS_FAIL_SYSCALL("mkdirat(fd, path)", error, path);
  } else {
    return;
  }

  ensureDirAllPessimistic(*this, path, mode);
}

kj::Own<Directory> Directory::openSubdir(kj::StringPtr name) const {
  int newFd;
  ATFS_SYSCALL(newFd = openat(fd.get(), name.cStr(), O_RDONLY | O_CLOEXEC | O_DIRECTORY), name);
  return kj::heap<Directory>(kj::AutoCloseFd(newFd));
}

kj::Maybe<kj::Own<Directory>> Directory::tryOpenSubdir(kj::StringPtr name) const {
  int newFd;
  KJ_SYSCALL_HANDLE_ERRORS(newFd = openat(
      fd.get(), name.cStr(), O_RDONLY | O_CLOEXEC | O_DIRECTORY)) {
    case ENOENT:
      return nullptr;
    case ENOTDIR:
      // Could mean that a parent is not a directory, which we treat as "doesn't exist".
      // Could also mean that the specified file is not a directory, which should throw.
      // Check using exists().
      if (!exists(name)) {
        return nullptr;
      }
      KJ_FALLTHROUGH;
    default:
      ATFS_FAIL_SYSCALL("openat(fd, name, O_DIRECTORY)", error, name);
  }

  return kj::heap<Directory>(kj::AutoCloseFd(newFd));
}

Metadata Directory::lstat(kj::StringPtr name) const {
  struct stat stats;
  ATFS_SYSCALL(fstatat(fd.get(), name.cStr(), &stats, AT_SYMLINK_NOFOLLOW), name);
  return statToMetadata(stats);
}

kj::Maybe<Metadata> Directory::tryLstat(kj::StringPtr name) const {
  struct stat stats;
  KJ_SYSCALL_HANDLE_ERRORS(fstatat(fd.get(), name.cStr(), &stats, AT_SYMLINK_NOFOLLOW)) {
    case ENOENT:
    case ENOTDIR:
      return nullptr;
    default:
      ATFS_FAIL_SYSCALL("fstatat(fd, name)", error, name);
  }
  return statToMetadata(stats);
}

bool Directory::exists(kj::StringPtr name) const {
  return tryLstat(name) != nullptr;
}

kj::Array<Directory::Entry> Directory::listEntries() const {
  // Seek to start of directory.
  ATFS_SYSCALL(lseek(fd.get(), 0, SEEK_SET));

  // Unfortunately, fdopendir() takes ownership of the file descriptor. Therefore we need to
  // make a duplicate.
  int duped;
  ATFS_SYSCALL(duped = fcntl(fd.get(), F_DUPFD_CLOEXEC, 0));
  DIR* dir = fdopendir(duped);
  if (dir == nullptr) {
    int error = errno;
    close(duped);
    ATFS_FAIL_SYSCALL("fdopendir", error);
  }

  KJ_DEFER(closedir(dir));
  kj::Vector<Entry> entries;

  for (;;) {
    errno = 0;
    struct dirent* entry = readdir(dir);
    if (entry == nullptr) {
      int error = errno;
      if (error == 0) {
        break;
      } else {
        ATFS_FAIL_SYSCALL("readdir", error);
      }
    }

    kj::StringPtr name = entry->d_name;
    if (name != "." && name != "..") {
      Entry result;
      result.name = kj::heapString(name);
#ifdef DT_UNKNOWN    // d_type is not available on all platforms.
      if (entry->d_type != DT_UNKNOWN) {
        result.type = modeToType(DTTOIF(entry->d_type));
      }
#endif
      entries.add(kj::mv(result));
    }
  }

  auto result = entries.releaseAsArray();
  std::sort(result.begin(), result.end());
  return result;
}

FileType Directory::getFileType(const Entry& entry) const {
  KJ_IF_MAYBE(type, entry.type) {
    return *type;
  }
  return lstat(entry.name).type;
}

kj::Own<FileWriter> Directory::newFileWriter(kj::StringPtr name, mode_t mode,
                                             FileWriterOptions options) const {
  KJ_REQUIRE(options.bufferSize > 0, "FileWriter buffer size must be non-zero");
  if (options.entropy == nullptr) {
    options.entropy = &systemCsprng();
  }

  KJ_IF_MAYBE(file, tryCreateTmpfile(mode)) {
    return kj::heap<FileWriter>(*this, kj::heapString(name), kj::mv(*file), nullptr, options);
  }

  // No unnamed temporaries on this kernel or filesystem. An unlinked file cannot be given a name
  // again, so stage the content under a temporary name instead.
  kj::String stagedName;
  auto file = createNamedTemporary(mode, options.tempPrefix, options.tempSuffix,
                                   *options.entropy, stagedName);
  KJ_ON_SCOPE_FAILURE(unlinkat(fd.get(), stagedName.cStr(), 0));
  return kj::heap<FileWriter>(*this, kj::heapString(name), kj::mv(file),
                              kj::heapString(stagedName), options);
}

void Directory::writeFileContents(kj::StringPtr name, mode_t mode,
                                  kj::ArrayPtr<const kj::byte> content) const {
  writeFileWith(name, mode, [&](kj::BufferedOutputStream& stream) {
    stream.write(content.begin(), content.size());
  });
}

void Directory::writeFileContents(kj::StringPtr name, mode_t mode, kj::StringPtr content) const {
  writeFileContents(name, mode, content.asArray().asBytes());
}

kj::Own<Directory> openDirectory(kj::StringPtr path) {
  int newFd;
  ATFS_SYSCALL(newFd = openat(AT_FDCWD, path.cStr(), O_RDONLY | O_CLOEXEC | O_DIRECTORY), path);
  return kj::heap<Directory>(kj::AutoCloseFd(newFd));
}

// =======================================================================================

FileWriter::Stream::Stream(const File& file, size_t bufferSize)
    : file(file), buffer(kj::heapArray<kj::byte>(bufferSize)), bufferPos(buffer.begin()) {}

void FileWriter::Stream::flush() {
  if (bufferPos > buffer.begin()) {
    size_t size = bufferPos - buffer.begin();
    bufferPos = buffer.begin();
    writeThrough(buffer.begin(), size);
  }
}

void FileWriter::Stream::discard() {
  bufferPos = buffer.begin();
}

kj::ArrayPtr<kj::byte> FileWriter::Stream::getWriteBuffer() {
  return kj::arrayPtr(bufferPos, buffer.end());
}

void FileWriter::Stream::write(const void* src, size_t size) {
  if (src == bufferPos && bufferPos != buffer.end()) {
    // The caller wrote directly into our buffer.
    KJ_REQUIRE(size <= size_t(buffer.end() - bufferPos), "write exceeds the write buffer");
    bufferPos += size;
  } else if (size <= size_t(buffer.end() - bufferPos)) {
    memcpy(bufferPos, src, size);
    bufferPos += size;
  } else if (size <= buffer.size()) {
    // Fill up the buffer, write it out, and keep the rest.
    size_t available = buffer.end() - bufferPos;
    memcpy(bufferPos, src, available);
    bufferPos = buffer.end();
    flush();

    size -= available;
    memcpy(buffer.begin(), reinterpret_cast<const kj::byte*>(src) + available, size);
    bufferPos = buffer.begin() + size;
  } else {
    // Bigger than the whole buffer, so skip the copy.
    flush();
    writeThrough(src, size);
  }
}

void FileWriter::Stream::writeThrough(const void* data, size_t size) {
  file.write(offset, kj::arrayPtr(reinterpret_cast<const kj::byte*>(data), size));
  offset += size;
}

// =======================================================================================

FileWriter::FileWriter(const Directory& directory, kj::String name, kj::Own<File> tempFile,
                       kj::Maybe<kj::String> stagedName, const FileWriterOptions& options)
    : directory(directory), name(kj::mv(name)),
      tempPrefix(kj::heapString(options.tempPrefix)),
      tempSuffix(kj::heapString(options.tempSuffix)),
      entropy(options.entropy == nullptr ? systemCsprng() : *options.entropy),
      tempFile(kj::mv(tempFile)), stagedName(kj::mv(stagedName)),
      stream(*this->tempFile, options.bufferSize) {}

FileWriter::~FileWriter() noexcept(false) {
  // Never write out buffered bytes once we're being destroyed.
  stream.discard();

  if (armed) {
    if (unwindDetector.isUnwinding()) {
      armed = false;
      removeStagedName();
    } else {
      KJ_LOG(FATAL, "FileWriter destroyed without calling complete() or abandon()", name);
      abort();
    }
  }
}

void FileWriter::beginCompletion() {
  KJ_REQUIRE(armed, "FileWriter already completed or abandoned", name);
  armed = false;
  stream.flush();
}

void FileWriter::complete() {
  completeWith([](const File&) {});
}

void FileWriter::abandon() {
  KJ_REQUIRE(armed, "FileWriter already completed or abandoned", name);
  armed = false;
  stream.discard();
  removeStagedName();
  tempFile = nullptr;
}

void FileWriter::removeStagedName() {
  KJ_IF_MAYBE(staged, stagedName) {
    // Best effort; the caller is already reporting a failure or has given up on the content.
    unlinkat(directory.getFd(), staged->cStr(), 0);
    stagedName = nullptr;
  }
}

void FileWriter::publish() {
  kj::String tempName;
  KJ_IF_MAYBE(staged, stagedName) {
    tempName = kj::mv(*staged);
    stagedName = nullptr;
  } else {
    for (uint attempt = 0;; attempt++) {
      if (attempt >= MAX_TEMP_NAME_ATTEMPTS) {
        KJ_FAIL_ASSERT("too many temporary name collisions", name, tempPrefix, tempSuffix);
      }
      tempName = generateTempName(tempPrefix, tempSuffix, entropy);
      if (directory.tryLinkFile(*tempFile, tempName)) break;
    }
  }

  int dirFd = directory.getFd();
  KJ_SYSCALL_HANDLE_ERRORS(renameat(dirFd, tempName.cStr(), dirFd, name.cStr())) {
    default:
      // Don't leave the temporary name behind. If that fails too, the rename's error is still
      // the one to report.
      unlinkat(dirFd, tempName.cStr(), 0);
      ATFS_FAIL_SYSCALL("renameat(fd, tempName, fd, name)", error, tempName, name);
  }

  tempFile = nullptr;
}

namespace _ {  // private

void completeWriter(FileWriter& writer) {
  writer.complete();
}

void completeWriterWithSync(FileWriter& writer) {
  writer.completeWith([](const File& file) { file.sync(); });
}

}  // namespace _ (private)

}  // namespace atfs
