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

#ifndef ATFS_FILESYSTEM_H_
#define ATFS_FILESYSTEM_H_

#include <sys/types.h>
#include <inttypes.h>
#include <type_traits>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/array.h>
#include <kj/string.h>
#include <kj/io.h>
#include <kj/exception.h>
#include "entropy.h"

namespace atfs {

// =======================================================================================
// This header exposes files and directories as capabilities.  A Directory is an open directory
// descriptor and every name passed to it is resolved relative to that descriptor, never relative
// to the process's working directory.  This avoids races where some path component is replaced
// between two operations on "the same" path.
//
// Names may contain '/' in which case they traverse subdirectories, but callers should prefer
// opening the subdirectory and operating on it.
//
// Errors are reported as exceptions.  An exception thrown because a system call failed is an
// OsError (see os-error.h) carrying the call's errno, so callers can tell e.g. ENOSPC from
// EACCES.  The try*() variants of lookups return null (or false) when the target does not exist
// (ENOENT, or ENOTDIR meaning some parent is not a directory) and throw for everything else.

class File;
class Directory;
class FileWriter;

enum class FileType {
  FILE,
  DIRECTORY,
  SYMLINK,
  BLOCK_DEVICE,
  CHARACTER_DEVICE,
  NAMED_PIPE,
  SOCKET,
  OTHER,
};

kj::StringPtr KJ_STRINGIFY(FileType type);

struct Metadata {
  FileType type = FileType::FILE;

  uint permissions = 0;
  // Permission bits of the mode (mode & 07777).

  uint64_t size = 0;
  // Logical size of the file.

  uint64_t spaceUsed = 0;
  // Physical size of the file on disk.  May be smaller for sparse files, or larger for
  // pre-allocated files.

  uint linkCount = 1;

  int64_t lastModified = 0;
  // Modification time in nanoseconds since the Unix epoch.

  uint64_t hashCode = 0;
  // Hint which identifies the underlying inode.  Two nodes with the same hashCode are likely
  // the same file, but this is not guaranteed.
};

enum class OpenMode {
  READ_ONLY,
  READ_WRITE,
};

struct FileWriterOptions {
  static constexpr size_t DEFAULT_BUFFER_SIZE = 8192;

  kj::StringPtr tempPrefix = ".tmp.";
  kj::StringPtr tempSuffix = ".tmp";
  // The temporary name is tempPrefix, eight random characters from [0-9A-Za-z], then tempSuffix.
  // Both strings are copied by newFileWriter().

  size_t bufferSize = DEFAULT_BUFFER_SIZE;
  // Bytes held in memory before they are written to the temporary file.  Must be non-zero.

  EntropySource* entropy = nullptr;
  // Randomness for temporary names.  Null means systemCsprng().  Must outlive the writer.
};

class FsNode {
  // Common base of File and Directory, owning the descriptor.

public:
  explicit FsNode(kj::AutoCloseFd fd);
  KJ_DISALLOW_COPY(FsNode);
  FsNode(FsNode&&) = default;

  Metadata stat() const;

  void sync() const;
  // fsync() the node, including its metadata.

  void datasync() const;
  // Like sync() but skips metadata which is not needed to read the content back (e.g. mtime).
  // Falls back to sync() where fdatasync() is unavailable.

  inline int getFd() const { return fd.get(); }

protected:
  kj::AutoCloseFd fd;
};

class File: public FsNode {
public:
  explicit File(kj::AutoCloseFd fd): FsNode(kj::mv(fd)) {}

  size_t read(uint64_t offset, kj::ArrayPtr<kj::byte> buffer) const;
  // Reads into `buffer` starting at `offset`.  Returns less than buffer.size() only at EOF.

  kj::Array<kj::byte> readAllBytes() const;
  kj::String readAllText() const;
  // Reads the whole file from offset zero, regardless of the descriptor's current position.

  void write(uint64_t offset, kj::ArrayPtr<const kj::byte> data) const;
  // Writes all of `data` at `offset`.  Does not move the descriptor's position.

  void truncate(uint64_t size) const;

  void chmod(mode_t mode) const;
};

class Directory: public FsNode {
public:
  explicit Directory(kj::AutoCloseFd fd): FsNode(kj::mv(fd)) {}

  // -------------------------------------------------------------------
  // Files

  kj::Own<File> openFile(kj::StringPtr name, OpenMode mode = OpenMode::READ_ONLY) const;
  kj::Maybe<kj::Own<File>> tryOpenFile(kj::StringPtr name,
                                       OpenMode mode = OpenMode::READ_ONLY) const;

  kj::Own<File> createFile(kj::StringPtr name, mode_t mode) const;
  // Exclusively creates `name` (EEXIST if present), opened read/write.  `mode` is subject to the
  // process umask like open(2).

  kj::Own<File> createUnnamedTemporary(mode_t mode) const;
  // Creates a read/write file on this directory's filesystem which has no name.  It disappears
  // when closed unless linkFile() gives it one first.  The permission bits are set to exactly
  // `mode`, ignoring the umask.

  void linkFile(const File& file, kj::StringPtr name) const;
  bool tryLinkFile(const File& file, kj::StringPtr name) const;
  // Hard-links an open file, including one from createUnnamedTemporary(), to `name`.
  // tryLinkFile() returns false if `name` already exists; linkFile() throws in that case.

  void rename(kj::StringPtr from, kj::StringPtr to) const;
  // Atomically replaces `to` (if it exists) with `from`.

  void removeFile(kj::StringPtr name) const;
  bool tryRemoveFile(kj::StringPtr name) const;
  // Returns false if there was nothing to remove.

  // -------------------------------------------------------------------
  // Subdirectories

  void mkdir(kj::StringPtr name, mode_t mode) const;
  // Throws if `name` exists.

  void ensureDir(kj::StringPtr name, mode_t mode) const;
  // Like mkdir() but it is not an error if `name` already exists.

  void ensureDirAll(kj::StringPtr path, mode_t mode) const;
  // Like ensureDir() but also creates missing parents.  The common case where the parent exists
  // costs a single mkdirat().

  kj::Own<Directory> openSubdir(kj::StringPtr name) const;
  kj::Maybe<kj::Own<Directory>> tryOpenSubdir(kj::StringPtr name) const;

  // -------------------------------------------------------------------
  // Metadata

  Metadata lstat(kj::StringPtr name) const;
  kj::Maybe<Metadata> tryLstat(kj::StringPtr name) const;
  // Does not follow a symlink at `name`.

  bool exists(kj::StringPtr name) const;

  struct Entry {
    kj::String name;
    kj::Maybe<FileType> type;
    // Null when the filesystem does not report types while listing; see getFileType().

    inline bool operator<(const Entry& other) const { return name < other.name; }
  };

  kj::Array<Entry> listEntries() const;
  // Lists the directory, sorted by name, omitting "." and "..".

  FileType getFileType(const Entry& entry) const;
  // The type hint from listing if present, otherwise lstat()s the entry.

  // -------------------------------------------------------------------
  // Atomic replacement

  kj::Own<FileWriter> newFileWriter(kj::StringPtr name, mode_t mode,
                                    FileWriterOptions options = FileWriterOptions()) const;
  // Starts writing new content for `name` which replaces it atomically on FileWriter::complete().
  // Nothing named `name` is touched before then.
  //
  // Where unnamed temporaries are unavailable, the content is staged from the start in a file
  // named after options.tempPrefix and options.tempSuffix.

  template <typename Func>
  auto writeFileWith(kj::StringPtr name, mode_t mode, Func&& func) const
      -> decltype(func(kj::instance<kj::BufferedOutputStream&>()));
  // Calls func(stream) with a new writer's stream, then completes the writer.  If func throws,
  // the writer is abandoned and the exception propagates.  Returns what func returns.

  template <typename Func>
  auto writeFileWithSync(kj::StringPtr name, mode_t mode, Func&& func) const
      -> decltype(func(kj::instance<kj::BufferedOutputStream&>()));
  // Like writeFileWith() but fsync()s the new content before it is renamed into place.

  void writeFileContents(kj::StringPtr name, mode_t mode,
                         kj::ArrayPtr<const kj::byte> content) const;
  void writeFileContents(kj::StringPtr name, mode_t mode, kj::StringPtr content) const;

private:
  kj::Maybe<kj::Own<File>> tryCreateTmpfile(mode_t mode) const;
  // O_TMPFILE, or null if the kernel or filesystem doesn't support it.

  kj::Own<File> createNamedTemporary(mode_t mode, kj::StringPtr prefix, kj::StringPtr suffix,
                                     EntropySource& entropy, kj::String& nameOut) const;
  // Exclusively creates a randomly-named file, retrying on collision.

  friend class FileWriter;
};

kj::Own<Directory> openDirectory(kj::StringPtr path);
// Opens a directory by path, relative to the current working directory if not absolute.

// =======================================================================================

class FileWriter {
  // One in-flight replacement of a file, created by Directory::newFileWriter().
  //
  // Content written to getStream() goes to an unnamed temporary file in the target directory.
  // complete() gives that file a random temporary name and then renames it over the target, so
  // anyone opening the target sees either the old content or the new content in full.
  //
  // Exactly one of complete(), completeWith() or abandon() must be called.  Destroying a writer
  // that was never finalized is a bug in the caller and aborts the process, unless the writer is
  // being destroyed during exception unwind, in which case it is quietly abandoned.

public:
  static constexpr uint MAX_TEMP_NAME_ATTEMPTS = 1000;

  FileWriter(const Directory& directory, kj::String name, kj::Own<File> tempFile,
             kj::Maybe<kj::String> stagedName, const FileWriterOptions& options);
  // `stagedName` is non-null when `tempFile` could not be created unnamed and already has a
  // temporary name, in which case completion skips the link step.
  KJ_DISALLOW_COPY(FileWriter);
  ~FileWriter() noexcept(false);

  inline kj::BufferedOutputStream& getStream() { return stream; }

  inline kj::StringPtr getName() const { return name; }
  inline bool isPending() const { return armed; }

  template <typename Func>
  void completeWith(Func&& func);
  // Flushes the stream, calls func(const File&) on the temporary file (e.g. to fsync or fchmod
  // it), then publishes it.  If func throws, nothing is published.
  //
  // The writer counts as finalized even if this throws.

  void complete();

  void abandon();
  // Discards everything written.  The target is left alone.

private:
  class Stream final: public kj::BufferedOutputStream {
    // Buffers writes to the temporary file.  Unlike kj::BufferedOutputStreamWrapper it never
    // writes on destruction, and discard() drops whatever is buffered.

  public:
    Stream(const File& file, size_t bufferSize);
    KJ_DISALLOW_COPY(Stream);

    void flush();
    void discard();

    kj::ArrayPtr<kj::byte> getWriteBuffer() override;
    void write(const void* buffer, size_t size) override;

  private:
    const File& file;
    uint64_t offset = 0;
    kj::Array<kj::byte> buffer;
    kj::byte* bufferPos;

    void writeThrough(const void* data, size_t size);
  };

  const Directory& directory;
  kj::String name;
  kj::String tempPrefix;
  kj::String tempSuffix;
  EntropySource& entropy;
  kj::Own<File> tempFile;
  kj::Maybe<kj::String> stagedName;
  Stream stream;
  bool armed = true;
  kj::UnwindDetector unwindDetector;

  void beginCompletion();
  void publish();
  void removeStagedName();
};

// =======================================================================================
// inline implementation details

template <typename Func>
void FileWriter::completeWith(Func&& func) {
  KJ_ON_SCOPE_FAILURE(removeStagedName());
  beginCompletion();
  func(kj::implicitCast<const File&>(*tempFile));
  publish();
}

namespace _ {  // private

template <typename Func>
auto callWithStream(Func& func, kj::BufferedOutputStream& stream, FileWriter& writer,
                    void (*finish)(FileWriter&))
    -> typename std::enable_if<!std::is_void<decltype(func(stream))>::value,
                               decltype(func(stream))>::type {
  auto result = func(stream);
  finish(writer);
  return result;
}

template <typename Func>
auto callWithStream(Func& func, kj::BufferedOutputStream& stream, FileWriter& writer,
                    void (*finish)(FileWriter&))
    -> typename std::enable_if<std::is_void<decltype(func(stream))>::value>::type {
  func(stream);
  finish(writer);
}

void completeWriter(FileWriter& writer);
void completeWriterWithSync(FileWriter& writer);

}  // namespace _ (private)

template <typename Func>
auto Directory::writeFileWith(kj::StringPtr name, mode_t mode, Func&& func) const
    -> decltype(func(kj::instance<kj::BufferedOutputStream&>())) {
  auto writer = newFileWriter(name, mode);
  KJ_ON_SCOPE_FAILURE(if (writer->isPending()) writer->abandon());
  return _::callWithStream(func, writer->getStream(), *writer, &_::completeWriter);
}

template <typename Func>
auto Directory::writeFileWithSync(kj::StringPtr name, mode_t mode, Func&& func) const
    -> decltype(func(kj::instance<kj::BufferedOutputStream&>())) {
  auto writer = newFileWriter(name, mode);
  KJ_ON_SCOPE_FAILURE(if (writer->isPending()) writer->abandon());
  return _::callWithStream(func, writer->getStream(), *writer, &_::completeWriterWithSync);
}

}  // namespace atfs

#endif  // ATFS_FILESYSTEM_H_
