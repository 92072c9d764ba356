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

#include "filesystem.h"
#include "entropy.h"
#include "test-util.h"
#include <kj/debug.h>
#include <kj/test.h>
#include <kj/thread.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>

namespace atfs {
namespace {

static mode_t getUmask() {
  mode_t mask = umask(0);
  umask(mask);
  return mask;
}

static kj::String longName() {
  kj::String result = kj::heapString(NAME_MAX + 10);
  memset(result.begin(), 'x', result.size());
  return result;
}

static kj::Array<kj::String> listNames(const Directory& dir) {
  auto entries = dir.listEntries();
  auto result = kj::heapArray<kj::String>(entries.size());
  for (size_t i = 0; i < entries.size(); i++) {
    result[i] = kj::mv(entries[i].name);
  }
  return result;
}

class FixedEntropy: public EntropySource {
  // Fills every buffer with `value`. With `increment`, the value goes up by one after each call.

public:
  explicit FixedEntropy(kj::byte value, bool increment = false)
      : value(value), increment(increment) {}

  void generate(kj::ArrayPtr<kj::byte> buffer) override {
    memset(buffer.begin(), value, buffer.size());
    if (increment) ++value;
  }

private:
  kj::byte value;
  bool increment;
};

// =======================================================================================

KJ_TEST("File") {
  TempDir tempDir;
  auto dir = tempDir.get();
  auto file = dir->createFile("foo", 0600);

  KJ_EXPECT(file->readAllText() == "");

  file->write(0, kj::StringPtr("foobar").asArray().asBytes());
  KJ_EXPECT(file->readAllText() == "foobar");

  file->write(3, kj::StringPtr("baz").asArray().asBytes());
  KJ_EXPECT(file->readAllText() == "foobaz");

  kj::byte buffer[16];
  KJ_EXPECT(file->read(2, buffer) == 4);
  KJ_EXPECT(memcmp(buffer, "obaz", 4) == 0);
  KJ_EXPECT(file->read(100, buffer) == 0);

  file->truncate(3);
  KJ_EXPECT(file->readAllText() == "foo");
  KJ_EXPECT(file->readAllBytes().size() == 3);

  auto meta = file->stat();
  KJ_EXPECT(meta.type == FileType::FILE);
  KJ_EXPECT(meta.size == 3);
  KJ_EXPECT(meta.linkCount == 1);

  file->chmod(0640);
  KJ_EXPECT(file->stat().permissions == 0640);

  file->sync();
  file->datasync();

  KJ_EXPECT(dir->lstat("foo").hashCode == meta.hashCode);
}

KJ_TEST("Directory optional lookups") {
  TempDir tempDir;
  auto dir = tempDir.get();

  KJ_EXPECT(dir->tryOpenFile("foo") == nullptr);
  KJ_EXPECT(dir->tryLstat("foo") == nullptr);
  KJ_EXPECT(dir->tryOpenSubdir("foo") == nullptr);
  KJ_EXPECT(!dir->exists("foo"));
  KJ_EXPECT(!dir->tryRemoveFile("foo"));

  dir->writeFileContents("foo", 0644, "hello");

  KJ_IF_MAYBE(file, dir->tryOpenFile("foo")) {
    KJ_EXPECT((*file)->readAllText() == "hello");
  } else {
    KJ_FAIL_EXPECT("foo should exist");
  }
  KJ_EXPECT(dir->exists("foo"));
  KJ_IF_MAYBE(meta, dir->tryLstat("foo")) {
    KJ_EXPECT(meta->type == FileType::FILE);
    KJ_EXPECT(meta->size == 5);
    KJ_EXPECT(meta->permissions == 0644);
  } else {
    KJ_FAIL_EXPECT("foo should exist");
  }

  KJ_EXPECT(dir->tryRemoveFile("foo"));
  KJ_EXPECT(dir->tryOpenFile("foo") == nullptr);
  KJ_EXPECT(!dir->tryRemoveFile("foo"));
  KJ_EXPECT(dir->tryOpenFile("foo") == nullptr);

  // A missing parent counts as not found too.
  KJ_EXPECT(dir->tryOpenFile("nosuchdir/foo") == nullptr);
  KJ_EXPECT(dir->tryLstat("nosuchdir/foo") == nullptr);
}

KJ_TEST("Directory lookups report errors other than not-found") {
  TempDir tempDir;
  auto dir = tempDir.get();
  auto name = longName();

  ATFS_EXPECT_THROW_ERRNO(ENAMETOOLONG, dir->tryOpenFile(name));
  ATFS_EXPECT_THROW_ERRNO(ENAMETOOLONG, dir->tryLstat(name));
  ATFS_EXPECT_THROW_ERRNO(ENAMETOOLONG, dir->tryRemoveFile(name));
  ATFS_EXPECT_THROW_ERRNO(ENAMETOOLONG, dir->exists(name));

  dir->writeFileContents("file", 0644, "x");
  ATFS_EXPECT_THROW_ERRNO(ENOTDIR, dir->tryOpenSubdir("file"));

  ATFS_EXPECT_THROW_ERRNO(ENOENT, dir->openFile("nosuch"));
  ATFS_EXPECT_THROW_ERRNO(ENOENT, dir->lstat("nosuch"));
  ATFS_EXPECT_THROW_ERRNO(ENOENT, dir->removeFile("nosuch"));
  ATFS_EXPECT_THROW_ERRNO(ENOENT, dir->openSubdir("nosuch"));
  ATFS_EXPECT_THROW_ERRNO(EEXIST, dir->createFile("file", 0644));
}

KJ_TEST("Directory subdirectories") {
  TempDir tempDir;
  auto dir = tempDir.get();

  dir->mkdir("sub", 0755);
  ATFS_EXPECT_THROW_ERRNO(EEXIST, dir->mkdir("sub", 0755));
  dir->ensureDir("sub", 0755);
  KJ_EXPECT(dir->lstat("sub").type == FileType::DIRECTORY);

  {
    auto sub = dir->openSubdir("sub");
    sub->writeFileContents("inner", 0644, "content");
  }

  KJ_IF_MAYBE(sub, dir->tryOpenSubdir("sub")) {
    KJ_EXPECT((*sub)->openFile("inner")->readAllText() == "content");
  } else {
    KJ_FAIL_EXPECT("sub should exist");
  }

  KJ_EXPECT(dir->openFile("sub/inner")->readAllText() == "content");
}

KJ_TEST("Directory::ensureDirAll()") {
  TempDir tempDir;
  auto dir = tempDir.get();
  mode_t mask = getUmask();

  dir->ensureDirAll("foo/bar/baz", 0755);
  auto meta = dir->lstat("foo/bar/baz");
  KJ_EXPECT(meta.type == FileType::DIRECTORY);
  KJ_EXPECT(meta.permissions == (0755 & ~mask), meta.permissions);
  KJ_EXPECT(dir->lstat("foo").type == FileType::DIRECTORY);
  KJ_EXPECT(dir->lstat("foo/bar").type == FileType::DIRECTORY);

  // Idempotent.
  dir->ensureDirAll("foo/bar/baz", 0755);
  dir->ensureDirAll("foo/bar", 0755);
  dir->ensureDirAll("foo", 0755);
  auto again = dir->lstat("foo/bar/baz");
  KJ_EXPECT(again.permissions == meta.permissions);
  KJ_EXPECT(again.hashCode == meta.hashCode);

  dir->ensureDirAll("bar", 0700);
  KJ_EXPECT(dir->lstat("bar").permissions == 0700);

  // Some parents exist already.
  dir->ensureDirAll("foo/qux/corge", 0700);
  KJ_EXPECT(dir->lstat("foo/qux/corge").type == FileType::DIRECTORY);

  // A file in the way is reported with its errno.
  dir->writeFileContents("file", 0644, "x");
  ATFS_EXPECT_THROW_ERRNO(ENOTDIR, dir->ensureDirAll("file/sub", 0755));
}

KJ_TEST("Directory::listEntries()") {
  TempDir tempDir;
  auto dir = tempDir.get();

  KJ_EXPECT(dir->listEntries().size() == 0);

  dir->writeFileContents("foo", 0644, "x");
  dir->mkdir("bar", 0755);
  dir->writeFileContents("baz", 0644, "y");

  auto entries = dir->listEntries();
  KJ_ASSERT(entries.size() == 3);
  KJ_EXPECT(entries[0].name == "bar");
  KJ_EXPECT(entries[1].name == "baz");
  KJ_EXPECT(entries[2].name == "foo");

  KJ_EXPECT(dir->getFileType(entries[0]) == FileType::DIRECTORY);
  KJ_EXPECT(dir->getFileType(entries[1]) == FileType::FILE);
  KJ_EXPECT(dir->getFileType(entries[2]) == FileType::FILE);

  // Without a hint getFileType() falls back to lstat().
  Directory::Entry entry;
  entry.name = kj::heapString("bar");
  KJ_EXPECT(dir->getFileType(entry) == FileType::DIRECTORY);

  // Listing again gives the same result.
  KJ_EXPECT(dir->listEntries().size() == 3);
}

KJ_TEST("Directory::createUnnamedTemporary()") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto file = dir->createUnnamedTemporary(0606);
  file->write(0, kj::StringPtr("foobar").asArray().asBytes());
  KJ_EXPECT(file->readAllText() == "foobar");
  KJ_EXPECT(file->stat().permissions == 0606);
  KJ_EXPECT(dir->listEntries().size() == 0);
}

KJ_TEST("Directory::linkFile()") {
  TempDir tempDir;
  auto dir = tempDir.get();

  kj::Own<File> file;
  uint links = 0;
  if (tmpfileSupported(*dir)) {
    file = dir->createUnnamedTemporary(0644);
  } else {
    // An unlinked file can't be given a name again, so link a named one instead.
    file = dir->createFile("orig", 0644);
    links = 1;
  }
  file->write(0, kj::StringPtr("linked").asArray().asBytes());

  KJ_EXPECT(dir->tryLinkFile(*file, "foo"));
  KJ_EXPECT(dir->openFile("foo")->readAllText() == "linked");
  KJ_EXPECT(file->stat().linkCount == links + 1);

  KJ_EXPECT(!dir->tryLinkFile(*file, "foo"));
  ATFS_EXPECT_THROW_ERRNO(EEXIST, dir->linkFile(*file, "foo"));

  dir->linkFile(*file, "bar");
  KJ_EXPECT(file->stat().linkCount == links + 2);

  dir->rename("bar", "baz");
  KJ_EXPECT(!dir->exists("bar"));
  KJ_EXPECT(dir->openFile("baz")->readAllText() == "linked");
}

// =======================================================================================

KJ_TEST("FileWriter complete") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto writer = dir->newFileWriter("foo", 0640);
  KJ_EXPECT(writer->getName() == "foo");
  KJ_EXPECT(writer->isPending());
  writer->getStream().write("hello, ", 7);
  writer->getStream().write("world", 5);

  // Nothing happens to the target until completion.
  KJ_EXPECT(!dir->exists("foo"));

  writer->complete();
  KJ_EXPECT(!writer->isPending());

  auto file = dir->openFile("foo");
  KJ_EXPECT(file->readAllText() == "hello, world");
  KJ_EXPECT(file->stat().permissions == 0640);

  auto names = listNames(*dir);
  KJ_ASSERT(names.size() == 1);
  KJ_EXPECT(names[0] == "foo");
}

KJ_TEST("FileWriter replaces existing content") {
  TempDir tempDir;
  auto dir = tempDir.get();

  dir->writeFileContents("foo", 0644, "old content");
  auto oldFile = dir->openFile("foo");

  dir->writeFileContents("foo", 0600, "new");
  KJ_EXPECT(dir->openFile("foo")->readAllText() == "new");
  KJ_EXPECT(dir->lstat("foo").permissions == 0600);

  // The old inode was replaced, not modified.
  KJ_EXPECT(oldFile->readAllText() == "old content");
  KJ_EXPECT(oldFile->stat().hashCode != dir->lstat("foo").hashCode);
  KJ_EXPECT(listNames(*dir).size() == 1);
}

KJ_TEST("FileWriter large writes") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto content = kj::heapArray<kj::byte>(100000);
  for (size_t i = 0; i < content.size(); i++) {
    content[i] = i % 251;
  }

  FileWriterOptions options;
  options.bufferSize = 1024;
  auto writer = dir->newFileWriter("foo", 0644, options);
  auto& stream = writer->getStream();
  stream.write(content.begin(), 10);
  stream.write(content.begin() + 10, 5000);
  stream.write(content.begin() + 5010, content.size() - 5010);
  writer->complete();

  auto result = dir->openFile("foo")->readAllBytes();
  KJ_ASSERT(result.size() == content.size());
  KJ_EXPECT(memcmp(result.begin(), content.begin(), content.size()) == 0);
}

KJ_TEST("FileWriter abandon") {
  TempDir tempDir;
  auto dir = tempDir.get();

  {
    auto writer = dir->newFileWriter("foo", 0644);
    writer->getStream().write("discarded", 9);
    writer->abandon();
    KJ_EXPECT(!writer->isPending());
  }
  KJ_EXPECT(!dir->exists("foo"));
  KJ_EXPECT(dir->listEntries().size() == 0);

  dir->writeFileContents("foo", 0644, "original");
  auto before = dir->lstat("foo");
  {
    auto writer = dir->newFileWriter("foo", 0600);
    writer->getStream().write("discarded", 9);
    writer->getStream().write("more", 4);
    writer->abandon();
  }
  KJ_EXPECT(dir->openFile("foo")->readAllText() == "original");
  auto after = dir->lstat("foo");
  KJ_EXPECT(after.hashCode == before.hashCode);
  KJ_EXPECT(after.permissions == before.permissions);
  KJ_EXPECT(listNames(*dir).size() == 1);
}

KJ_TEST("FileWriter finalizing twice is an error") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto writer = dir->newFileWriter("foo", 0644);
  writer->complete();
  KJ_EXPECT_THROW_MESSAGE("already completed or abandoned", writer->complete());
  KJ_EXPECT_THROW_MESSAGE("already completed or abandoned", writer->abandon());

  auto writer2 = dir->newFileWriter("bar", 0644);
  writer2->abandon();
  KJ_EXPECT_THROW_MESSAGE("already completed or abandoned", writer2->abandon());
  KJ_EXPECT(!dir->exists("bar"));
}

KJ_TEST("FileWriter::completeWith()") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto writer = dir->newFileWriter("foo", 0600);
  writer->getStream().write("buffered", 8);
  bool called = false;
  writer->completeWith([&](const File& file) {
    // Everything written is flushed before the hook runs.
    KJ_EXPECT(file.readAllText() == "buffered");
    file.chmod(0644);
    file.sync();
    called = true;
  });
  KJ_EXPECT(called);
  KJ_EXPECT(dir->openFile("foo")->readAllText() == "buffered");
  KJ_EXPECT(dir->lstat("foo").permissions == 0644);
}

KJ_TEST("FileWriter::completeWith() hook failure leaves the target alone") {
  TempDir tempDir;
  auto dir = tempDir.get();

  dir->writeFileContents("foo", 0644, "original");

  auto writer = dir->newFileWriter("foo", 0644);
  writer->getStream().write("new", 3);
  KJ_EXPECT_THROW_MESSAGE("hook failed", writer->completeWith([](const File&) {
    KJ_FAIL_ASSERT("hook failed");
  }));

  // The writer counts as finalized.
  KJ_EXPECT(!writer->isPending());
  KJ_EXPECT(dir->openFile("foo")->readAllText() == "original");
  KJ_EXPECT(listNames(*dir).size() == 1);
}

KJ_TEST("FileWriter rename failure") {
  TempDir tempDir;
  auto dir = tempDir.get();

  // A file can't replace a non-empty directory.
  dir->mkdir("foo", 0755);
  dir->writeFileContents("foo/child", 0644, "x");

  auto writer = dir->newFileWriter("foo", 0644);
  writer->getStream().write("new", 3);
  {
    LogRecorder log;
    ATFS_EXPECT_THROW_ERRNO(EISDIR, writer->complete());
    KJ_EXPECT(log.messages.size() == 0, log.messages.size());
  }

  KJ_EXPECT(!writer->isPending());
  KJ_EXPECT(dir->lstat("foo").type == FileType::DIRECTORY);
  KJ_EXPECT(dir->openFile("foo/child")->readAllText() == "x");

  // The temporary name was removed.
  auto names = listNames(*dir);
  KJ_ASSERT(names.size() == 1);
  KJ_EXPECT(names[0] == "foo");
}

KJ_TEST("FileWriterOptions defaults") {
  FileWriterOptions options;
  KJ_EXPECT(options.tempPrefix == ".tmp.");
  KJ_EXPECT(options.tempSuffix == ".tmp");
  KJ_EXPECT(options.bufferSize == 8192);
  KJ_EXPECT(options.entropy == nullptr);

  TempDir tempDir;
  auto dir = tempDir.get();
  options.bufferSize = 0;
  KJ_EXPECT_THROW_MESSAGE("buffer size must be non-zero", dir->newFileWriter("foo", 0644, options));
  KJ_EXPECT(!dir->exists("foo"));
}

KJ_TEST("FileWriter temporary name prefix and suffix") {
  TempDir tempDir;
  auto dir = tempDir.get();

  FixedEntropy entropy(0);
  auto tempName = generateTempName(".custom.", ".part", entropy);
  KJ_EXPECT(tempName == ".custom.00000000.part", tempName);

  // Occupy the name the writer will pick first, using a file the rename won't touch.
  dir->mkdir(tempName, 0755);

  FixedEntropy sequence(0, true);
  FileWriterOptions options;
  options.tempPrefix = ".custom.";
  options.tempSuffix = ".part";
  options.entropy = &sequence;
  auto writer = dir->newFileWriter("foo", 0644, options);
  writer->getStream().write("content", 7);

  // Whether the content is staged under a name right away or only linked at completion, only the
  // custom prefix and suffix are ever used.
  for (auto& entry: dir->listEntries()) {
    KJ_EXPECT(entry.name == tempName || entry.name == ".custom.11111111.part", entry.name);
  }

  writer->complete();

  KJ_EXPECT(dir->openFile("foo")->readAllText() == "content");
  KJ_EXPECT(dir->lstat(tempName).type == FileType::DIRECTORY);
  KJ_EXPECT(!dir->exists(".custom.11111111.part"));
  KJ_EXPECT(listNames(*dir).size() == 2);
}

KJ_TEST("FileWriter gives up after too many temporary name collisions") {
  TempDir tempDir;
  auto dir = tempDir.get();

  FixedEntropy entropy(0);
  dir->writeFileContents(generateTempName(".tmp.", ".tmp", entropy), 0644, "occupied");

  FileWriterOptions options;
  options.entropy = &entropy;

  // Without unnamed temporaries the name is needed when the writer is created, otherwise only
  // once it completes.
  KJ_EXPECT_THROW_MESSAGE("too many temporary name collisions", {
    auto writer = dir->newFileWriter("foo", 0644, options);
    writer->complete();
  });
  KJ_EXPECT(!dir->exists("foo"));
  KJ_EXPECT(listNames(*dir).size() == 1);

  tempDir.allowLeftovers();
}

KJ_TEST("FileWriter destroyed without finalizing aborts") {
  TempDir tempDir;
  auto dir = tempDir.get();
  tempDir.allowLeftovers();

  KJ_EXPECT_SIGNAL(SIGABRT, {
    auto writer = dir->newFileWriter("foo", 0644);
    writer->getStream().write("oops", 4);
  });

  KJ_EXPECT(!dir->exists("foo"));
}

KJ_TEST("FileWriter destroyed during unwind is abandoned") {
  TempDir tempDir;
  auto dir = tempDir.get();

  dir->writeFileContents("foo", 0644, "original");

  KJ_EXPECT_THROW_MESSAGE("something else failed", {
    auto writer = dir->newFileWriter("foo", 0644);
    writer->getStream().write("new", 3);
    KJ_FAIL_ASSERT("something else failed");
  });

  KJ_EXPECT(dir->openFile("foo")->readAllText() == "original");
  KJ_EXPECT(listNames(*dir).size() == 1);
}

KJ_TEST("Directory::writeFileWith()") {
  TempDir tempDir;
  auto dir = tempDir.get();

  int result = dir->writeFileWith("foo", 0644, [](kj::BufferedOutputStream& stream) {
    stream.write("abc", 3);
    return 123;
  });
  KJ_EXPECT(result == 123);
  KJ_EXPECT(dir->openFile("foo")->readAllText() == "abc");

  dir->writeFileWithSync("foo", 0600, [](kj::BufferedOutputStream& stream) {
    stream.write("synced", 6);
  });
  KJ_EXPECT(dir->openFile("foo")->readAllText() == "synced");
  KJ_EXPECT(dir->lstat("foo").permissions == 0600);

  KJ_EXPECT_THROW_MESSAGE("callback failed",
      dir->writeFileWith("foo", 0644, [](kj::BufferedOutputStream& stream) {
    stream.write("partial", 7);
    KJ_FAIL_ASSERT("callback failed");
  }));
  KJ_EXPECT(dir->openFile("foo")->readAllText() == "synced");
  KJ_EXPECT(listNames(*dir).size() == 1);

  kj::byte bytes[] = { 0, 1, 2, 0xff };
  dir->writeFileContents("bin", 0644, bytes);
  auto read = dir->openFile("bin")->readAllBytes();
  KJ_ASSERT(read.size() == 4);
  KJ_EXPECT(memcmp(read.begin(), bytes, 4) == 0);
}

KJ_TEST("FileWriter replacement is atomic for concurrent readers") {
  TempDir tempDir;
  auto dir = tempDir.get();

  const size_t size = 1 << 20;
  auto contentA = kj::heapArray<kj::byte>(size);
  auto contentB = kj::heapArray<kj::byte>(size);
  memset(contentA.begin(), 'a', size);
  memset(contentB.begin(), 'b', size);

  dir->writeFileContents("target", 0644, contentA);

  bool done = false;
  uint reads = 0;
  uint badReads = 0;

  {
    kj::Thread reader([&]() {
      while (!__atomic_load_n(&done, __ATOMIC_ACQUIRE)) {
        auto bytes = dir->openFile("target")->readAllBytes();
        ++reads;
        if (bytes.size() != size) {
          ++badReads;
          continue;
        }
        kj::byte first = bytes[0];
        if (first != 'a' && first != 'b') {
          ++badReads;
          continue;
        }
        for (kj::byte b: bytes) {
          if (b != first) {
            ++badReads;
            break;
          }
        }
      }
    });
    KJ_DEFER(__atomic_store_n(&done, true, __ATOMIC_RELEASE));

    for (uint i = 0; i < 20; i++) {
      dir->writeFileContents("target", 0644, i % 2 == 0 ? contentB : contentA);
    }
  }

  KJ_EXPECT(reads > 0);
  KJ_EXPECT(badReads == 0, badReads, reads);
}

KJ_TEST("FileWriters racing for the same name both succeed") {
  TempDir tempDir;
  auto dir = tempDir.get();

  auto writer1 = dir->newFileWriter("foo", 0644);
  auto writer2 = dir->newFileWriter("foo", 0644);
  writer1->getStream().write("first", 5);
  writer2->getStream().write("second", 6);
  writer1->complete();
  writer2->complete();

  KJ_EXPECT(dir->openFile("foo")->readAllText() == "second");
  KJ_EXPECT(listNames(*dir).size() == 1);
}

}  // namespace
}  // namespace atfs
