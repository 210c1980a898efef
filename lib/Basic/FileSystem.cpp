//===-- FileSystem.cpp ----------------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "mkdone/Basic/FileSystem.h"
#include "mkdone/Basic/PlatformUtility.h"
#include "mkdone/Basic/Stat.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Process.h"

#include <cassert>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace {
  using namespace llvm;
  using namespace llvm::sys::fs;

  /// Remove a directory tree without looking through symbolic links.
  std::error_code removeTree(StringRef path) {
    std::error_code ec;
    directory_iterator i(path, ec, /*follow_symlinks=*/false);
    for (directory_iterator e; i != e && !ec; i.increment(ec)) {
      mkdone::basic::sys::StatStruct statbuf;
      if (mkdone::basic::sys::lstat(i->path().c_str(), &statbuf) != 0)
        return std::error_code(errno, std::generic_category());

      if (S_ISDIR(statbuf.st_mode)) {
        if (std::error_code subEC = removeTree(i->path()))
          return subEC;
      } else if (std::error_code subEC = llvm::sys::fs::remove(i->path())) {
        return subEC;
      }
    }
    if (ec)
      return ec;

    return llvm::sys::fs::remove(path);
  }
}

using namespace mkdone;
using namespace mkdone::basic;

FileSystem::~FileSystem() {}

bool FileSystem::createDirectories(const std::string& path) {
  // Attempt to create the final directory first, to optimize for the common
  // case where we don't need to recurse.
  if (createDirectory(path))
    return true;

  // If that failed, attempt to create the parent.
  StringRef parent = llvm::sys::path::parent_path(path);
  if (parent.empty())
    return false;
  return createDirectories(parent.str()) && createDirectory(path);
}

namespace {

class LocalFileSystem : public FileSystem {
public:
  LocalFileSystem() {}

  virtual bool
  createDirectory(const std::string& path) override {
    if (!mkdone::basic::sys::mkdir(path.c_str())) {
      if (errno != EEXIST) {
        return false;
      }
    }
    return true;
  }

  virtual std::unique_ptr<llvm::MemoryBuffer>
  getFileContents(const std::string& path) override {
    auto result = llvm::MemoryBuffer::getFile(path);
    if (result.getError()) {
      return nullptr;
    }
    return std::unique_ptr<llvm::MemoryBuffer>(result->release());
  }

  virtual bool remove(const std::string& path) override {
    // Assume `path` is a regular file.
    if (mkdone::basic::sys::unlink(path.c_str()) == 0) {
      return true;
    }

    // Error can't be that `path` is actually a directory (on Linux `EISDIR`
    // will be returned since 2.1.132).
    if (errno != EPERM && errno != EISDIR) {
      return false;
    }

    // Check if `path` is a directory.
    mkdone::basic::sys::StatStruct statbuf;
    if (mkdone::basic::sys::lstat(path.c_str(), &statbuf) != 0) {
      return false;
    }

    if (S_ISDIR(statbuf.st_mode)) {
      if (mkdone::basic::sys::rmdir(path.c_str()) == 0) {
        return true;
      } else {
        return !removeTree(path);
      }
    }

    return false;
  }

  virtual bool touch(const std::string& path,
                     std::string* error_out) override {
    int fd;
    std::error_code ec = llvm::sys::fs::openFileForWrite(
        path, fd, llvm::sys::fs::CD_OpenAlways, llvm::sys::fs::OF_None);
    if (ec) {
      *error_out = "unable to open '" + path + "': " + ec.message();
      return false;
    }

    // An existing file keeps its contents, only the timestamps move.
    ec = llvm::sys::fs::setLastAccessAndModificationTime(
        fd, std::chrono::time_point_cast<std::chrono::nanoseconds>(
                std::chrono::system_clock::now()));
    std::error_code closeEC = llvm::sys::Process::SafelyCloseFileDescriptor(fd);
    if (ec || closeEC) {
      *error_out = "unable to update '" + path + "': " +
        (ec ? ec : closeEC).message();
      return false;
    }
    return true;
  }

  virtual FileInfo getFileInfo(const std::string& path) override {
    return FileInfo::getInfoForPath(path);
  }

  virtual FileInfo getLinkInfo(const std::string& path) override {
    return FileInfo::getInfoForPath(path, /*isLink:*/ true);
  }
};

}

std::unique_ptr<FileSystem> basic::createLocalFileSystem() {
  return std::make_unique<LocalFileSystem>();
}
