//===- StampStore.h ---------------------------------------------*- C++ -*-===//
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

#ifndef MKDONE_CORE_STAMPSTORE_H
#define MKDONE_CORE_STAMPSTORE_H

#include "mkdone/Basic/Compiler.h"
#include "mkdone/Basic/FileInfo.h"
#include "mkdone/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>

namespace mkdone {
namespace basic {

class FileSystem;

}

namespace core {

/// The store of completion stamps.
///
/// A stamp is an empty file recording the last successful completion of a
/// task. Its presence and modification time are the only record of
/// completion; the store keeps no other state, in memory or on disk.
///
/// Every stamp lives directly under a single root directory, at a path
/// derived deterministically from the task name (see \see getStampPath()).
class StampStore {
  basic::FileSystem& fileSystem;

  /// The directory holding all stamps.
  std::string rootDir;

  StampStore(const StampStore&) MKDONE_DELETED_FUNCTION;
  void operator=(const StampStore&) MKDONE_DELETED_FUNCTION;

public:
  StampStore(basic::FileSystem& fileSystem, StringRef rootDir);

  basic::FileSystem& getFileSystem() const { return fileSystem; }

  StringRef getRootDir() const { return rootDir; }

  /// Get the path of the stamp for the task \arg name.
  ///
  /// This is a pure function of the root directory and the name.
  std::string getStampPath(StringRef name) const;

  /// Check whether the stamp at \arg stampPath exists.
  bool exists(StringRef stampPath) const;

  /// Get the file information for the stamp at \arg stampPath, which will be
  /// missing if the stamp does not exist.
  basic::FileInfo getInfo(StringRef stampPath) const;

  /// Create the stamp (and its containing directories) and set its
  /// modification time to the current time.
  ///
  /// This must only be invoked as the last step of a successful run.
  ///
  /// \param error_out [out] Error string if return value is false.
  bool touch(StringRef stampPath, std::string* error_out);

  /// Remove the stamp, if present.
  ///
  /// Removing a stamp which does not exist is not an error.
  ///
  /// \param error_out [out] Error string if return value is false.
  bool remove(StringRef stampPath, std::string* error_out);
};

}
}

#endif
