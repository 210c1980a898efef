//===- BuildFile.h ----------------------------------------------*- C++ -*-===//
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
//
// This file contains the loader for the YAML manifest describing the tasks
// and tools of a project.
//
//===----------------------------------------------------------------------===//

#ifndef MKDONE_BUILDFILE_BUILDFILE_H
#define MKDONE_BUILDFILE_BUILDFILE_H

#include "mkdone/Basic/Compiler.h"
#include "mkdone/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <memory>

namespace mkdone {
namespace basic {

class FileSystem;

}

namespace buildfile {

class BuildDescription;

/// Minimal token object representing the range where a diagnostic occurred.
struct BuildFileToken {
  const char* start;
  unsigned length;
};

class BuildFileDelegate {
public:
  virtual ~BuildFileDelegate();

  /// Get the file system to use for access.
  virtual basic::FileSystem& getFileSystem() = 0;

  /// Called by the build file loader to register the current file contents.
  virtual void setFileContentsBeingParsed(StringRef buffer) = 0;

  /// Called by the build file loader to report an error.
  ///
  /// \param filename The file the error occurred in.
  ///
  /// \param at The token at which the error occurred. The token will be null if
  /// no location is associated.
  ///
  /// \param message The diagnostic message.
  virtual void error(StringRef filename,
                     const BuildFileToken& at,
                     const Twine& message) = 0;
};

/// The manifest loader.
///
/// The manifest is a single YAML document, a mapping with the sections
/// 'client', 'config', 'tasks', 'tools', 'packages', 'tool-requires' and
/// 'commands'. Only 'client' is required, and it must come first.
class BuildFile {
private:
  void *impl;

  BuildFile(const BuildFile&) MKDONE_DELETED_FUNCTION;
  void operator=(const BuildFile&) MKDONE_DELETED_FUNCTION;

public:
  /// Create a build file with the given delegate.
  ///
  /// \arg mainFilename The path of the main build file.
  explicit BuildFile(StringRef mainFilename,
                     BuildFileDelegate& delegate);
  ~BuildFile();

  /// Return the delegate the loader was configured with.
  BuildFileDelegate* getDelegate();

  /// Load the build file from the provided filename.
  ///
  /// \returns A non-null build description on success.
  std::unique_ptr<BuildDescription> load();
};

}
}

#endif
