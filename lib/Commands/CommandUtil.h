//===- CommandUtil.h --------------------------------------------*- C++ -*-===//
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

#ifndef MKDONE_COMMANDS_COMMANDUTIL_H
#define MKDONE_COMMANDS_COMMANDUTIL_H

#include "mkdone/Basic/LLVM.h"
#include "mkdone/BuildFile/Project.h"

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>
#include <vector>

namespace mkdone {
namespace basic {

class FileSystem;

}

namespace commands {
namespace util {

void emitError(StringRef filename, StringRef message,
               const char* position, unsigned length,
               StringRef buffer);

/// The options shared by the commands operating on a manifest.
struct ProjectInvocation {
  /// The manifest to load.
  std::string buildFilePath = "mkdone.yaml";

  /// The directory to change to before doing anything else, if any.
  std::string chdirPath;

  /// The path of the run journal, if any.
  std::string journalPath;

  /// Whether to echo commands and report up to date targets.
  bool verbose = false;

  /// Whether to silence informational notes.
  bool quiet = false;

  /// The configuration overrides given as "key=value" arguments.
  std::vector<buildfile::ConfigOverride> overrides;

  /// The remaining arguments.
  std::vector<std::string> positionalArgs;

  /// Whether usage should be shown.
  bool showUsage = false;

  /// Whether there were errors in parsing the arguments.
  bool hadErrors = false;

  /// Parse \arg args, accepting the journal option if \arg allowJournal.
  void parse(std::vector<std::string> args, bool allowJournal);
};

/// Print the options understood by \see ProjectInvocation.
void printProjectOptions(bool allowJournal);

/// Change directory, if requested, and load and configure the manifest.
///
/// Errors are reported to stderr.
///
/// \returns The project, or null on error.
std::unique_ptr<buildfile::Project>
loadProject(const ProjectInvocation& invocation,
            basic::FileSystem& fileSystem);

}
}
}

#endif
