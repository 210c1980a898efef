//===- Subprocess.h ---------------------------------------------*- C++ -*-===//
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
// This file declares the interface used to run the shell commands making up
// task, tool and environment operations.
//
//===----------------------------------------------------------------------===//

#ifndef MKDONE_BASIC_SUBPROCESS_H
#define MKDONE_BASIC_SUBPROCESS_H

#include "mkdone/Basic/Compiler.h"
#include "mkdone/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>

namespace mkdone {
namespace basic {

/// The outcome of running a single external command.
struct ProcessResult {
  /// The exit status of the process, or a negative value if the process could
  /// not be executed or did not exit normally.
  int exitStatus = 0;

  /// Whether the process could not be launched at all.
  bool executionFailed = false;

  /// Diagnostic describing an execution failure, if any.
  std::string errorMessage;

  bool succeeded() const { return !executionFailed && exitStatus == 0; }
};

/// Executes shell commands on behalf of the engine.
///
/// Commands are always run synchronously, the call returns once the process
/// has exited.
class CommandRunner {
  CommandRunner(const CommandRunner&) MKDONE_DELETED_FUNCTION;
  void operator=(const CommandRunner&) MKDONE_DELETED_FUNCTION;

public:
  CommandRunner() {}
  virtual ~CommandRunner();

  /// Run \arg command through the shell and wait for it to complete.
  virtual ProcessResult executeShellCommand(StringRef command) = 0;
};

/// Create a runner which spawns \arg shellPath with `-c <command>` in the
/// current working directory and environment.
std::unique_ptr<CommandRunner>
createLocalCommandRunner(StringRef shellPath = "/bin/sh");

}
}

#endif
