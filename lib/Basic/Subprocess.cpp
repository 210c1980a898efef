//===-- Subprocess.cpp ----------------------------------------------------===//
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

#include "mkdone/Basic/Subprocess.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Program.h"

using namespace mkdone;
using namespace mkdone::basic;

CommandRunner::~CommandRunner() {}

namespace {

class LocalCommandRunner : public CommandRunner {
  std::string shellPath;

public:
  explicit LocalCommandRunner(StringRef shellPath) : shellPath(shellPath) {}

  virtual ProcessResult executeShellCommand(StringRef command) override {
    ProcessResult result;
    StringRef args[] = { shellPath, "-c", command };

    // ExecuteAndWait returns -1 if the program could not be run, and -2 if it
    // crashed or was killed by a signal.
    result.exitStatus = llvm::sys::ExecuteAndWait(
        shellPath, args, /*Env=*/llvm::None, /*Redirects=*/{},
        /*SecondsToWait=*/0, /*MemoryLimit=*/0, &result.errorMessage,
        &result.executionFailed);
    if (result.executionFailed && result.errorMessage.empty()) {
      result.errorMessage = "unable to execute '" + shellPath + "'";
    }
    return result;
  }
};

}

std::unique_ptr<CommandRunner>
basic::createLocalCommandRunner(StringRef shellPath) {
  return std::make_unique<LocalCommandRunner>(shellPath);
}
