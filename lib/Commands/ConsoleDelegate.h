//===- ConsoleDelegate.h ----------------------------------------*- C++ -*-===//
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

#ifndef MKDONE_COMMANDS_CONSOLEDELEGATE_H
#define MKDONE_COMMANDS_CONSOLEDELEGATE_H

#include "mkdone/Basic/LLVM.h"
#include "mkdone/BuildFile/BuildFile.h"
#include "mkdone/Core/TaskEngine.h"

#include "llvm/ADT/StringRef.h"

namespace mkdone {
namespace commands {

/// Reports manifest errors to stderr, with caret diagnostics.
class ConsoleBuildFileDelegate : public buildfile::BuildFileDelegate {
  basic::FileSystem& fileSystem;

  StringRef bufferBeingParsed;

public:
  explicit ConsoleBuildFileDelegate(basic::FileSystem& fileSystem)
    : fileSystem(fileSystem) {}

  virtual basic::FileSystem& getFileSystem() override { return fileSystem; }

  virtual void setFileContentsBeingParsed(StringRef buffer) override;

  virtual void error(StringRef filename,
                     const buildfile::BuildFileToken& at,
                     const Twine& message) override;
};

/// Reports engine progress to stdout and diagnostics to stderr.
class ConsoleEngineDelegate : public core::TaskEngineDelegate {
  bool verbose;

  bool quiet;

  unsigned numErrors = 0;

  unsigned numCommands = 0;

public:
  ConsoleEngineDelegate(bool verbose, bool quiet)
    : verbose(verbose), quiet(quiet) {}

  unsigned getNumErrors() const { return numErrors; }

  unsigned getNumCommands() const { return numCommands; }

  virtual void ruleStarted(const core::Rule& rule,
                           const core::Staleness& reason) override;

  virtual void ruleUpToDate(const core::Rule& rule) override;

  virtual void commandStarted(StringRef owner, StringRef command) override;

  virtual void commandFinished(StringRef owner, StringRef command,
                               const basic::ProcessResult& result) override;

  virtual void error(const Twine& message) override;

  virtual void note(const Twine& message) override;

  virtual void cycleDetected(ArrayRef<const core::Rule*> cycle) override;
};

}
}

#endif
